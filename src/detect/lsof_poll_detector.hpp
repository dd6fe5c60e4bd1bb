#pragma once

#include "detect/device_holder_probe.hpp"
#include "detect/state_detector.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace camsnitch::core::logging {
class Logger;
}

namespace camsnitch::detect {

// Periodic detector for hosts without inotify on device nodes.
//
// A `timerfd` armed at `interval` is the wait handle. On each expiry the
// device glob is re-expanded and the holder probe is asked whether anything
// holds a node open: holders -> `On`, none (or no nodes) -> `Off`.
//
// Opens shorter than the interval are missed; prefer the watch strategy.
class LsofPollDetector final : public IStateDetector {
public:
  LsofPollDetector(std::string device_glob, std::chrono::milliseconds interval,
                   std::unique_ptr<IDeviceHolderProbe> probe, core::logging::Logger& logger);
  ~LsofPollDetector() override;

  LsofPollDetector(const LsofPollDetector&) = delete;
  LsofPollDetector& operator=(const LsofPollDetector&) = delete;

  bool Start(std::string& error) override;
  int WaitHandle() const override;
  bool ReadSignals(std::vector<RawSignal>& signals, std::string& error) override;
  std::string_view Name() const override;

private:
  bool ProbeOnce(RawSignal& signal, std::string& error);

  std::string device_glob_;
  std::chrono::milliseconds interval_{};
  std::unique_ptr<IDeviceHolderProbe> probe_;
  core::logging::Logger* logger_ = nullptr;
  int timer_fd_ = -1;
};

} // namespace camsnitch::detect
