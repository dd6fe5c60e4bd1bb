#pragma once

#include "detect/state_detector.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace camsnitch::core::logging {
class Logger;
}

namespace camsnitch::detect {

// Event-driven detector backed by Linux inotify.
//
// Every device node matching the glob at `Start` gets one watch for
// open/close activity. An open yields `On`; a close (with or without write)
// yields `Off`. Nodes that appear after startup are not picked up.
class InotifyWatchDetector final : public IStateDetector {
public:
  InotifyWatchDetector(std::string device_glob, core::logging::Logger& logger);
  ~InotifyWatchDetector() override;

  InotifyWatchDetector(const InotifyWatchDetector&) = delete;
  InotifyWatchDetector& operator=(const InotifyWatchDetector&) = delete;

  bool Start(std::string& error) override;
  int WaitHandle() const override;
  bool ReadSignals(std::vector<RawSignal>& signals, std::string& error) override;
  std::string_view Name() const override;

  std::size_t WatchedDeviceCount() const;

private:
  void HandleEvent(int watch_descriptor, std::uint32_t mask, std::vector<RawSignal>& signals);

  std::string device_glob_;
  core::logging::Logger* logger_ = nullptr;
  int inotify_fd_ = -1;
  std::map<int, std::string> watched_paths_;
};

} // namespace camsnitch::detect
