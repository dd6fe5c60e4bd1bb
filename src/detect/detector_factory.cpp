#include "detect/detector_factory.hpp"

#include "detect/device_holder_probe.hpp"
#include "detect/inotify_watch_detector.hpp"
#include "detect/lsof_poll_detector.hpp"

namespace camsnitch::detect {

std::unique_ptr<IStateDetector> CreateStateDetector(const config::DaemonConfig& config,
                                                    core::logging::Logger& logger,
                                                    std::string& error) {
  error.clear();
  if (config.device_glob.empty()) {
    error = "device glob cannot be empty";
    return nullptr;
  }

  switch (config.detector) {
  case config::DetectorMode::kWatch:
    return std::make_unique<InotifyWatchDetector>(config.device_glob, logger);
  case config::DetectorMode::kPoll:
    if (config.poll_interval.count() <= 0) {
      error = "poll interval must be positive";
      return nullptr;
    }
    return std::make_unique<LsofPollDetector>(config.device_glob, config.poll_interval,
                                              std::make_unique<LsofDeviceHolderProbe>(), logger);
  }

  error = "unsupported detector mode";
  return nullptr;
}

} // namespace camsnitch::detect
