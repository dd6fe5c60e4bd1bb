#include "detect/lsof_poll_detector.hpp"

#include "core/logging/logger.hpp"
#include "detect/device_glob.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <utility>

#include <sys/timerfd.h>
#include <unistd.h>

namespace camsnitch::detect {

namespace {

timespec ToTimespec(const std::chrono::nanoseconds span) {
  timespec ts{};
  ts.tv_sec = static_cast<time_t>(std::chrono::duration_cast<std::chrono::seconds>(span).count());
  ts.tv_nsec = static_cast<long>((span % std::chrono::seconds(1)).count());
  return ts;
}

} // namespace

LsofPollDetector::LsofPollDetector(std::string device_glob, const std::chrono::milliseconds interval,
                                   std::unique_ptr<IDeviceHolderProbe> probe,
                                   core::logging::Logger& logger)
    : device_glob_(std::move(device_glob)),
      interval_(interval),
      probe_(std::move(probe)),
      logger_(&logger) {}

LsofPollDetector::~LsofPollDetector() {
  if (timer_fd_ >= 0) {
    close(timer_fd_);
  }
}

bool LsofPollDetector::Start(std::string& error) {
  error.clear();
  if (timer_fd_ >= 0) {
    error = "poll detector already started";
    return false;
  }
  if (probe_ == nullptr) {
    error = "poll detector requires a device holder probe";
    return false;
  }
  if (interval_.count() <= 0) {
    error = "poll interval must be positive";
    return false;
  }

  timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
  if (timer_fd_ < 0) {
    error = std::string("timerfd_create failed: ") + std::strerror(errno);
    return false;
  }

  // First expiry almost immediately so the initial state is known without
  // waiting a whole interval.
  itimerspec spec{};
  spec.it_value = ToTimespec(std::chrono::nanoseconds(1));
  spec.it_interval = ToTimespec(interval_);
  if (timerfd_settime(timer_fd_, 0, &spec, nullptr) != 0) {
    error = std::string("timerfd_settime failed: ") + std::strerror(errno);
    close(timer_fd_);
    timer_fd_ = -1;
    return false;
  }

  logger_->Info("polling device holders",
                {{"device_glob", device_glob_},
                 {"interval_ms", std::to_string(interval_.count())}});
  return true;
}

int LsofPollDetector::WaitHandle() const {
  return timer_fd_;
}

bool LsofPollDetector::ReadSignals(std::vector<RawSignal>& signals, std::string& error) {
  error.clear();
  if (timer_fd_ < 0) {
    error = "poll detector not started";
    return false;
  }

  std::uint64_t expirations = 0;
  for (;;) {
    const ssize_t bytes_read = read(timer_fd_, &expirations, sizeof(expirations));
    if (bytes_read == static_cast<ssize_t>(sizeof(expirations))) {
      break;
    }
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    if (bytes_read < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return true;
    }
    error = bytes_read < 0 ? std::string("timerfd read failed: ") + std::strerror(errno)
                           : std::string("short timerfd read");
    return false;
  }

  if (expirations > 1U) {
    logger_->Debug("poll ticks coalesced", {{"expirations", std::to_string(expirations)}});
  }

  RawSignal signal;
  if (!ProbeOnce(signal, error)) {
    return false;
  }
  signals.push_back(std::move(signal));
  return true;
}

std::string_view LsofPollDetector::Name() const {
  return "poll";
}

bool LsofPollDetector::ProbeOnce(RawSignal& signal, std::string& error) {
  std::vector<std::string> device_paths;
  if (!ExpandDevicePattern(device_glob_, device_paths, error)) {
    return false;
  }

  std::vector<std::string> holder_pids;
  if (!probe_->FindHolders(device_paths, holder_pids, error)) {
    if (error.empty()) {
      error = "device holder probe failed";
    }
    return false;
  }

  logger_->Debug("device holder probe finished",
                 {{"devices", std::to_string(device_paths.size())},
                  {"holders", std::to_string(holder_pids.size())}});

  signal.state = holder_pids.empty() ? CameraState::kOff : CameraState::kOn;
  signal.observed_at = std::chrono::steady_clock::now();
  signal.source.clear();
  return true;
}

} // namespace camsnitch::detect
