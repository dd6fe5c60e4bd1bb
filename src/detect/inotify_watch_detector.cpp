#include "detect/inotify_watch_detector.hpp"

#include "core/logging/logger.hpp"
#include "detect/device_glob.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <utility>

#include <sys/inotify.h>
#include <unistd.h>

namespace camsnitch::detect {

namespace {

constexpr std::uint32_t kWatchMask = IN_OPEN | IN_CLOSE_WRITE | IN_CLOSE_NOWRITE;

// Room for a few dozen events per read; names are never set for file watches.
constexpr std::size_t kReadBufferBytes = 64U * (sizeof(inotify_event) + 16U);

std::string ErrnoText(const int err) {
  return std::strerror(err);
}

} // namespace

InotifyWatchDetector::InotifyWatchDetector(std::string device_glob, core::logging::Logger& logger)
    : device_glob_(std::move(device_glob)), logger_(&logger) {}

InotifyWatchDetector::~InotifyWatchDetector() {
  if (inotify_fd_ >= 0) {
    close(inotify_fd_);
  }
}

bool InotifyWatchDetector::Start(std::string& error) {
  error.clear();
  if (inotify_fd_ >= 0) {
    error = "inotify watch detector already started";
    return false;
  }

  inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (inotify_fd_ < 0) {
    error = "inotify_init1 failed: " + ErrnoText(errno);
    return false;
  }

  std::vector<std::string> device_paths;
  std::string glob_error;
  if (!ExpandDevicePattern(device_glob_, device_paths, glob_error)) {
    // An unreadable pattern directory is no different from "no devices yet".
    logger_->Warn("device glob expansion failed; watching nothing",
                  {{"device_glob", device_glob_}, {"error", glob_error}});
    device_paths.clear();
  }

  for (const std::string& path : device_paths) {
    const int watch_descriptor = inotify_add_watch(inotify_fd_, path.c_str(), kWatchMask);
    if (watch_descriptor < 0) {
      logger_->Warn("failed to watch device node",
                    {{"device", path}, {"error", ErrnoText(errno)}});
      continue;
    }
    watched_paths_[watch_descriptor] = path;
    logger_->Info("watching device node", {{"device", path}});
  }

  if (watched_paths_.empty()) {
    logger_->Warn("no device nodes matched; camera is treated as off",
                  {{"device_glob", device_glob_}});
  }
  return true;
}

int InotifyWatchDetector::WaitHandle() const {
  return inotify_fd_;
}

bool InotifyWatchDetector::ReadSignals(std::vector<RawSignal>& signals, std::string& error) {
  error.clear();
  if (inotify_fd_ < 0) {
    error = "inotify watch detector not started";
    return false;
  }

  alignas(inotify_event) char buffer[kReadBufferBytes];
  for (;;) {
    const ssize_t bytes_read = read(inotify_fd_, buffer, sizeof(buffer));
    if (bytes_read < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return true;
      }
      error = "inotify read failed: " + ErrnoText(errno);
      return false;
    }
    if (bytes_read == 0) {
      return true;
    }

    std::size_t offset = 0;
    const auto total = static_cast<std::size_t>(bytes_read);
    while (offset + sizeof(inotify_event) <= total) {
      inotify_event event{};
      std::memcpy(&event, buffer + offset, sizeof(inotify_event));
      HandleEvent(event.wd, event.mask, signals);
      offset += sizeof(inotify_event) + event.len;
    }
  }
}

std::string_view InotifyWatchDetector::Name() const {
  return "watch";
}

std::size_t InotifyWatchDetector::WatchedDeviceCount() const {
  return watched_paths_.size();
}

void InotifyWatchDetector::HandleEvent(const int watch_descriptor, const std::uint32_t mask,
                                       std::vector<RawSignal>& signals) {
  if ((mask & IN_Q_OVERFLOW) != 0U) {
    logger_->Warn("inotify queue overflowed; some device activity was dropped");
    return;
  }

  const auto it = watched_paths_.find(watch_descriptor);
  if (it == watched_paths_.end()) {
    return;
  }

  if ((mask & IN_IGNORED) != 0U) {
    logger_->Warn("device node watch removed", {{"device", it->second}});
    watched_paths_.erase(it);
    return;
  }

  RawSignal signal;
  signal.observed_at = std::chrono::steady_clock::now();
  signal.source = it->second;
  if ((mask & IN_OPEN) != 0U) {
    signal.state = CameraState::kOn;
  } else if ((mask & (IN_CLOSE_WRITE | IN_CLOSE_NOWRITE)) != 0U) {
    signal.state = CameraState::kOff;
  } else {
    return;
  }
  signals.push_back(std::move(signal));
}

} // namespace camsnitch::detect
