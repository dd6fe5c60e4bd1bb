#include "broker/broker_event_queue.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <utility>

#include <sys/eventfd.h>
#include <unistd.h>

namespace camsnitch::broker {

BrokerEventQueue::~BrokerEventQueue() {
  if (event_fd_ >= 0) {
    close(event_fd_);
  }
}

bool BrokerEventQueue::Open(std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  if (event_fd_ >= 0) {
    return true;
  }

  event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC | EFD_SEMAPHORE);
  if (event_fd_ < 0) {
    error = std::string("eventfd failed: ") + std::strerror(errno);
    return false;
  }

  // Events pushed before the descriptor existed still need their counts.
  const std::uint64_t backlog = events_.size();
  if (backlog > 0U && write(event_fd_, &backlog, sizeof(backlog)) < 0) {
    error = std::string("eventfd write failed: ") + std::strerror(errno);
    return false;
  }
  return true;
}

int BrokerEventQueue::Handle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return event_fd_;
}

void BrokerEventQueue::Push(BrokerEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(std::move(event));
  if (event_fd_ < 0) {
    return;
  }
  const std::uint64_t one = 1U;
  if (write(event_fd_, &one, sizeof(one)) < 0) {
    // Only the wake-up is lost; the event stays queued and is drained on the
    // next readiness of an earlier event.
    return;
  }
}

bool BrokerEventQueue::Pop(BrokerEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (events_.empty()) {
    ConsumeWakeup();
    return false;
  }
  event = std::move(events_.front());
  events_.pop_front();
  ConsumeWakeup();
  return true;
}

void BrokerEventQueue::ConsumeWakeup() {
  if (event_fd_ < 0) {
    return;
  }
  std::uint64_t count = 0;
  while (read(event_fd_, &count, sizeof(count)) < 0) {
    if (errno == EINTR) {
      continue;
    }
    // EAGAIN: the counter is already zero because `Push` lost its wake-up
    // write. The deque, not the counter, decides what is queued, and a count
    // left behind by any other failure is consumed by the next empty `Pop`.
    return;
  }
}

std::size_t BrokerEventQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

} // namespace camsnitch::broker
