#pragma once

#include "broker/broker_publisher.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace camsnitch::broker {

// Hands broker events from the MQTT client's callback thread to the event
// loop thread.
//
// `Push` may be called from any thread. `Pop` and `Handle` belong to the loop
// thread. The handle is a semaphore-mode eventfd holding one count per queued
// event, so it stays readable exactly while the queue is non-empty.
class BrokerEventQueue {
public:
  BrokerEventQueue() = default;
  ~BrokerEventQueue();

  BrokerEventQueue(const BrokerEventQueue&) = delete;
  BrokerEventQueue& operator=(const BrokerEventQueue&) = delete;

  bool Open(std::string& error);

  int Handle() const;

  void Push(BrokerEvent event);

  // Pops the oldest event and takes one count off the handle. On an empty
  // queue any stray count is consumed so the handle cannot stay readable.
  bool Pop(BrokerEvent& event);

  std::size_t Size() const;

private:
  void ConsumeWakeup();

  int event_fd_ = -1;
  mutable std::mutex mutex_;
  std::deque<BrokerEvent> events_;
};

} // namespace camsnitch::broker
