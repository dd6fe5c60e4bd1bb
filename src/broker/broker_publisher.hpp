#pragma once

#include "detect/camera_state.hpp"

#include <chrono>
#include <string>

namespace camsnitch::broker {

// Connection and delivery notifications surfaced to the event loop. They are
// informational: the loop logs them and never changes camera state.
enum class BrokerEventType {
  kConnected,
  kConnectFailed,
  kConnectionLost,
  kDeliveryAcked,
  kDeliveryFailed,
  kMessageArrived,
};

const char* ToString(BrokerEventType type);

struct BrokerEvent {
  BrokerEventType type = BrokerEventType::kConnected;
  // Delivery token for ack/failure events, 0 otherwise.
  int token = 0;
  std::string topic;
  std::string detail;
};

// Publishing side of the broker connection, as consumed by the event loop.
//
// Every method is called from the loop thread only. Failures are returned,
// never logged here; the caller decides what to log and whether to go on.
class IBrokerPublisher {
public:
  virtual ~IBrokerPublisher() = default;

  // Creates the client and starts connecting. `false` means the settings are
  // unusable or the client could not be created; that is fatal at startup.
  virtual bool Connect(std::string& error) = 0;

  // Publishes the discovery descriptor, retained, QoS 1. Safe to repeat.
  virtual bool PublishDiscovery(std::string& error) = 0;

  // Publishes `ON`/`OFF` to the state topic, retained, QoS 1.
  virtual bool PublishState(detect::CameraState state, std::string& error) = 0;

  // Descriptor readable while events are queued; -1 before `Connect`.
  virtual int EventHandle() const = 0;

  // Pops one queued event. `false` when none is queued.
  virtual bool NextEvent(BrokerEvent& event) = 0;

  // Idle-time upkeep such as retrying a connect that failed. `false` reports
  // an upkeep step that failed and will be retried on a later call.
  virtual bool Maintain(std::chrono::steady_clock::time_point now, std::string& error) = 0;
};

} // namespace camsnitch::broker
