#include "broker/broker_publisher.hpp"

namespace camsnitch::broker {

const char* ToString(const BrokerEventType type) {
  switch (type) {
  case BrokerEventType::kConnected:
    return "connected";
  case BrokerEventType::kConnectFailed:
    return "connect_failed";
  case BrokerEventType::kConnectionLost:
    return "connection_lost";
  case BrokerEventType::kDeliveryAcked:
    return "delivery_acked";
  case BrokerEventType::kDeliveryFailed:
    return "delivery_failed";
  case BrokerEventType::kMessageArrived:
    return "message_arrived";
  }
  return "connected";
}

} // namespace camsnitch::broker
