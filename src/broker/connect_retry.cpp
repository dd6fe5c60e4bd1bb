#include "broker/connect_retry.hpp"

namespace camsnitch::broker {

void RecordConnectStarted(ConnectRetryState& state) {
  state.connect_in_flight = true;
  state.connect_failed_at.reset();
}

void RecordBrokerEvent(ConnectRetryState& state, const BrokerEventType type,
                       const std::chrono::steady_clock::time_point now) {
  switch (type) {
  case BrokerEventType::kConnected:
    state.connected = true;
    state.connect_in_flight = false;
    state.connect_failed_at.reset();
    break;
  case BrokerEventType::kConnectFailed:
    state.connected = false;
    state.connect_in_flight = false;
    state.connect_failed_at = now;
    break;
  case BrokerEventType::kConnectionLost:
    // Paho's automatic reconnect takes over from here.
    state.connected = false;
    break;
  case BrokerEventType::kDeliveryAcked:
  case BrokerEventType::kDeliveryFailed:
  case BrokerEventType::kMessageArrived:
    break;
  }
}

void RecordReissueFailed(ConnectRetryState& state,
                         const std::chrono::steady_clock::time_point now) {
  state.connect_in_flight = false;
  state.connect_failed_at = now;
}

bool ShouldReissueConnect(const ConnectRetryState& state,
                          const std::chrono::steady_clock::time_point now,
                          const std::chrono::milliseconds reconnect_delay) {
  if (state.connected || state.connect_in_flight || !state.connect_failed_at.has_value()) {
    return false;
  }
  return now - state.connect_failed_at.value() >= reconnect_delay;
}

std::chrono::steady_clock::duration
ComputeThrottleWait(const std::optional<std::chrono::steady_clock::time_point>& last_publish_at,
                    const std::chrono::steady_clock::time_point now,
                    const std::chrono::milliseconds spacing) {
  if (spacing.count() <= 0 || !last_publish_at.has_value()) {
    return std::chrono::steady_clock::duration::zero();
  }
  const auto since_last = now - last_publish_at.value();
  if (since_last >= spacing) {
    return std::chrono::steady_clock::duration::zero();
  }
  return spacing - since_last;
}

} // namespace camsnitch::broker
