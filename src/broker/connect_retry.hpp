#pragma once

#include "broker/broker_publisher.hpp"

#include <chrono>
#include <optional>

namespace camsnitch::broker {

// Connection bookkeeping kept on the loop thread. Paho reconnects on its own
// after a connection that once succeeded; only a connect that failed outright
// is re-issued by the daemon.
struct ConnectRetryState {
  bool connected = false;
  bool connect_in_flight = false;
  std::optional<std::chrono::steady_clock::time_point> connect_failed_at;
};

// A connect request was accepted by the client.
void RecordConnectStarted(ConnectRetryState& state);

// Folds a popped broker event into `state`. Delivery and inbound-message
// events leave it unchanged.
void RecordBrokerEvent(ConnectRetryState& state, BrokerEventType type,
                       std::chrono::steady_clock::time_point now);

// A re-issued connect could not even be started; wait a full delay again.
void RecordReissueFailed(ConnectRetryState& state, std::chrono::steady_clock::time_point now);

// True once a failed connect has waited `reconnect_delay` with nothing in
// flight.
bool ShouldReissueConnect(const ConnectRetryState& state,
                          std::chrono::steady_clock::time_point now,
                          std::chrono::milliseconds reconnect_delay);

// Time still to wait before the next publish so consecutive publishes are at
// least `spacing` apart. Zero when throttling is off or nothing was sent yet.
std::chrono::steady_clock::duration
ComputeThrottleWait(const std::optional<std::chrono::steady_clock::time_point>& last_publish_at,
                    std::chrono::steady_clock::time_point now,
                    std::chrono::milliseconds spacing);

} // namespace camsnitch::broker
