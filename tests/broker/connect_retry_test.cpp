#include "broker/connect_retry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using camsnitch::broker::BrokerEventType;
using camsnitch::broker::ConnectRetryState;
using std::chrono::milliseconds;

namespace {

const auto kT0 = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);
constexpr milliseconds kDelay{5000};

} // namespace

TEST_CASE("a refused first connect is re-issued only after the delay", "[broker][retry]") {
  ConnectRetryState state;
  camsnitch::broker::RecordConnectStarted(state);
  REQUIRE(state.connect_in_flight);
  REQUIRE_FALSE(camsnitch::broker::ShouldReissueConnect(state, kT0 + kDelay, kDelay));

  camsnitch::broker::RecordBrokerEvent(state, BrokerEventType::kConnectFailed, kT0);
  REQUIRE_FALSE(state.connect_in_flight);
  REQUIRE(state.connect_failed_at == kT0);

  REQUIRE_FALSE(
      camsnitch::broker::ShouldReissueConnect(state, kT0 + kDelay - milliseconds(1), kDelay));
  REQUIRE(camsnitch::broker::ShouldReissueConnect(state, kT0 + kDelay, kDelay));

  camsnitch::broker::RecordConnectStarted(state);
  REQUIRE_FALSE(state.connect_failed_at.has_value());
  REQUIRE_FALSE(camsnitch::broker::ShouldReissueConnect(state, kT0 + 10 * kDelay, kDelay));
}

TEST_CASE("a re-issue that cannot start backs off a full delay", "[broker][retry]") {
  ConnectRetryState state;
  camsnitch::broker::RecordBrokerEvent(state, BrokerEventType::kConnectFailed, kT0);

  const auto retry_at = kT0 + kDelay;
  camsnitch::broker::RecordReissueFailed(state, retry_at);
  REQUIRE_FALSE(camsnitch::broker::ShouldReissueConnect(state, retry_at + milliseconds(1), kDelay));
  REQUIRE(camsnitch::broker::ShouldReissueConnect(state, retry_at + kDelay, kDelay));
}

TEST_CASE("a lost connection is left to the client's own reconnect", "[broker][retry]") {
  ConnectRetryState state;
  camsnitch::broker::RecordConnectStarted(state);
  camsnitch::broker::RecordBrokerEvent(state, BrokerEventType::kConnected, kT0);
  REQUIRE(state.connected);
  REQUIRE_FALSE(state.connect_in_flight);

  camsnitch::broker::RecordBrokerEvent(state, BrokerEventType::kConnectionLost, kT0);
  REQUIRE_FALSE(state.connected);
  REQUIRE_FALSE(state.connect_failed_at.has_value());
  REQUIRE_FALSE(camsnitch::broker::ShouldReissueConnect(state, kT0 + 100 * kDelay, kDelay));

  camsnitch::broker::RecordBrokerEvent(state, BrokerEventType::kConnected, kT0 + kDelay);
  REQUIRE(state.connected);
}

TEST_CASE("delivery events do not touch connection bookkeeping", "[broker][retry]") {
  ConnectRetryState state;
  camsnitch::broker::RecordBrokerEvent(state, BrokerEventType::kConnectFailed, kT0);
  camsnitch::broker::RecordBrokerEvent(state, BrokerEventType::kDeliveryFailed, kT0 + kDelay);
  camsnitch::broker::RecordBrokerEvent(state, BrokerEventType::kMessageArrived, kT0 + kDelay);
  REQUIRE(state.connect_failed_at == kT0);
  REQUIRE(camsnitch::broker::ShouldReissueConnect(state, kT0 + kDelay, kDelay));
}

TEST_CASE("throttle spaces consecutive publishes", "[broker][throttle]") {
  using camsnitch::broker::ComputeThrottleWait;
  const auto zero = std::chrono::steady_clock::duration::zero();
  const milliseconds spacing{250};

  REQUIRE(ComputeThrottleWait(std::nullopt, kT0, spacing) == zero);
  REQUIRE(ComputeThrottleWait(kT0, kT0 + milliseconds(100), milliseconds(0)) == zero);
  REQUIRE(ComputeThrottleWait(kT0, kT0 + milliseconds(100), spacing) == milliseconds(150));
  REQUIRE(ComputeThrottleWait(kT0, kT0 + spacing, spacing) == zero);
  REQUIRE(ComputeThrottleWait(kT0, kT0 + milliseconds(400), spacing) == zero);
}
