#include "debounce/debouncer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <vector>

using camsnitch::debounce::Clock;
using camsnitch::debounce::DebounceState;
using camsnitch::detect::CameraState;
using namespace std::chrono_literals;

namespace {

constexpr Clock::duration kWindow = 300ms;

Clock::time_point At(Clock::time_point origin, std::chrono::milliseconds offset) {
  return origin + offset;
}

} // namespace

TEST_CASE("ShouldConfirm requires an elapsed window and a different state", "[debounce]") {
  using camsnitch::debounce::ShouldConfirm;

  REQUIRE(ShouldConfirm(CameraState::kOn, 300ms, kWindow, CameraState::kOff));
  REQUIRE(ShouldConfirm(CameraState::kOff, 5s, kWindow, CameraState::kOn));
  REQUIRE_FALSE(ShouldConfirm(CameraState::kOn, 299ms, kWindow, CameraState::kOff));
  REQUIRE_FALSE(ShouldConfirm(CameraState::kOn, 5s, kWindow, CameraState::kOn));
  REQUIRE_FALSE(ShouldConfirm(CameraState::kOff, 0ms, kWindow, CameraState::kOff));
}

TEST_CASE("initial state is off and lets the first change through", "[debounce]") {
  const Clock::time_point start = Clock::now();
  DebounceState state = camsnitch::debounce::MakeInitialDebounceState(start, kWindow);

  REQUIRE(state.stable_state == CameraState::kOff);
  REQUIRE(start - state.last_transition_at == kWindow);

  const auto confirmed =
      camsnitch::debounce::EvaluateCandidate(state, CameraState::kOn, start, kWindow);
  REQUIRE(confirmed.has_value());
  REQUIRE(confirmed.value() == CameraState::kOn);
  REQUIRE(state.stable_state == CameraState::kOn);
  REQUIRE(state.last_transition_at == start);
}

TEST_CASE("repeated identical candidates never re-announce", "[debounce]") {
  const Clock::time_point t0 = Clock::now();
  DebounceState state{CameraState::kOn, t0};

  for (int i = 1; i <= 10; ++i) {
    const Clock::time_point now = At(t0, std::chrono::milliseconds(i * 250));
    REQUIRE_FALSE(
        camsnitch::debounce::EvaluateCandidate(state, CameraState::kOn, now, kWindow).has_value());
  }
  REQUIRE(state.stable_state == CameraState::kOn);
  REQUIRE(state.last_transition_at == t0);
}

TEST_CASE("a burst inside the window confirms once after it elapses", "[debounce][scenario]") {
  // The previous transition (to Off) happened at t0.
  const Clock::time_point t0 = Clock::now();
  DebounceState state{CameraState::kOff, t0};

  struct Step {
    CameraState candidate;
    std::chrono::milliseconds at;
  };
  const std::vector<Step> burst = {
      {CameraState::kOn, 0ms},
      {CameraState::kOff, 50ms},
      {CameraState::kOn, 120ms},
  };

  int confirmations = 0;
  for (const Step& step : burst) {
    if (camsnitch::debounce::EvaluateCandidate(state, step.candidate, At(t0, step.at), kWindow)) {
      ++confirmations;
    }
  }
  REQUIRE(confirmations == 0);
  REQUIRE(state.stable_state == CameraState::kOff);

  // The final candidate stays pending until the window is over.
  const auto remaining =
      camsnitch::debounce::RemainingSettleTime(state, CameraState::kOn, At(t0, 120ms), kWindow);
  REQUIRE(remaining.has_value());
  REQUIRE(remaining.value() == 180ms);

  REQUIRE_FALSE(
      camsnitch::debounce::EvaluateCandidate(state, CameraState::kOn, At(t0, 299ms), kWindow));
  const auto confirmed =
      camsnitch::debounce::EvaluateCandidate(state, CameraState::kOn, At(t0, 300ms), kWindow);
  REQUIRE(confirmed == CameraState::kOn);

  // And nothing more for the same state afterwards.
  REQUIRE_FALSE(
      camsnitch::debounce::EvaluateCandidate(state, CameraState::kOn, At(t0, 900ms), kWindow));
}

TEST_CASE("a candidate equal to the confirmed state leaves the timer alone",
          "[debounce][scenario]") {
  const Clock::time_point t0 = Clock::now();
  DebounceState state{CameraState::kOff, t0};

  REQUIRE_FALSE(
      camsnitch::debounce::EvaluateCandidate(state, CameraState::kOff, At(t0, 1000ms), kWindow));
  REQUIRE(state.stable_state == CameraState::kOff);
  REQUIRE(state.last_transition_at == t0);
}

TEST_CASE("confirmed transitions are at least one window apart", "[debounce]") {
  const Clock::time_point t0 = Clock::now();
  DebounceState state = camsnitch::debounce::MakeInitialDebounceState(t0, kWindow);

  std::vector<Clock::time_point> confirmed_at;
  CameraState candidate = CameraState::kOn;
  for (int ms = 0; ms <= 3000; ms += 40) {
    const Clock::time_point now = At(t0, std::chrono::milliseconds(ms));
    if (camsnitch::debounce::EvaluateCandidate(state, candidate, now, kWindow)) {
      confirmed_at.push_back(now);
    }
    candidate = candidate == CameraState::kOn ? CameraState::kOff : CameraState::kOn;
  }

  REQUIRE(confirmed_at.size() > 1U);
  for (std::size_t i = 1; i < confirmed_at.size(); ++i) {
    REQUIRE(confirmed_at[i] - confirmed_at[i - 1] >= kWindow);
  }
}

TEST_CASE("RemainingSettleTime reports zero once the window is over", "[debounce]") {
  const Clock::time_point t0 = Clock::now();
  const DebounceState state{CameraState::kOn, t0};

  REQUIRE_FALSE(camsnitch::debounce::RemainingSettleTime(state, CameraState::kOn, At(t0, 10ms),
                                                         kWindow)
                    .has_value());
  REQUIRE(camsnitch::debounce::RemainingSettleTime(state, CameraState::kOff, At(t0, 400ms),
                                                   kWindow) == Clock::duration::zero());
}
