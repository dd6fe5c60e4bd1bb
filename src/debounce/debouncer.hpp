#pragma once

#include "detect/camera_state.hpp"

#include <chrono>
#include <optional>

namespace camsnitch::debounce {

using Clock = std::chrono::steady_clock;

// Last confirmed state plus the moment it was confirmed. Owned by the event
// loop and only mutated through `EvaluateCandidate`.
struct DebounceState {
  detect::CameraState stable_state = detect::CameraState::kOff;
  Clock::time_point last_transition_at{};
};

// Pure gate: a candidate is confirmed iff at least `window` has elapsed since
// the last confirmed transition and it differs from the confirmed state.
bool ShouldConfirm(detect::CameraState candidate, Clock::duration elapsed, Clock::duration window,
                   detect::CameraState last_confirmed);

// Starting point for a fresh process: state `Off`, with the timer backdated
// by one window so the first differing candidate confirms immediately.
DebounceState MakeInitialDebounceState(Clock::time_point now, Clock::duration window);

// Applies `ShouldConfirm` at `now`. On confirmation records the new state and
// restarts the timer, returning the confirmed state. Otherwise `state` is left
// untouched; a candidate equal to the confirmed state never moves the timer.
std::optional<detect::CameraState> EvaluateCandidate(DebounceState& state,
                                                     detect::CameraState candidate,
                                                     Clock::time_point now,
                                                     Clock::duration window);

// Time left before `candidate` could confirm: zero if it already could,
// `nullopt` if it equals the confirmed state and never will.
std::optional<Clock::duration> RemainingSettleTime(const DebounceState& state,
                                                   detect::CameraState candidate,
                                                   Clock::time_point now, Clock::duration window);

} // namespace camsnitch::debounce
