#include "debounce/debouncer.hpp"

namespace camsnitch::debounce {

bool ShouldConfirm(const detect::CameraState candidate, const Clock::duration elapsed,
                   const Clock::duration window, const detect::CameraState last_confirmed) {
  return elapsed >= window && candidate != last_confirmed;
}

DebounceState MakeInitialDebounceState(const Clock::time_point now,
                                       const Clock::duration window) {
  DebounceState state;
  state.stable_state = detect::CameraState::kOff;
  state.last_transition_at = now - window;
  return state;
}

std::optional<detect::CameraState> EvaluateCandidate(DebounceState& state,
                                                     const detect::CameraState candidate,
                                                     const Clock::time_point now,
                                                     const Clock::duration window) {
  const Clock::duration elapsed = now - state.last_transition_at;
  if (!ShouldConfirm(candidate, elapsed, window, state.stable_state)) {
    return std::nullopt;
  }

  state.stable_state = candidate;
  state.last_transition_at = now;
  return candidate;
}

std::optional<Clock::duration> RemainingSettleTime(const DebounceState& state,
                                                   const detect::CameraState candidate,
                                                   const Clock::time_point now,
                                                   const Clock::duration window) {
  if (candidate == state.stable_state) {
    return std::nullopt;
  }
  const Clock::duration elapsed = now - state.last_transition_at;
  if (elapsed >= window) {
    return Clock::duration::zero();
  }
  return window - elapsed;
}

} // namespace camsnitch::debounce
