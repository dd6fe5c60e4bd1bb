#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace camsnitch::detect {

// Binary usage state of the watched capture device(s).
enum class CameraState {
  kOff,
  kOn,
};

// Lower-case name for logs (`on` / `off`).
const char* ToString(CameraState state);

// Broker payload (`ON` / `OFF`). These strings are also the discovery
// descriptor's `payload_on` / `payload_off`, so both must stay in sync.
std::string_view ToPayload(CameraState state);

// One candidate observation produced by a detector.
//
// `observed_at` is monotonic so debounce timing is immune to wall-clock
// jumps. `source` is the device path that triggered the observation when the
// strategy knows it (empty for poll results); it is diagnostic only.
struct RawSignal {
  CameraState state = CameraState::kOff;
  std::chrono::steady_clock::time_point observed_at{};
  std::string source;
};

} // namespace camsnitch::detect
