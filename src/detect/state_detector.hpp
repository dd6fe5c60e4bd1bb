#pragma once

#include "detect/camera_state.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace camsnitch::detect {

// Shared contract for camera-usage detection strategies.
//
// Contract goals:
// - the event loop multiplexes detectors with `poll(2)`, so every strategy
//   exposes one readable file descriptor (`WaitHandle`)
// - `Start` failures are fatal startup errors; `ReadSignals` failures are
//   transient and the loop simply calls again on the next readiness
// - a strategy with nothing to watch is still healthy: its handle just never
//   becomes readable
class IStateDetector {
public:
  virtual ~IStateDetector() = default;

  // Acquires the underlying mechanism (inotify instance, timer, ...).
  virtual bool Start(std::string& error) = 0;

  // Descriptor that becomes readable when signals may be available.
  // Returns -1 before a successful `Start`.
  virtual int WaitHandle() const = 0;

  // Drains the ready batch. Appends zero or more signals in observation
  // order; `false` reports a transient read/probe failure.
  virtual bool ReadSignals(std::vector<RawSignal>& signals, std::string& error) = 0;

  // Strategy name for logs (`watch`, `poll`).
  virtual std::string_view Name() const = 0;
};

} // namespace camsnitch::detect
