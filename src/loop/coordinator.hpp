#pragma once

#include "broker/broker_publisher.hpp"
#include "core/errors/exit_codes.hpp"
#include "debounce/debouncer.hpp"
#include "detect/state_detector.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace camsnitch::core::logging {
class Logger;
}

namespace camsnitch::loop {

struct CoordinatorOptions {
  std::chrono::milliseconds debounce_window{300};
  std::chrono::milliseconds idle_tick{1000};
};

// Which event source an iteration serviced.
enum class LoopSource {
  kDetector,
  kBroker,
  kIdle,
};

const char* ToString(LoopSource source);

// Counters kept for logs and tests.
struct LoopStats {
  std::uint64_t iterations = 0;
  std::uint64_t signals_seen = 0;
  std::uint64_t confirmed_transitions = 0;
  std::uint64_t publish_failures = 0;
  std::uint64_t broker_events = 0;
  std::uint64_t idle_ticks = 0;
};

// Top-level driver of the daemon.
//
// Owns the detector and the publisher and multiplexes three sources on a
// single thread: detector readiness, broker events and the idle tick. Each
// iteration services at most one ready source; the source checked first
// rotates so a busy source cannot starve the other.
//
// Debounce state and the pending candidate are touched only from this thread.
class Coordinator {
public:
  Coordinator(std::unique_ptr<detect::IStateDetector> detector,
              std::unique_ptr<broker::IBrokerPublisher> publisher, CoordinatorOptions options,
              core::logging::Logger& logger);

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  // Starts the detector, connects the publisher and announces discovery.
  // Returns the exit code that matches a fatal startup failure, with `error`
  // filled; a failed discovery publish is logged only.
  core::errors::ExitCode Start(std::string& error);

  // Waits for and services one source, then re-checks the pending candidate.
  // `false` only when waiting itself fails.
  bool RunIteration(std::string& error);

  // Runs iterations until one fails. Never returns `true`.
  bool Run(std::string& error);

  const debounce::DebounceState& State() const {
    return state_;
  }
  std::optional<detect::CameraState> PendingCandidate() const {
    return pending_;
  }
  std::optional<LoopSource> LastServiced() const {
    return last_serviced_;
  }
  const LoopStats& Stats() const {
    return stats_;
  }

private:
  std::chrono::milliseconds NextWaitTimeout(debounce::Clock::time_point now) const;
  void ServiceDetector();
  void ServiceBroker();
  void ServiceIdle(debounce::Clock::time_point now);
  void ApplyCandidate(detect::CameraState candidate, debounce::Clock::time_point at);
  void ReevaluatePending(debounce::Clock::time_point now);
  void PublishTransition(detect::CameraState state);

  std::unique_ptr<detect::IStateDetector> detector_;
  std::unique_ptr<broker::IBrokerPublisher> publisher_;
  CoordinatorOptions options_;
  core::logging::Logger* logger_ = nullptr;

  bool started_ = false;
  debounce::DebounceState state_;
  std::optional<detect::CameraState> pending_;
  std::size_t first_checked_ = 0;
  std::optional<LoopSource> last_serviced_;
  LoopStats stats_;
};

} // namespace camsnitch::loop
