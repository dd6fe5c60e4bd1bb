#include "loop/coordinator.hpp"

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include <poll.h>

namespace camsnitch::loop {

namespace {

constexpr std::size_t kDetectorSlot = 0;
constexpr std::size_t kBrokerSlot = 1;
constexpr std::size_t kSlotCount = 2;

constexpr short kReadyMask = POLLIN | POLLERR | POLLHUP;

} // namespace

const char* ToString(const LoopSource source) {
  switch (source) {
  case LoopSource::kDetector:
    return "detector";
  case LoopSource::kBroker:
    return "broker";
  case LoopSource::kIdle:
    return "idle";
  }
  return "idle";
}

Coordinator::Coordinator(std::unique_ptr<detect::IStateDetector> detector,
                         std::unique_ptr<broker::IBrokerPublisher> publisher,
                         const CoordinatorOptions options, core::logging::Logger& logger)
    : detector_(std::move(detector)),
      publisher_(std::move(publisher)),
      options_(options),
      logger_(&logger) {}

core::errors::ExitCode Coordinator::Start(std::string& error) {
  error.clear();
  if (started_) {
    error = "coordinator already started";
    return core::errors::ExitCode::kFailure;
  }
  if (detector_ == nullptr || publisher_ == nullptr) {
    error = "coordinator requires a detector and a publisher";
    return core::errors::ExitCode::kFailure;
  }
  if (options_.idle_tick.count() <= 0) {
    error = "idle tick must be positive";
    return core::errors::ExitCode::kConfigInvalid;
  }

  if (!detector_->Start(error)) {
    error = "detector '" + std::string(detector_->Name()) + "' failed to start: " + error;
    return core::errors::ExitCode::kDetectorInitFailed;
  }
  logger_->Info("detector started", {{"detector", detector_->Name()}});

  if (!publisher_->Connect(error)) {
    error = "broker setup failed: " + error;
    return core::errors::ExitCode::kBrokerSetupFailed;
  }
  logger_->Info("broker connect started");

  std::string publish_error;
  if (publisher_->PublishDiscovery(publish_error)) {
    logger_->Info("discovery descriptor published");
  } else {
    logger_->Error("discovery descriptor publish failed", {{"error", publish_error}});
  }

  state_ = debounce::MakeInitialDebounceState(debounce::Clock::now(), options_.debounce_window);
  pending_.reset();
  started_ = true;
  logger_->Info("event loop ready",
                {{"state", detect::ToString(state_.stable_state)},
                 {"debounce_window_ms", core::FormatMillis(options_.debounce_window)},
                 {"idle_tick_ms", core::FormatMillis(options_.idle_tick)}});
  return core::errors::ExitCode::kSuccess;
}

bool Coordinator::RunIteration(std::string& error) {
  error.clear();
  if (!started_) {
    error = "coordinator not started";
    return false;
  }

  std::array<pollfd, kSlotCount> fds{};
  fds[kDetectorSlot].fd = detector_->WaitHandle();
  fds[kDetectorSlot].events = POLLIN;
  fds[kBrokerSlot].fd = publisher_->EventHandle();
  fds[kBrokerSlot].events = POLLIN;

  const auto timeout = NextWaitTimeout(debounce::Clock::now());
  const int ready = poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));
  if (ready < 0) {
    if (errno == EINTR) {
      return true;
    }
    error = std::string("poll failed: ") + std::strerror(errno);
    return false;
  }

  ++stats_.iterations;

  // First ready source wins, starting from a slot that rotates every
  // iteration.
  std::optional<std::size_t> serviced_slot;
  if (ready > 0) {
    for (std::size_t offset = 0; offset < kSlotCount; ++offset) {
      const std::size_t slot = (first_checked_ + offset) % kSlotCount;
      if (fds[slot].fd >= 0 && (fds[slot].revents & kReadyMask) != 0) {
        serviced_slot = slot;
        break;
      }
    }
  }
  first_checked_ = (first_checked_ + 1U) % kSlotCount;

  if (!serviced_slot.has_value()) {
    ServiceIdle(debounce::Clock::now());
  } else if (serviced_slot.value() == kDetectorSlot) {
    ServiceDetector();
  } else {
    ServiceBroker();
  }

  ReevaluatePending(debounce::Clock::now());
  return true;
}

bool Coordinator::Run(std::string& error) {
  while (RunIteration(error)) {
  }
  return false;
}

std::chrono::milliseconds Coordinator::NextWaitTimeout(const debounce::Clock::time_point now) const {
  std::chrono::milliseconds timeout = options_.idle_tick;
  if (!pending_.has_value()) {
    return timeout;
  }
  const auto remaining = debounce::RemainingSettleTime(state_, pending_.value(), now,
                                                       options_.debounce_window);
  if (remaining.has_value()) {
    // Rounded up so the wake-up never lands just short of the window.
    timeout = std::min(timeout, std::chrono::ceil<std::chrono::milliseconds>(remaining.value()));
  }
  return timeout;
}

void Coordinator::ServiceDetector() {
  last_serviced_ = LoopSource::kDetector;

  std::vector<detect::RawSignal> signals;
  std::string read_error;
  if (!detector_->ReadSignals(signals, read_error)) {
    logger_->Warn("detector read failed",
                  {{"detector", detector_->Name()}, {"error", read_error}});
  }

  // Signals appended before a failure are still valid observations.
  for (const detect::RawSignal& signal : signals) {
    ++stats_.signals_seen;
    logger_->Debug("raw signal", {{"detector", detector_->Name()},
                                  {"state", detect::ToString(signal.state)},
                                  {"source", signal.source}});
    ApplyCandidate(signal.state, signal.observed_at);
  }
}

void Coordinator::ServiceBroker() {
  last_serviced_ = LoopSource::kBroker;

  broker::BrokerEvent event;
  if (!publisher_->NextEvent(event)) {
    return;
  }
  ++stats_.broker_events;

  const std::string token = std::to_string(event.token);
  switch (event.type) {
  case broker::BrokerEventType::kConnected:
    logger_->Info("broker connected", {{"detail", event.detail}});
    break;
  case broker::BrokerEventType::kConnectFailed:
    logger_->Warn("broker connect failed", {{"detail", event.detail}});
    break;
  case broker::BrokerEventType::kConnectionLost:
    logger_->Warn("broker connection lost", {{"detail", event.detail}});
    break;
  case broker::BrokerEventType::kDeliveryAcked:
    logger_->Debug("broker delivery acked", {{"token", token}, {"topic", event.topic}});
    break;
  case broker::BrokerEventType::kDeliveryFailed:
    logger_->Error("broker delivery failed", {{"token", token}, {"detail", event.detail}});
    break;
  case broker::BrokerEventType::kMessageArrived:
    logger_->Debug("broker message ignored", {{"topic", event.topic}});
    break;
  }
}

void Coordinator::ServiceIdle(const debounce::Clock::time_point now) {
  last_serviced_ = LoopSource::kIdle;
  ++stats_.idle_ticks;

  std::string upkeep_error;
  if (!publisher_->Maintain(now, upkeep_error)) {
    logger_->Warn("broker upkeep failed", {{"error", upkeep_error}});
  }
}

void Coordinator::ApplyCandidate(const detect::CameraState candidate,
                                 const debounce::Clock::time_point at) {
  const auto confirmed =
      debounce::EvaluateCandidate(state_, candidate, at, options_.debounce_window);
  if (confirmed.has_value()) {
    pending_.reset();
    PublishTransition(confirmed.value());
    return;
  }

  // A candidate matching the confirmed state cancels whatever was pending.
  if (candidate == state_.stable_state) {
    pending_.reset();
  } else {
    pending_ = candidate;
  }
}

void Coordinator::ReevaluatePending(const debounce::Clock::time_point now) {
  if (!pending_.has_value()) {
    return;
  }
  ApplyCandidate(pending_.value(), now);
}

void Coordinator::PublishTransition(const detect::CameraState state) {
  ++stats_.confirmed_transitions;
  logger_->Info("camera state confirmed", {{"state", detect::ToString(state)}});

  std::string publish_error;
  if (!publisher_->PublishState(state, publish_error)) {
    // The confirmed state is kept; the next real transition publishes again.
    ++stats_.publish_failures;
    logger_->Error("state publish failed",
                   {{"state", detect::ToString(state)}, {"error", publish_error}});
    return;
  }
  logger_->Info("state published", {{"payload", detect::ToPayload(state)}});
}

} // namespace camsnitch::loop
