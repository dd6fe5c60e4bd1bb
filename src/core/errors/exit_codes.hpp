#pragma once

namespace camsnitch::core::errors {

// Process-exit contract for supervisors (systemd, runit, container runtimes).
//
// The daemon never exits on its own once the event loop is running, so every
// non-zero value below identifies a startup failure:
// - 0 help/version printed
// - 1 generic failure
// - 2 usage/argument failure
// - 10 configuration rejected by validation
// - 20 broker client could not be created or connected
// - 21 device watch mechanism could not be initialized
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kBrokerSetupFailed = 20,
  kDetectorInitFailed = 21,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace camsnitch::core::errors
