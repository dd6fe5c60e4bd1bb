#pragma once

#include "config/daemon_config.hpp"
#include "detect/state_detector.hpp"

#include <memory>
#include <string>

namespace camsnitch::core::logging {
class Logger;
}

namespace camsnitch::detect {

// Builds the detection strategy selected by `config.detector`.
//
// The poll strategy gets the `lsof`-backed holder probe. Returns null with
// `error` set when the selection cannot be honored.
std::unique_ptr<IStateDetector> CreateStateDetector(const config::DaemonConfig& config,
                                                    core::logging::Logger& logger,
                                                    std::string& error);

} // namespace camsnitch::detect
