#pragma once

#include "config/daemon_config.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace camsnitch::cli {

// Parsed `run` invocation. Flag values are kept raw and in command-line order
// so they can be applied after the optional config file is loaded.
struct RunOptions {
  std::string config_path;
  std::vector<std::pair<std::string, std::string>> flag_values;
};

// Parses `run` args. Unknown flags, flags missing their value and positional
// arguments are usage errors.
bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error);

// Overlays parsed flag values onto `config`. A value that does not fit its
// flag (non-numeric port, unknown detector, ...) is an error.
bool ApplyFlagValues(const RunOptions& options, config::DaemonConfig& config, std::string& error);

// Routes `camsnitch` subcommands and returns process exit codes:
//   0  => help/version printed
//   1  => event loop stopped on an unrecoverable wait failure
//   2  => usage error (unknown command / invalid args)
//   10 => configuration file or values rejected
//   20 => broker client could not be set up
//   21 => camera detector could not be started
// Without a subcommand the daemon runs.
int Dispatch(int argc, char** argv);

} // namespace camsnitch::cli
