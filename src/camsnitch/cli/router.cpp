#include "camsnitch/cli/router.hpp"

#include "broker/discovery_descriptor.hpp"
#include "broker/mqtt_broker_publisher.hpp"
#include "camsnitch/version.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "detect/detector_factory.hpp"
#include "loop/coordinator.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <ostream>
#include <system_error>

namespace camsnitch::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  camsnitch [run] [--config <file.json>] [--mqtt-host <host>] [--mqtt-port <port>]\n"
      << "            [--mqtt-client-id <id>] [--mqtt-username <user>] "
         "[--mqtt-password <password>]\n"
      << "            [--keep-alive <s>] [--outbound-throttle-ms <ms>] "
         "[--outbound-capacity <n>]\n"
      << "            [--reconnect-delay-ms <ms>] [--debounce-ms <ms>] [--idle-tick-ms <ms>]\n"
      << "            [--detector <watch|poll>] [--poll-interval-ms <ms>] "
         "[--device-glob <pattern>]\n"
      << "            [--discovery-prefix <prefix>] [--node-id <id>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  camsnitch version\n"
      << "  camsnitch help\n";
}

bool ParseUnsignedFlag(std::string_view flag, std::string_view raw, std::uint64_t max_value,
                       std::uint64_t& value, std::string& error) {
  std::uint64_t parsed = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (raw.empty() || ec != std::errc() || ptr != end || parsed > max_value) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected whole number in range [0," + std::to_string(max_value) + "])";
    return false;
  }
  value = parsed;
  return true;
}

template <typename Duration>
bool ParseDurationFlag(std::string_view flag, std::string_view raw, Duration& target,
                       std::string& error) {
  constexpr std::uint64_t kMaxMillis = 86'400'000ULL;
  std::uint64_t count = 0;
  if (!ParseUnsignedFlag(flag, raw, kMaxMillis, count, error)) {
    return false;
  }
  target = Duration(static_cast<typename Duration::rep>(count));
  return true;
}

using FlagHandler =
    std::function<bool(std::string_view, std::string_view, config::DaemonConfig&, std::string&)>;

FlagHandler StringFlag(std::string config::DaemonConfig::*member) {
  return [member](std::string_view, std::string_view raw, config::DaemonConfig& config,
                  std::string&) {
    config.*member = std::string(raw);
    return true;
  };
}

FlagHandler BrokerStringFlag(std::string config::BrokerSettings::*member) {
  return [member](std::string_view, std::string_view raw, config::DaemonConfig& config,
                  std::string&) {
    config.broker.*member = std::string(raw);
    return true;
  };
}

FlagHandler IdentityStringFlag(std::string config::SensorIdentity::*member) {
  return [member](std::string_view, std::string_view raw, config::DaemonConfig& config,
                  std::string&) {
    config.identity.*member = std::string(raw);
    return true;
  };
}

const std::map<std::string, FlagHandler, std::less<>>& FlagHandlers() {
  static const std::map<std::string, FlagHandler, std::less<>> handlers = {
      {"--mqtt-host", BrokerStringFlag(&config::BrokerSettings::host)},
      {"--mqtt-port",
       [](std::string_view flag, std::string_view raw, config::DaemonConfig& config,
          std::string& error) {
         std::uint64_t port = 0;
         if (!ParseUnsignedFlag(flag, raw, std::numeric_limits<std::uint16_t>::max(), port,
                                error)) {
           return false;
         }
         config.broker.port = static_cast<std::uint32_t>(port);
         return true;
       }},
      {"--mqtt-client-id", BrokerStringFlag(&config::BrokerSettings::client_id)},
      {"--mqtt-username", BrokerStringFlag(&config::BrokerSettings::username)},
      {"--mqtt-password", BrokerStringFlag(&config::BrokerSettings::password)},
      {"--keep-alive",
       [](std::string_view flag, std::string_view raw, config::DaemonConfig& config,
          std::string& error) {
         std::uint64_t seconds = 0;
         if (!ParseUnsignedFlag(flag, raw, config::kMaxKeepAliveSeconds, seconds, error)) {
           return false;
         }
         config.broker.keep_alive = std::chrono::seconds(static_cast<std::int64_t>(seconds));
         return true;
       }},
      {"--outbound-throttle-ms",
       [](std::string_view flag, std::string_view raw, config::DaemonConfig& config,
          std::string& error) {
         return ParseDurationFlag(flag, raw, config.broker.outbound_throttle, error);
       }},
      {"--outbound-capacity",
       [](std::string_view flag, std::string_view raw, config::DaemonConfig& config,
          std::string& error) {
         constexpr std::uint64_t kMaxCapacity = 65535U;
         std::uint64_t capacity = 0;
         if (!ParseUnsignedFlag(flag, raw, kMaxCapacity, capacity, error)) {
           return false;
         }
         config.broker.outbound_capacity = static_cast<std::uint32_t>(capacity);
         return true;
       }},
      {"--reconnect-delay-ms",
       [](std::string_view flag, std::string_view raw, config::DaemonConfig& config,
          std::string& error) {
         return ParseDurationFlag(flag, raw, config.broker.reconnect_delay, error);
       }},
      {"--debounce-ms",
       [](std::string_view flag, std::string_view raw, config::DaemonConfig& config,
          std::string& error) {
         return ParseDurationFlag(flag, raw, config.debounce_window, error);
       }},
      {"--idle-tick-ms",
       [](std::string_view flag, std::string_view raw, config::DaemonConfig& config,
          std::string& error) {
         return ParseDurationFlag(flag, raw, config.idle_tick, error);
       }},
      {"--poll-interval-ms",
       [](std::string_view flag, std::string_view raw, config::DaemonConfig& config,
          std::string& error) {
         return ParseDurationFlag(flag, raw, config.poll_interval, error);
       }},
      {"--device-glob", StringFlag(&config::DaemonConfig::device_glob)},
      {"--detector",
       [](std::string_view, std::string_view raw, config::DaemonConfig& config,
          std::string& error) { return config::ParseDetectorMode(raw, config.detector, error); }},
      {"--discovery-prefix", IdentityStringFlag(&config::SensorIdentity::discovery_prefix)},
      {"--node-id", IdentityStringFlag(&config::SensorIdentity::node_id)},
      {"--log-level",
       [](std::string_view, std::string_view raw, config::DaemonConfig& config,
          std::string& error) {
         return core::logging::ParseLogLevel(raw, config.log_level, error);
       }},
  };
  return handlers;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "camsnitch " << kVersion << '\n';
  return kExitSuccess;
}

int ReportInvalidConfig(const std::vector<config::ConfigIssue>& issues) {
  std::cerr << "error: invalid configuration\n";
  for (const auto& issue : issues) {
    std::cerr << "  - " << issue.field << ": " << issue.message << '\n';
  }
  return kExitConfigInvalid;
}

int ExecuteRun(const RunOptions& options) {
  config::DaemonConfig daemon_config;
  std::string error;

  if (!options.config_path.empty() &&
      !config::LoadConfigFile(options.config_path, daemon_config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (!ApplyFlagValues(options, daemon_config, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  std::vector<config::ConfigIssue> issues;
  if (!config::ValidateConfig(daemon_config, issues)) {
    return ReportInvalidConfig(issues);
  }

  core::logging::Logger logger(daemon_config.log_level);
  logger.SetNodeId(daemon_config.identity.node_id);

  const broker::SensorTopics topics = broker::BuildSensorTopics(daemon_config.identity);
  logger.Info("camsnitch starting",
              {{"version", kVersion},
               {"detector", config::ToString(daemon_config.detector)},
               {"device_glob", daemon_config.device_glob},
               {"mqtt_host", daemon_config.broker.host},
               {"mqtt_port", std::to_string(daemon_config.broker.port)},
               {"state_topic", topics.state_topic},
               {"config_topic", topics.config_topic}});

  std::unique_ptr<detect::IStateDetector> detector =
      detect::CreateStateDetector(daemon_config, logger, error);
  if (detector == nullptr) {
    logger.Error("detector setup failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return core::errors::ToInt(core::errors::ExitCode::kDetectorInitFailed);
  }

  const std::string discovery_json = broker::ToJson(
      broker::BuildDiscoveryDescriptor(daemon_config.identity, kVersion));
  auto publisher = std::make_unique<broker::MqttBrokerPublisher>(daemon_config.broker, topics,
                                                                 discovery_json);

  loop::CoordinatorOptions coordinator_options;
  coordinator_options.debounce_window = daemon_config.debounce_window;
  coordinator_options.idle_tick = daemon_config.idle_tick;
  loop::Coordinator coordinator(std::move(detector), std::move(publisher), coordinator_options,
                                logger);

  const core::errors::ExitCode start_code = coordinator.Start(error);
  if (start_code != core::errors::ExitCode::kSuccess) {
    logger.Error("startup failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return core::errors::ToInt(start_code);
  }

  if (!coordinator.Run(error)) {
    logger.Error("event loop stopped", {{"error", error}});
    std::cerr << "error: " << error << '\n';
  }
  return kExitFailure;
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteRun(options);
}

} // namespace

bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  const auto& handlers = FlagHandlers();
  bool has_config = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    const bool takes_value = token == "--config" || handlers.find(token) != handlers.end();
    if (!takes_value) {
      if (!token.empty() && token.front() == '-') {
        error = "unknown option: " + std::string(token);
      } else {
        error = "unexpected argument: " + std::string(token);
      }
      return false;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }

    const std::string_view value = args[i + 1];
    ++i;
    if (token == "--config") {
      if (has_config) {
        error = "--config may only be given once";
        return false;
      }
      if (value.empty()) {
        error = "config path cannot be empty";
        return false;
      }
      options.config_path = std::string(value);
      has_config = true;
      continue;
    }
    options.flag_values.emplace_back(std::string(token), std::string(value));
  }
  return true;
}

bool ApplyFlagValues(const RunOptions& options, config::DaemonConfig& config, std::string& error) {
  const auto& handlers = FlagHandlers();
  for (const auto& [flag, value] : options.flag_values) {
    const auto it = handlers.find(flag);
    if (it == handlers.end()) {
      error = "unknown option: " + flag;
      return false;
    }
    if (!it->second(flag, value, config, error)) {
      return false;
    }
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    return CommandRun({});
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "run") {
    return CommandRun(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  // Flags without a subcommand run the daemon.
  if (!command.empty() && command.front() == '-') {
    return CommandRun(std::vector<std::string_view>(argv + 1, argv + argc));
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace camsnitch::cli
