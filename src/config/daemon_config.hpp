#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace camsnitch::config {

enum class DetectorMode {
  kWatch,
  kPoll,
};

// MQTT CONNECT carries the keep-alive as a 16-bit count of seconds.
constexpr std::uint32_t kMaxKeepAliveSeconds = 65535U;

const char* ToString(DetectorMode mode);
bool ParseDetectorMode(std::string_view raw, DetectorMode& mode, std::string& error);

// Broker connection knobs handed to the publisher.
struct BrokerSettings {
  std::string host = "localhost";
  std::uint32_t port = 1883;
  std::string client_id = "camera-snitch";
  std::string username;
  std::string password;
  std::chrono::seconds keep_alive{30};
  // Minimum spacing between two outgoing publishes (0 disables).
  std::chrono::milliseconds outbound_throttle{0};
  // Messages Paho may buffer while the connection is down.
  std::uint32_t outbound_capacity = 10;
  // Delay before re-issuing a connect that failed.
  std::chrono::milliseconds reconnect_delay{5000};
};

// Identity published through the discovery descriptor and used to build
// topics: `<discovery_prefix>/binary_sensor/<node_id>/{config,state}`.
struct SensorIdentity {
  std::string discovery_prefix = "homeassistant";
  std::string node_id = "officecamera";
  std::string sensor_name = "OfficeCamera";
  std::string device_name = "Office Camera";
  std::string device_model = "Custom Binary Sensor";
  std::string device_manufacturer = "camsnitch";
  std::string device_class = "connectivity";
};

// Full daemon configuration: defaults below, optionally overlaid by a JSON
// config file, then by command-line flags.
struct DaemonConfig {
  BrokerSettings broker;
  SensorIdentity identity;
  std::chrono::milliseconds debounce_window{300};
  std::chrono::milliseconds idle_tick{1000};
  std::chrono::milliseconds poll_interval{5000};
  std::string device_glob = "/dev/video*";
  DetectorMode detector = DetectorMode::kWatch;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// One validation finding, keyed by config-file field name.
struct ConfigIssue {
  std::string field;
  std::string message;
};

// Overlays keys from a JSON object onto `config`. Unknown keys and values of
// the wrong type are errors; absent keys keep their current value.
bool ApplyConfigJson(std::string_view json_text, DaemonConfig& config, std::string& error);

// Reads `path` and applies it with `ApplyConfigJson`.
bool LoadConfigFile(const std::filesystem::path& path, DaemonConfig& config, std::string& error);

// Checks cross-field and range constraints after all overlays. Returns
// `true` when `issues` is empty.
bool ValidateConfig(const DaemonConfig& config, std::vector<ConfigIssue>& issues);

// Node ids and discovery prefixes become MQTT topic levels.
bool IsValidTopicToken(std::string_view token);

} // namespace camsnitch::config
