#include "config/daemon_config.hpp"

#include "core/json_dom.hpp"

#include <chrono>
#include <cmath>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <utility>

namespace camsnitch::config {

namespace {

using core::json::Value;

bool ReadString(const std::string& key, const Value& value, std::string& target,
                std::string& error) {
  if (!value.IsString()) {
    error = "config key '" + key + "' must be a string, got " + core::json::TypeName(value.type);
    return false;
  }
  target = value.string_value;
  return true;
}

bool ReadUnsigned(const std::string& key, const Value& value, std::uint64_t max_value,
                  std::uint64_t& target, std::string& error) {
  if (!value.IsNumber()) {
    error = "config key '" + key + "' must be a number, got " + core::json::TypeName(value.type);
    return false;
  }
  const double raw = value.number_value;
  if (!std::isfinite(raw) || raw < 0.0 || std::floor(raw) != raw ||
      raw > static_cast<double>(max_value)) {
    error = "config key '" + key + "' must be a whole number in range [0," +
            std::to_string(max_value) + "]";
    return false;
  }
  target = static_cast<std::uint64_t>(raw);
  return true;
}

template <typename Duration>
bool ReadDuration(const std::string& key, const Value& value, Duration& target,
                  std::string& error) {
  std::uint64_t count = 0;
  // One day is far beyond any sensible knob and keeps the cast exact.
  constexpr std::uint64_t kMaxMillis = 86'400'000ULL;
  if (!ReadUnsigned(key, value, kMaxMillis, count, error)) {
    return false;
  }
  target = Duration(static_cast<typename Duration::rep>(count));
  return true;
}

using KeyHandler = std::function<bool(const std::string&, const Value&, DaemonConfig&,
                                      std::string&)>;

const std::map<std::string, KeyHandler>& KeyHandlers() {
  static const std::map<std::string, KeyHandler> handlers = {
      {"mqtt_host",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.broker.host, e);
       }},
      {"mqtt_port",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         std::uint64_t port = 0;
         if (!ReadUnsigned(key, v, 65535U, port, e)) {
           return false;
         }
         c.broker.port = static_cast<std::uint32_t>(port);
         return true;
       }},
      {"mqtt_client_id",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.broker.client_id, e);
       }},
      {"mqtt_username",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.broker.username, e);
       }},
      {"mqtt_password",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.broker.password, e);
       }},
      {"keep_alive_s",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         std::uint64_t seconds = 0;
         if (!ReadUnsigned(key, v, kMaxKeepAliveSeconds, seconds, e)) {
           return false;
         }
         c.broker.keep_alive = std::chrono::seconds(static_cast<std::int64_t>(seconds));
         return true;
       }},
      {"outbound_throttle_ms",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadDuration(key, v, c.broker.outbound_throttle, e);
       }},
      {"outbound_capacity",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         std::uint64_t capacity = 0;
         if (!ReadUnsigned(key, v, 65535U, capacity, e)) {
           return false;
         }
         c.broker.outbound_capacity = static_cast<std::uint32_t>(capacity);
         return true;
       }},
      {"reconnect_delay_ms",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadDuration(key, v, c.broker.reconnect_delay, e);
       }},
      {"debounce_window_ms",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadDuration(key, v, c.debounce_window, e);
       }},
      {"idle_tick_ms",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadDuration(key, v, c.idle_tick, e);
       }},
      {"poll_interval_ms",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadDuration(key, v, c.poll_interval, e);
       }},
      {"device_glob",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.device_glob, e);
       }},
      {"detector",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         std::string raw;
         return ReadString(key, v, raw, e) && ParseDetectorMode(raw, c.detector, e);
       }},
      {"discovery_prefix",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.identity.discovery_prefix, e);
       }},
      {"node_id",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.identity.node_id, e);
       }},
      {"sensor_name",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.identity.sensor_name, e);
       }},
      {"device_name",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.identity.device_name, e);
       }},
      {"device_model",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.identity.device_model, e);
       }},
      {"device_manufacturer",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.identity.device_manufacturer, e);
       }},
      {"device_class",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         return ReadString(key, v, c.identity.device_class, e);
       }},
      {"log_level",
       [](const std::string& key, const Value& v, DaemonConfig& c, std::string& e) {
         std::string raw;
         return ReadString(key, v, raw, e) && core::logging::ParseLogLevel(raw, c.log_level, e);
       }},
  };
  return handlers;
}

bool IsValidDiscoveryPrefix(std::string_view prefix) {
  if (prefix.empty() || prefix.front() == '/' || prefix.back() == '/') {
    return false;
  }
  for (const char c : prefix) {
    if (c == '+' || c == '#' || static_cast<unsigned char>(c) < 0x20U) {
      return false;
    }
  }
  return prefix.find("//") == std::string_view::npos;
}

} // namespace

const char* ToString(const DetectorMode mode) {
  switch (mode) {
  case DetectorMode::kWatch:
    return "watch";
  case DetectorMode::kPoll:
    return "poll";
  }
  return "watch";
}

bool ParseDetectorMode(std::string_view raw, DetectorMode& mode, std::string& error) {
  if (raw == "watch") {
    mode = DetectorMode::kWatch;
    return true;
  }
  if (raw == "poll") {
    mode = DetectorMode::kPoll;
    return true;
  }
  error = "invalid detector '" + std::string(raw) + "' (expected watch|poll)";
  return false;
}

bool ApplyConfigJson(std::string_view json_text, DaemonConfig& config, std::string& error) {
  error.clear();

  Value root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    error = "config document must be a JSON object";
    return false;
  }

  // Apply onto a copy so a bad key leaves the caller's config untouched.
  DaemonConfig updated = config;
  const auto& handlers = KeyHandlers();
  for (const auto& [key, value] : root.object_value) {
    const auto handler = handlers.find(key);
    if (handler == handlers.end()) {
      error = "unknown config key '" + key + "'";
      return false;
    }
    if (!handler->second(key, value, updated, error)) {
      return false;
    }
  }

  config = std::move(updated);
  return true;
}

bool LoadConfigFile(const std::filesystem::path& path, DaemonConfig& config, std::string& error) {
  error.clear();

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open config file: " + path.string();
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());
  if (text.empty()) {
    error = "config file is empty: " + path.string();
    return false;
  }

  if (!ApplyConfigJson(text, config, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

bool IsValidTopicToken(std::string_view token) {
  if (token.empty()) {
    return false;
  }
  for (const char c : token) {
    const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                         (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!allowed) {
      return false;
    }
  }
  return true;
}

bool ValidateConfig(const DaemonConfig& config, std::vector<ConfigIssue>& issues) {
  issues.clear();

  if (config.broker.host.empty()) {
    issues.push_back({"mqtt_host", "broker host cannot be empty"});
  }
  if (config.broker.port == 0U || config.broker.port > 65535U) {
    issues.push_back({"mqtt_port", "broker port must be in range [1,65535]"});
  }
  if (config.broker.client_id.empty()) {
    issues.push_back({"mqtt_client_id", "client id cannot be empty"});
  }
  if (!config.broker.password.empty() && config.broker.username.empty()) {
    issues.push_back({"mqtt_password", "password requires mqtt_username"});
  }
  if (config.broker.keep_alive.count() <= 0) {
    issues.push_back({"keep_alive_s", "keep-alive must be positive"});
  } else if (config.broker.keep_alive.count() > static_cast<std::int64_t>(kMaxKeepAliveSeconds)) {
    issues.push_back({"keep_alive_s", "keep-alive must be at most " +
                                          std::to_string(kMaxKeepAliveSeconds) + " seconds"});
  }
  if (config.broker.outbound_capacity == 0U) {
    issues.push_back({"outbound_capacity", "outbound capacity must be positive"});
  }
  if (config.broker.reconnect_delay.count() <= 0) {
    issues.push_back({"reconnect_delay_ms", "reconnect delay must be positive"});
  }
  if (config.idle_tick.count() <= 0) {
    issues.push_back({"idle_tick_ms", "idle tick must be positive"});
  }
  if (config.detector == DetectorMode::kPoll && config.poll_interval.count() <= 0) {
    issues.push_back({"poll_interval_ms", "poll interval must be positive"});
  }
  if (config.device_glob.empty()) {
    issues.push_back({"device_glob", "device glob cannot be empty"});
  }
  if (!IsValidDiscoveryPrefix(config.identity.discovery_prefix)) {
    issues.push_back({"discovery_prefix",
                      "discovery prefix must be non-empty topic levels without wildcards"});
  }
  if (!IsValidTopicToken(config.identity.node_id)) {
    issues.push_back({"node_id", "node id may only contain [A-Za-z0-9_-]"});
  }
  if (config.identity.sensor_name.empty()) {
    issues.push_back({"sensor_name", "sensor name cannot be empty"});
  }
  if (config.identity.device_class.empty()) {
    issues.push_back({"device_class", "device class cannot be empty"});
  }

  return issues.empty();
}

} // namespace camsnitch::config
