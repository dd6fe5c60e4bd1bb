#pragma once

#include "config/daemon_config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace camsnitch::broker {

// Topics owned by one sensor.
struct SensorTopics {
  std::string config_topic;
  std::string state_topic;
};

// Home Assistant MQTT discovery document for the camera binary sensor.
//
// Serialized shape (key order fixed):
//   {"name":..., "device":{"identifiers":[...], "name":..., "sw_version":...,
//    "model":..., "manufacturer":...}, "state_topic":..., "device_class":...,
//    "payload_on":"ON", "payload_off":"OFF"}
struct DiscoveryDescriptor {
  std::string name;
  std::vector<std::string> identifiers;
  std::string device_name;
  std::string sw_version;
  std::string model;
  std::string manufacturer;
  std::string state_topic;
  std::string device_class;
  std::string payload_on;
  std::string payload_off;
};

// `<prefix>/binary_sensor/<node_id>/config` and `.../state`.
SensorTopics BuildSensorTopics(const config::SensorIdentity& identity);

DiscoveryDescriptor BuildDiscoveryDescriptor(const config::SensorIdentity& identity,
                                             std::string_view sw_version);

std::string ToJson(const DiscoveryDescriptor& descriptor);

} // namespace camsnitch::broker
