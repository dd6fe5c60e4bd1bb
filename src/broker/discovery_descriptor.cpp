#include "broker/discovery_descriptor.hpp"

#include "core/json_utils.hpp"
#include "detect/camera_state.hpp"

#include <sstream>

namespace camsnitch::broker {

namespace {

constexpr std::string_view kComponent = "binary_sensor";

} // namespace

SensorTopics BuildSensorTopics(const config::SensorIdentity& identity) {
  const std::string base = identity.discovery_prefix + "/" + std::string(kComponent) + "/" +
                           identity.node_id;
  SensorTopics topics;
  topics.config_topic = base + "/config";
  topics.state_topic = base + "/state";
  return topics;
}

DiscoveryDescriptor BuildDiscoveryDescriptor(const config::SensorIdentity& identity,
                                             std::string_view sw_version) {
  DiscoveryDescriptor descriptor;
  descriptor.name = identity.sensor_name;
  descriptor.identifiers.push_back(identity.node_id);
  descriptor.device_name = identity.device_name;
  descriptor.sw_version = std::string(sw_version);
  descriptor.model = identity.device_model;
  descriptor.manufacturer = identity.device_manufacturer;
  descriptor.state_topic = BuildSensorTopics(identity).state_topic;
  descriptor.device_class = identity.device_class;
  descriptor.payload_on = std::string(detect::ToPayload(detect::CameraState::kOn));
  descriptor.payload_off = std::string(detect::ToPayload(detect::CameraState::kOff));
  return descriptor;
}

std::string ToJson(const DiscoveryDescriptor& descriptor) {
  using core::QuoteJson;

  std::ostringstream out;
  out << "{\"name\":" << QuoteJson(descriptor.name);

  out << ",\"device\":{\"identifiers\":[";
  for (std::size_t i = 0; i < descriptor.identifiers.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << QuoteJson(descriptor.identifiers[i]);
  }
  out << "],\"name\":" << QuoteJson(descriptor.device_name)
      << ",\"sw_version\":" << QuoteJson(descriptor.sw_version)
      << ",\"model\":" << QuoteJson(descriptor.model)
      << ",\"manufacturer\":" << QuoteJson(descriptor.manufacturer) << '}';

  out << ",\"state_topic\":" << QuoteJson(descriptor.state_topic)
      << ",\"device_class\":" << QuoteJson(descriptor.device_class)
      << ",\"payload_on\":" << QuoteJson(descriptor.payload_on)
      << ",\"payload_off\":" << QuoteJson(descriptor.payload_off) << '}';
  return out.str();
}

} // namespace camsnitch::broker
