#include "broker/discovery_descriptor.hpp"
#include "core/json_dom.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using camsnitch::core::json::Value;

namespace {

Value ParseOrFail(const std::string& text) {
  Value root;
  std::string error;
  INFO(text);
  REQUIRE(camsnitch::core::json::Parse(text, root, error));
  REQUIRE(error.empty());
  return root;
}

std::string StringAt(const Value& object, const std::string& key) {
  const Value* member = object.Find(key);
  REQUIRE(member != nullptr);
  REQUIRE(member->IsString());
  return member->string_value;
}

} // namespace

TEST_CASE("default identity maps to the office camera topics", "[broker][discovery]") {
  const camsnitch::config::SensorIdentity identity;
  const auto topics = camsnitch::broker::BuildSensorTopics(identity);

  REQUIRE(topics.state_topic == "homeassistant/binary_sensor/officecamera/state");
  REQUIRE(topics.config_topic == "homeassistant/binary_sensor/officecamera/config");
}

TEST_CASE("discovery descriptor carries every field", "[broker][discovery][json]") {
  const camsnitch::config::SensorIdentity identity;
  const auto descriptor = camsnitch::broker::BuildDiscoveryDescriptor(identity, "0.1");
  const Value root = ParseOrFail(camsnitch::broker::ToJson(descriptor));

  REQUIRE(root.IsObject());
  REQUIRE(root.object_value.size() == 6U);
  REQUIRE(StringAt(root, "name") == "OfficeCamera");
  REQUIRE(StringAt(root, "state_topic") == "homeassistant/binary_sensor/officecamera/state");
  REQUIRE(StringAt(root, "device_class") == "connectivity");
  REQUIRE(StringAt(root, "payload_on") == "ON");
  REQUIRE(StringAt(root, "payload_off") == "OFF");

  const Value* device = root.Find("device");
  REQUIRE(device != nullptr);
  REQUIRE(device->IsObject());
  REQUIRE(device->object_value.size() == 5U);
  REQUIRE(StringAt(*device, "name") == "Office Camera");
  REQUIRE(StringAt(*device, "sw_version") == "0.1");
  REQUIRE(StringAt(*device, "model") == "Custom Binary Sensor");
  REQUIRE(StringAt(*device, "manufacturer") == "camsnitch");

  const Value* identifiers = device->Find("identifiers");
  REQUIRE(identifiers != nullptr);
  REQUIRE(identifiers->IsArray());
  REQUIRE(identifiers->array_value.size() == 1U);
  REQUIRE(identifiers->array_value.front().string_value == "officecamera");
}

TEST_CASE("descriptor payloads match the state payloads", "[broker][discovery]") {
  const auto descriptor =
      camsnitch::broker::BuildDiscoveryDescriptor(camsnitch::config::SensorIdentity{}, "x");
  REQUIRE(descriptor.payload_on ==
          camsnitch::detect::ToPayload(camsnitch::detect::CameraState::kOn));
  REQUIRE(descriptor.payload_off ==
          camsnitch::detect::ToPayload(camsnitch::detect::CameraState::kOff));
}

TEST_CASE("descriptor escapes configured text", "[broker][discovery][json]") {
  camsnitch::config::SensorIdentity identity;
  identity.sensor_name = "Desk \"Cam\"\\1";
  identity.device_name = "line\nbreak";
  identity.node_id = "desk_cam-2";

  const std::string json =
      camsnitch::broker::ToJson(camsnitch::broker::BuildDiscoveryDescriptor(identity, "0.1.0"));
  const Value root = ParseOrFail(json);

  REQUIRE(StringAt(root, "name") == "Desk \"Cam\"\\1");
  REQUIRE(StringAt(*root.Find("device"), "name") == "line\nbreak");
  REQUIRE(StringAt(root, "state_topic") == "homeassistant/binary_sensor/desk_cam-2/state");
  REQUIRE(json.find('\n') == std::string::npos);
}

TEST_CASE("descriptor keeps a fixed key order", "[broker][discovery][json]") {
  const std::string json = camsnitch::broker::ToJson(
      camsnitch::broker::BuildDiscoveryDescriptor(camsnitch::config::SensorIdentity{}, "0.1"));
  REQUIRE(json ==
          R"({"name":"OfficeCamera","device":{"identifiers":["officecamera"],)"
          R"("name":"Office Camera","sw_version":"0.1","model":"Custom Binary Sensor",)"
          R"("manufacturer":"camsnitch"},)"
          R"("state_topic":"homeassistant/binary_sensor/officecamera/state",)"
          R"("device_class":"connectivity","payload_on":"ON","payload_off":"OFF"})");
}
