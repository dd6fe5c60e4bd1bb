#include "broker/mqtt_broker_publisher.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using camsnitch::broker::MqttBrokerPublisher;
using camsnitch::config::BrokerSettings;

TEST_CASE("server URI is built from host and port", "[broker][mqtt]") {
  BrokerSettings settings;
  std::string error;

  REQUIRE(MqttBrokerPublisher::BuildServerUri(settings, error) == "tcp://localhost:1883");
  REQUIRE(error.empty());

  settings.host = "10.0.0.5";
  settings.port = 8883;
  REQUIRE(MqttBrokerPublisher::BuildServerUri(settings, error) == "tcp://10.0.0.5:8883");

  settings.host = "fd00::1";
  REQUIRE(MqttBrokerPublisher::BuildServerUri(settings, error) == "tcp://[fd00::1]:8883");
}

TEST_CASE("server URI rejects unusable settings", "[broker][mqtt]") {
  BrokerSettings settings;
  std::string error;

  settings.host.clear();
  REQUIRE(MqttBrokerPublisher::BuildServerUri(settings, error).empty());
  REQUIRE(error == "broker host cannot be empty");

  settings.host = "broker.lan";
  settings.port = 0;
  REQUIRE(MqttBrokerPublisher::BuildServerUri(settings, error).empty());
  REQUIRE(error.find("port") != std::string::npos);

  settings.port = 1883;
  settings.host = "broker.lan/extra";
  REQUIRE(MqttBrokerPublisher::BuildServerUri(settings, error).empty());
  REQUIRE(error.find("invalid character") != std::string::npos);
}

TEST_CASE("publisher reports misuse before connect", "[broker][mqtt]") {
  MqttBrokerPublisher publisher(BrokerSettings{}, camsnitch::broker::SensorTopics{"c", "s"}, "{}");
  std::string error;

  REQUIRE(publisher.EventHandle() < 0);
  REQUIRE_FALSE(publisher.PublishState(camsnitch::detect::CameraState::kOn, error));
  REQUIRE(error == "broker client not connected");

  camsnitch::broker::BrokerEvent event;
  REQUIRE_FALSE(publisher.NextEvent(event));
  REQUIRE(publisher.Maintain(std::chrono::steady_clock::now(), error));
}
