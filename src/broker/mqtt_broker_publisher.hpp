#pragma once

#include "broker/broker_event_queue.hpp"
#include "broker/broker_publisher.hpp"
#include "broker/connect_retry.hpp"
#include "broker/discovery_descriptor.hpp"
#include "config/daemon_config.hpp"

#include <MQTTAsync.h>

#include <chrono>
#include <optional>
#include <string>

namespace camsnitch::broker {

// `IBrokerPublisher` over Eclipse Paho `MQTTAsync`.
//
// Paho owns the socket, keep-alive and reconnects after a connection that
// once succeeded. Its callbacks run on Paho's thread and only push
// `BrokerEvent`s into a `BrokerEventQueue`; connection bookkeeping is updated
// when the loop thread pops those events.
//
// Publishes issued while offline (including before the first connect
// completes) are buffered by Paho up to `outbound_capacity`, dropping the
// oldest when full so the latest state always wins.
class MqttBrokerPublisher final : public IBrokerPublisher {
public:
  MqttBrokerPublisher(config::BrokerSettings settings, SensorTopics topics,
                      std::string discovery_json);
  ~MqttBrokerPublisher() override;

  MqttBrokerPublisher(const MqttBrokerPublisher&) = delete;
  MqttBrokerPublisher& operator=(const MqttBrokerPublisher&) = delete;

  bool Connect(std::string& error) override;
  bool PublishDiscovery(std::string& error) override;
  bool PublishState(detect::CameraState state, std::string& error) override;
  int EventHandle() const override;
  bool NextEvent(BrokerEvent& event) override;
  bool Maintain(std::chrono::steady_clock::time_point now, std::string& error) override;

  // Connection bookkeeping as of the last popped event.
  const ConnectRetryState& RetryState() const { return retry_; }

  // `tcp://host:port`, bracketing IPv6 literals. Empty when `settings` cannot
  // form a URI; `error` then says why.
  static std::string BuildServerUri(const config::BrokerSettings& settings, std::string& error);

private:
  bool StartConnect(std::string& error);
  bool Publish(const std::string& topic, const std::string& payload, std::string& error);
  void ApplyThrottle();

  static void OnConnected(void* context, char* cause);
  static void OnConnectFailure(void* context, MQTTAsync_failureData* response);
  static void OnConnectionLost(void* context, char* cause);
  static int OnMessageArrived(void* context, char* topic_name, int topic_len,
                              MQTTAsync_message* message);
  static void OnPublishSuccess(void* context, MQTTAsync_successData* response);
  static void OnPublishFailure(void* context, MQTTAsync_failureData* response);

  config::BrokerSettings settings_;
  SensorTopics topics_;
  std::string discovery_json_;
  std::string server_uri_;

  MQTTAsync client_ = nullptr;
  BrokerEventQueue events_;

  // Loop-thread bookkeeping, updated from popped events.
  ConnectRetryState retry_;
  std::optional<std::chrono::steady_clock::time_point> last_publish_at_;
};

} // namespace camsnitch::broker
