#include "broker/mqtt_broker_publisher.hpp"

#include <thread>
#include <utility>

namespace camsnitch::broker {

namespace {

constexpr int kQosAtLeastOnce = 1;
constexpr int kMinRetryIntervalSeconds = 1;
constexpr int kMaxRetryIntervalSeconds = 60;

std::string DescribeFailure(const MQTTAsync_failureData* response, std::string_view fallback) {
  if (response == nullptr) {
    return std::string(fallback);
  }
  std::string text = response->message != nullptr ? std::string(response->message)
                                                  : std::string(fallback);
  text += " (code " + std::to_string(response->code) + ")";
  return text;
}

std::string DescribeReturnCode(const int rc) {
  const char* text = MQTTAsync_strerror(rc);
  if (text == nullptr) {
    return "paho error " + std::to_string(rc);
  }
  return std::string(text) + " (" + std::to_string(rc) + ")";
}

} // namespace

MqttBrokerPublisher::MqttBrokerPublisher(config::BrokerSettings settings, SensorTopics topics,
                                         std::string discovery_json)
    : settings_(std::move(settings)),
      topics_(std::move(topics)),
      discovery_json_(std::move(discovery_json)) {}

MqttBrokerPublisher::~MqttBrokerPublisher() {
  if (client_ == nullptr) {
    return;
  }
  if (MQTTAsync_isConnected(client_) != 0) {
    MQTTAsync_disconnectOptions options = MQTTAsync_disconnectOptions_initializer;
    options.timeout = 1000;
    MQTTAsync_disconnect(client_, &options);
  }
  MQTTAsync_destroy(&client_);
}

std::string MqttBrokerPublisher::BuildServerUri(const config::BrokerSettings& settings,
                                                std::string& error) {
  error.clear();
  if (settings.host.empty()) {
    error = "broker host cannot be empty";
    return "";
  }
  if (settings.port == 0U || settings.port > 65535U) {
    error = "broker port must be in range [1,65535]";
    return "";
  }
  for (const char c : settings.host) {
    if (c == '/' || c == ' ' || c == '[' || c == ']' || static_cast<unsigned char>(c) < 0x20U) {
      error = "broker host contains invalid character: " + settings.host;
      return "";
    }
  }

  const bool ipv6_literal = settings.host.find(':') != std::string::npos;
  const std::string host = ipv6_literal ? "[" + settings.host + "]" : settings.host;
  return "tcp://" + host + ":" + std::to_string(settings.port);
}

bool MqttBrokerPublisher::Connect(std::string& error) {
  error.clear();
  if (client_ != nullptr) {
    error = "broker client already created";
    return false;
  }

  server_uri_ = BuildServerUri(settings_, error);
  if (server_uri_.empty()) {
    return false;
  }
  if (settings_.client_id.empty()) {
    error = "broker client id cannot be empty";
    return false;
  }

  if (!events_.Open(error)) {
    return false;
  }

  MQTTAsync_createOptions create_options = MQTTAsync_createOptions_initializer;
  create_options.sendWhileDisconnected = 1;
  create_options.allowDisconnectedSendAtAnyTime = 1;
  create_options.deleteOldestMessages = 1;
  create_options.maxBufferedMessages = static_cast<int>(settings_.outbound_capacity);

  int rc = MQTTAsync_createWithOptions(&client_, server_uri_.c_str(), settings_.client_id.c_str(),
                                       MQTTCLIENT_PERSISTENCE_NONE, nullptr, &create_options);
  if (rc != MQTTASYNC_SUCCESS) {
    client_ = nullptr;
    error = "failed to create MQTT client for " + server_uri_ + ": " + DescribeReturnCode(rc);
    return false;
  }

  rc = MQTTAsync_setCallbacks(client_, this, OnConnectionLost, OnMessageArrived, nullptr);
  if (rc != MQTTASYNC_SUCCESS) {
    error = "failed to register MQTT callbacks: " + DescribeReturnCode(rc);
    MQTTAsync_destroy(&client_);
    client_ = nullptr;
    return false;
  }

  rc = MQTTAsync_setConnected(client_, this, OnConnected);
  if (rc != MQTTASYNC_SUCCESS) {
    error = "failed to register MQTT connected callback: " + DescribeReturnCode(rc);
    MQTTAsync_destroy(&client_);
    client_ = nullptr;
    return false;
  }

  if (!StartConnect(error)) {
    MQTTAsync_destroy(&client_);
    client_ = nullptr;
    return false;
  }
  return true;
}

bool MqttBrokerPublisher::StartConnect(std::string& error) {
  MQTTAsync_connectOptions options = MQTTAsync_connectOptions_initializer;
  options.keepAliveInterval = static_cast<int>(settings_.keep_alive.count());
  options.cleansession = 1;
  options.automaticReconnect = 1;
  options.minRetryInterval = kMinRetryIntervalSeconds;
  options.maxRetryInterval = kMaxRetryIntervalSeconds;
  options.onFailure = OnConnectFailure;
  options.context = this;
  if (!settings_.username.empty()) {
    options.username = settings_.username.c_str();
  }
  if (!settings_.password.empty()) {
    options.password = settings_.password.c_str();
  }

  const int rc = MQTTAsync_connect(client_, &options);
  if (rc != MQTTASYNC_SUCCESS) {
    error = "failed to start MQTT connect to " + server_uri_ + ": " + DescribeReturnCode(rc);
    return false;
  }
  RecordConnectStarted(retry_);
  return true;
}

bool MqttBrokerPublisher::PublishDiscovery(std::string& error) {
  return Publish(topics_.config_topic, discovery_json_, error);
}

bool MqttBrokerPublisher::PublishState(const detect::CameraState state, std::string& error) {
  return Publish(topics_.state_topic, std::string(detect::ToPayload(state)), error);
}

int MqttBrokerPublisher::EventHandle() const {
  return events_.Handle();
}

bool MqttBrokerPublisher::NextEvent(BrokerEvent& event) {
  if (!events_.Pop(event)) {
    return false;
  }

  RecordBrokerEvent(retry_, event.type, std::chrono::steady_clock::now());
  return true;
}

bool MqttBrokerPublisher::Maintain(const std::chrono::steady_clock::time_point now,
                                   std::string& error) {
  error.clear();
  if (client_ == nullptr || !ShouldReissueConnect(retry_, now, settings_.reconnect_delay)) {
    return true;
  }

  if (!StartConnect(error)) {
    RecordReissueFailed(retry_, now);
    return false;
  }
  return true;
}

bool MqttBrokerPublisher::Publish(const std::string& topic, const std::string& payload,
                                  std::string& error) {
  error.clear();
  if (client_ == nullptr) {
    error = "broker client not connected";
    return false;
  }

  ApplyThrottle();

  MQTTAsync_message message = MQTTAsync_message_initializer;
  message.payload = const_cast<char*>(payload.data());
  message.payloadlen = static_cast<int>(payload.size());
  message.qos = kQosAtLeastOnce;
  message.retained = 1;

  MQTTAsync_responseOptions response = MQTTAsync_responseOptions_initializer;
  response.onSuccess = OnPublishSuccess;
  response.onFailure = OnPublishFailure;
  response.context = this;

  const int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &message, &response);
  last_publish_at_ = std::chrono::steady_clock::now();
  if (rc != MQTTASYNC_SUCCESS) {
    error = "publish to " + topic + " failed: " + DescribeReturnCode(rc);
    return false;
  }
  return true;
}

void MqttBrokerPublisher::ApplyThrottle() {
  const auto wait = ComputeThrottleWait(last_publish_at_, std::chrono::steady_clock::now(),
                                        settings_.outbound_throttle);
  if (wait > std::chrono::steady_clock::duration::zero()) {
    std::this_thread::sleep_for(wait);
  }
}

void MqttBrokerPublisher::OnConnected(void* context, char* cause) {
  auto* self = static_cast<MqttBrokerPublisher*>(context);
  BrokerEvent event;
  event.type = BrokerEventType::kConnected;
  event.detail = cause != nullptr ? std::string(cause) : self->server_uri_;
  self->events_.Push(std::move(event));
}

void MqttBrokerPublisher::OnConnectFailure(void* context, MQTTAsync_failureData* response) {
  auto* self = static_cast<MqttBrokerPublisher*>(context);
  BrokerEvent event;
  event.type = BrokerEventType::kConnectFailed;
  event.detail = DescribeFailure(response, "connect failed");
  self->events_.Push(std::move(event));
}

void MqttBrokerPublisher::OnConnectionLost(void* context, char* cause) {
  auto* self = static_cast<MqttBrokerPublisher*>(context);
  BrokerEvent event;
  event.type = BrokerEventType::kConnectionLost;
  event.detail = cause != nullptr ? std::string(cause) : std::string("connection lost");
  self->events_.Push(std::move(event));
}

int MqttBrokerPublisher::OnMessageArrived(void* context, char* topic_name, int topic_len,
                                          MQTTAsync_message* message) {
  auto* self = static_cast<MqttBrokerPublisher*>(context);
  BrokerEvent event;
  event.type = BrokerEventType::kMessageArrived;
  if (topic_name != nullptr) {
    event.topic = topic_len > 0 ? std::string(topic_name, static_cast<std::size_t>(topic_len))
                                : std::string(topic_name);
  }
  if (message != nullptr && message->payload != nullptr && message->payloadlen > 0) {
    event.detail.assign(static_cast<const char*>(message->payload),
                        static_cast<std::size_t>(message->payloadlen));
  }
  self->events_.Push(std::move(event));

  MQTTAsync_freeMessage(&message);
  MQTTAsync_free(topic_name);
  return 1;
}

void MqttBrokerPublisher::OnPublishSuccess(void* context, MQTTAsync_successData* response) {
  auto* self = static_cast<MqttBrokerPublisher*>(context);
  BrokerEvent event;
  event.type = BrokerEventType::kDeliveryAcked;
  if (response != nullptr) {
    event.token = response->token;
    if (response->alt.pub.destinationName != nullptr) {
      event.topic = response->alt.pub.destinationName;
    }
  }
  self->events_.Push(std::move(event));
}

void MqttBrokerPublisher::OnPublishFailure(void* context, MQTTAsync_failureData* response) {
  auto* self = static_cast<MqttBrokerPublisher*>(context);
  BrokerEvent event;
  event.type = BrokerEventType::kDeliveryFailed;
  if (response != nullptr) {
    event.token = response->token;
  }
  event.detail = DescribeFailure(response, "delivery failed");
  self->events_.Push(std::move(event));
}

} // namespace camsnitch::broker
