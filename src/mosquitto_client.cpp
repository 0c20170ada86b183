// SPDX-License-Identifier: Apache-2.0
#include "mosquitto_client.hpp"

#include <mosquitto.h>
#include <everest/logging.hpp>

namespace evselink {

namespace {
constexpr int RECONNECT_DELAY_S = 2;
constexpr int RECONNECT_DELAY_MAX_S = 30;

void ensure_lib_init() {
    static std::once_flag mosquitto_once;
    std::call_once(mosquitto_once, []() { mosquitto_lib_init(); });
}
} // namespace

MosquittoClient::MosquittoClient() {
    ensure_lib_init();
}

MosquittoClient::~MosquittoClient() {
    shutdown_loop();
    if (mosq_) {
        mosquitto_destroy(mosq_);
        mosq_ = nullptr;
    }
}

void MosquittoClient::set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    message_handler_ = std::move(handler);
}

void MosquittoClient::set_connection_handler(ConnectionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_handler_ = std::move(handler);
}

std::optional<TransportError> MosquittoClient::connect(const MqttConnectOptions& options) {
    shutdown_loop();
    if (mosq_) {
        mosquitto_destroy(mosq_);
        mosq_ = nullptr;
    }

    mosq_ = mosquitto_new(options.client_id.empty() ? nullptr : options.client_id.c_str(), true, this);
    if (!mosq_) {
        return TransportError{ErrorKind::TransportOpen, "mosquitto_new failed", std::nullopt};
    }
    auto_reconnect_ = options.auto_reconnect;

    mosquitto_int_option(mosq_, MOSQ_OPT_PROTOCOL_VERSION, MQTT_PROTOCOL_V311);
    if (!options.username.empty()) {
        mosquitto_username_pw_set(mosq_, options.username.c_str(),
                                  options.password.empty() ? nullptr : options.password.c_str());
    }
    if (options.will) {
        const auto& will = *options.will;
        const int rc = mosquitto_will_set(mosq_, will.topic.c_str(), static_cast<int>(will.payload.size()),
                                          will.payload.data(), will.qos, will.retain);
        if (rc != MOSQ_ERR_SUCCESS) {
            return TransportError{ErrorKind::TransportOpen, std::string("will: ") + mosquitto_strerror(rc),
                                  std::nullopt};
        }
    }
    if (options.use_tls) {
        int rc = MOSQ_ERR_SUCCESS;
        if (options.ca_path.empty()) {
            rc = mosquitto_int_option(mosq_, MOSQ_OPT_TLS_USE_OS_CERTS, 1);
        } else {
            rc = mosquitto_tls_set(mosq_, nullptr, options.ca_path.c_str(), nullptr, nullptr, nullptr);
        }
        if (rc != MOSQ_ERR_SUCCESS) {
            return TransportError{ErrorKind::TransportOpen, std::string("tls: ") + mosquitto_strerror(rc),
                                  std::nullopt};
        }
    }
    mosquitto_reconnect_delay_set(mosq_, RECONNECT_DELAY_S, RECONNECT_DELAY_MAX_S, true);
    mosquitto_connect_callback_set(mosq_, &MosquittoClient::on_connect);
    mosquitto_disconnect_callback_set(mosq_, &MosquittoClient::on_disconnect);
    mosquitto_message_callback_set(mosq_, &MosquittoClient::on_message);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connack_received_ = false;
        connack_rc_ = 0;
    }

    int rc = mosquitto_connect_async(mosq_, options.host.c_str(), options.port, options.keepalive_s);
    if (rc != MOSQ_ERR_SUCCESS) {
        return TransportError{ErrorKind::TransportOpen, std::string("connect: ") + mosquitto_strerror(rc),
                              std::nullopt};
    }
    rc = mosquitto_loop_start(mosq_);
    if (rc != MOSQ_ERR_SUCCESS) {
        return TransportError{ErrorKind::TransportOpen, std::string("loop: ") + mosquitto_strerror(rc), std::nullopt};
    }
    loop_running_ = true;

    std::unique_lock<std::mutex> lock(mutex_);
    const bool answered = connack_cv_.wait_for(lock, options.connect_timeout, [this] { return connack_received_; });
    const int connack_rc = connack_rc_;
    lock.unlock();

    if (!answered) {
        EVLOG_warning << "MQTT connect to " << options.host << ":" << options.port << " timed out";
        shutdown_loop();
        return TransportError{ErrorKind::TransportTimeout, "broker did not answer within connect timeout",
                              std::nullopt};
    }
    if (connack_rc != 0) {
        shutdown_loop();
        return TransportError{ErrorKind::TransportOpen, mosquitto_connack_string(connack_rc), std::nullopt};
    }
    return std::nullopt;
}

void MosquittoClient::shutdown_loop() {
    if (!mosq_ || !loop_running_) {
        return;
    }
    mosquitto_disconnect(mosq_);
    mosquitto_loop_stop(mosq_, false);
    loop_running_ = false;
    connected_ = false;
}

void MosquittoClient::disconnect() {
    shutdown_loop();
}

bool MosquittoClient::subscribe(const std::string& topic, int qos) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.emplace_back(topic, qos);
    }
    if (!mosq_ || !connected_) {
        return false;
    }
    return mosquitto_subscribe(mosq_, nullptr, topic.c_str(), qos) == MOSQ_ERR_SUCCESS;
}

bool MosquittoClient::publish(const std::string& topic, const std::string& payload, int qos, bool retain) {
    if (!mosq_ || !connected_) {
        return false;
    }
    const int rc = mosquitto_publish(mosq_, nullptr, topic.c_str(), static_cast<int>(payload.size()),
                                     payload.data(), qos, retain);
    if (rc != MOSQ_ERR_SUCCESS) {
        EVLOG_debug << "MQTT publish to " << topic << " failed: " << mosquitto_strerror(rc);
        return false;
    }
    return true;
}

bool MosquittoClient::is_connected() const {
    return connected_;
}

void MosquittoClient::on_connect(mosquitto*, void* obj, int rc) {
    static_cast<MosquittoClient*>(obj)->handle_connect(rc);
}

void MosquittoClient::on_disconnect(mosquitto*, void* obj, int rc) {
    static_cast<MosquittoClient*>(obj)->handle_disconnect(rc);
}

void MosquittoClient::on_message(mosquitto*, void* obj, const mosquitto_message* message) {
    auto* self = static_cast<MosquittoClient*>(obj);
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(self->mutex_);
        handler = self->message_handler_;
    }
    if (!handler || !message || !message->topic) {
        return;
    }
    const std::string payload = message->payload
                                    ? std::string(static_cast<const char*>(message->payload),
                                                  static_cast<std::size_t>(message->payloadlen))
                                    : std::string();
    handler(message->topic, payload);
}

void MosquittoClient::handle_connect(int rc) {
    std::vector<std::pair<std::string, int>> replay;
    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connack_received_ = true;
        connack_rc_ = rc;
        if (rc == 0) {
            connected_ = true;
            replay = subscriptions_;
            handler = connection_handler_;
        }
    }
    connack_cv_.notify_all();
    if (rc != 0) {
        EVLOG_warning << "MQTT broker refused session: " << mosquitto_connack_string(rc);
        return;
    }
    for (const auto& [topic, qos] : replay) {
        mosquitto_subscribe(mosq_, nullptr, topic.c_str(), qos);
    }
    if (handler) {
        handler(true);
    }
}

void MosquittoClient::handle_disconnect(int rc) {
    const bool was_connected = connected_.exchange(false);
    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = connection_handler_;
    }
    if (rc != 0) {
        EVLOG_info << "MQTT session lost: " << mosquitto_strerror(rc);
        if (!auto_reconnect_) {
            mosquitto_disconnect(mosq_);
        }
    }
    if (was_connected && handler) {
        handler(false);
    }
}

} // namespace evselink
