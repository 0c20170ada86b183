// SPDX-License-Identifier: Apache-2.0
#include "push_transport.hpp"

#include <everest/logging.hpp>

#include <chrono>
#include <thread>

namespace evselink {

namespace {
constexpr int STATE_QOS = 1;
constexpr int STATUS_QOS = 1;
constexpr const char* STATUS_TOPIC = "App/Status";
constexpr std::size_t CLIENT_ID_IDENTITY_CHARS = 8;
} // namespace

PushTransport::PushTransport(PushConfig config, std::string product_prefix, ClientFactory factory) :
    config_(std::move(config)), product_prefix_(std::move(product_prefix)), factory_(std::move(factory)) {
}

PushTransport::~PushTransport() {
    close();
}

void PushTransport::set_telemetry_handler(TelemetryHandler handler) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    telemetry_handler_ = std::move(handler);
}

void PushTransport::set_connection_handler(ConnectionHandler handler) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    connection_handler_ = std::move(handler);
}

const std::vector<std::string>& PushTransport::state_topics() {
    static const std::vector<std::string> topics{
        "Version",       "Access",         "ChargeCurrent",  "ChargeCurrentOverride", "Mode",
        "NrOfPhases",    "State",          "Error",          "LoadBl",                "SolarStopTimer",
        "MainsCurrentL1", "MainsCurrentL2", "MainsCurrentL3", "EVChargePower",         "EVEnergyCharged",
        "EVImportActiveEnergy", "MaxCurrent"};
    return topics;
}

std::string PushTransport::client_id_for(const std::string& prefix, const std::string& identity) {
    return prefix + identity.substr(0, CLIENT_ID_IDENTITY_CHARS);
}

std::string PushTransport::topic_root(const std::string& serial) const {
    return product_prefix_ + "-" + serial;
}

bool PushTransport::is_current(std::uint64_t id) const {
    return session_ && session_->id == id;
}

PushOpenResult PushTransport::open(const std::string& serial, const std::string& identity,
                                   const std::string& credential) {
    std::lock_guard<std::mutex> io(io_mutex_);
    if (teardown_locked() && config_.settle_delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.settle_delay_ms));
    }

    PushOpenResult result;
    auto client = factory_ ? factory_() : nullptr;
    if (!client) {
        result.error = TransportError{ErrorKind::TransportOpen, "no MQTT client available", std::nullopt};
        return result;
    }

    const auto root = topic_root(serial);
    SessionHandle handle;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        handle = SessionHandle{++next_session_id_, serial};
        session_ = handle;
        established_ = false;
    }

    MqttClient* raw = client.get();
    client->set_message_handler([this, handle, root](const std::string& topic, const std::string& payload) {
        on_message(handle, root, topic, payload);
    });
    client->set_connection_handler(
        [this, handle, raw, root](bool connected) { on_connection(handle, raw, root, connected); });

    MqttConnectOptions options;
    options.host = config_.broker_host;
    options.port = config_.broker_port;
    options.client_id = client_id_for(config_.client_id_prefix, identity);
    options.username = identity;
    options.password = credential;
    options.use_tls = config_.use_tls;
    options.ca_path = config_.ca_path;
    options.keepalive_s = config_.keepalive_s;
    options.connect_timeout = std::chrono::milliseconds(config_.connect_timeout_ms);
    options.auto_reconnect = true;
    options.will = MqttWill{root + "/" + STATUS_TOPIC, "offline", STATUS_QOS, false};

    EVLOG_info << "Opening push session for " << root << " as " << options.client_id;
    if (auto err = client->connect(options)) {
        EVLOG_warning << "Push session for " << root << " failed: " << err->message;
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_.reset();
        result.error = std::move(err);
        return result;
    }

    for (const auto& topic : state_topics()) {
        if (!client->subscribe(root + "/" + topic, STATE_QOS)) {
            EVLOG_debug << "Subscribe to " << root << "/" << topic << " deferred until reconnect";
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        client_ = std::move(client);
        established_ = true;
    }
    result.session = handle;
    return result;
}

bool PushTransport::teardown_locked() {
    std::unique_ptr<MqttClient> client;
    std::optional<SessionHandle> session;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        client = std::move(client_);
        session = session_;
        session_.reset();
        established_ = false;
    }
    if (!client) {
        return false;
    }
    if (client->is_connected() && session) {
        client->publish(topic_root(session->serial) + "/" + STATUS_TOPIC, "offline", STATUS_QOS, false);
    }
    client->disconnect();
    EVLOG_debug << "Push session closed";
    return true;
}

void PushTransport::close(const SessionHandle& session) {
    std::lock_guard<std::mutex> io(io_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!is_current(session.id)) {
            return;
        }
    }
    teardown_locked();
}

void PushTransport::close() {
    std::lock_guard<std::mutex> io(io_mutex_);
    teardown_locked();
}

std::optional<TransportError> PushTransport::publish(const SessionHandle& session, const std::string& command_topic,
                                                     const std::string& payload) {
    std::lock_guard<std::mutex> io(io_mutex_);
    MqttClient* client = nullptr;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!is_current(session.id) || !client_) {
            return TransportError{ErrorKind::Publish, "push session is not open", std::nullopt};
        }
        client = client_.get();
    }
    if (!client->is_connected()) {
        return TransportError{ErrorKind::Publish, "push session is not connected", std::nullopt};
    }
    const auto topic = topic_root(session.serial) + "/" + command_topic;
    if (!client->publish(topic, payload, STATUS_QOS, false)) {
        return TransportError{ErrorKind::Publish, "publish to " + topic + " failed", std::nullopt};
    }
    EVLOG_debug << "Published " << topic << " = " << payload;
    return std::nullopt;
}

std::optional<TransportError> PushTransport::send_mode(const SessionHandle& session, ChargeMode mode) {
    return publish(session, "Set/Mode", mode_to_string(mode));
}

std::optional<TransportError> PushTransport::send_override_current(const SessionHandle& session, int deciamps) {
    return publish(session, "Set/CurrentOverride", std::to_string(deciamps));
}

bool PushTransport::is_live() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return established_ && client_ && client_->is_connected();
}

std::optional<SessionHandle> PushTransport::current_session() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!established_) {
        return std::nullopt;
    }
    return session_;
}

void PushTransport::on_message(const SessionHandle& handle, const std::string& root, const std::string& topic,
                               const std::string& payload) {
    const auto prefix = root + "/";
    if (topic.rfind(prefix, 0) != 0) {
        return;
    }
    const auto snapshot = decode_push_value(topic.substr(prefix.size()), payload);
    if (snapshot.empty()) {
        return;
    }
    TelemetryHandler handler;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!is_current(handle.id)) {
            return;
        }
        handler = telemetry_handler_;
    }
    if (handler) {
        handler(handle, snapshot);
    }
}

void PushTransport::on_connection(const SessionHandle& handle, MqttClient* client, const std::string& root,
                                  bool connected) {
    ConnectionHandler handler;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!is_current(handle.id)) {
            return;
        }
        if (established_) {
            handler = connection_handler_;
        }
    }
    if (connected) {
        client->publish(root + "/" + STATUS_TOPIC, "online", STATUS_QOS, false);
    }
    if (handler) {
        handler(handle, connected);
    }
}

} // namespace evselink
