// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "wire_interface.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace evselink::testing {

inline HttpResult respond(long status, std::string body) {
    HttpResult r;
    r.response = HttpResponse{status, std::move(body)};
    return r;
}

inline HttpResult fail(ErrorKind kind = ErrorKind::TransportTimeout, std::string message = "timed out") {
    HttpResult r;
    r.error = TransportError{kind, std::move(message), std::nullopt};
    return r;
}

/// Scripted HTTP client; thread safe so the subnet fan-out can use it.
class FakeHttpClient : public HttpClient {
public:
    using Handler = std::function<HttpResult(const HttpRequest&)>;

    explicit FakeHttpClient(Handler handler = {}) : handler_(std::move(handler)) {
    }

    void set_handler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    HttpResult perform(const HttpRequest& request) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            handler = handler_;
        }
        const int now = ++in_flight_;
        int seen = max_in_flight_.load();
        while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
        }
        auto result = handler ? handler(request) : fail(ErrorKind::TransportOpen, "no route");
        --in_flight_;
        return result;
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::size_t count(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(requests_.begin(), requests_.end(),
                                                      [&](const HttpRequest& r) { return r.method == method; }));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
    }

    int max_in_flight() const { return max_in_flight_; }

private:
    mutable std::mutex mutex_;
    Handler handler_;
    std::vector<HttpRequest> requests_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
};

struct PublishedMessage {
    std::string topic;
    std::string payload;
    int qos{0};
    bool retain{false};
};

/// Broker-side view shared by every FakeMqttClient the factory creates.
struct FakeBroker {
    std::mutex mutex;
    bool accept_connect{true};
    int clients_created{0};
    int connect_calls{0};
    int disconnect_calls{0};
    MqttConnectOptions last_options;
    std::vector<std::pair<std::string, int>> subscriptions;
    std::vector<PublishedMessage> published;
    std::vector<std::string> log; // "connect", "disconnect", "publish <topic> <payload>"
    bool connected{false};
    MqttClient::MessageHandler message_handler;
    MqttClient::ConnectionHandler connection_handler;

    void deliver(const std::string& topic, const std::string& payload) {
        MqttClient::MessageHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!connected) return;
            handler = message_handler;
        }
        if (handler) handler(topic, payload);
    }

    /// Simulates an unexpected loss; the session layer would reconnect on its own.
    void drop() {
        MqttClient::ConnectionHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            connected = false;
            handler = connection_handler;
        }
        if (handler) handler(false);
    }

    void restore() {
        MqttClient::ConnectionHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            connected = true;
            handler = connection_handler;
        }
        if (handler) handler(true);
    }

    std::vector<PublishedMessage> published_to(const std::string& topic) {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<PublishedMessage> out;
        for (const auto& m : published) {
            if (m.topic == topic) out.push_back(m);
        }
        return out;
    }
};

class FakeMqttClient : public MqttClient {
public:
    explicit FakeMqttClient(std::shared_ptr<FakeBroker> broker) : broker_(std::move(broker)) {
    }

    std::optional<TransportError> connect(const MqttConnectOptions& options) override {
        ConnectionHandler handler;
        {
            std::lock_guard<std::mutex> lock(broker_->mutex);
            ++broker_->connect_calls;
            broker_->last_options = options;
            broker_->log.push_back("connect");
            if (!broker_->accept_connect) {
                return TransportError{ErrorKind::TransportOpen, "connection refused", std::nullopt};
            }
            broker_->connected = true;
            broker_->message_handler = message_handler_;
            broker_->connection_handler = connection_handler_;
            handler = connection_handler_;
        }
        if (handler) handler(true);
        return std::nullopt;
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        ++broker_->disconnect_calls;
        broker_->log.push_back("disconnect");
        broker_->connected = false;
        broker_->message_handler = nullptr;
        broker_->connection_handler = nullptr;
    }

    bool subscribe(const std::string& topic, int qos) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        broker_->subscriptions.emplace_back(topic, qos);
        return broker_->connected;
    }

    bool publish(const std::string& topic, const std::string& payload, int qos, bool retain) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        if (!broker_->connected) return false;
        broker_->published.push_back(PublishedMessage{topic, payload, qos, retain});
        broker_->log.push_back("publish " + topic + " " + payload);
        return true;
    }

    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        return broker_->connected;
    }

    void set_message_handler(MessageHandler handler) override { message_handler_ = std::move(handler); }
    void set_connection_handler(ConnectionHandler handler) override { connection_handler_ = std::move(handler); }

private:
    std::shared_ptr<FakeBroker> broker_;
    MessageHandler message_handler_;
    ConnectionHandler connection_handler_;
};

inline std::function<std::unique_ptr<MqttClient>()> fake_client_factory(const std::shared_ptr<FakeBroker>& broker) {
    return [broker]() -> std::unique_ptr<MqttClient> {
        {
            std::lock_guard<std::mutex> lock(broker->mutex);
            ++broker->clients_created;
        }
        return std::make_unique<FakeMqttClient>(broker);
    };
}

class FakeServiceBrowser : public ServiceBrowser {
public:
    bool available{true};
    std::vector<ServiceAnnouncement> announcements;
    std::vector<std::string> browsed_types;
    std::chrono::milliseconds last_window{0};

    bool browse(const std::string& service_type, std::chrono::milliseconds window,
                const FoundHandler& on_found) override {
        browsed_types.push_back(service_type);
        last_window = window;
        if (!available) return false;
        for (const auto& a : announcements) {
            on_found(a);
        }
        return true;
    }
};

class FakeHostNetwork : public HostNetwork {
public:
    std::optional<std::string> address;

    std::optional<std::string> local_ipv4() override { return address; }
};

} // namespace evselink::testing
