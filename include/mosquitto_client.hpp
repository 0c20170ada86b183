// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "wire_interface.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <utility>
#include <vector>

struct mosquitto;
struct mosquitto_message;

namespace evselink {

/// \brief libmosquitto session running on the library's own network thread. The network
/// thread reconnects on its own; subscriptions made through this object are replayed on
/// every CONNACK.
class MosquittoClient : public MqttClient {
public:
    MosquittoClient();
    ~MosquittoClient() override;

    MosquittoClient(const MosquittoClient&) = delete;
    MosquittoClient& operator=(const MosquittoClient&) = delete;

    std::optional<TransportError> connect(const MqttConnectOptions& options) override;
    void disconnect() override;
    bool subscribe(const std::string& topic, int qos) override;
    bool publish(const std::string& topic, const std::string& payload, int qos, bool retain) override;
    bool is_connected() const override;

    void set_message_handler(MessageHandler handler) override;
    void set_connection_handler(ConnectionHandler handler) override;

private:
    static void on_connect(mosquitto* mosq, void* obj, int rc);
    static void on_disconnect(mosquitto* mosq, void* obj, int rc);
    static void on_message(mosquitto* mosq, void* obj, const mosquitto_message* message);

    void handle_connect(int rc);
    void handle_disconnect(int rc);
    void shutdown_loop();

    mosquitto* mosq_{nullptr};
    bool loop_running_{false};
    bool auto_reconnect_{true};
    std::atomic<bool> connected_{false};

    mutable std::mutex mutex_;
    std::condition_variable connack_cv_;
    bool connack_received_{false};
    int connack_rc_{0};
    std::vector<std::pair<std::string, int>> subscriptions_;
    MessageHandler message_handler_;
    ConnectionHandler connection_handler_;
};

} // namespace evselink
