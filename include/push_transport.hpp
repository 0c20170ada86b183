// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "client_config.hpp"
#include "telemetry.hpp"
#include "wire_interface.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace evselink {

struct SessionHandle {
    std::uint64_t id{0};
    std::string serial;
};

struct PushOpenResult {
    std::optional<SessionHandle> session;
    std::optional<TransportError> error;
};

/// \brief Broker session scoped to one controller. Owns at most one MqttClient at a time; every
/// open() builds a new client through the factory after tearing the previous one down.
class PushTransport {
public:
    using ClientFactory = std::function<std::unique_ptr<MqttClient>()>;
    using TelemetryHandler = std::function<void(const SessionHandle&, const TelemetrySnapshot&)>;
    using ConnectionHandler = std::function<void(const SessionHandle&, bool connected)>;

    PushTransport(PushConfig config, std::string product_prefix, ClientFactory factory);
    ~PushTransport();

    PushTransport(const PushTransport&) = delete;
    PushTransport& operator=(const PushTransport&) = delete;

    void set_telemetry_handler(TelemetryHandler handler);
    void set_connection_handler(ConnectionHandler handler);

    PushOpenResult open(const std::string& serial, const std::string& identity, const std::string& credential);

    /// \brief Graceful close: publishes "offline" when still connected, then disconnects.
    void close(const SessionHandle& session);
    void close();

    std::optional<TransportError> publish(const SessionHandle& session, const std::string& command_topic,
                                          const std::string& payload);
    std::optional<TransportError> send_mode(const SessionHandle& session, ChargeMode mode);
    std::optional<TransportError> send_override_current(const SessionHandle& session, int deciamps);

    bool is_live() const;
    std::optional<SessionHandle> current_session() const;

    std::string topic_root(const std::string& serial) const;
    static const std::vector<std::string>& state_topics();
    static std::string client_id_for(const std::string& prefix, const std::string& identity);

private:
    bool teardown_locked();
    void on_message(const SessionHandle& handle, const std::string& root, const std::string& topic,
                    const std::string& payload);
    void on_connection(const SessionHandle& handle, MqttClient* client, const std::string& root, bool connected);
    bool is_current(std::uint64_t id) const;

    PushConfig config_;
    std::string product_prefix_;
    ClientFactory factory_;

    std::mutex io_mutex_; // serialises open/close/publish

    mutable std::mutex state_mutex_;
    std::unique_ptr<MqttClient> client_;
    std::optional<SessionHandle> session_;
    bool established_{false};
    std::uint64_t next_session_id_{0};
    TelemetryHandler telemetry_handler_;
    ConnectionHandler connection_handler_;
};

} // namespace evselink
