// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "telemetry.hpp"
#include "wire_interface.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace evselink {

struct ModeCommand {
    ChargeMode mode{ChargeMode::Normal};
};

/// Deciamps; 0 clears the override.
struct OverrideCurrentCommand {
    int deciamps{0};
};

using DeviceCommand = std::variant<ModeCommand, OverrideCurrentCommand>;

struct PollFetchResult {
    std::optional<TelemetrySnapshot> snapshot;
    std::optional<TransportError> error;
};

struct ProbeResult {
    std::string serial;
    std::string address;
};

/// \brief Direct local-network request/response channel to one controller address.
class PollTransport {
public:
    explicit PollTransport(HttpClient& http, std::chrono::milliseconds request_timeout = std::chrono::seconds(5));

    PollFetchResult fetch_snapshot(const std::string& address);
    std::optional<TransportError> send_command(const std::string& address, const DeviceCommand& command);

    /// \brief Identity check used by discovery. Anything that is not a genuine controller
    /// document yields nullopt.
    std::optional<ProbeResult> probe(const std::string& address, std::chrono::milliseconds timeout);

    static std::string settings_url(const std::string& address);
    static std::string command_query(const DeviceCommand& command);

private:
    HttpClient& http_;
    std::chrono::milliseconds request_timeout_;
};

/// \brief True when \p document has an evse object, a settings key and a non-empty serialnr.
bool is_controller_document(const nlohmann::json& document);

} // namespace evselink
