// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace evselink {

enum class ErrorKind { TransportOpen, TransportTimeout, Decode, Pair, DiscoveryProbe, Publish, Command };

struct TransportError {
    ErrorKind kind{ErrorKind::TransportOpen};
    std::string message;
    std::optional<long> http_status;
};

std::string to_string(ErrorKind kind);

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
    std::chrono::milliseconds timeout{5000};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

struct HttpResult {
    std::optional<HttpResponse> response;
    std::optional<TransportError> error;

    bool ok() const { return response.has_value() && !error.has_value(); }
};

/// \brief One-shot request/response HTTP transport. Implementations must honour request.timeout
/// as the upper bound for the whole exchange.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResult perform(const HttpRequest& request) = 0;
};

struct MqttWill {
    std::string topic;
    std::string payload;
    int qos{1};
    bool retain{false};
};

struct MqttConnectOptions {
    std::string host;
    int port{8883};
    std::string client_id;
    std::string username;
    std::string password;
    bool use_tls{true};
    std::string ca_path; // empty => system trust store
    int keepalive_s{30};
    std::chrono::milliseconds connect_timeout{5000};
    bool auto_reconnect{true};
    std::optional<MqttWill> will;
};

/// \brief Publish/subscribe session to a broker. One instance represents one session; a new
/// session is a new instance. Subscriptions are replayed by the implementation after every
/// automatic reconnect.
class MqttClient {
public:
    using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;
    using ConnectionHandler = std::function<void(bool connected)>;

    virtual ~MqttClient() = default;

    /// \brief Blocks until the broker accepted the session or connect_timeout elapsed.
    virtual std::optional<TransportError> connect(const MqttConnectOptions& options) = 0;
    virtual void disconnect() = 0;
    virtual bool subscribe(const std::string& topic, int qos) = 0;
    virtual bool publish(const std::string& topic, const std::string& payload, int qos, bool retain) = 0;
    virtual bool is_connected() const = 0;

    virtual void set_message_handler(MessageHandler handler) = 0;
    virtual void set_connection_handler(ConnectionHandler handler) = 0;
};

struct ServiceAnnouncement {
    std::string name;
    std::vector<std::string> addresses; // IPv4 dotted quads
    std::uint16_t port{0};
};

/// \brief Multicast service browsing for a fixed window.
class ServiceBrowser {
public:
    using FoundHandler = std::function<void(const ServiceAnnouncement&)>;

    virtual ~ServiceBrowser() = default;

    /// \brief Returns false when browsing could not be started at all.
    virtual bool browse(const std::string& service_type, std::chrono::milliseconds window,
                        const FoundHandler& on_found) = 0;
};

class HostNetwork {
public:
    virtual ~HostNetwork() = default;

    /// \brief First non-loopback IPv4 address of this host, if any.
    virtual std::optional<std::string> local_ipv4() = 0;
};

} // namespace evselink
