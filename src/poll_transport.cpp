// SPDX-License-Identifier: Apache-2.0
#include "poll_transport.hpp"

#include <everest/logging.hpp>

namespace evselink {

namespace {

std::optional<std::string> serial_of(const nlohmann::json& document) {
    const auto it = document.find("serialnr");
    if (it == document.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        auto serial = it->get<std::string>();
        if (serial.empty()) return std::nullopt;
        return serial;
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<long long>());
    }
    return std::nullopt;
}

bool is_success(long status) {
    return status >= 200 && status < 300;
}

} // namespace

bool is_controller_document(const nlohmann::json& document) {
    if (!document.is_object()) {
        return false;
    }
    const auto evse = document.find("evse");
    if (evse == document.end() || !evse->is_object()) {
        return false;
    }
    if (!document.contains("settings")) {
        return false;
    }
    return serial_of(document).has_value();
}

PollTransport::PollTransport(HttpClient& http, std::chrono::milliseconds request_timeout) :
    http_(http), request_timeout_(request_timeout) {
}

std::string PollTransport::settings_url(const std::string& address) {
    return "http://" + address + "/settings";
}

std::string PollTransport::command_query(const DeviceCommand& command) {
    if (const auto* mode = std::get_if<ModeCommand>(&command)) {
        return "mode=" + std::to_string(static_cast<int>(mode->mode));
    }
    const auto& current = std::get<OverrideCurrentCommand>(command);
    return "override_current=" + std::to_string(current.deciamps);
}

PollFetchResult PollTransport::fetch_snapshot(const std::string& address) {
    PollFetchResult out;
    HttpRequest req;
    req.method = "GET";
    req.url = settings_url(address);
    req.timeout = request_timeout_;

    auto res = http_.perform(req);
    if (!res.ok()) {
        out.error = res.error.value_or(TransportError{ErrorKind::TransportOpen, "no response", std::nullopt});
        return out;
    }
    if (!is_success(res.response->status)) {
        out.error = TransportError{ErrorKind::TransportOpen, "HTTP " + std::to_string(res.response->status),
                                   res.response->status};
        return out;
    }

    const auto doc = nlohmann::json::parse(res.response->body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        out.error = TransportError{ErrorKind::Decode, "status document is not a JSON object", res.response->status};
        return out;
    }
    out.snapshot = decode_poll_document(doc);
    return out;
}

std::optional<TransportError> PollTransport::send_command(const std::string& address, const DeviceCommand& command) {
    HttpRequest req;
    req.method = "POST";
    req.url = settings_url(address) + "?" + command_query(command);
    req.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
    req.timeout = request_timeout_;

    auto res = http_.perform(req);
    if (!res.ok()) {
        return res.error.value_or(TransportError{ErrorKind::TransportOpen, "no response", std::nullopt});
    }
    if (!is_success(res.response->status)) {
        return TransportError{ErrorKind::Command, "HTTP " + std::to_string(res.response->status), res.response->status};
    }
    EVLOG_debug << "Command " << command_query(command) << " accepted by " << address;
    return std::nullopt;
}

std::optional<ProbeResult> PollTransport::probe(const std::string& address, std::chrono::milliseconds timeout) {
    HttpRequest req;
    req.method = "GET";
    req.url = settings_url(address);
    req.timeout = timeout;

    auto res = http_.perform(req);
    if (!res.ok() || !is_success(res.response->status)) {
        return std::nullopt;
    }
    const auto doc = nlohmann::json::parse(res.response->body, nullptr, false);
    if (doc.is_discarded() || !is_controller_document(doc)) {
        return std::nullopt;
    }
    return ProbeResult{*serial_of(doc), address};
}

} // namespace evselink
