// SPDX-License-Identifier: Apache-2.0
#include "pairing_client.hpp"

#include <everest/logging.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace evselink {

namespace {
constexpr std::size_t PIN_DIGITS = 6;
} // namespace

PairingClient::PairingClient(HttpClient& http, PairingConfig config, std::string product_prefix) :
    http_(http), config_(std::move(config)), product_prefix_(std::move(product_prefix)) {
}

bool PairingClient::is_valid_pin(const std::string& pin) {
    return pin.size() == PIN_DIGITS &&
           std::all_of(pin.begin(), pin.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

PairResult PairingClient::pair(const std::string& identity, const std::string& device_serial,
                               const std::string& pin) {
    PairResult result;
    nlohmann::json body{
        {"app_uuid", identity},
        {"device_serial", product_prefix_ + "-" + device_serial},
        {"pairing_pin", pin},
    };

    HttpRequest req;
    req.method = "POST";
    req.url = config_.url;
    req.body = body.dump();
    req.headers.emplace_back("Content-Type", "application/json");
    req.timeout = std::chrono::seconds(config_.timeout_s);

    EVLOG_info << "Pairing " << product_prefix_ << "-" << device_serial;
    auto res = http_.perform(req);
    if (!res.ok()) {
        auto err = res.error.value_or(TransportError{ErrorKind::TransportOpen, "no response", std::nullopt});
        result.error = TransportError{ErrorKind::Pair, "Pairing error: " + err.message, std::nullopt};
        return result;
    }

    const auto& response = *res.response;
    if (response.status < 200 || response.status >= 300) {
        result.error = TransportError{ErrorKind::Pair,
                                      "Pairing failed: " + std::to_string(response.status) + " - " + response.body,
                                      response.status};
        return result;
    }

    const auto doc = nlohmann::json::parse(response.body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        result.error = TransportError{ErrorKind::Pair, "Pairing failed: malformed response - " + response.body,
                                      response.status};
        return result;
    }
    const auto token = doc.find("mqtt_token");
    if (token == doc.end() || token->is_null()) {
        result.error = TransportError{ErrorKind::Pair, "No token received from server", response.status};
        return result;
    }

    result.credential = token->is_string() ? token->get<std::string>() : token->dump();
    if (result.credential->empty()) {
        result.credential.reset();
        result.error = TransportError{ErrorKind::Pair, "No token received from server", response.status};
        return result;
    }
    EVLOG_info << "Pairing successful for " << product_prefix_ << "-" << device_serial;
    return result;
}

} // namespace evselink
