// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "client_config.hpp"
#include "wire_interface.hpp"

#include <optional>
#include <string>

namespace evselink {

struct PairResult {
    std::optional<std::string> credential;
    std::optional<TransportError> error;
};

/// \brief Exchanges a pairing PIN for the broker credential of this application identity.
class PairingClient {
public:
    PairingClient(HttpClient& http, PairingConfig config, std::string product_prefix);

    PairResult pair(const std::string& identity, const std::string& device_serial, const std::string& pin);

    static bool is_valid_pin(const std::string& pin);

private:
    HttpClient& http_;
    PairingConfig config_;
    std::string product_prefix_;
};

} // namespace evselink
