// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "wire_interface.hpp"

namespace evselink {

/// \brief DNS-SD browse + resolve. Host targets are turned into IPv4 addresses through the
/// system resolver, which handles ".local" names when nss-mdns is present.
class DnsSdServiceBrowser : public ServiceBrowser {
public:
    bool browse(const std::string& service_type, std::chrono::milliseconds window,
                const FoundHandler& on_found) override;
};

/// \brief Host addresses from getifaddrs().
class InterfaceHostNetwork : public HostNetwork {
public:
    std::optional<std::string> local_ipv4() override;
};

} // namespace evselink
