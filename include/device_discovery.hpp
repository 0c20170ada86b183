// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "client_config.hpp"
#include "device_registry.hpp"
#include "poll_transport.hpp"
#include "wire_interface.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace evselink {

struct DiscoveredDevice {
    std::string serial;
    std::string address;
};

enum class DiscoveryPhase { None, Announcement, SubnetScan };

struct DiscoveryReport {
    std::vector<DiscoveredDevice> devices;
    DiscoveryPhase phase{DiscoveryPhase::None};
    std::string message;
};

struct ScanProgress {
    int scanned{0};
    int total{0};
};

/// \brief Exhaustive probe of the 254 host addresses of one /24, one bounded batch per step().
/// A new object always starts from the first host.
class SubnetScan {
public:
    static constexpr int kHostCount = 254;

    /// \param subnet_prefix first three octets including the trailing dot, e.g. "192.168.1."
    SubnetScan(PollTransport& poll, std::string subnet_prefix, const DiscoveryConfig& config);

    bool done() const { return next_host_ > kHostCount; }
    ScanProgress progress() const { return {next_host_ - 1, kHostCount}; }

    /// \brief Probes the next batch concurrently, joins it, and returns the progress after it.
    ScanProgress step();

    const std::vector<DiscoveredDevice>& devices() const { return devices_; }
    const std::string& subnet_prefix() const { return subnet_prefix_; }

private:
    PollTransport& poll_;
    std::string subnet_prefix_;
    std::chrono::milliseconds probe_timeout_;
    int batch_size_;
    std::size_t max_devices_;

    int next_host_{1};
    std::vector<DiscoveredDevice> devices_;
};

class DeviceDiscovery {
public:
    using ProgressHandler = std::function<void(const ScanProgress&)>;

    DeviceDiscovery(PollTransport& poll, ServiceBrowser& browser, HostNetwork& host, DiscoveryConfig config);

    /// \brief Phase 1: browse announcements for the listen window, then confirm each candidate.
    std::vector<DiscoveredDevice> listen_for_announcements();

    /// \brief Phase 2 scan over the host's own /24, or nullopt when the host has no IPv4 address.
    std::optional<SubnetScan> subnet_scan();

    /// \brief Phase 1, then phase 2 only if phase 1 confirmed nothing.
    DiscoveryReport discover(const ProgressHandler& on_progress = {});

private:
    PollTransport& poll_;
    ServiceBrowser& browser_;
    HostNetwork& host_;
    DiscoveryConfig config_;
};

/// \brief "a.b.c." for a dotted-quad IPv4 address, nullopt for anything else.
std::optional<std::string> subnet_prefix_of(const std::string& ipv4);

std::string summary_message(std::size_t found);

/// \brief Rewrites the stored address of every known serial seen at a different address.
std::size_t update_registry_addresses(DeviceRegistry& registry, const std::vector<DiscoveredDevice>& found);

struct ListedDevice {
    Device device;
    bool online{false};
};

/// \brief Stored and discovered devices keyed by serial, discovered address wins.
std::vector<ListedDevice> combined_listing(const DeviceRegistry& registry, const std::vector<DiscoveredDevice>& found);

} // namespace evselink
