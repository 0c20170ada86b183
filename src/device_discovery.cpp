// SPDX-License-Identifier: Apache-2.0
#include "device_discovery.hpp"

#include <everest/logging.hpp>

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace evselink {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_numeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Numeric serials first in numeric order, then the rest lexically.
bool serial_less(const std::string& a, const std::string& b) {
    const bool a_num = is_numeric(a);
    const bool b_num = is_numeric(b);
    if (a_num != b_num) {
        return a_num;
    }
    if (a_num) {
        const auto a_trim = a.substr(std::min(a.find_first_not_of('0'), a.size() - 1));
        const auto b_trim = b.substr(std::min(b.find_first_not_of('0'), b.size() - 1));
        if (a_trim.size() != b_trim.size()) {
            return a_trim.size() < b_trim.size();
        }
        return a_trim < b_trim;
    }
    return a < b;
}

bool has_serial(const std::vector<DiscoveredDevice>& devices, const std::string& serial) {
    return std::any_of(devices.begin(), devices.end(), [&](const DiscoveredDevice& d) { return d.serial == serial; });
}

} // namespace

std::optional<std::string> subnet_prefix_of(const std::string& ipv4) {
    in_addr addr{};
    if (inet_pton(AF_INET, ipv4.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    const auto last_dot = ipv4.find_last_of('.');
    if (last_dot == std::string::npos) {
        return std::nullopt;
    }
    return ipv4.substr(0, last_dot + 1);
}

std::string summary_message(std::size_t found) {
    if (found == 0) {
        return "No devices found";
    }
    return "Found " + std::to_string(found) + " device(s)";
}

SubnetScan::SubnetScan(PollTransport& poll, std::string subnet_prefix, const DiscoveryConfig& config) :
    poll_(poll),
    subnet_prefix_(std::move(subnet_prefix)),
    probe_timeout_(config.subnet_probe_timeout_ms),
    batch_size_(std::max(1, config.batch_size)),
    max_devices_(config.max_devices) {
}

ScanProgress SubnetScan::step() {
    if (done()) {
        return progress();
    }
    const int first = next_host_;
    const int last = std::min(first + batch_size_ - 1, kHostCount);
    const auto count = static_cast<std::size_t>(last - first + 1);

    std::vector<std::optional<ProbeResult>> results(count);
    std::vector<std::thread> workers;
    workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto address = subnet_prefix_ + std::to_string(first + static_cast<int>(i));
        workers.emplace_back([this, &results, i, address]() { results[i] = poll_.probe(address, probe_timeout_); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& result : results) {
        if (!result || devices_.size() >= max_devices_ || has_serial(devices_, result->serial)) {
            continue;
        }
        EVLOG_debug << "Subnet scan: found " << result->serial << " at " << result->address;
        devices_.push_back(DiscoveredDevice{result->serial, result->address});
    }
    next_host_ = last + 1;
    return progress();
}

DeviceDiscovery::DeviceDiscovery(PollTransport& poll, ServiceBrowser& browser, HostNetwork& host,
                                 DiscoveryConfig config) :
    poll_(poll), browser_(browser), host_(host), config_(std::move(config)) {
}

std::vector<DiscoveredDevice> DeviceDiscovery::listen_for_announcements() {
    std::mutex candidates_mutex;
    std::vector<std::string> candidates;
    const auto prefix = to_lower(config_.name_prefix);

    const bool started = browser_.browse(
        config_.service_type, std::chrono::milliseconds(config_.listen_window_ms),
        [&](const ServiceAnnouncement& announcement) {
            if (to_lower(announcement.name).rfind(prefix, 0) != 0 || announcement.addresses.empty()) {
                return;
            }
            const auto& address = announcement.addresses.front();
            std::lock_guard<std::mutex> lock(candidates_mutex);
            if (candidates.size() >= config_.max_devices ||
                std::find(candidates.begin(), candidates.end(), address) != candidates.end()) {
                return;
            }
            candidates.push_back(address);
        });
    if (!started) {
        EVLOG_warning << "Announcement browsing unavailable";
    }

    std::vector<DiscoveredDevice> found;
    const auto timeout = std::chrono::milliseconds(config_.announcement_probe_timeout_ms);
    for (const auto& address : candidates) {
        const auto result = poll_.probe(address, timeout);
        if (!result || has_serial(found, result->serial)) {
            continue;
        }
        found.push_back(DiscoveredDevice{result->serial, result->address});
    }
    EVLOG_debug << "Announcements: " << candidates.size() << " candidate(s), " << found.size() << " confirmed";
    return found;
}

std::optional<SubnetScan> DeviceDiscovery::subnet_scan() {
    const auto local = host_.local_ipv4();
    if (!local) {
        EVLOG_warning << "Subnet scan: no local IPv4 address";
        return std::nullopt;
    }
    const auto prefix = subnet_prefix_of(*local);
    if (!prefix) {
        EVLOG_warning << "Subnet scan: invalid local address " << *local;
        return std::nullopt;
    }
    EVLOG_debug << "Subnet scan: scanning " << *prefix << "*";
    return SubnetScan(poll_, *prefix, config_);
}

DiscoveryReport DeviceDiscovery::discover(const ProgressHandler& on_progress) {
    DiscoveryReport report;
    report.devices = listen_for_announcements();
    if (!report.devices.empty()) {
        report.phase = DiscoveryPhase::Announcement;
    } else if (auto scan = subnet_scan()) {
        while (!scan->done()) {
            const auto progress = scan->step();
            if (on_progress) {
                on_progress(progress);
            }
        }
        report.devices = scan->devices();
        if (!report.devices.empty()) {
            report.phase = DiscoveryPhase::SubnetScan;
        }
    }
    report.message = summary_message(report.devices.size());
    EVLOG_info << report.message;
    return report;
}

std::size_t update_registry_addresses(DeviceRegistry& registry, const std::vector<DiscoveredDevice>& found) {
    std::size_t changed = 0;
    for (const auto& d : found) {
        if (registry.find(d.serial) && registry.update_address(d.serial, d.address)) {
            ++changed;
        }
    }
    return changed;
}

std::vector<ListedDevice> combined_listing(const DeviceRegistry& registry, const std::vector<DiscoveredDevice>& found) {
    std::map<std::string, ListedDevice> by_serial;
    for (const auto& d : registry.devices()) {
        by_serial[d.serial] = ListedDevice{d, false};
    }
    for (const auto& d : found) {
        auto& entry = by_serial[d.serial];
        entry.device.serial = d.serial;
        entry.device.address = d.address;
        entry.online = true;
    }

    std::vector<ListedDevice> out;
    out.reserve(by_serial.size());
    for (auto& kv : by_serial) {
        out.push_back(std::move(kv.second));
    }
    std::sort(out.begin(), out.end(),
              [](const ListedDevice& a, const ListedDevice& b) { return serial_less(a.device.serial, b.device.serial); });
    return out;
}

} // namespace evselink
