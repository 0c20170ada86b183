// SPDX-License-Identifier: Apache-2.0
#include "device_registry.hpp"

#include <everest/logging.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace evselink {

namespace {

std::optional<std::string> optional_string(const nlohmann::json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

void put_optional(nlohmann::json& obj, const char* key, const std::optional<std::string>& value) {
    if (value) {
        obj[key] = *value;
    }
}

} // namespace

std::string make_uuid_v4() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::uint64_t> dist;

    std::uint64_t hi = dist(gen);
    std::uint64_t lo = dist(gen);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (hi >> 32) << "-" << std::setw(4) << ((hi >> 16) & 0xFFFF) << "-" << std::setw(4)
       << (hi & 0xFFFF) << "-" << std::setw(4) << (lo >> 48) << "-" << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

DeviceRegistry::DeviceRegistry(std::filesystem::path store_path, std::string product_prefix) :
    store_path_(std::move(store_path)), product_prefix_(std::move(product_prefix)) {
}

void DeviceRegistry::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.clear();
    active_serial_.reset();
    identity_.clear();
    if (store_path_.empty() || !std::filesystem::exists(store_path_)) {
        return;
    }
    try {
        std::ifstream in(store_path_);
        if (!in) {
            EVLOG_warning << "Device store " << store_path_ << " is not readable";
            return;
        }
        nlohmann::json root;
        in >> root;
        if (root.contains("devices") && root["devices"].is_array()) {
            for (const auto& entry : root["devices"]) {
                const std::string serial = entry.value("serial", "");
                if (serial.empty() || find_locked(serial)) continue;
                Device d;
                d.serial = serial;
                d.address = optional_string(entry, "address");
                d.credential = optional_string(entry, "credential");
                d.display_name = optional_string(entry, "displayName");
                devices_.push_back(std::move(d));
            }
        }
        active_serial_ = optional_string(root, "activeSerial");
        identity_ = root.value("identity", "");
    } catch (const std::exception& e) {
        EVLOG_warning << "Failed to load device store " << store_path_ << ": " << e.what();
        devices_.clear();
        active_serial_.reset();
    }
}

void DeviceRegistry::persist_locked() const {
    if (store_path_.empty()) {
        return;
    }
    nlohmann::json root;
    root["devices"] = nlohmann::json::array();
    for (const auto& d : devices_) {
        nlohmann::json entry;
        entry["serial"] = d.serial;
        put_optional(entry, "address", d.address);
        put_optional(entry, "credential", d.credential);
        put_optional(entry, "displayName", d.display_name);
        root["devices"].push_back(entry);
    }
    if (active_serial_) {
        root["activeSerial"] = *active_serial_;
    }
    if (!identity_.empty()) {
        root["identity"] = identity_;
    }

    std::error_code ec;
    std::filesystem::create_directories(store_path_.parent_path(), ec);
    std::ofstream out(store_path_);
    if (!out) {
        throw std::runtime_error("Cannot write device store: " + store_path_.string());
    }
    out << root.dump(2);
}

Device* DeviceRegistry::find_locked(const std::string& serial) {
    const auto it =
        std::find_if(devices_.begin(), devices_.end(), [&](const Device& d) { return d.serial == serial; });
    return it == devices_.end() ? nullptr : &(*it);
}

std::vector<Device> DeviceRegistry::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

std::optional<Device> DeviceRegistry::find(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& d : devices_) {
        if (d.serial == serial) return d;
    }
    return std::nullopt;
}

void DeviceRegistry::upsert(const Device& device) {
    if (device.serial.empty()) {
        throw std::invalid_argument("Device serial must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* existing = find_locked(device.serial)) {
        if (device.address) existing->address = device.address;
        if (device.credential) existing->credential = device.credential;
        if (device.display_name) existing->display_name = device.display_name;
    } else {
        devices_.push_back(device);
    }
    persist_locked();
}

bool DeviceRegistry::remove(const std::string& serial) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto before = devices_.size();
    devices_.erase(std::remove_if(devices_.begin(), devices_.end(), [&](const Device& d) { return d.serial == serial; }),
                   devices_.end());
    if (devices_.size() == before) {
        return false;
    }
    if (active_serial_ && *active_serial_ == serial) {
        active_serial_.reset();
    }
    persist_locked();
    return true;
}

bool DeviceRegistry::set_display_name(const std::string& serial, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* d = find_locked(serial);
    if (!d) {
        return false;
    }
    if (name.empty()) {
        d->display_name.reset();
    } else {
        d->display_name = name;
    }
    persist_locked();
    return true;
}

bool DeviceRegistry::update_address(const std::string& serial, const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* d = find_locked(serial);
    if (!d || (d->address && *d->address == address)) {
        return false;
    }
    EVLOG_info << "Device " << serial << " moved to " << address;
    d->address = address;
    persist_locked();
    return true;
}

std::size_t DeviceRegistry::apply_pairing_credential(const std::string& serial, const std::string& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t changed = 0;
    for (auto& d : devices_) {
        if (d.serial == serial || d.has_credential()) {
            if (!d.credential || *d.credential != credential) {
                d.credential = credential;
                ++changed;
            }
        }
    }
    if (!find_locked(serial)) {
        Device d;
        d.serial = serial;
        d.credential = credential;
        devices_.push_back(std::move(d));
        ++changed;
    }
    persist_locked();
    return changed;
}

std::optional<std::string> DeviceRegistry::active_serial() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_serial_;
}

void DeviceRegistry::set_active_serial(const std::optional<std::string>& serial) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_serial_ = serial;
    persist_locked();
}

std::string DeviceRegistry::identity() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (identity_.empty()) {
        identity_ = make_uuid_v4();
        EVLOG_info << "Generated application identity " << identity_;
        persist_locked();
    }
    return identity_;
}

std::string DeviceRegistry::display_name(const Device& device) const {
    if (device.display_name && !device.display_name->empty()) {
        return *device.display_name;
    }
    return product_prefix_ + "-" + device.serial;
}

} // namespace evselink
