// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace evselink {

struct Device {
    std::string serial;
    std::optional<std::string> address;
    std::optional<std::string> credential;
    std::optional<std::string> display_name;

    bool has_credential() const { return credential.has_value() && !credential->empty(); }
};

/// \brief Stored device records, the active selection and the application identity, kept in
/// one JSON document. Every mutation is written through to disk.
class DeviceRegistry {
public:
    DeviceRegistry(std::filesystem::path store_path, std::string product_prefix);

    /// \brief Missing or corrupt store loads as empty.
    void load();

    std::vector<Device> devices() const;
    std::optional<Device> find(const std::string& serial) const;

    /// \brief Merge by serial; fields absent in \p device keep their stored value.
    void upsert(const Device& device);
    bool remove(const std::string& serial);
    bool set_display_name(const std::string& serial, const std::string& name);
    bool update_address(const std::string& serial, const std::string& address);

    /// \brief Credentials are issued per identity: the paired serial and every record that
    /// already held one receive \p credential. Returns the number of records changed.
    std::size_t apply_pairing_credential(const std::string& serial, const std::string& credential);

    std::optional<std::string> active_serial() const;
    void set_active_serial(const std::optional<std::string>& serial);

    /// \brief Stable application identity (UUID v4), generated and persisted on first use.
    std::string identity();

    std::string display_name(const Device& device) const;

private:
    Device* find_locked(const std::string& serial);
    void persist_locked() const;

    std::filesystem::path store_path_;
    std::string product_prefix_;

    mutable std::mutex mutex_;
    std::vector<Device> devices_;
    std::optional<std::string> active_serial_;
    std::string identity_;
};

std::string make_uuid_v4();

} // namespace evselink
