// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace evselink {

namespace fs = std::filesystem;

struct PushConfig {
    std::string broker_host{"mqtt.smartevse.nl"};
    int broker_port{8883};
    bool use_tls{true};
    std::string ca_path;            // empty => system trust store
    int keepalive_s{30};
    int connect_timeout_ms{5000};
    int settle_delay_ms{100};       // pause between tearing down a session and opening the next
    std::string client_id_prefix{"smartevse_app_"};
};

struct PollConfig {
    int period_s{5};
    int request_timeout_ms{5000};
};

struct EngineConfig {
    int data_timeout_s{30};
    int tick_ms{100};
    bool background_push_open{true}; // false => push open runs inline on the caller
};

struct PairingConfig {
    std::string url{"https://mqtt.smartevse.nl/pair"};
    int timeout_s{10};
};

struct DiscoveryConfig {
    std::string service_type{"_http._tcp"};
    std::string name_prefix{"smartevse-"};
    int listen_window_ms{5000};
    int announcement_probe_timeout_ms{3000};
    int subnet_probe_timeout_ms{2000};
    int batch_size{50};
    std::size_t max_devices{8};
};

struct ClientConfig {
    std::string product_prefix{"SmartEVSE"};
    fs::path data_dir;
    fs::path registry_path;
    fs::path logging_config;

    PushConfig push;
    PollConfig poll;
    EngineConfig engine;
    PairingConfig pairing;
    DiscoveryConfig discovery;
};

/// \brief Load the client JSON config; relative paths resolve against the config file directory.
ClientConfig load_client_config(const fs::path& config_path);

/// \brief Defaults only, rooted at \p base_dir.
ClientConfig default_client_config(const fs::path& base_dir);

/// \brief Topic root / pairing id for a device: "<product>-<serial>".
std::string device_topic_root(const ClientConfig& cfg, const std::string& serial);

} // namespace evselink
