// SPDX-License-Identifier: Apache-2.0
#include "client_config.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace evselink {

namespace {
fs::path make_absolute(const fs::path& base, const fs::path& relative_or_absolute) {
    if (relative_or_absolute.is_absolute()) {
        return relative_or_absolute;
    }
    return fs::weakly_canonical(base / relative_or_absolute);
}

template <typename T> void positive_or_default(T& value, T fallback) {
    if (value <= 0) {
        value = fallback;
    }
}
} // namespace

ClientConfig default_client_config(const fs::path& base_dir) {
    ClientConfig cfg{};
    cfg.data_dir = make_absolute(base_dir, "data");
    cfg.registry_path = cfg.data_dir / "devices.json";
    cfg.logging_config = make_absolute(base_dir, "configs/logging.ini");
    return cfg;
}

ClientConfig load_client_config(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    const auto json = nlohmann::json::parse(file);
    const auto base_dir = config_path.parent_path().empty() ? fs::current_path() : config_path.parent_path();

    const ClientConfig defaults = default_client_config(base_dir);
    ClientConfig cfg = defaults;

    const auto client = json.value("client", nlohmann::json::object());
    cfg.product_prefix = client.value("productPrefix", cfg.product_prefix);
    cfg.data_dir = make_absolute(base_dir, client.value("dataDir", "data"));
    cfg.registry_path = make_absolute(cfg.data_dir, client.value("registryFile", "devices.json"));
    cfg.logging_config = make_absolute(base_dir, client.value("loggingConfig", "logging.ini"));

    const auto push = json.value("push", nlohmann::json::object());
    cfg.push.broker_host = push.value("brokerHost", cfg.push.broker_host);
    cfg.push.broker_port = push.value("brokerPort", cfg.push.broker_port);
    cfg.push.use_tls = push.value("useTls", cfg.push.use_tls);
    cfg.push.ca_path = push.value("caPath", cfg.push.ca_path);
    cfg.push.keepalive_s = push.value("keepAliveSeconds", cfg.push.keepalive_s);
    cfg.push.connect_timeout_ms = push.value("connectTimeoutMs", cfg.push.connect_timeout_ms);
    cfg.push.settle_delay_ms = push.value("settleDelayMs", cfg.push.settle_delay_ms);
    cfg.push.client_id_prefix = push.value("clientIdPrefix", cfg.push.client_id_prefix);

    const auto poll = json.value("poll", nlohmann::json::object());
    cfg.poll.period_s = poll.value("periodSeconds", cfg.poll.period_s);
    cfg.poll.request_timeout_ms = poll.value("requestTimeoutMs", cfg.poll.request_timeout_ms);

    const auto engine = json.value("engine", nlohmann::json::object());
    cfg.engine.data_timeout_s = engine.value("dataTimeoutSeconds", cfg.engine.data_timeout_s);
    cfg.engine.tick_ms = engine.value("tickMs", cfg.engine.tick_ms);
    cfg.engine.background_push_open = engine.value("backgroundPushOpen", cfg.engine.background_push_open);

    const auto pairing = json.value("pairing", nlohmann::json::object());
    cfg.pairing.url = pairing.value("url", cfg.pairing.url);
    cfg.pairing.timeout_s = pairing.value("timeoutSeconds", cfg.pairing.timeout_s);

    const auto discovery = json.value("discovery", nlohmann::json::object());
    cfg.discovery.service_type = discovery.value("serviceType", cfg.discovery.service_type);
    cfg.discovery.name_prefix = discovery.value("namePrefix", cfg.discovery.name_prefix);
    cfg.discovery.listen_window_ms = discovery.value("listenWindowMs", cfg.discovery.listen_window_ms);
    cfg.discovery.announcement_probe_timeout_ms =
        discovery.value("announcementProbeTimeoutMs", cfg.discovery.announcement_probe_timeout_ms);
    cfg.discovery.subnet_probe_timeout_ms =
        discovery.value("subnetProbeTimeoutMs", cfg.discovery.subnet_probe_timeout_ms);
    cfg.discovery.batch_size = discovery.value("batchSize", cfg.discovery.batch_size);
    // signed read so that a negative value falls back instead of wrapping
    int max_devices = discovery.value("maxDevices", static_cast<int>(defaults.discovery.max_devices));

    positive_or_default(cfg.push.broker_port, defaults.push.broker_port);
    positive_or_default(cfg.push.keepalive_s, defaults.push.keepalive_s);
    positive_or_default(cfg.push.connect_timeout_ms, defaults.push.connect_timeout_ms);
    if (cfg.push.settle_delay_ms < 0) {
        cfg.push.settle_delay_ms = defaults.push.settle_delay_ms;
    }
    positive_or_default(cfg.poll.period_s, defaults.poll.period_s);
    positive_or_default(cfg.poll.request_timeout_ms, defaults.poll.request_timeout_ms);
    positive_or_default(cfg.engine.data_timeout_s, defaults.engine.data_timeout_s);
    positive_or_default(cfg.engine.tick_ms, defaults.engine.tick_ms);
    positive_or_default(cfg.pairing.timeout_s, defaults.pairing.timeout_s);
    positive_or_default(cfg.discovery.listen_window_ms, defaults.discovery.listen_window_ms);
    positive_or_default(cfg.discovery.announcement_probe_timeout_ms, defaults.discovery.announcement_probe_timeout_ms);
    positive_or_default(cfg.discovery.subnet_probe_timeout_ms, defaults.discovery.subnet_probe_timeout_ms);
    positive_or_default(cfg.discovery.batch_size, defaults.discovery.batch_size);
    positive_or_default(max_devices, static_cast<int>(defaults.discovery.max_devices));
    cfg.discovery.max_devices = static_cast<std::size_t>(max_devices);
    if (cfg.product_prefix.empty()) {
        cfg.product_prefix = defaults.product_prefix;
    }
    if (cfg.pairing.url.rfind("https://", 0) != 0) {
        throw std::runtime_error("Pairing URL must use https: " + cfg.pairing.url);
    }

    return cfg;
}

std::string device_topic_root(const ClientConfig& cfg, const std::string& serial) {
    return cfg.product_prefix + "-" + serial;
}

} // namespace evselink
