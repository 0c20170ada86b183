// SPDX-License-Identifier: Apache-2.0
#include "client_config.hpp"
#include "curl_http_client.hpp"
#include "device_discovery.hpp"
#include "device_registry.hpp"
#include "dnssd_browser.hpp"
#include "mosquitto_client.hpp"
#include "pairing_client.hpp"
#include "poll_transport.hpp"
#include "push_transport.hpp"
#include "transport_engine.hpp"

#include <everest/logging.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {
std::atomic<bool> keep_running{true};

void handle_signal(int) {
    keep_running = false;
}

constexpr auto COMMAND_CONNECT_WAIT = std::chrono::seconds(12);

struct CliArgs {
    std::string config_path{"configs/evse_link.json"};
    std::vector<std::string> positional;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

void print_usage() {
    std::cerr << "usage: evse_link [--config <path>] <command>\n"
                 "  devices                    list stored devices\n"
                 "  discover                   search the local network\n"
                 "  add <serial> <address>     store a device\n"
                 "  select <serial>            make a stored device active\n"
                 "  rename <serial> <name>     set a display name (empty clears)\n"
                 "  remove <serial>            forget a device\n"
                 "  pair <pin>                 pair the active device for remote access\n"
                 "  monitor                    follow the active device until interrupted\n"
                 "  set-mode <off|normal|solar|smart>\n"
                 "  set-override <amps>        0 clears the override\n";
}

class App {
public:
    explicit App(evselink::ClientConfig cfg) :
        cfg_(std::move(cfg)),
        registry_(cfg_.registry_path, cfg_.product_prefix),
        poll_(http_, std::chrono::milliseconds(cfg_.poll.request_timeout_ms)),
        push_(cfg_.push, cfg_.product_prefix, []() { return std::make_unique<evselink::MosquittoClient>(); }) {
        registry_.load();
    }

    int run(const std::vector<std::string>& args) {
        const auto& cmd = args.front();
        if (cmd == "devices") return list_devices({});
        if (cmd == "discover") return discover();
        if (cmd == "add" && args.size() == 3) return add(args[1], args[2]);
        if (cmd == "select" && args.size() == 2) return select(args[1]);
        if (cmd == "rename" && args.size() >= 2) return rename(args[1], args.size() > 2 ? args[2] : std::string());
        if (cmd == "remove" && args.size() == 2) return remove(args[1]);
        if (cmd == "pair" && args.size() == 2) return pair(args[1]);
        if (cmd == "monitor") return monitor();
        if (cmd == "set-mode" && args.size() == 2) return set_mode(args[1]);
        if (cmd == "set-override" && args.size() == 2) return set_override(args[1]);
        print_usage();
        return 2;
    }

private:
    std::optional<evselink::Device> active_device() {
        const auto serial = registry_.active_serial();
        if (!serial) {
            return std::nullopt;
        }
        return registry_.find(*serial);
    }

    int list_devices(const std::vector<evselink::DiscoveredDevice>& found) {
        const auto listing = evselink::combined_listing(registry_, found);
        if (listing.empty()) {
            std::cout << "No devices stored" << std::endl;
            return 0;
        }
        const auto active = registry_.active_serial();
        for (const auto& entry : listing) {
            const auto& d = entry.device;
            const bool stored = registry_.find(d.serial).has_value();
            std::cout << (active && *active == d.serial ? "* " : "  ") << std::left << std::setw(12) << d.serial
                      << std::setw(24) << registry_.display_name(d) << std::setw(16) << d.address.value_or("-")
                      << (d.has_credential() ? "paired   " : "unpaired ");
            if (!found.empty()) {
                std::cout << (entry.online ? "online" : "offline");
                if (!stored) std::cout << " (new)";
            }
            std::cout << std::endl;
        }
        return 0;
    }

    int discover() {
        evselink::DnsSdServiceBrowser browser;
        evselink::InterfaceHostNetwork host;
        evselink::DeviceDiscovery discovery(poll_, browser, host, cfg_.discovery);
        std::cout << "Searching for devices..." << std::endl;
        const auto report = discovery.discover([](const evselink::ScanProgress& p) {
            std::cout << "\rScanning network " << p.scanned << "/" << p.total << std::flush;
            if (p.scanned == p.total) std::cout << std::endl;
        });
        std::cout << report.message << std::endl;
        const auto moved = evselink::update_registry_addresses(registry_, report.devices);
        if (moved > 0) {
            std::cout << "Updated address of " << moved << " stored device(s)" << std::endl;
        }
        return list_devices(report.devices);
    }

    int add(const std::string& serial, const std::string& address) {
        evselink::Device d;
        d.serial = serial;
        d.address = address;
        registry_.upsert(d);
        if (!registry_.active_serial()) {
            registry_.set_active_serial(serial);
        }
        std::cout << "Stored " << registry_.display_name(*registry_.find(serial)) << std::endl;
        return 0;
    }

    int select(const std::string& serial) {
        if (!registry_.find(serial)) {
            std::cerr << "Unknown device " << serial << std::endl;
            return 1;
        }
        registry_.set_active_serial(serial);
        return 0;
    }

    int rename(const std::string& serial, const std::string& name) {
        if (!registry_.set_display_name(serial, name)) {
            std::cerr << "Unknown device " << serial << std::endl;
            return 1;
        }
        return 0;
    }

    int remove(const std::string& serial) {
        const auto device = registry_.find(serial);
        if (!device) {
            std::cerr << "Unknown device " << serial << std::endl;
            return 1;
        }
        if (device->has_credential()) {
            std::cout << "Device was paired; removing it requires pairing again" << std::endl;
        }
        registry_.remove(serial);
        return 0;
    }

    int pair(const std::string& pin) {
        const auto device = active_device();
        if (!device) {
            std::cerr << "Select a device first" << std::endl;
            return 1;
        }
        if (!evselink::PairingClient::is_valid_pin(pin)) {
            std::cerr << "PIN must be 6 digits" << std::endl;
            return 1;
        }
        evselink::PairingClient client(http_, cfg_.pairing, cfg_.product_prefix);
        const auto result = client.pair(registry_.identity(), device->serial, pin);
        if (!result.credential) {
            if (result.error) {
                std::cerr << evselink::to_string(result.error->kind) << ": " << result.error->message << std::endl;
            } else {
                std::cerr << "Pairing failed" << std::endl;
            }
            return 1;
        }
        registry_.apply_pairing_credential(device->serial, *result.credential);
        std::cout << "Pairing successful!" << std::endl;
        return 0;
    }

    std::unique_ptr<evselink::TransportEngine> make_engine() {
        auto engine = std::make_unique<evselink::TransportEngine>(poll_, push_, registry_.identity(), cfg_.poll,
                                                                  cfg_.engine);
        engine->set_refresh_request_handler([](const std::string& serial) {
            EVLOG_info << "Device " << serial << " unreachable; run 'discover' to refresh its address";
        });
        return engine;
    }

    int monitor() {
        const auto device = active_device();
        if (!device) {
            std::cerr << "Select a device first" << std::endl;
            return 1;
        }
        auto engine = make_engine();
        engine->subscribe([](const evselink::EngineUpdate& u) {
            std::cout << "[" << evselink::to_string(u.state) << "/" << evselink::to_string(u.status.active_transport)
                      << (u.status.push_session_live ? " push-live" : "") << "] ";
            if (u.status.last_error) {
                std::cout << *u.status.last_error << " | ";
            }
            std::cout << evselink::describe(u.snapshot) << std::endl;
        });
        engine->select(*device);
        engine->start();
        while (keep_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        engine->stop();
        engine->deselect();
        return 0;
    }

    std::unique_ptr<evselink::TransportEngine> connected_engine() {
        const auto device = active_device();
        if (!device) {
            std::cerr << "Select a device first" << std::endl;
            return nullptr;
        }
        auto engine = make_engine();
        engine->select(*device);
        engine->start();
        const auto deadline = std::chrono::steady_clock::now() + COMMAND_CONNECT_WAIT;
        while (keep_running && std::chrono::steady_clock::now() < deadline) {
            const auto state = engine->state();
            if (state == evselink::EngineState::PollActive || state == evselink::EngineState::PushActive) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return engine;
    }

    int report(evselink::TransportEngine& engine, const evselink::CommandResult& result) {
        engine.stop();
        engine.deselect();
        if (!result.ok) {
            std::cerr << result.message << std::endl;
            return 1;
        }
        std::cout << "Sent via " << evselink::to_string(result.via) << std::endl;
        return 0;
    }

    int set_mode(const std::string& text) {
        const auto mode = evselink::mode_from_string(text);
        if (mode == evselink::ChargeMode::Off && text != "off" && text != "Off" && text != "OFF") {
            std::cerr << "Unknown mode " << text << std::endl;
            return 1;
        }
        auto engine = connected_engine();
        if (!engine) return 1;
        return report(*engine, engine->set_mode(mode));
    }

    int set_override(const std::string& text) {
        double amps = 0.0;
        try {
            amps = std::stod(text);
        } catch (const std::exception&) {
            std::cerr << "Invalid current " << text << std::endl;
            return 1;
        }
        auto engine = connected_engine();
        if (!engine) return 1;
        return report(*engine, engine->set_override_current(static_cast<int>(std::lround(amps * 10.0))));
    }

    evselink::ClientConfig cfg_;
    evselink::DeviceRegistry registry_;
    evselink::CurlHttpClient http_;
    evselink::PollTransport poll_;
    evselink::PushTransport push_;
};
} // namespace

int main(int argc, char* argv[]) {
    const auto args = parse_args(argc, argv);
    if (args.positional.empty()) {
        print_usage();
        return 2;
    }

    evselink::ClientConfig cfg;
    try {
        cfg = evselink::load_client_config(args.config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }
    Everest::Logging::init(cfg.logging_config.string(), "evse-link");

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        App app(cfg);
        return app.run(args.positional);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
