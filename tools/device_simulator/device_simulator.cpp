// SPDX-License-Identifier: Apache-2.0
#include "simulated_controller.hpp"

#include <everest/logging.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {
std::atomic<bool> keep_running{true};

void handle_signal(int) {
    keep_running = false;
}

struct SimOptions {
    std::string bind_host{"0.0.0.0"};
    int port{8080};
    std::string logging_config{"configs/logging.ini"};
    evselink::sim::ControllerSettings settings;
    bool vehicle_connected{true};
};

SimOptions parse_args(int argc, char* argv[]) {
    SimOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--port" && has_value) {
            opts.port = std::stoi(argv[++i]);
        } else if (arg == "--bind" && has_value) {
            opts.bind_host = argv[++i];
        } else if (arg == "--serial" && has_value) {
            opts.settings.serial = argv[++i];
        } else if (arg == "--max-current" && has_value) {
            opts.settings.current_max_a = std::stoi(argv[++i]);
        } else if (arg == "--logging" && has_value) {
            opts.logging_config = argv[++i];
        } else if (arg == "--no-vehicle") {
            opts.vehicle_connected = false;
        }
    }
    return opts;
}
} // namespace

int main(int argc, char* argv[]) {
    SimOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << std::endl;
        return 1;
    }
    Everest::Logging::init(opts.logging_config, "evselink-sim");

    evselink::sim::SimulatedController controller(opts.settings);
    controller.set_vehicle_connected(opts.vehicle_connected);
    evselink::sim::ControllerServer server(controller, opts.bind_host, opts.port);
    if (!server.start()) {
        std::cerr << "Failed to bind simulator on " << opts.bind_host << std::endl;
        return 1;
    }
    EVLOG_info << "Simulated controller " << opts.settings.serial << " listening on " << opts.bind_host << ":"
               << server.port();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    while (keep_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    server.stop();
    return 0;
}
