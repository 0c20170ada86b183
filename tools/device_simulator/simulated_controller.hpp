// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "telemetry.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace evselink::sim {

struct ControllerSettings {
    std::string serial{"12345"};
    std::string version{"v3.6.4"};
    int current_min_a{6};
    int current_max_a{16};
    int nr_of_phases{3};
    bool ev_meter{true};
    bool mains_meter{true};
};

/// \brief In-memory charging controller answering the local status/command API.
class SimulatedController {
public:
    explicit SimulatedController(ControllerSettings settings);

    nlohmann::json settings_document();

    /// \brief Applies one command parameter. Returns false for unknown keys or bad values.
    bool apply(const std::string& key, const std::string& value);

    void set_vehicle_connected(bool connected);

    ChargeMode mode() const;
    int override_current_deciamps() const;
    int commands_applied() const;

private:
    void update_energy();

    ControllerSettings settings_;
    mutable std::mutex mutex_;
    ChargeMode mode_{ChargeMode::Normal};
    int override_deciamps_{0};
    bool vehicle_connected_{false};
    double charged_wh_{0.0};
    double imported_wh_{1234500.0};
    int commands_applied_{0};
    std::chrono::steady_clock::time_point last_update_;
};

/// \brief cpp-httplib front end for a SimulatedController.
class ControllerServer {
public:
    ControllerServer(SimulatedController& controller, std::string bind_host, int port_hint);
    ~ControllerServer();

    bool start();
    void stop();
    int port() const { return port_; }

private:
    void setup_routes();

    SimulatedController& controller_;
    std::string bind_host_;
    int port_;
    httplib::Server server_;
    std::thread server_thread_;
    std::atomic<bool> stopped_{false};
};

} // namespace evselink::sim
