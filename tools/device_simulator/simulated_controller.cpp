// SPDX-License-Identifier: Apache-2.0
#include "simulated_controller.hpp"

#include <everest/logging.hpp>

#include <charconv>

namespace evselink::sim {

namespace {
constexpr double SIM_VOLTAGE_V = 230.0;

std::optional<int> parse_int(const std::string& s) {
    int value = 0;
    const auto res = std::from_chars(s.data(), s.data() + s.size(), value);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}
} // namespace

SimulatedController::SimulatedController(ControllerSettings settings) :
    settings_(std::move(settings)), last_update_(std::chrono::steady_clock::now()) {
}

void SimulatedController::update_energy() {
    const auto now = std::chrono::steady_clock::now();
    const double hours = std::chrono::duration<double>(now - last_update_).count() / 3600.0;
    last_update_ = now;
    if (!vehicle_connected_ || mode_ == ChargeMode::Off) {
        return;
    }
    const int deciamps = override_deciamps_ > 0 ? override_deciamps_ : settings_.current_max_a * 10;
    const double power_w = SIM_VOLTAGE_V * (deciamps / 10.0) * settings_.nr_of_phases;
    charged_wh_ += power_w * hours;
    imported_wh_ += power_w * hours;
}

nlohmann::json SimulatedController::settings_document() {
    std::lock_guard<std::mutex> lock(mutex_);
    update_energy();

    const bool charging = vehicle_connected_ && mode_ != ChargeMode::Off;
    const auto state = charging ? LifecycleState::Charging
                                : (vehicle_connected_ ? LifecycleState::ConnectedToEv : LifecycleState::ReadyToCharge);
    const int charge_deciamps = charging ? (override_deciamps_ > 0 ? override_deciamps_ : settings_.current_max_a * 10) : 0;
    const double power_w = charging ? SIM_VOLTAGE_V * (charge_deciamps / 10.0) * settings_.nr_of_phases : 0.0;

    nlohmann::json doc;
    doc["version"] = settings_.version;
    doc["serialnr"] = settings_.serial;
    doc["mode"] = mode_to_string(mode_);
    doc["mode_id"] = static_cast<int>(mode_);
    doc["evse"] = {
        {"state", lifecycle_to_string(state)},
        {"state_id", static_cast<int>(state)},
        {"connected", vehicle_connected_},
        {"error", "None"},
        {"loadbl", 0},
        {"nrofphases", settings_.nr_of_phases},
        {"solar_stop_timer", 0},
    };
    doc["settings"] = {
        {"charge_current", charge_deciamps},
        {"current_min", settings_.current_min_a},
        {"current_max", settings_.current_max_a},
        {"override_current", override_deciamps_},
        {"mains_meter", settings_.mains_meter ? "Sensorbox" : "Disabled"},
    };
    doc["ev_meter"] = {
        {"description", settings_.ev_meter ? "Eastron3P" : "Disabled"},
        {"import_active_power", static_cast<long long>(power_w)},
        {"charged_wh", static_cast<long long>(charged_wh_)},
        {"import_active_energy", static_cast<long long>(imported_wh_)},
    };
    doc["phase_currents"] = {{"L1", charge_deciamps}, {"L2", charge_deciamps}, {"L3", charge_deciamps}};
    return doc;
}

bool SimulatedController::apply(const std::string& key, const std::string& value) {
    const auto parsed = parse_int(value);
    if (!parsed) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    update_energy();
    if (key == "mode") {
        const auto mode = mode_from_int(*parsed);
        if (!mode) return false;
        mode_ = *mode;
    } else if (key == "override_current") {
        if (*parsed != 0 && (*parsed < settings_.current_min_a * 10 || *parsed > settings_.current_max_a * 10)) {
            return false;
        }
        override_deciamps_ = *parsed;
    } else {
        return false;
    }
    ++commands_applied_;
    EVLOG_info << "Simulator applied " << key << "=" << value;
    return true;
}

void SimulatedController::set_vehicle_connected(bool connected) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_energy();
    vehicle_connected_ = connected;
}

ChargeMode SimulatedController::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

int SimulatedController::override_current_deciamps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return override_deciamps_;
}

int SimulatedController::commands_applied() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_applied_;
}

ControllerServer::ControllerServer(SimulatedController& controller, std::string bind_host, int port_hint) :
    controller_(controller), bind_host_(std::move(bind_host)), port_(port_hint) {
}

ControllerServer::~ControllerServer() {
    stop();
}

bool ControllerServer::start() {
    setup_routes();
    server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr eptr) {
        std::string msg = "Unhandled server error";
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& e) {
                msg = e.what();
            }
        }
        res.status = 500;
        res.set_content(nlohmann::json{{"error", msg}}.dump(), "application/json");
    });

    const auto host = bind_host_.empty() ? "0.0.0.0" : bind_host_.c_str();
    if (port_ <= 0 || !server_.bind_to_port(host, port_)) {
        port_ = server_.bind_to_any_port(host);
        if (port_ <= 0) {
            return false;
        }
    }
    server_thread_ = std::thread([this]() { server_.listen_after_bind(); });
    // stop() is a no-op until the accept loop runs
    for (int i = 0; i < 200 && !server_.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return server_.is_running();
}

void ControllerServer::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    server_.stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void ControllerServer::setup_routes() {
    server_.Get("/settings", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(controller_.settings_document().dump(), "application/json");
    });
    server_.Post("/settings", [this](const httplib::Request& req, httplib::Response& res) {
        bool any = false;
        for (const auto* key : {"mode", "override_current"}) {
            if (!req.has_param(key)) continue;
            if (!controller_.apply(key, req.get_param_value(key))) {
                res.status = 400;
                res.set_content(nlohmann::json{{"error", std::string("invalid ") + key}}.dump(), "application/json");
                return;
            }
            any = true;
        }
        if (!any) {
            res.status = 400;
            res.set_content(nlohmann::json{{"error", "no command"}}.dump(), "application/json");
            return;
        }
        res.set_content(controller_.settings_document().dump(), "application/json");
    });
}

} // namespace evselink::sim
