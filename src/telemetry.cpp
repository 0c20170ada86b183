// SPDX-License-Identifier: Apache-2.0
#include "telemetry.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <limits>
#include <sstream>

namespace evselink {

namespace {

constexpr double DECIAMPS_PER_AMP = 10.0;
constexpr double WATTS_PER_KW = 1000.0;
constexpr double WH_PER_KWH = 1000.0;

const std::array<const char*, kLifecycleStateCount> LIFECYCLE_NAMES{{
    "Ready to Charge",
    "Connected to EV",
    "Charging",
    "D",
    "Request State B",
    "State B OK",
    "Request State C",
    "State C OK",
    "Activate",
    "Charging Stopped",
    "Stop Charging",
}};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<long long> parse_integer(const std::string& raw) {
    const auto first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = raw.find_last_not_of(" \t\r\n");
    const char* begin = raw.data() + first;
    const char* end = raw.data() + last + 1;
    long long value = 0;
    const auto res = std::from_chars(begin, end, value);
    if (res.ec != std::errc() || res.ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> parse_int(const std::string& raw) {
    const auto v = parse_integer(raw);
    if (!v || *v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(*v);
}

std::optional<double> parse_scaled(const std::string& raw, double divisor) {
    const auto v = parse_integer(raw);
    if (!v) return std::nullopt;
    return static_cast<double>(*v) / divisor;
}

const nlohmann::json* section(const nlohmann::json& doc, const char* key) {
    if (!doc.is_object()) return nullptr;
    const auto it = doc.find(key);
    if (it == doc.end() || !it->is_object()) return nullptr;
    return &(*it);
}

std::optional<double> number_at(const nlohmann::json* obj, const char* key) {
    if (!obj) return std::nullopt;
    const auto it = obj->find(key);
    if (it == obj->end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

std::optional<int> int_at(const nlohmann::json* obj, const char* key) {
    if (!obj) return std::nullopt;
    const auto it = obj->find(key);
    if (it == obj->end() || !it->is_number()) return std::nullopt;
    // out-of-range values are dropped like any other malformed field
    const double value = it->get<double>();
    if (!(value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<std::string> string_at(const nlohmann::json* obj, const char* key) {
    if (!obj) return std::nullopt;
    const auto it = obj->find(key);
    if (it == obj->end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<bool> bool_at(const nlohmann::json* obj, const char* key) {
    if (!obj) return std::nullopt;
    const auto it = obj->find(key);
    if (it == obj->end()) return std::nullopt;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    return std::nullopt;
}

template <typename T> void take(std::optional<T>& dst, const std::optional<T>& src) {
    if (src) {
        dst = src;
    }
}

} // namespace

bool TelemetrySnapshot::empty() const {
    const bool mains_empty = std::none_of(mains_current_a.begin(), mains_current_a.end(),
                                          [](const std::optional<double>& v) { return v.has_value(); });
    return !serial && !firmware_version && !access && !charge_current_a && !override_current_a && !mode &&
           !mode_text && !phase_count && !lifecycle && !lifecycle_text && !error_text && !load_balancing &&
           !solar_stop_timer_s && mains_empty && !power_kw && !energy_kwh && !imported_energy_kwh &&
           !min_current_a && !max_current_a && !vehicle_connected && !ev_meter_enabled && !mains_meter_enabled;
}

void merge_into(TelemetrySnapshot& base, const TelemetrySnapshot& update) {
    take(base.serial, update.serial);
    take(base.firmware_version, update.firmware_version);
    take(base.access, update.access);
    take(base.charge_current_a, update.charge_current_a);
    take(base.override_current_a, update.override_current_a);
    take(base.mode, update.mode);
    take(base.mode_text, update.mode_text);
    take(base.phase_count, update.phase_count);
    take(base.lifecycle, update.lifecycle);
    take(base.lifecycle_text, update.lifecycle_text);
    take(base.error_text, update.error_text);
    take(base.load_balancing, update.load_balancing);
    take(base.solar_stop_timer_s, update.solar_stop_timer_s);
    for (std::size_t i = 0; i < base.mains_current_a.size(); ++i) {
        take(base.mains_current_a[i], update.mains_current_a[i]);
    }
    take(base.power_kw, update.power_kw);
    take(base.energy_kwh, update.energy_kwh);
    take(base.imported_energy_kwh, update.imported_energy_kwh);
    take(base.min_current_a, update.min_current_a);
    take(base.max_current_a, update.max_current_a);
    take(base.vehicle_connected, update.vehicle_connected);
    take(base.ev_meter_enabled, update.ev_meter_enabled);
    take(base.mains_meter_enabled, update.mains_meter_enabled);
}

TelemetrySnapshot merged(TelemetrySnapshot base, const TelemetrySnapshot& update) {
    merge_into(base, update);
    return base;
}

std::string mode_to_string(ChargeMode mode) {
    switch (mode) {
    case ChargeMode::Off:
        return "Off";
    case ChargeMode::Normal:
        return "Normal";
    case ChargeMode::Solar:
        return "Solar";
    case ChargeMode::Smart:
        return "Smart";
    }
    return "Off";
}

ChargeMode mode_from_string(const std::string& text) {
    const auto lower = to_lower(text);
    if (lower == "normal") return ChargeMode::Normal;
    if (lower == "solar") return ChargeMode::Solar;
    if (lower == "smart") return ChargeMode::Smart;
    return ChargeMode::Off;
}

std::optional<ChargeMode> mode_from_int(int value) {
    if (value < 0 || value > 3) {
        return std::nullopt;
    }
    return static_cast<ChargeMode>(value);
}

std::string lifecycle_to_string(LifecycleState state) {
    const auto idx = static_cast<std::size_t>(state);
    return idx < LIFECYCLE_NAMES.size() ? LIFECYCLE_NAMES[idx] : LIFECYCLE_NAMES[0];
}

LifecycleState lifecycle_from_string(const std::string& text) {
    for (std::size_t i = 0; i < LIFECYCLE_NAMES.size(); ++i) {
        if (text == LIFECYCLE_NAMES[i]) {
            return static_cast<LifecycleState>(i);
        }
    }
    return LifecycleState::ReadyToCharge;
}

std::optional<LifecycleState> lifecycle_from_id(int id) {
    if (id < 0 || id >= kLifecycleStateCount) {
        return std::nullopt;
    }
    return static_cast<LifecycleState>(id);
}

TelemetrySnapshot decode_push_value(const std::string& topic_suffix, const std::string& raw_value) {
    TelemetrySnapshot out;
    const auto& t = topic_suffix;
    if (t == "Version") {
        out.firmware_version = raw_value;
    } else if (t == "Access") {
        out.access = parse_int(raw_value);
    } else if (t == "ChargeCurrent") {
        out.charge_current_a = parse_scaled(raw_value, DECIAMPS_PER_AMP);
    } else if (t == "ChargeCurrentOverride") {
        out.override_current_a = parse_scaled(raw_value, DECIAMPS_PER_AMP);
    } else if (t == "Mode") {
        out.mode_text = to_lower(raw_value);
        out.mode = mode_from_string(raw_value);
    } else if (t == "NrOfPhases") {
        out.phase_count = parse_int(raw_value);
    } else if (t == "State") {
        out.lifecycle_text = raw_value;
        out.lifecycle = lifecycle_from_string(raw_value);
    } else if (t == "Error") {
        out.error_text = raw_value;
    } else if (t == "LoadBl") {
        out.load_balancing = parse_int(raw_value);
    } else if (t == "SolarStopTimer") {
        out.solar_stop_timer_s = parse_int(raw_value);
    } else if (t == "MainsCurrentL1") {
        out.mains_current_a[0] = parse_scaled(raw_value, DECIAMPS_PER_AMP);
        if (out.mains_current_a[0]) {
            out.mains_meter_enabled = true;
        }
    } else if (t == "MainsCurrentL2") {
        out.mains_current_a[1] = parse_scaled(raw_value, DECIAMPS_PER_AMP);
    } else if (t == "MainsCurrentL3") {
        out.mains_current_a[2] = parse_scaled(raw_value, DECIAMPS_PER_AMP);
    } else if (t == "EVChargePower") {
        out.power_kw = parse_scaled(raw_value, WATTS_PER_KW);
    } else if (t == "EVEnergyCharged") {
        out.energy_kwh = parse_scaled(raw_value, WH_PER_KWH);
        if (out.energy_kwh) {
            out.ev_meter_enabled = true;
        }
    } else if (t == "EVImportActiveEnergy") {
        out.imported_energy_kwh = parse_scaled(raw_value, WH_PER_KWH);
    } else if (t == "MaxCurrent") {
        out.max_current_a = parse_scaled(raw_value, DECIAMPS_PER_AMP);
    }
    return out;
}

TelemetrySnapshot decode_poll_document(const nlohmann::json& document) {
    TelemetrySnapshot out;
    if (!document.is_object()) {
        return out;
    }
    const auto* evse = section(document, "evse");
    const auto* settings = section(document, "settings");
    const auto* ev_meter = section(document, "ev_meter");
    const auto* phases = section(document, "phase_currents");

    if (const auto serial_it = document.find("serialnr"); serial_it != document.end()) {
        if (serial_it->is_string()) {
            out.serial = serial_it->get<std::string>();
        } else if (serial_it->is_number_integer()) {
            out.serial = std::to_string(serial_it->get<long long>());
        }
    }
    out.firmware_version = string_at(&document, "version");

    if (const auto mode_id = int_at(&document, "mode_id")) {
        out.mode = mode_from_int(*mode_id);
    }
    if (const auto mode_text = string_at(&document, "mode")) {
        out.mode_text = to_lower(*mode_text);
        if (!out.mode) {
            out.mode = mode_from_string(*mode_text);
        }
    }

    out.lifecycle_text = string_at(evse, "state");
    if (const auto state_id = int_at(evse, "state_id")) {
        out.lifecycle = lifecycle_from_id(*state_id);
    }
    if (!out.lifecycle && out.lifecycle_text) {
        out.lifecycle = lifecycle_from_string(*out.lifecycle_text);
    }
    out.vehicle_connected = bool_at(evse, "connected");
    out.error_text = string_at(evse, "error");
    out.load_balancing = int_at(evse, "loadbl");
    out.phase_count = int_at(evse, "nrofphases");
    out.solar_stop_timer_s = int_at(evse, "solar_stop_timer");
    out.access = int_at(evse, "access");

    if (const auto v = number_at(settings, "charge_current")) out.charge_current_a = *v / DECIAMPS_PER_AMP;
    if (const auto v = number_at(settings, "override_current")) out.override_current_a = *v / DECIAMPS_PER_AMP;
    out.min_current_a = number_at(settings, "current_min");
    out.max_current_a = number_at(settings, "current_max");
    if (const auto meter = string_at(settings, "mains_meter")) out.mains_meter_enabled = *meter != "Disabled";

    if (const auto desc = string_at(ev_meter, "description")) out.ev_meter_enabled = *desc != "Disabled";
    if (const auto v = number_at(ev_meter, "import_active_power")) out.power_kw = *v / WATTS_PER_KW;
    if (const auto v = number_at(ev_meter, "charged_wh")) out.energy_kwh = *v / WH_PER_KWH;
    if (const auto v = number_at(ev_meter, "import_active_energy")) out.imported_energy_kwh = *v / WH_PER_KWH;

    static const std::array<const char*, 3> phase_keys{{"L1", "L2", "L3"}};
    for (std::size_t i = 0; i < phase_keys.size(); ++i) {
        if (const auto v = number_at(phases, phase_keys[i])) {
            out.mains_current_a[i] = *v / DECIAMPS_PER_AMP;
        }
    }
    return out;
}

std::string describe(const TelemetrySnapshot& s) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << (s.lifecycle ? lifecycle_to_string(*s.lifecycle) : std::string("-"));
    oss << " | mode " << (s.mode ? mode_to_string(*s.mode) : std::string("-"));
    if (s.charge_current_a) oss << " | " << *s.charge_current_a << " A";
    if (s.override_current_a && *s.override_current_a > 0.0) oss << " (override " << *s.override_current_a << " A)";
    if (s.phase_count) oss << " | " << *s.phase_count << "ph";
    if (s.power_kw) oss << " | " << std::setprecision(2) << *s.power_kw << " kW" << std::setprecision(1);
    if (s.energy_kwh) oss << " | " << *s.energy_kwh << " kWh";
    if (s.mains_current_a[0] || s.mains_current_a[1] || s.mains_current_a[2]) {
        oss << " | mains";
        for (const auto& l : s.mains_current_a) {
            oss << " " << (l ? *l : 0.0);
        }
    }
    if (s.solar_stop_timer_s && *s.solar_stop_timer_s > 0) oss << " | solar stop in " << *s.solar_stop_timer_s << "s";
    if (s.error_text && *s.error_text != "None") oss << " | error: " << *s.error_text;
    return oss.str();
}

} // namespace evselink
