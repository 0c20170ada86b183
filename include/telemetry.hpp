// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace evselink {

enum class ChargeMode { Off = 0, Normal = 1, Solar = 2, Smart = 3 };

/// \brief Controller lifecycle phases, ids fixed by the controller firmware.
enum class LifecycleState {
    ReadyToCharge = 0,
    ConnectedToEv = 1,
    Charging = 2,
    D = 3,
    RequestStateB = 4,
    StateBOk = 5,
    RequestStateC = 6,
    StateCOk = 7,
    Activate = 8,
    ChargingStopped = 9,
    StopCharging = 10
};

/// \brief Canonical decoded controller state. Every field is optional so that partial
/// updates from either transport can be merged field by field.
struct TelemetrySnapshot {
    std::optional<std::string> serial;
    std::optional<std::string> firmware_version;
    std::optional<int> access;
    std::optional<double> charge_current_a;
    std::optional<double> override_current_a; // 0 => no override
    std::optional<ChargeMode> mode;
    std::optional<std::string> mode_text;
    std::optional<int> phase_count;
    std::optional<LifecycleState> lifecycle;
    std::optional<std::string> lifecycle_text;
    std::optional<std::string> error_text; // "None" => no error
    std::optional<int> load_balancing;
    std::optional<int> solar_stop_timer_s;
    std::array<std::optional<double>, 3> mains_current_a{};
    std::optional<double> power_kw;
    std::optional<double> energy_kwh;
    std::optional<double> imported_energy_kwh;
    std::optional<double> min_current_a;
    std::optional<double> max_current_a;
    std::optional<bool> vehicle_connected;
    std::optional<bool> ev_meter_enabled;
    std::optional<bool> mains_meter_enabled;

    bool empty() const;
};

constexpr int kLifecycleStateCount = 11;

/// \brief Field-wise union, last write wins. Fields absent in \p update keep their value in \p base.
void merge_into(TelemetrySnapshot& base, const TelemetrySnapshot& update);
TelemetrySnapshot merged(TelemetrySnapshot base, const TelemetrySnapshot& update);

std::string mode_to_string(ChargeMode mode);
ChargeMode mode_from_string(const std::string& text);
std::optional<ChargeMode> mode_from_int(int value);

std::string lifecycle_to_string(LifecycleState state);
LifecycleState lifecycle_from_string(const std::string& text);
std::optional<LifecycleState> lifecycle_from_id(int id);

/// \brief Decode one push message (topic relative to the device root) into a partial snapshot.
/// Unknown topics and unparsable values yield an empty snapshot.
TelemetrySnapshot decode_push_value(const std::string& topic_suffix, const std::string& raw_value);

/// \brief Decode a poll status document. Fields that are missing or of the wrong type are omitted.
TelemetrySnapshot decode_poll_document(const nlohmann::json& document);

std::string describe(const TelemetrySnapshot& snapshot);

} // namespace evselink
