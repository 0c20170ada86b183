// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "client_config.hpp"
#include "device_registry.hpp"
#include "poll_transport.hpp"
#include "push_transport.hpp"
#include "telemetry.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace evselink {

enum class EngineState { Idle, Connecting, PollActive, PushActive, PushStale, Disconnected };

enum class ActiveTransport { None, Poll, Push };

struct ConnectivityStatus {
    ActiveTransport active_transport{ActiveTransport::None};
    bool push_session_live{false};
    std::optional<std::string> last_error;
    bool recovering{false}; // push claimed but no data; a poll probe is standing in
};

struct EngineUpdate {
    TelemetrySnapshot snapshot;
    ConnectivityStatus status;
    EngineState state{EngineState::Idle};
};

struct CommandResult {
    bool ok{false};
    ActiveTransport via{ActiveTransport::None};
    std::string message;
};

std::string to_string(EngineState state);
std::string to_string(ActiveTransport transport);

/// \brief Owns the selected device session and arbitrates between the poll and push channels.
///
/// Every operation is serialised; network I/O runs without the state lock held so that getters
/// stay responsive. Push callbacks only enqueue events which tick() drains, so all state
/// transitions happen on the caller of tick()/select()/commands. Update handlers run on that
/// thread and must not call back into the engine.
class TransportEngine {
public:
    using Clock = std::chrono::steady_clock;
    using UpdateHandler = std::function<void(const EngineUpdate&)>;
    using RefreshRequestHandler = std::function<void(const std::string& serial)>;

    TransportEngine(PollTransport& poll, PushTransport& push, std::string identity, PollConfig poll_config,
                    EngineConfig engine_config);
    ~TransportEngine();

    TransportEngine(const TransportEngine&) = delete;
    TransportEngine& operator=(const TransportEngine&) = delete;

    void subscribe(UpdateHandler handler);
    void set_refresh_request_handler(RefreshRequestHandler handler);

    void select(const Device& device, Clock::time_point now = Clock::now());
    void deselect();
    void update_device(const Device& device);

    void on_app_resume(Clock::time_point now = Clock::now());
    void on_app_pause();
    bool reconnect_push(Clock::time_point now = Clock::now());

    void tick(Clock::time_point now);

    CommandResult set_mode(ChargeMode mode);
    CommandResult set_override_current(int deciamps);

    EngineState state() const;
    ConnectivityStatus status() const;
    TelemetrySnapshot snapshot() const;
    std::optional<Device> device() const;

    void start();
    void stop();

private:
    enum class EventKind { OpenResult, Connection, Telemetry };

    struct PushEvent {
        EventKind kind{EventKind::Telemetry};
        std::uint64_t generation{0};
        std::uint64_t session_id{0};
        std::optional<SessionHandle> session;
        std::optional<TransportError> error;
        bool connected{false};
        TelemetrySnapshot snapshot;
    };

    using Lock = std::unique_lock<std::mutex>;

    void enqueue(PushEvent event);
    void drain_events(Lock& lock, Clock::time_point now);
    void handle_event(Lock& lock, const PushEvent& event, Clock::time_point now);

    bool do_poll(Lock& lock, Clock::time_point now);
    void on_poll_failure(Lock& lock, Clock::time_point now, const std::string& reason);
    void handle_poll_tick(Lock& lock, Clock::time_point now);
    void handle_data_timeout(Lock& lock, Clock::time_point now);

    void enter_push_active(Clock::time_point now);
    void enter_state(EngineState next);
    void start_push_open(Lock& lock, bool force);
    void join_open_thread(Lock& lock);
    void teardown_session(Lock& lock);
    bool push_live_locked() const;

    CommandResult dispatch(const DeviceCommand& command);
    void apply_optimistic(const DeviceCommand& command);

    void emit(Lock& lock);
    void run_loop();

    PollTransport& poll_;
    PushTransport& push_;
    std::string identity_;
    std::chrono::seconds poll_period_;
    std::chrono::seconds data_timeout_;
    std::chrono::milliseconds tick_period_;
    bool background_push_open_;

    std::mutex io_mutex_;

    mutable std::mutex mutex_;
    EngineState state_{EngineState::Idle};
    ConnectivityStatus status_;
    TelemetrySnapshot snapshot_;
    std::optional<Device> device_;
    std::optional<SessionHandle> push_session_;
    std::optional<Clock::time_point> poll_deadline_;
    std::optional<Clock::time_point> data_deadline_;
    std::uint64_t generation_{0};
    bool push_opening_{false};
    bool dirty_{false};
    std::vector<UpdateHandler> handlers_;
    RefreshRequestHandler refresh_handler_;

    std::mutex events_mutex_;
    std::deque<PushEvent> events_;

    std::thread open_thread_;
    std::thread worker_;
    std::atomic<bool> running_{false};
};

} // namespace evselink
