// SPDX-License-Identifier: Apache-2.0
#include "transport_engine.hpp"

#include <everest/logging.hpp>

#include <cctype>
#include <utility>
#include <variant>

namespace evselink {

namespace {
constexpr const char* ERROR_UNAVAILABLE = "Connection unavailable - check network";
constexpr const char* ERROR_NO_PUSH_DATA = "Connection lost - no data received";
constexpr const char* ERROR_NO_DEVICE = "Select a device first";
} // namespace

std::string to_string(EngineState state) {
    switch (state) {
    case EngineState::Idle:
        return "Idle";
    case EngineState::Connecting:
        return "Connecting";
    case EngineState::PollActive:
        return "PollActive";
    case EngineState::PushActive:
        return "PushActive";
    case EngineState::PushStale:
        return "PushStale";
    case EngineState::Disconnected:
        return "Disconnected";
    }
    return "Unknown";
}

std::string to_string(ActiveTransport transport) {
    switch (transport) {
    case ActiveTransport::None:
        return "none";
    case ActiveTransport::Poll:
        return "poll";
    case ActiveTransport::Push:
        return "push";
    }
    return "none";
}

TransportEngine::TransportEngine(PollTransport& poll, PushTransport& push, std::string identity,
                                 PollConfig poll_config, EngineConfig engine_config) :
    poll_(poll),
    push_(push),
    identity_(std::move(identity)),
    poll_period_(std::chrono::seconds(poll_config.period_s)),
    data_timeout_(std::chrono::seconds(engine_config.data_timeout_s)),
    tick_period_(std::chrono::milliseconds(engine_config.tick_ms)),
    background_push_open_(engine_config.background_push_open) {
    push_.set_telemetry_handler([this](const SessionHandle& session, const TelemetrySnapshot& snapshot) {
        PushEvent event;
        event.kind = EventKind::Telemetry;
        event.session_id = session.id;
        event.snapshot = snapshot;
        enqueue(std::move(event));
    });
    push_.set_connection_handler([this](const SessionHandle& session, bool connected) {
        PushEvent event;
        event.kind = EventKind::Connection;
        event.session_id = session.id;
        event.connected = connected;
        enqueue(std::move(event));
    });
}

TransportEngine::~TransportEngine() {
    stop();
    {
        std::lock_guard<std::mutex> io(io_mutex_);
        Lock lock(mutex_);
        teardown_session(lock);
    }
    push_.set_telemetry_handler({});
    push_.set_connection_handler({});
}

void TransportEngine::subscribe(UpdateHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void TransportEngine::set_refresh_request_handler(RefreshRequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_handler_ = std::move(handler);
}

void TransportEngine::enqueue(PushEvent event) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_.push_back(std::move(event));
}

void TransportEngine::drain_events(Lock& lock, Clock::time_point now) {
    std::deque<PushEvent> pending;
    {
        std::lock_guard<std::mutex> events_lock(events_mutex_);
        pending.swap(events_);
    }
    for (const auto& event : pending) {
        handle_event(lock, event, now);
    }
}

void TransportEngine::handle_event(Lock& lock, const PushEvent& event, Clock::time_point now) {
    switch (event.kind) {
    case EventKind::OpenResult:
        if (event.generation != generation_) {
            return;
        }
        push_opening_ = false;
        dirty_ = true;
        if (!event.session) {
            EVLOG_warning << "Push session could not be opened: "
                          << (event.error ? event.error->message : std::string("unknown error"));
            return;
        }
        push_session_ = event.session;
        if (state_ != EngineState::Idle) {
            EVLOG_info << "Push session open for " << event.session->serial;
            enter_push_active(now);
        }
        return;

    case EventKind::Connection:
        if (!push_session_ || push_session_->id != event.session_id) {
            return;
        }
        dirty_ = true;
        if (event.connected) {
            if (state_ != EngineState::Idle) {
                enter_push_active(now);
            }
            return;
        }
        if (state_ == EngineState::PushActive || state_ == EngineState::PushStale) {
            EVLOG_warning << "Push session lost, polling";
            data_deadline_.reset();
            poll_deadline_ = now + poll_period_;
            do_poll(lock, now);
        }
        return;

    case EventKind::Telemetry:
        if (!push_session_ || push_session_->id != event.session_id) {
            return;
        }
        if (state_ != EngineState::PushActive && state_ != EngineState::PushStale) {
            return;
        }
        merge_into(snapshot_, event.snapshot);
        dirty_ = true;
        if (state_ == EngineState::PushStale) {
            EVLOG_info << "Push data resumed";
            enter_push_active(now);
        } else {
            data_deadline_ = now + data_timeout_;
        }
        return;
    }
}

void TransportEngine::enter_state(EngineState next) {
    if (state_ != next) {
        EVLOG_debug << "Transport " << to_string(state_) << " -> " << to_string(next);
        state_ = next;
        dirty_ = true;
    }
}

void TransportEngine::enter_push_active(Clock::time_point now) {
    enter_state(EngineState::PushActive);
    status_.active_transport = ActiveTransport::Push;
    status_.last_error.reset();
    status_.recovering = false;
    data_deadline_ = now + data_timeout_;
    dirty_ = true;
}

bool TransportEngine::push_live_locked() const {
    return push_session_.has_value() && push_.is_live();
}

bool TransportEngine::do_poll(Lock& lock, Clock::time_point now) {
    const auto address = device_ ? device_->address : std::nullopt;
    if (!address || address->empty()) {
        on_poll_failure(lock, now, "no address known");
        return false;
    }

    lock.unlock();
    auto result = poll_.fetch_snapshot(*address);
    lock.lock();

    if (!result.snapshot) {
        on_poll_failure(lock, now, result.error ? result.error->message : std::string("no snapshot"));
        return false;
    }
    merge_into(snapshot_, *result.snapshot);
    data_deadline_.reset();
    status_.active_transport = ActiveTransport::Poll;
    status_.last_error.reset();
    status_.recovering = false;
    enter_state(EngineState::PollActive);
    dirty_ = true;
    return true;
}

void TransportEngine::on_poll_failure(Lock& lock, Clock::time_point now, const std::string& reason) {
    EVLOG_debug << "Poll failed: " << reason;
    if (push_live_locked()) {
        if (state_ != EngineState::PushActive) {
            EVLOG_info << "Poll unavailable, using push session";
            enter_push_active(now);
        }
        return;
    }

    start_push_open(lock, false);

    const bool entering = state_ != EngineState::Disconnected;
    enter_state(EngineState::Disconnected);
    data_deadline_.reset();
    status_.active_transport = ActiveTransport::None;
    status_.recovering = false;
    status_.last_error = ERROR_UNAVAILABLE;
    dirty_ = true;

    if (entering && device_) {
        EVLOG_warning << "Device " << device_->serial << " unreachable: " << reason;
        if (refresh_handler_) {
            auto handler = refresh_handler_;
            const auto serial = device_->serial;
            lock.unlock();
            handler(serial);
            lock.lock();
        }
    }
}

void TransportEngine::handle_poll_tick(Lock& lock, Clock::time_point now) {
    poll_deadline_ = now + poll_period_;
    switch (state_) {
    case EngineState::Idle:
    case EngineState::PushActive:
    case EngineState::PushStale:
        return;
    default:
        break;
    }
    do_poll(lock, now);
}

void TransportEngine::handle_data_timeout(Lock& lock, Clock::time_point now) {
    data_deadline_.reset();
    if (state_ != EngineState::PushActive && state_ != EngineState::PushStale) {
        return;
    }
    if (state_ == EngineState::PushActive) {
        EVLOG_warning << "No push data for " << data_timeout_.count() << "s, probing via poll";
        enter_state(EngineState::PushStale);
        status_.recovering = true;
    }

    std::optional<TelemetrySnapshot> probed;
    const auto address = device_ ? device_->address : std::nullopt;
    if (address && !address->empty()) {
        lock.unlock();
        auto result = poll_.fetch_snapshot(*address);
        lock.lock();
        probed = std::move(result.snapshot);
    }

    dirty_ = true;
    if (probed) {
        merge_into(snapshot_, *probed);
        status_.active_transport = ActiveTransport::Poll;
        status_.last_error.reset();
        status_.recovering = false;
        enter_state(EngineState::PollActive);
        poll_deadline_ = now + poll_period_;
        return;
    }
    status_.last_error = ERROR_NO_PUSH_DATA;
    status_.recovering = true;
    data_deadline_ = now + data_timeout_;
}

void TransportEngine::start_push_open(Lock& lock, bool force) {
    if (!device_ || !device_->has_credential() || push_opening_) {
        return;
    }
    if (push_session_ && !force) {
        return;
    }
    join_open_thread(lock);

    push_opening_ = true;
    push_session_.reset();
    const auto generation = generation_;
    const auto serial = device_->serial;
    const auto credential = *device_->credential;

    auto job = [this, generation, serial, credential]() {
        PushEvent event;
        event.kind = EventKind::OpenResult;
        event.generation = generation;
        try {
            auto result = push_.open(serial, identity_, credential);
            event.session = std::move(result.session);
            event.error = std::move(result.error);
        } catch (const std::exception& e) {
            event.error = TransportError{ErrorKind::TransportOpen, e.what(), std::nullopt};
        }
        enqueue(std::move(event));
    };

    if (background_push_open_) {
        open_thread_ = std::thread(job);
    } else {
        lock.unlock();
        job();
        lock.lock();
    }
}

void TransportEngine::join_open_thread(Lock& lock) {
    if (!open_thread_.joinable()) {
        return;
    }
    lock.unlock();
    open_thread_.join();
    lock.lock();
}

void TransportEngine::teardown_session(Lock& lock) {
    poll_deadline_.reset();
    data_deadline_.reset();
    ++generation_;
    join_open_thread(lock);
    push_opening_ = false;

    lock.unlock();
    push_.close();
    lock.lock();

    push_session_.reset();
    std::lock_guard<std::mutex> events_lock(events_mutex_);
    events_.clear();
}

void TransportEngine::select(const Device& device, Clock::time_point now) {
    std::lock_guard<std::mutex> io(io_mutex_);
    Lock lock(mutex_);
    teardown_session(lock);

    device_ = device;
    snapshot_ = TelemetrySnapshot{};
    status_ = ConnectivityStatus{};
    enter_state(EngineState::Connecting);
    dirty_ = true;
    poll_deadline_ = now + poll_period_;
    EVLOG_info << "Selected device " << device.serial << (device.has_credential() ? " (paired)" : "");

    if (device.has_credential()) {
        start_push_open(lock, false);
        drain_events(lock, now);
    } else {
        do_poll(lock, now);
    }
    emit(lock);
}

void TransportEngine::deselect() {
    std::lock_guard<std::mutex> io(io_mutex_);
    Lock lock(mutex_);
    if (state_ == EngineState::Idle && !device_) {
        return;
    }
    teardown_session(lock);
    if (device_) {
        EVLOG_info << "Deselected device " << device_->serial;
    }
    device_.reset();
    snapshot_ = TelemetrySnapshot{};
    status_ = ConnectivityStatus{};
    enter_state(EngineState::Idle);
    dirty_ = true;
    emit(lock);
}

void TransportEngine::update_device(const Device& device) {
    std::lock_guard<std::mutex> io(io_mutex_);
    Lock lock(mutex_);
    if (!device_ || device_->serial != device.serial) {
        return;
    }
    if (device.address) device_->address = device.address;
    if (device.credential) device_->credential = device.credential;
    if (device.display_name) device_->display_name = device.display_name;
}

void TransportEngine::on_app_pause() {
    std::lock_guard<std::mutex> io(io_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    poll_deadline_.reset();
}

void TransportEngine::on_app_resume(Clock::time_point now) {
    std::lock_guard<std::mutex> io(io_mutex_);
    Lock lock(mutex_);
    if (state_ == EngineState::Idle || !device_) {
        return;
    }
    drain_events(lock, now);
    poll_deadline_ = now + poll_period_;

    if (push_live_locked()) {
        if (state_ != EngineState::PushActive) {
            enter_push_active(now);
        }
    } else {
        if (device_->address && !device_->address->empty()) {
            do_poll(lock, now);
        }
        start_push_open(lock, false);
        drain_events(lock, now);
    }
    emit(lock);
}

bool TransportEngine::reconnect_push(Clock::time_point now) {
    std::lock_guard<std::mutex> io(io_mutex_);
    Lock lock(mutex_);
    if (!device_ || !device_->has_credential()) {
        return false;
    }
    drain_events(lock, now);
    if (push_live_locked()) {
        enter_push_active(now);
    } else {
        start_push_open(lock, true);
        drain_events(lock, now);
    }
    emit(lock);
    return true;
}

void TransportEngine::tick(Clock::time_point now) {
    std::lock_guard<std::mutex> io(io_mutex_);
    Lock lock(mutex_);
    drain_events(lock, now);
    if (state_ != EngineState::Idle) {
        if (data_deadline_ && now >= *data_deadline_) {
            handle_data_timeout(lock, now);
        }
        if (poll_deadline_ && now >= *poll_deadline_) {
            handle_poll_tick(lock, now);
        }
    }
    emit(lock);
}

CommandResult TransportEngine::set_mode(ChargeMode mode) {
    if (!mode_from_int(static_cast<int>(mode))) {
        return CommandResult{false, ActiveTransport::None, "Unknown mode"};
    }
    return dispatch(ModeCommand{mode});
}

CommandResult TransportEngine::set_override_current(int deciamps) {
    if (deciamps < 0) {
        return CommandResult{false, ActiveTransport::None, "Override current must not be negative"};
    }
    if (deciamps != 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        const double amps = deciamps / 10.0;
        const auto& min = snapshot_.min_current_a;
        const auto& max = snapshot_.max_current_a;
        if ((min && amps < *min) || (max && amps > *max)) {
            return CommandResult{false, ActiveTransport::None,
                                 "Override current must be 0 or between " + std::to_string(min ? *min : 0.0) +
                                     " and " + std::to_string(max ? *max : 0.0) + " A"};
        }
    }
    return dispatch(OverrideCurrentCommand{deciamps});
}

void TransportEngine::apply_optimistic(const DeviceCommand& command) {
    if (const auto* mode = std::get_if<ModeCommand>(&command)) {
        snapshot_.mode = mode->mode;
        auto text = mode_to_string(mode->mode);
        for (auto& c : text) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        snapshot_.mode_text = text;
    } else {
        snapshot_.override_current_a = std::get<OverrideCurrentCommand>(command).deciamps / 10.0;
    }
    dirty_ = true;
}

CommandResult TransportEngine::dispatch(const DeviceCommand& command) {
    std::lock_guard<std::mutex> io(io_mutex_);
    Lock lock(mutex_);
    if (!device_) {
        return CommandResult{false, ActiveTransport::None, ERROR_NO_DEVICE};
    }

    auto send_push = [&]() {
        const auto session = *push_session_;
        lock.unlock();
        std::optional<TransportError> err;
        if (const auto* mode = std::get_if<ModeCommand>(&command)) {
            err = push_.send_mode(session, mode->mode);
        } else {
            err = push_.send_override_current(session, std::get<OverrideCurrentCommand>(command).deciamps);
        }
        lock.lock();
        return err;
    };

    if (state_ == EngineState::PushActive && push_live_locked()) {
        if (auto err = send_push()) {
            EVLOG_warning << "Push command failed: " << err->message;
            return CommandResult{false, ActiveTransport::Push, err->message};
        }
        apply_optimistic(command);
        emit(lock);
        return CommandResult{true, ActiveTransport::Push, {}};
    }

    const auto address = device_->address;
    if (address && !address->empty()) {
        lock.unlock();
        auto err = poll_.send_command(*address, command);
        lock.lock();
        if (!err) {
            lock.unlock();
            auto refresh = poll_.fetch_snapshot(*address);
            lock.lock();
            if (refresh.snapshot) {
                merge_into(snapshot_, *refresh.snapshot);
                dirty_ = true;
            }
            emit(lock);
            return CommandResult{true, ActiveTransport::Poll, {}};
        }
        EVLOG_info << "Poll command failed: " << err->message;
    }

    if (push_live_locked()) {
        if (auto err = send_push()) {
            EVLOG_warning << "Push command failed: " << err->message;
            return CommandResult{false, ActiveTransport::Push, err->message};
        }
        apply_optimistic(command);
        emit(lock);
        return CommandResult{true, ActiveTransport::Push, {}};
    }
    return CommandResult{false, ActiveTransport::None, ERROR_UNAVAILABLE};
}

EngineState TransportEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ConnectivityStatus TransportEngine::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = status_;
    out.push_session_live = push_live_locked();
    return out;
}

TelemetrySnapshot TransportEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

std::optional<Device> TransportEngine::device() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_;
}

void TransportEngine::emit(Lock& lock) {
    const bool live = push_live_locked();
    if (status_.push_session_live != live) {
        status_.push_session_live = live;
        dirty_ = true;
    }
    if (!dirty_) {
        return;
    }
    dirty_ = false;
    const EngineUpdate update{snapshot_, status_, state_};
    const auto handlers = handlers_;
    lock.unlock();
    for (const auto& handler : handlers) {
        handler(update);
    }
    lock.lock();
}

void TransportEngine::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&TransportEngine::run_loop, this);
}

void TransportEngine::stop() {
    running_ = false;
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TransportEngine::run_loop() {
    while (running_) {
        try {
            tick(Clock::now());
        } catch (const std::exception& e) {
            EVLOG_error << "Transport tick failed: " << e.what();
        }
        std::this_thread::sleep_for(tick_period_);
    }
}

} // namespace evselink
