// SPDX-License-Identifier: Apache-2.0
#include "transport_engine.hpp"
#include "test_doubles.hpp"

#include <cassert>
#include <iostream>
#include <thread>

using namespace evselink;
using namespace evselink::testing;

namespace {
using Clock = TransportEngine::Clock;

const std::string IDENTITY = "0f1e2d3c-4b5a-4978-8695-a4b3c2d1e0f9";
const Clock::time_point T0 = Clock::now();

Clock::time_point at(int seconds) {
    return T0 + std::chrono::seconds(seconds);
}

const char* STATUS_DOC =
    R"({"evse":{"state":"Charging","state_id":2,"connected":true,"error":"None","nrofphases":3},
        "settings":{"charge_current":160,"current_min":6,"current_max":16,"override_current":0},
        "serialnr":"12345","mode":"NORMAL","mode_id":1})";

Device paired_device() {
    return Device{"12345", std::string("10.0.0.5"), std::string("token"), std::nullopt};
}

Device local_device() {
    return Device{"12345", std::string("10.0.0.5"), std::nullopt, std::nullopt};
}

PushConfig quick_push() {
    PushConfig cfg;
    cfg.settle_delay_ms = 0;
    return cfg;
}

EngineConfig inline_engine() {
    return EngineConfig{30, 100, false};
}

/// Fakes and an engine wired together; the engine is declared last so it is torn down first.
struct Rig {
    std::shared_ptr<FakeBroker> broker{std::make_shared<FakeBroker>()};
    FakeHttpClient http{[](const HttpRequest&) { return respond(200, STATUS_DOC); }};
    PollTransport poll{http};
    PushTransport push{quick_push(), "SmartEVSE", fake_client_factory(broker)};
    TransportEngine engine;

    explicit Rig(EngineConfig config = inline_engine()) : engine(poll, push, IDENTITY, PollConfig{}, config) {
    }

    void http_up() {
        http.set_handler([](const HttpRequest&) { return respond(200, STATUS_DOC); });
    }
    void http_down() {
        http.set_handler([](const HttpRequest&) { return fail(ErrorKind::TransportTimeout); });
    }
};
} // namespace

static void unpaired_device_polls() {
    Rig rig;
    std::vector<EngineUpdate> updates;
    rig.engine.subscribe([&](const EngineUpdate& u) { updates.push_back(u); });

    rig.engine.select(local_device(), at(0));
    assert(rig.engine.state() == EngineState::PollActive);
    assert(rig.engine.status().active_transport == ActiveTransport::Poll);
    assert(!rig.engine.status().push_session_live);
    assert(rig.broker->connect_calls == 0);
    assert(rig.http.count("GET") == 1);
    assert(rig.engine.snapshot().charge_current_a == 16.0);
    assert(!updates.empty() && updates.back().state == EngineState::PollActive);

    rig.engine.tick(at(4));
    assert(rig.http.count("GET") == 1);
    rig.engine.tick(at(5));
    assert(rig.http.count("GET") == 2);
    rig.engine.tick(at(10));
    assert(rig.http.count("GET") == 3);
}

static void paired_device_uses_push_without_polling() {
    Rig rig;
    rig.engine.select(paired_device(), at(0));
    assert(rig.engine.state() == EngineState::PushActive);
    const auto status = rig.engine.status();
    assert(status.active_transport == ActiveTransport::Push);
    assert(status.push_session_live);
    assert(!status.last_error);
    assert(rig.broker->connect_calls == 1);

    rig.engine.tick(at(5));
    rig.engine.tick(at(10));
    assert(rig.http.count("GET") == 0);
    assert(rig.engine.state() == EngineState::PushActive);

    rig.broker->deliver("SmartEVSE-12345/ChargeCurrent", "130");
    rig.broker->deliver("SmartEVSE-12345/State", "Charging");
    rig.engine.tick(at(11));
    const auto snap = rig.engine.snapshot();
    assert(snap.charge_current_a == 13.0);
    assert(snap.lifecycle == LifecycleState::Charging);
    assert(rig.http.count("GET") == 0);
}

static void silent_push_is_probed_once_and_recovers() {
    Rig rig;
    rig.engine.select(paired_device(), at(0));
    for (int s = 5; s < 30; s += 5) {
        rig.engine.tick(at(s));
    }
    assert(rig.http.count("GET") == 0);

    rig.engine.tick(at(30));
    assert(rig.http.count("GET") == 1);
    assert(rig.engine.state() == EngineState::PollActive);
    const auto status = rig.engine.status();
    assert(status.active_transport == ActiveTransport::Poll);
    assert(!status.recovering);
    assert(!status.last_error);
}

static void silent_push_without_poll_reports_lost_data() {
    Rig rig;
    rig.engine.select(paired_device(), at(0));
    for (int s = 5; s < 30; s += 5) {
        rig.engine.tick(at(s));
    }
    rig.http_down();

    rig.engine.tick(at(30));
    assert(rig.http.count("GET") == 1);
    assert(rig.engine.state() == EngineState::PushStale);
    auto status = rig.engine.status();
    assert(status.recovering);
    assert(status.last_error == std::string("Connection lost - no data received"));

    rig.engine.tick(at(35));
    rig.engine.tick(at(40));
    assert(rig.http.count("GET") == 1);

    rig.broker->deliver("SmartEVSE-12345/Mode", "Smart");
    rig.engine.tick(at(41));
    assert(rig.engine.state() == EngineState::PushActive);
    status = rig.engine.status();
    assert(!status.recovering);
    assert(!status.last_error);
    assert(rig.engine.snapshot().mode == ChargeMode::Smart);
}

static void commands_over_push_do_not_post() {
    Rig rig;
    rig.engine.select(paired_device(), at(0));

    const auto result = rig.engine.set_mode(ChargeMode::Solar);
    assert(result.ok && result.via == ActiveTransport::Push);
    assert(rig.http.count("POST") == 0);
    const auto published = rig.broker->published_to("SmartEVSE-12345/Set/Mode");
    assert(published.size() == 1 && published[0].payload == "Solar");
    assert(rig.engine.snapshot().mode == ChargeMode::Solar);

    const auto current = rig.engine.set_override_current(0);
    assert(current.ok && current.via == ActiveTransport::Push);
    assert(rig.broker->published_to("SmartEVSE-12345/Set/CurrentOverride").at(0).payload == "0");
}

static void commands_over_poll_refresh_state() {
    Rig rig;
    rig.engine.select(local_device(), at(0));
    rig.http.clear();

    const auto result = rig.engine.set_mode(ChargeMode::Smart);
    assert(result.ok && result.via == ActiveTransport::Poll);
    const auto requests = rig.http.requests();
    assert(requests.size() == 2);
    assert(requests[0].method == "POST" && requests[0].url == "http://10.0.0.5/settings?mode=3");
    assert(requests[1].method == "GET");
}

static void override_is_validated() {
    Rig rig;
    rig.engine.select(local_device(), at(0));
    rig.http.clear();

    assert(!rig.engine.set_override_current(-10).ok);
    assert(!rig.engine.set_override_current(50).ok);  // below the 6 A minimum
    assert(!rig.engine.set_override_current(170).ok); // above the 16 A maximum
    assert(rig.http.count("POST") == 0);

    assert(rig.engine.set_override_current(0).ok);
    assert(rig.engine.set_override_current(160).ok);
    assert(rig.http.count("POST") == 2);
    assert(rig.http.requests()[2].url == "http://10.0.0.5/settings?override_current=160");
}

static void commands_need_a_device_and_a_channel() {
    Rig rig;
    auto result = rig.engine.set_mode(ChargeMode::Normal);
    assert(!result.ok && result.message == "Select a device first");

    rig.http_down();
    rig.engine.select(local_device(), at(0));
    result = rig.engine.set_mode(ChargeMode::Normal);
    assert(!result.ok && result.via == ActiveTransport::None);
    assert(result.message == "Connection unavailable - check network");
}

static void unreachable_device_requests_refresh_once() {
    Rig rig;
    rig.http_down();
    std::vector<std::string> refresh_requests;
    rig.engine.set_refresh_request_handler([&](const std::string& serial) { refresh_requests.push_back(serial); });

    rig.engine.select(local_device(), at(0));
    assert(rig.engine.state() == EngineState::Disconnected);
    assert(rig.engine.status().last_error == std::string("Connection unavailable - check network"));
    assert(rig.engine.status().active_transport == ActiveTransport::None);

    rig.engine.tick(at(5));
    rig.engine.tick(at(10));
    assert(rig.http.count("GET") == 3);
    assert(refresh_requests.size() == 1 && refresh_requests[0] == "12345");

    rig.http_up();
    rig.engine.tick(at(15));
    assert(rig.engine.state() == EngineState::PollActive);
    assert(!rig.engine.status().last_error);
}

static void failed_push_open_falls_back_to_polling() {
    Rig rig;
    rig.broker->accept_connect = false;
    rig.engine.select(paired_device(), at(0));
    assert(rig.engine.state() == EngineState::Connecting);
    assert(rig.http.count("GET") == 0);

    rig.engine.tick(at(5));
    assert(rig.engine.state() == EngineState::PollActive);
    assert(rig.http.count("GET") == 1);

    // poll lost while the broker is reachable again
    rig.broker->accept_connect = true;
    rig.http_down();
    rig.engine.tick(at(10));
    assert(rig.broker->connect_calls == 2);
    rig.engine.tick(at(10));
    assert(rig.engine.state() == EngineState::PushActive);
    assert(rig.engine.status().push_session_live);
}

static void lost_session_switches_to_polling() {
    Rig rig;
    rig.engine.select(paired_device(), at(0));
    assert(rig.engine.state() == EngineState::PushActive);

    rig.broker->drop();
    rig.engine.tick(at(1));
    assert(rig.http.count("GET") == 1);
    assert(rig.engine.state() == EngineState::PollActive);
    assert(!rig.engine.status().push_session_live);

    rig.broker->restore();
    rig.engine.tick(at(2));
    assert(rig.engine.state() == EngineState::PushActive);
    assert(rig.broker->connect_calls == 1);
}

static void deselect_closes_session() {
    Rig rig;
    rig.engine.select(paired_device(), at(0));
    rig.engine.deselect();

    assert(rig.engine.state() == EngineState::Idle);
    assert(!rig.engine.device());
    assert(!rig.engine.status().push_session_live);
    const auto status = rig.broker->published_to("SmartEVSE-12345/App/Status");
    assert(!status.empty() && status.back().payload == "offline");

    rig.engine.tick(at(10));
    rig.engine.tick(at(40));
    assert(rig.http.count("GET") == 0);
}

static void reselect_replaces_session() {
    Rig rig;
    rig.engine.select(paired_device(), at(0));
    Device other{"777", std::string("10.0.0.7"), std::string("token"), std::nullopt};
    rig.engine.select(other, at(1));

    assert(rig.engine.state() == EngineState::PushActive);
    assert(rig.engine.device()->serial == "777");
    assert(rig.broker->connect_calls == 2);
    assert(rig.broker->published_to("SmartEVSE-12345/App/Status").back().payload == "offline");

    // values for the previous device are ignored
    rig.broker->deliver("SmartEVSE-12345/ChargeCurrent", "100");
    rig.engine.tick(at(2));
    assert(!rig.engine.snapshot().charge_current_a);
}

static void pause_and_resume() {
    Rig rig;
    rig.engine.select(local_device(), at(0));
    rig.engine.on_app_pause();
    rig.engine.tick(at(10));
    rig.engine.tick(at(20));
    assert(rig.http.count("GET") == 1);

    rig.engine.on_app_resume(at(21));
    assert(rig.http.count("GET") == 2);
    assert(rig.engine.state() == EngineState::PollActive);
    rig.engine.tick(at(26));
    assert(rig.http.count("GET") == 3);
}

static void resume_and_reconnect_with_push() {
    Rig rig;
    rig.engine.select(paired_device(), at(0));
    rig.engine.on_app_pause();
    rig.engine.on_app_resume(at(60));
    assert(rig.engine.state() == EngineState::PushActive);
    assert(rig.http.count("GET") == 0);

    assert(rig.engine.reconnect_push(at(61)));
    assert(rig.engine.state() == EngineState::PushActive);

    Rig unpaired;
    unpaired.engine.select(local_device(), at(0));
    assert(!unpaired.engine.reconnect_push(at(1)));
}

static void background_open_completes_within_grace_window() {
    Rig rig(EngineConfig{30, 100, true});
    rig.engine.select(paired_device(), at(0));

    // the open runs on its own thread; tick() picks up the result
    for (int i = 0; i < 400 && rig.engine.state() != EngineState::PushActive; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        rig.engine.tick(at(1));
    }
    assert(rig.engine.state() == EngineState::PushActive);
    assert(rig.broker->connect_calls == 1);

    for (int s = 5; s <= 25; s += 5) {
        rig.engine.tick(at(s));
    }
    assert(rig.http.count("GET") == 0);
    assert(rig.engine.state() == EngineState::PushActive);

    rig.engine.tick(at(31));
    assert(rig.http.count("GET") == 1);
    assert(rig.engine.state() == EngineState::PollActive);
    assert(rig.engine.status().push_session_live);
}

static void failed_poll_command_goes_over_live_session() {
    Rig rig;
    rig.engine.select(paired_device(), at(0));
    for (int s = 5; s <= 30; s += 5) {
        rig.engine.tick(at(s));
    }
    assert(rig.engine.state() == EngineState::PollActive);
    assert(rig.engine.status().push_session_live);
    assert(rig.engine.snapshot().mode == ChargeMode::Normal);

    rig.http_down();
    const auto result = rig.engine.set_mode(ChargeMode::Smart);
    assert(result.ok);
    assert(result.via == ActiveTransport::Push);
    assert(rig.http.count("POST") == 1);
    const auto published = rig.broker->published_to("SmartEVSE-12345/Set/Mode");
    assert(published.size() == 1 && published[0].payload == "Smart");
    assert(rig.engine.snapshot().mode == ChargeMode::Smart);
    assert(rig.engine.snapshot().mode_text == std::string("smart"));
}

static void worker_runs_ticks() {
    Rig rig;
    rig.engine.select(local_device());
    rig.engine.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    rig.engine.stop();
    assert(rig.engine.state() == EngineState::PollActive);
}

int main() {
    unpaired_device_polls();
    paired_device_uses_push_without_polling();
    silent_push_is_probed_once_and_recovers();
    silent_push_without_poll_reports_lost_data();
    commands_over_push_do_not_post();
    commands_over_poll_refresh_state();
    override_is_validated();
    commands_need_a_device_and_a_channel();
    unreachable_device_requests_refresh_once();
    failed_push_open_falls_back_to_polling();
    lost_session_switches_to_polling();
    deselect_closes_session();
    reselect_replaces_session();
    pause_and_resume();
    resume_and_reconnect_with_push();
    background_open_completes_within_grace_window();
    failed_poll_command_goes_over_live_session();
    worker_runs_ticks();
    std::cout << "transport engine tests passed\n";
    return 0;
}
