// SPDX-License-Identifier: Apache-2.0
#include "curl_http_client.hpp"
#include "poll_transport.hpp"
#include "simulated_controller.hpp"

#include <cassert>
#include <iostream>
#include <thread>

using namespace evselink;

namespace {
std::optional<TelemetrySnapshot> fetch_when_ready(PollTransport& poll, const std::string& address) {
    for (int attempt = 0; attempt < 50; ++attempt) {
        auto result = poll.fetch_snapshot(address);
        if (result.snapshot) {
            return result.snapshot;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return std::nullopt;
}
} // namespace

static void poll_against_simulator() {
    sim::ControllerSettings settings;
    settings.serial = "4242";
    sim::SimulatedController controller(settings);
    controller.set_vehicle_connected(true);
    sim::ControllerServer server(controller, "127.0.0.1", 0);
    assert(server.start());
    assert(server.port() > 0);

    CurlHttpClient http;
    PollTransport poll(http, std::chrono::milliseconds(2000));
    const auto address = "127.0.0.1:" + std::to_string(server.port());

    const auto snapshot = fetch_when_ready(poll, address);
    assert(snapshot.has_value());
    assert(snapshot->serial == std::string("4242"));
    assert(snapshot->lifecycle == LifecycleState::Charging);
    assert(snapshot->mode == ChargeMode::Normal);
    assert(snapshot->charge_current_a == 16.0);
    assert(snapshot->min_current_a == 6.0);
    assert(snapshot->vehicle_connected == true);

    assert(!poll.send_command(address, ModeCommand{ChargeMode::Solar}).has_value());
    assert(controller.mode() == ChargeMode::Solar);
    assert(!poll.send_command(address, OverrideCurrentCommand{80}).has_value());
    assert(controller.override_current_deciamps() == 80);

    const auto rejected = poll.send_command(address, OverrideCurrentCommand{500});
    assert(rejected && rejected->kind == ErrorKind::Command && rejected->http_status == 400L);
    assert(controller.commands_applied() == 2);

    const auto after = poll.fetch_snapshot(address);
    assert(after.snapshot && after.snapshot->mode == ChargeMode::Solar);
    assert(after.snapshot->override_current_a == 8.0);

    const auto probed = poll.probe(address, std::chrono::milliseconds(1000));
    assert(probed && probed->serial == "4242" && probed->address == address);

    server.stop();
}

static void unreachable_host_is_a_transport_error() {
    sim::SimulatedController controller(sim::ControllerSettings{});
    int port = 0;
    {
        sim::ControllerServer server(controller, "127.0.0.1", 0);
        assert(server.start());
        port = server.port();
        server.stop();
    }

    CurlHttpClient http;
    PollTransport poll(http, std::chrono::milliseconds(500));
    const auto result = poll.fetch_snapshot("127.0.0.1:" + std::to_string(port));
    assert(!result.snapshot);
    assert(result.error.has_value());
    assert(result.error->kind == ErrorKind::TransportOpen || result.error->kind == ErrorKind::TransportTimeout);
    assert(!poll.probe("127.0.0.1:" + std::to_string(port), std::chrono::milliseconds(300)));
}

int main() {
    poll_against_simulator();
    unreachable_host_is_a_transport_error();
    std::cout << "curl loopback tests passed\n";
    return 0;
}
