// SPDX-License-Identifier: Apache-2.0
#include "device_registry.hpp"
#include "pairing_client.hpp"
#include "test_doubles.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <filesystem>
#include <iostream>

using namespace evselink;
using namespace evselink::testing;

namespace {
const std::string IDENTITY = "0f1e2d3c-4b5a-4978-8695-a4b3c2d1e0f9";

std::filesystem::path temp_store(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "evselink_pairing_tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    std::filesystem::remove(path);
    return path;
}
} // namespace

static void successful_pairing_returns_token() {
    FakeHttpClient http([](const HttpRequest&) { return respond(200, R"({"mqtt_token":"tok-123"})"); });
    PairingClient client(http, PairingConfig{}, "SmartEVSE");

    const auto result = client.pair(IDENTITY, "12345", "123456");
    assert(result.credential && *result.credential == "tok-123");
    assert(!result.error);

    const auto req = http.requests().at(0);
    assert(req.method == "POST");
    assert(req.url == "https://mqtt.smartevse.nl/pair");
    assert(req.timeout == std::chrono::seconds(10));
    bool json_header = false;
    for (const auto& [name, value] : req.headers) {
        if (name == "Content-Type" && value == "application/json") json_header = true;
    }
    assert(json_header);

    const auto body = nlohmann::json::parse(req.body);
    assert(body.at("app_uuid") == IDENTITY);
    assert(body.at("device_serial") == "SmartEVSE-12345");
    assert(body.at("pairing_pin") == "123456");
}

static void rejected_pairing_reports_status_and_body() {
    FakeHttpClient http([](const HttpRequest&) { return respond(403, "invalid pin"); });
    PairingClient client(http, PairingConfig{}, "SmartEVSE");

    const auto result = client.pair(IDENTITY, "12345", "000000");
    assert(!result.credential);
    assert(result.error && result.error->kind == ErrorKind::Pair);
    assert(to_string(result.error->kind) == "PairError");
    assert(result.error->http_status == 403L);
    assert(result.error->message == "Pairing failed: 403 - invalid pin");
}

static void missing_token_is_an_error() {
    std::string body;
    FakeHttpClient http([&body](const HttpRequest&) { return respond(200, body); });
    PairingClient client(http, PairingConfig{}, "SmartEVSE");

    for (const auto* doc : {R"({"mqtt_token":null})", R"({"status":"ok"})", R"({"mqtt_token":""})"}) {
        body = doc;
        const auto result = client.pair(IDENTITY, "12345", "123456");
        assert(!result.credential);
        assert(result.error && result.error->message == "No token received from server");
    }

    body = "not json";
    const auto result = client.pair(IDENTITY, "12345", "123456");
    assert(!result.credential && result.error && result.error->kind == ErrorKind::Pair);
}

static void transport_failure_is_reported() {
    FakeHttpClient http([](const HttpRequest&) { return fail(ErrorKind::TransportOpen, "could not resolve host"); });
    PairingClient client(http, PairingConfig{}, "SmartEVSE");

    const auto result = client.pair(IDENTITY, "12345", "123456");
    assert(!result.credential);
    assert(result.error && result.error->kind == ErrorKind::Pair);
    assert(result.error->message == "Pairing error: could not resolve host");
}

static void pin_validation() {
    assert(PairingClient::is_valid_pin("123456"));
    assert(PairingClient::is_valid_pin("000000"));
    assert(!PairingClient::is_valid_pin("12345"));
    assert(!PairingClient::is_valid_pin("1234567"));
    assert(!PairingClient::is_valid_pin("12a456"));
    assert(!PairingClient::is_valid_pin(""));
}

static void credential_is_shared_by_paired_devices() {
    DeviceRegistry registry(temp_store("credentials.json"), "SmartEVSE");
    registry.load();
    registry.upsert(Device{"12345", std::string("10.0.0.5"), std::nullopt, std::nullopt});
    registry.upsert(Device{"222", std::string("10.0.0.6"), std::string("old"), std::nullopt});
    registry.upsert(Device{"333", std::string("10.0.0.7"), std::nullopt, std::nullopt});

    const auto changed = registry.apply_pairing_credential("12345", "new");
    assert(changed == 2);
    assert(registry.find("12345")->credential == std::string("new"));
    assert(registry.find("222")->credential == std::string("new"));
    assert(!registry.find("333")->credential.has_value());

    // unchanged credential changes nothing
    assert(registry.apply_pairing_credential("12345", "new") == 0);
}

int main() {
    successful_pairing_returns_token();
    rejected_pairing_reports_status_and_body();
    missing_token_is_an_error();
    transport_failure_is_reported();
    pin_validation();
    credential_is_shared_by_paired_devices();
    std::cout << "pairing client tests passed\n";
    return 0;
}
