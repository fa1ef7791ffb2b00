// SPDX-License-Identifier: Apache-2.0
#include "emulator_config.hpp"

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using namespace evsemu;

namespace {

const char* kEnvVars[] = {"SERIAL_MODE", "SERIAL_PTY_PATH", "SERIAL_TCP_PORT", "SERIAL_RECONNECT_TIMEOUT",
                          "SERIAL_RECONNECT_BACKOFF"};

void clear_env() {
    for (const auto* name : kEnvVars) {
        unsetenv(name);
    }
}

fs::path write_config(const fs::path& dir, const nlohmann::json& json) {
    fs::create_directories(dir);
    const auto path = dir / "emulator.json";
    std::ofstream out(path);
    out << json.dump(2);
    return path;
}

void test_defaults() {
    const auto cfg = emulator_config_from_json(nlohmann::json::object(), "/etc/evse");
    assert(cfg.serial.mode == SerialMode::Pty);
    assert(cfg.serial.tcp_port == 8023);
    assert(cfg.serial.bind_address == "0.0.0.0");
    assert(cfg.serial.reconnect_timeout_sec == 60);
    assert(cfg.serial.reconnect_backoff_ms == 1000);
    assert(!cfg.serial.append_checksum);
    assert(cfg.evse.firmware_version == "8.2.1");
    assert(cfg.evse.default_current_amps == 32);
    assert(cfg.evse.service_level == ServiceLevel::L2);
    assert(cfg.ev.battery_capacity_kwh == 75.0);
    assert(cfg.simulation.update_interval_ms == 1000);
    assert(cfg.logging_config == fs::path("/etc/evse/logging.ini"));
}

void test_file_values_and_clamping() {
    clear_env();
    const auto dir = fs::temp_directory_path() / "evse_emulator_config_test";
    const nlohmann::json json = {
        {"serial",
         {{"mode", "TCP"}, {"tcpPort", 9100}, {"reconnectTimeoutSec", 5}, {"appendChecksum", true}}},
        {"evse", {{"defaultCurrentA", 120}, {"maxCurrentA", 40}, {"minCurrentA", 2}, {"serviceLevel", "L1"}}},
        {"ev", {{"batteryCapacityKwh", -3.0}, {"initialSocPercent", 150.0}}},
        {"simulation", {{"updateIntervalMs", 0}, {"varianceSeed", 42}}},
        {"loggingConfig", "log/custom.ini"}};
    const auto path = write_config(dir, json);

    const auto cfg = load_emulator_config(path);
    assert(cfg.serial.mode == SerialMode::Tcp);
    assert(cfg.serial.tcp_port == 9100);
    assert(cfg.serial.reconnect_timeout_sec == 5);
    assert(cfg.serial.append_checksum);
    assert(cfg.evse.min_current_amps == 6);
    assert(cfg.evse.max_current_amps == 40);
    assert(cfg.evse.default_current_amps == 40);
    assert(cfg.evse.service_level == ServiceLevel::L1);
    assert(cfg.ev.battery_capacity_kwh == 75.0);
    assert(cfg.ev.initial_soc_percent == 100.0);
    assert(cfg.ev.variance_seed == 42u);
    assert(cfg.simulation.update_interval_ms == 1000);
    assert(cfg.logging_config.filename() == "custom.ini");
    assert(cfg.logging_config.is_absolute());

    fs::remove_all(dir);
}

void test_env_overrides() {
    clear_env();
    EmulatorConfig cfg{};
    setenv("SERIAL_MODE", "tcp", 1);
    setenv("SERIAL_PTY_PATH", "/tmp/evse_test_pty", 1);
    setenv("SERIAL_TCP_PORT", "9000", 1);
    setenv("SERIAL_RECONNECT_TIMEOUT", "15", 1);
    setenv("SERIAL_RECONNECT_BACKOFF", "250", 1);
    apply_env_overrides(cfg);
    assert(cfg.serial.mode == SerialMode::Tcp);
    assert(cfg.serial.pty_path == "/tmp/evse_test_pty");
    assert(cfg.serial.tcp_port == 9000);
    assert(cfg.serial.reconnect_timeout_sec == 15);
    assert(cfg.serial.reconnect_backoff_ms == 250);

    // Garbage integers are skipped, the previous value stays.
    setenv("SERIAL_TCP_PORT", "90x0", 1);
    setenv("SERIAL_RECONNECT_TIMEOUT", "", 1);
    apply_env_overrides(cfg);
    assert(cfg.serial.tcp_port == 9000);
    assert(cfg.serial.reconnect_timeout_sec == 15);

    setenv("SERIAL_MODE", "usb", 1);
    bool threw = false;
    try {
        apply_env_overrides(cfg);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    clear_env();
}

void test_validation() {
    EmulatorConfig cfg{};
    validate_emulator_config(cfg);

    cfg.serial.reconnect_timeout_sec = -1;
    bool threw = false;
    try {
        validate_emulator_config(cfg);
    } catch (const std::invalid_argument& e) {
        threw = true;
        assert(std::string(e.what()) == "reconnect_timeout_sec must be >= 0, got -1");
    }
    assert(threw);

    cfg.serial.reconnect_timeout_sec = 0;
    cfg.serial.reconnect_backoff_ms = -5;
    threw = false;
    try {
        validate_emulator_config(cfg);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    cfg.serial.reconnect_backoff_ms = 100;
    cfg.serial.mode = SerialMode::Tcp;
    cfg.serial.tcp_port = 70000;
    threw = false;
    try {
        validate_emulator_config(cfg);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // A negative timeout from the environment is rejected at load time.
    clear_env();
    const auto dir = fs::temp_directory_path() / "evse_emulator_config_env_test";
    const auto path = write_config(dir, nlohmann::json::object());
    setenv("SERIAL_RECONNECT_TIMEOUT", "-1", 1);
    threw = false;
    try {
        (void)load_emulator_config(path);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    clear_env();
    fs::remove_all(dir);
}

void test_bad_inputs() {
    bool threw = false;
    try {
        (void)load_emulator_config("/nonexistent/evse/emulator.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)emulator_config_from_json(nlohmann::json{{"serial", {{"mode", "bluetooth"}}}}, "/tmp");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    assert(parse_serial_mode("PTY") == SerialMode::Pty);
    assert(parse_service_level("auto") == ServiceLevel::Auto);
    assert(parse_service_level("2") == ServiceLevel::L2);
}

} // namespace

int main() {
    test_defaults();
    test_file_values_and_clamping();
    test_env_overrides();
    test_validation();
    test_bad_inputs();

    std::cout << "emulator_config_tests passed\n";
    return 0;
}
