// SPDX-License-Identifier: Apache-2.0
#include "emulator_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

#include <everest/logging.hpp>
#include <nlohmann/json.hpp>

namespace evsemu {

namespace {
fs::path make_absolute(const fs::path& base, const fs::path& relative_or_absolute) {
    if (relative_or_absolute.empty() || relative_or_absolute.is_absolute()) {
        return relative_or_absolute;
    }
    return fs::weakly_canonical(base / relative_or_absolute);
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::optional<int> parse_int(const std::string& text) {
    int value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto result = std::from_chars(first, last, value);
    if (text.empty() || result.ec != std::errc() || result.ptr != last) {
        return std::nullopt;
    }
    return value;
}

void override_int(const char* env_var, int& target) {
    const char* raw = std::getenv(env_var);
    if (!raw) {
        return;
    }
    const auto parsed = parse_int(raw);
    if (!parsed) {
        EVLOG_warning << "Invalid integer value for " << env_var << "=" << raw << ", skipping";
        return;
    }
    target = *parsed;
    EVLOG_info << "Applied env override " << env_var << "=" << *parsed;
}
} // namespace

SerialMode parse_serial_mode(const std::string& text) {
    const auto mode = lowercase(text);
    if (mode == "pty") {
        return SerialMode::Pty;
    }
    if (mode == "tcp") {
        return SerialMode::Tcp;
    }
    throw std::runtime_error("Unknown serial mode '" + text + "' (expected pty or tcp)");
}

ServiceLevel parse_service_level(const std::string& text) {
    const auto level = lowercase(text);
    if (level == "l1" || level == "1") {
        return ServiceLevel::L1;
    }
    if (level == "auto" || level == "a") {
        return ServiceLevel::Auto;
    }
    return ServiceLevel::L2;
}

EmulatorConfig emulator_config_from_json(const nlohmann::json& json, const fs::path& base_dir) {
    EmulatorConfig cfg{};

    const auto serial = json.value("serial", nlohmann::json::object());
    cfg.serial.mode = parse_serial_mode(serial.value("mode", "pty"));
    cfg.serial.bind_address = serial.value("bindAddress", cfg.serial.bind_address);
    cfg.serial.tcp_port = serial.value("tcpPort", cfg.serial.tcp_port);
    cfg.serial.pty_path = serial.value("ptyPath", cfg.serial.pty_path);
    cfg.serial.baudrate = serial.value("baudrate", cfg.serial.baudrate);
    cfg.serial.reconnect_timeout_sec = serial.value("reconnectTimeoutSec", cfg.serial.reconnect_timeout_sec);
    cfg.serial.reconnect_backoff_ms = serial.value("reconnectBackoffMs", cfg.serial.reconnect_backoff_ms);
    cfg.serial.append_checksum = serial.value("appendChecksum", cfg.serial.append_checksum);

    const auto evse = json.value("evse", nlohmann::json::object());
    cfg.evse.firmware_version = evse.value("firmwareVersion", cfg.evse.firmware_version);
    cfg.evse.protocol_version = evse.value("protocolVersion", cfg.evse.protocol_version);
    cfg.evse.default_current_amps = evse.value("defaultCurrentA", cfg.evse.default_current_amps);
    cfg.evse.min_current_amps = evse.value("minCurrentA", cfg.evse.min_current_amps);
    cfg.evse.max_current_amps = evse.value("maxCurrentA", cfg.evse.max_current_amps);
    cfg.evse.service_level = parse_service_level(evse.value("serviceLevel", "L2"));
    cfg.evse.gfci_self_test = evse.value("gfciSelfTest", cfg.evse.gfci_self_test);

    const auto ev = json.value("ev", nlohmann::json::object());
    cfg.ev.battery_capacity_kwh = ev.value("batteryCapacityKwh", cfg.ev.battery_capacity_kwh);
    cfg.ev.max_charge_rate_kw = ev.value("maxChargeRateKw", cfg.ev.max_charge_rate_kw);
    cfg.ev.initial_soc_percent = ev.value("initialSocPercent", cfg.ev.initial_soc_percent);

    const auto simulation = json.value("simulation", nlohmann::json::object());
    cfg.simulation.update_interval_ms = simulation.value("updateIntervalMs", cfg.simulation.update_interval_ms);
    cfg.evse.temperature_simulation = simulation.value("temperatureSimulation", cfg.evse.temperature_simulation);
    cfg.ev.realistic_charge_curve = simulation.value("realisticChargeCurve", cfg.ev.realistic_charge_curve);
    cfg.ev.variance_seed = simulation.value("varianceSeed", cfg.ev.variance_seed);

    cfg.logging_config = make_absolute(base_dir, json.value("loggingConfig", "logging.ini"));

    // Clamp what can be clamped; validate_emulator_config() rejects the rest.
    cfg.evse.min_current_amps = std::clamp(cfg.evse.min_current_amps, kHardwareMinAmps, kHardwareMaxAmps);
    cfg.evse.max_current_amps = std::clamp(cfg.evse.max_current_amps, cfg.evse.min_current_amps, kHardwareMaxAmps);
    cfg.evse.default_current_amps =
        std::clamp(cfg.evse.default_current_amps, cfg.evse.min_current_amps, cfg.evse.max_current_amps);
    if (cfg.ev.battery_capacity_kwh <= 0.0) {
        cfg.ev.battery_capacity_kwh = 75.0;
    }
    if (cfg.ev.max_charge_rate_kw < 0.0) {
        cfg.ev.max_charge_rate_kw = 7.2;
    }
    cfg.ev.initial_soc_percent = std::clamp(cfg.ev.initial_soc_percent, 0.0, 100.0);
    if (cfg.simulation.update_interval_ms <= 0) {
        cfg.simulation.update_interval_ms = 1000;
    }
    if (cfg.serial.baudrate <= 0) {
        cfg.serial.baudrate = 115200;
    }
    return cfg;
}

void apply_env_overrides(EmulatorConfig& cfg) {
    if (const char* mode = std::getenv("SERIAL_MODE")) {
        cfg.serial.mode = parse_serial_mode(mode);
        EVLOG_info << "Applied env override SERIAL_MODE=" << mode;
    }
    if (const char* path = std::getenv("SERIAL_PTY_PATH")) {
        cfg.serial.pty_path = path;
        EVLOG_info << "Applied env override SERIAL_PTY_PATH=" << path;
    }
    override_int("SERIAL_TCP_PORT", cfg.serial.tcp_port);
    override_int("SERIAL_RECONNECT_TIMEOUT", cfg.serial.reconnect_timeout_sec);
    override_int("SERIAL_RECONNECT_BACKOFF", cfg.serial.reconnect_backoff_ms);
}

void validate_emulator_config(const EmulatorConfig& cfg) {
    if (cfg.serial.reconnect_timeout_sec < 0) {
        throw std::invalid_argument("reconnect_timeout_sec must be >= 0, got " +
                                    std::to_string(cfg.serial.reconnect_timeout_sec));
    }
    if (cfg.serial.reconnect_backoff_ms < 0) {
        throw std::invalid_argument("reconnect_backoff_ms must be >= 0, got " +
                                    std::to_string(cfg.serial.reconnect_backoff_ms));
    }
    if (cfg.serial.mode == SerialMode::Tcp && (cfg.serial.tcp_port < 0 || cfg.serial.tcp_port > 65535)) {
        throw std::invalid_argument("tcp_port must be within 0-65535, got " + std::to_string(cfg.serial.tcp_port));
    }
}

EmulatorConfig load_emulator_config(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    const auto json = nlohmann::json::parse(file);
    const auto base_dir = config_path.parent_path().empty() ? fs::current_path() : config_path.parent_path();

    auto cfg = emulator_config_from_json(json, base_dir);
    apply_env_overrides(cfg);
    validate_emulator_config(cfg);
    return cfg;
}

} // namespace evsemu
