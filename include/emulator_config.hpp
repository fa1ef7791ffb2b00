// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "ev_simulator.hpp"
#include "evse_state_machine.hpp"
#include "serial_transport.hpp"

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace evsemu {

namespace fs = std::filesystem;

struct SimulationConfig {
    int update_interval_ms{1000};
};

struct EmulatorConfig {
    SerialConfig serial;
    EvseParameters evse;
    EvParameters ev;
    SimulationConfig simulation;
    fs::path logging_config;
};

/// \brief Load emulator.json, apply environment overrides and validate. Relative paths resolve
/// against the config file's directory. Throws std::runtime_error / std::invalid_argument.
EmulatorConfig load_emulator_config(const fs::path& config_path);

/// \brief Build a config from parsed JSON. Missing keys take defaults, out-of-range values are clamped.
EmulatorConfig emulator_config_from_json(const nlohmann::json& json, const fs::path& base_dir);

/// \brief Apply SERIAL_* environment variables. Unparsable integers are skipped with a warning.
void apply_env_overrides(EmulatorConfig& cfg);

/// \brief Reject values that cannot be clamped into something sensible.
void validate_emulator_config(const EmulatorConfig& cfg);

SerialMode parse_serial_mode(const std::string& text);
ServiceLevel parse_service_level(const std::string& text);

} // namespace evsemu
