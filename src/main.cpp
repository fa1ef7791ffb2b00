// SPDX-License-Identifier: Apache-2.0
#include "emulator_config.hpp"
#include "emulator_core.hpp"
#include "serial_bridge.hpp"
#include "simulation_clock.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <everest/logging.hpp>

namespace {
std::atomic<bool> keep_running{true};

void handle_signal(int) {
    keep_running = false;
}

std::string parse_config_path(int argc, char* argv[]) {
    std::string path = "configs/emulator.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            path = argv[i + 1];
        }
    }
    return path;
}
} // namespace

int main(int argc, char* argv[]) {
    const auto config_path = parse_config_path(argc, argv);

    evsemu::EmulatorConfig cfg;
    try {
        cfg = evsemu::load_emulator_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    if (!cfg.logging_config.empty() && std::filesystem::exists(cfg.logging_config)) {
        Everest::Logging::init(cfg.logging_config.string(), "evse-emulator");
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    evsemu::RapiOptions rapi{};
    rapi.append_checksum = cfg.serial.append_checksum;
    evsemu::EmulatorCore core(cfg.evse, cfg.ev, rapi);
    evsemu::SimulationClock clock(core, std::chrono::milliseconds(cfg.simulation.update_interval_ms));

    std::unique_ptr<evsemu::SerialBridge> bridge;
    try {
        bridge = std::make_unique<evsemu::SerialBridge>(core, evsemu::make_serial_transport(cfg.serial));
        bridge->start();
    } catch (const std::exception& e) {
        std::cerr << "Failed to start " << evsemu::to_string(cfg.serial.mode) << " transport: " << e.what()
                  << std::endl;
        return 1;
    }
    clock.start();

    EVLOG_info << "EVSE emulator running on " << bridge->transport().describe();

    bool bridge_reported = false;
    while (keep_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        if (!bridge->running() && !bridge_reported) {
            EVLOG_warning << "Serial bridge stopped; simulation continues without a RAPI client";
            bridge_reported = true;
        }
    }

    EVLOG_info << "Shutting down";
    bridge->stop();
    clock.stop();
    return 0;
}
