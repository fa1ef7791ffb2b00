// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "emulator_core.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace evsemu {

/// \brief Fixed-period driver that advances physical state with the measured elapsed time.
class SimulationClock {
public:
    SimulationClock(EmulatorCore& core, std::chrono::milliseconds interval);
    ~SimulationClock();

    SimulationClock(const SimulationClock&) = delete;
    SimulationClock& operator=(const SimulationClock&) = delete;

    void start();
    void stop();
    bool running() const;

private:
    void run();

    EmulatorCore& core_;
    std::chrono::milliseconds interval_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_{false};
    std::thread thread_;
};

} // namespace evsemu
