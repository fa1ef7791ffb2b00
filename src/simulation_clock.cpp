// SPDX-License-Identifier: Apache-2.0
#include "simulation_clock.hpp"

#include <exception>

#include <everest/logging.hpp>

namespace evsemu {

SimulationClock::SimulationClock(EmulatorCore& core, std::chrono::milliseconds interval) :
    core_(core), interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000)) {
}

SimulationClock::~SimulationClock() {
    stop();
}

void SimulationClock::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this]() { run(); });
    EVLOG_info << "Simulation clock started, interval " << interval_.count() << " ms";
}

void SimulationClock::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool SimulationClock::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void SimulationClock::run() {
    auto last = std::chrono::steady_clock::now();
    auto next = last + interval_;
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (cv_.wait_until(lock, next, [this]() { return !running_; })) {
            break;
        }
        lock.unlock();
        const auto now = std::chrono::steady_clock::now();
        const double dt = std::chrono::duration<double>(now - last).count();
        last = now;
        try {
            core_.tick(dt);
        } catch (const std::exception& e) {
            EVLOG_error << "Simulation tick failed: " << e.what();
        }
        next += interval_;
        if (next < now) {
            // Fell behind (suspend, debugger); resync instead of bursting.
            next = now + interval_;
        }
        lock.lock();
    }
}

} // namespace evsemu
