// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "ev_simulator.hpp"
#include "evse_state_machine.hpp"
#include "fault_registry.hpp"
#include "rapi_protocol.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace evsemu {

/// \brief Consistent copy of the whole aggregate, taken under the state lock.
struct EmulatorSnapshot {
    EvseState evse;
    EvState ev;
    FaultRegistry faults;
};

void to_json(nlohmann::json& j, const EmulatorSnapshot& snapshot);
void to_json(nlohmann::json& j, const TransitionEvent& event);

/// \brief Bounded per-subscriber event queue. The producer never blocks; when full the oldest event is dropped.
class TransitionSubscription {
public:
    explicit TransitionSubscription(std::size_t capacity);

    /// \brief Wait up to timeout for the next event. nullopt on timeout or once closed and drained.
    std::optional<TransitionEvent> next(std::chrono::milliseconds timeout);
    std::optional<TransitionEvent> try_next();

    std::uint64_t dropped() const;
    void close();
    bool closed() const;

private:
    friend class EmulatorCore;
    void push(const TransitionEvent& event);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransitionEvent> queue_;
    std::size_t capacity_;
    std::uint64_t dropped_{0};
    bool closed_{false};
};

/// \brief Owns the station, vehicle and fault state behind one lock.
/// The protocol engine, the simulation clock and control commands all go through here.
class EmulatorCore {
public:
    EmulatorCore(const EvseParameters& evse, const EvParameters& ev, RapiOptions rapi = {});
    ~EmulatorCore();

    EmulatorCore(const EmulatorCore&) = delete;
    EmulatorCore& operator=(const EmulatorCore&) = delete;

    EmulatorSnapshot get_snapshot() const;

    /// \brief Run one RAPI line; returns the bytes to send back.
    std::string execute(const std::string& command_line);

    void tick(double dt_s);
    /// \brief Run simulated time forward in fixed steps.
    void advance_simulation(double seconds, double step_s = 1.0);

    std::shared_ptr<TransitionSubscription> subscribe_to_transitions(std::size_t capacity = 64);

    std::string boot_notification() const;

    // Control commands for the simulated vehicle and fault injection
    void connect_ev();
    void disconnect_ev();
    bool request_charge(bool requested);
    void set_soc(double percent);
    void set_battery_capacity(double kwh);
    void set_max_charge_rate(double kw);
    void set_direct_mode(bool enabled);
    void set_direct_current(double amps);
    void set_current_variance(bool enabled);
    void set_ev_error_mode(std::optional<EvErrorMode> mode);
    void trigger_fault(Fault fault);
    void clear_fault(Fault fault);
    void clear_all_faults();
    void set_ventilation_required(bool required);
    void set_temperatures(std::optional<double> ds_tenths, std::optional<double> mcp_tenths);
    void set_sensor_errors(bool ds_error, bool mcp_error);

private:
    template <typename Fn> auto mutate(Fn&& fn);
    void publish(const std::vector<TransitionEvent>& events);

    mutable std::mutex state_mutex_;
    FaultRegistry faults_;
    EvSimulator ev_;
    EvseStateMachine machine_;
    RapiEngine engine_;

    std::mutex publish_mutex_;
    std::vector<std::weak_ptr<TransitionSubscription>> subscribers_;
};

} // namespace evsemu
