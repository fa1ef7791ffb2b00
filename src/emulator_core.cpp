// SPDX-License-Identifier: Apache-2.0
#include "emulator_core.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <utility>

#include <everest/logging.hpp>
#include <nlohmann/json.hpp>

namespace evsemu {

namespace {
const char* to_string(TransitionEvent::Kind kind) {
    switch (kind) {
    case TransitionEvent::Kind::StateChanged:
        return "state_changed";
    case TransitionEvent::Kind::FaultTriggered:
        return "fault_triggered";
    case TransitionEvent::Kind::FaultCleared:
        return "fault_cleared";
    }
    return "unknown";
}
} // namespace

void to_json(nlohmann::json& j, const EmulatorSnapshot& snapshot) {
    const auto& evse = snapshot.evse;
    const auto& ev = snapshot.ev;
    nlohmann::json faults = nlohmann::json::object();
    nlohmann::json counters = nlohmann::json::object();
    for (const auto fault : kAllFaults) {
        faults[to_string(fault)] = snapshot.faults.is_active(fault);
        counters[to_string(fault)] = snapshot.faults.count(fault);
    }

    j = nlohmann::json{
        {"evse",
         {{"state", to_string(evse.state)},
          {"stateCode", static_cast<int>(evse.state)},
          {"currentCapacityA", evse.current_capacity_amps},
          {"maxConfiguredCapacityA", evse.max_configured_capacity_amps},
          {"actualCurrentMa", evse.actual_current_milliamps},
          {"voltageMv", evse.voltage_millivolts},
          {"temperatureDs", std::lround(evse.temperature_ds_tenths)},
          {"temperatureMcp", std::lround(evse.temperature_mcp_tenths)},
          {"temperatureDsError", evse.temperature_ds_error},
          {"temperatureMcpError", evse.temperature_mcp_error},
          {"sessionEnergyWh", evse.session.energy_wh},
          {"sessionElapsedSeconds", evse.session.elapsed_seconds},
          {"totalEnergyWh", evse.total_energy_wh},
          {"serviceLevel", to_string(evse.service_level)},
          {"firmwareVersion", evse.firmware_version},
          {"protocolVersion", evse.protocol_version},
          {"echoMode", evse.echo_mode},
          {"gfciSelfTest", evse.gfci_self_test_enabled},
          {"timeLimitMinutes", evse.time_limit_minutes},
          {"energyLimitKwh", evse.energy_limit_kwh},
          {"lcd", {{"rows", evse.lcd.rows}, {"backlightColor", evse.lcd.backlight_color}}}}},
        {"ev",
         {{"connected", ev.connected},
          {"chargeRequested", ev.charge_requested},
          {"socPercent", std::round(ev.soc_percent * 10.0) / 10.0},
          {"batteryCapacityKwh", ev.battery_capacity_kwh},
          {"maxChargeRateKw", ev.max_charge_rate_kw},
          {"actualChargeRateKw", ev.actual_charge_rate_kw},
          {"directMode", ev.direct_mode},
          {"directCurrentA", ev.direct_current_amps},
          {"currentVariance", ev.current_variance_enabled},
          {"errorMode", ev.error_mode ? nlohmann::json(to_string(*ev.error_mode)) : nlohmann::json(nullptr)}}},
        {"faults",
         {{"active", faults},
          {"counters", counters},
          {"mask", snapshot.faults.mask()},
          {"ventilationRequired", snapshot.faults.ventilation_required()}}}};
}

void to_json(nlohmann::json& j, const TransitionEvent& event) {
    j = nlohmann::json{{"kind", to_string(event.kind)},
                       {"from", to_string(event.from)},
                       {"to", to_string(event.to)},
                       {"faultMask", event.fault_mask},
                       {"capacityA", event.capacity_amps},
                       {"evConnected", event.ev_connected}};
    if (event.fault) {
        j["fault"] = to_string(*event.fault);
    }
}

TransitionSubscription::TransitionSubscription(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {
}

void TransitionSubscription::push(const TransitionEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(event);
    }
    cv_.notify_one();
}

std::optional<TransitionEvent> TransitionSubscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = queue_.front();
    queue_.pop_front();
    return event;
}

std::optional<TransitionEvent> TransitionSubscription::try_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = queue_.front();
    queue_.pop_front();
    return event;
}

std::uint64_t TransitionSubscription::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void TransitionSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool TransitionSubscription::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

EmulatorCore::EmulatorCore(const EvseParameters& evse, const EvParameters& ev, RapiOptions rapi) :
    ev_(ev), machine_(evse, faults_, ev_), engine_(machine_, rapi) {
    EVLOG_info << "EVSE emulator core ready (firmware " << machine_.state().firmware_version << ", capacity "
               << machine_.state().current_capacity_amps << " A)";
}

EmulatorCore::~EmulatorCore() {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    for (auto& weak : subscribers_) {
        if (auto sub = weak.lock()) {
            sub->close();
        }
    }
}

template <typename Fn> auto EmulatorCore::mutate(Fn&& fn) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
        fn();
        const auto events = machine_.take_events();
        // Taking the publish lock before releasing the state lock keeps event order equal to commit order.
        std::lock_guard<std::mutex> publish_lock(publish_mutex_);
        lock.unlock();
        publish(events);
    } else {
        auto result = fn();
        const auto events = machine_.take_events();
        std::lock_guard<std::mutex> publish_lock(publish_mutex_);
        lock.unlock();
        publish(events);
        return result;
    }
}

void EmulatorCore::publish(const std::vector<TransitionEvent>& events) {
    if (events.empty()) {
        return;
    }
    for (const auto& event : events) {
        switch (event.kind) {
        case TransitionEvent::Kind::StateChanged:
            EVLOG_info << "EVSE state " << to_string(event.from) << " -> " << to_string(event.to);
            break;
        case TransitionEvent::Kind::FaultTriggered:
            EVLOG_warning << "Fault triggered: " << (event.fault ? to_string(*event.fault) : "unknown");
            break;
        case TransitionEvent::Kind::FaultCleared:
            EVLOG_info << "Fault cleared: " << (event.fault ? to_string(*event.fault) : "all");
            break;
        }
    }
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [](const std::weak_ptr<TransitionSubscription>& w) { return w.expired(); }),
                       subscribers_.end());
    for (auto& weak : subscribers_) {
        if (auto sub = weak.lock()) {
            for (const auto& event : events) {
                sub->push(event);
            }
        }
    }
}

EmulatorSnapshot EmulatorCore::get_snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return EmulatorSnapshot{machine_.state(), ev_.state(), faults_};
}

std::string EmulatorCore::execute(const std::string& command_line) {
    return mutate([&]() { return engine_.process(command_line); });
}

void EmulatorCore::tick(double dt_s) {
    mutate([&]() { machine_.tick(dt_s); });
}

void EmulatorCore::advance_simulation(double seconds, double step_s) {
    if (step_s <= 0.0) {
        step_s = 1.0;
    }
    double remaining = seconds;
    while (remaining > 1e-9) {
        const double dt = std::min(step_s, remaining);
        tick(dt);
        remaining -= dt;
    }
}

std::shared_ptr<TransitionSubscription> EmulatorCore::subscribe_to_transitions(std::size_t capacity) {
    auto sub = std::make_shared<TransitionSubscription>(capacity);
    std::lock_guard<std::mutex> lock(publish_mutex_);
    subscribers_.push_back(sub);
    return sub;
}

std::string EmulatorCore::boot_notification() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return make_boot_notification(machine_.state().firmware_version);
}

void EmulatorCore::connect_ev() {
    mutate([&]() {
        ev_.connect();
        machine_.evaluate();
    });
}

void EmulatorCore::disconnect_ev() {
    mutate([&]() {
        ev_.disconnect();
        machine_.evaluate();
    });
}

bool EmulatorCore::request_charge(bool requested) {
    return mutate([&]() {
        const bool accepted = ev_.request_charge(requested);
        machine_.evaluate();
        return accepted;
    });
}

void EmulatorCore::set_soc(double percent) {
    mutate([&]() {
        ev_.set_soc(percent);
        machine_.evaluate();
    });
}

void EmulatorCore::set_battery_capacity(double kwh) {
    mutate([&]() { ev_.set_battery_capacity(kwh); });
}

void EmulatorCore::set_max_charge_rate(double kw) {
    mutate([&]() { ev_.set_max_charge_rate(kw); });
}

void EmulatorCore::set_direct_mode(bool enabled) {
    mutate([&]() {
        ev_.set_direct_mode(enabled);
        machine_.evaluate();
    });
}

void EmulatorCore::set_direct_current(double amps) {
    mutate([&]() { ev_.set_direct_current(amps, machine_.state().current_capacity_amps); });
}

void EmulatorCore::set_current_variance(bool enabled) {
    mutate([&]() { ev_.set_current_variance(enabled); });
}

void EmulatorCore::set_ev_error_mode(std::optional<EvErrorMode> mode) {
    mutate([&]() {
        ev_.set_error_mode(mode);
        machine_.evaluate();
    });
}

void EmulatorCore::trigger_fault(Fault fault) {
    mutate([&]() { machine_.trigger_fault(fault); });
}

void EmulatorCore::clear_fault(Fault fault) {
    mutate([&]() { machine_.clear_fault(fault); });
}

void EmulatorCore::clear_all_faults() {
    mutate([&]() { machine_.clear_all_faults(); });
}

void EmulatorCore::set_ventilation_required(bool required) {
    mutate([&]() { machine_.set_ventilation_required(required); });
}

void EmulatorCore::set_temperatures(std::optional<double> ds_tenths, std::optional<double> mcp_tenths) {
    mutate([&]() { machine_.set_temperatures(ds_tenths, mcp_tenths); });
}

void EmulatorCore::set_sensor_errors(bool ds_error, bool mcp_error) {
    mutate([&]() { machine_.set_sensor_errors(ds_error, mcp_error); });
}

} // namespace evsemu
