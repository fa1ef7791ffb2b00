// SPDX-License-Identifier: Apache-2.0
#include "evse_state_machine.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace evsemu {

const char* to_string(EvseStateCode state) {
    switch (state) {
    case EvseStateCode::Ready:
        return "ready";
    case EvseStateCode::Connected:
        return "connected";
    case EvseStateCode::Charging:
        return "charging";
    case EvseStateCode::VentilationRequired:
        return "ventilation_required";
    case EvseStateCode::Sleep:
        return "sleep";
    case EvseStateCode::Error:
        return "error";
    }
    return "unknown";
}

const char* to_string(ServiceLevel level) {
    switch (level) {
    case ServiceLevel::L1:
        return "L1";
    case ServiceLevel::L2:
        return "L2";
    case ServiceLevel::Auto:
        return "Auto";
    }
    return "unknown";
}

EvseStateMachine::EvseStateMachine(const EvseParameters& params, FaultRegistry& faults, EvSimulator& ev) :
    params_(params), faults_(faults), ev_(ev) {
    params_.min_current_amps = std::clamp(params_.min_current_amps, kHardwareMinAmps, kHardwareMaxAmps);
    params_.max_current_amps = std::clamp(params_.max_current_amps, params_.min_current_amps, kHardwareMaxAmps);
    params_.default_current_amps =
        std::clamp(params_.default_current_amps, params_.min_current_amps, params_.max_current_amps);

    state_.current_capacity_amps = params_.default_current_amps;
    state_.persistent_capacity_amps = params_.default_current_amps;
    state_.max_configured_capacity_amps = params_.max_current_amps;
    state_.service_level = params_.service_level;
    state_.voltage_millivolts = voltage_for(params_.service_level);
    state_.firmware_version = params_.firmware_version;
    state_.protocol_version = params_.protocol_version;
    state_.gfci_self_test_enabled = params_.gfci_self_test;
    if (ev_.state().connected) {
        state_.state = EvseStateCode::Connected;
    }
}

int EvseStateMachine::allowed_max_amps() const {
    return state_.max_capacity_locked ? state_.max_configured_capacity_amps : params_.max_current_amps;
}

int EvseStateMachine::voltage_for(ServiceLevel level) const {
    return level == ServiceLevel::L1 ? kL1VoltageMillivolts : kL2VoltageMillivolts;
}

bool EvseStateMachine::session_limit_reached() const {
    if (state_.time_limit_minutes > 0 && state_.session.elapsed_seconds >= state_.time_limit_minutes * 60.0) {
        return true;
    }
    if (state_.energy_limit_kwh > 0 && state_.session.energy_wh >= state_.energy_limit_kwh * 1000.0) {
        return true;
    }
    return false;
}

EvseStateCode EvseStateMachine::next_state() {
    const auto current = state_.state;
    const auto& ev = ev_.state();

    if (faults_.any_active()) {
        return EvseStateCode::Error;
    }
    if (faults_.ventilation_required()) {
        return EvseStateCode::VentilationRequired;
    }
    if (current == EvseStateCode::Error || current == EvseStateCode::VentilationRequired) {
        if (state_.sleep_requested) {
            return EvseStateCode::Sleep;
        }
        return ev.connected ? EvseStateCode::Connected : EvseStateCode::Ready;
    }
    if (current == EvseStateCode::Sleep) {
        return current;
    }
    if (!ev.connected) {
        return EvseStateCode::Ready;
    }
    switch (current) {
    case EvseStateCode::Ready:
        return EvseStateCode::Connected;
    case EvseStateCode::Connected:
        return ev_.wants_charge() ? EvseStateCode::Charging : EvseStateCode::Connected;
    case EvseStateCode::Charging:
        if (!ev.direct_mode && ev.soc_percent >= 100.0) {
            return EvseStateCode::Connected;
        }
        if (session_limit_reached() || !ev_.wants_charge()) {
            return EvseStateCode::Connected;
        }
        return EvseStateCode::Charging;
    default:
        return current;
    }
}

bool EvseStateMachine::evaluate() {
    check_ev_error_mode();
    const auto next = next_state();
    if (next == state_.state) {
        return false;
    }
    if (state_.state == EvseStateCode::Charging && next == EvseStateCode::Connected) {
        const auto& ev = ev_.state();
        // A full battery or an exhausted session limit ends the request; otherwise we would re-enter CHARGING.
        if ((!ev.direct_mode && ev.soc_percent >= 100.0) || session_limit_reached()) {
            ev_.request_charge(false);
        }
    }
    transition_to(next);
    return true;
}

void EvseStateMachine::transition_to(EvseStateCode next) {
    const auto previous = state_.state;
    if (next == EvseStateCode::Charging && previous != EvseStateCode::Charging) {
        state_.session = SessionClock{};
    }
    if (next != EvseStateCode::Charging) {
        state_.actual_current_milliamps = 0;
        ev_.stop_drawing();
    }
    state_.state = next;

    TransitionEvent event;
    event.kind = TransitionEvent::Kind::StateChanged;
    event.from = previous;
    event.to = next;
    event.fault_mask = faults_.mask();
    event.capacity_amps = state_.current_capacity_amps;
    event.ev_connected = ev_.state().connected;
    pending_events_.push_back(event);
}

void EvseStateMachine::record_fault_event(TransitionEvent::Kind kind, std::optional<Fault> fault) {
    TransitionEvent event;
    event.kind = kind;
    event.from = state_.state;
    event.to = state_.state;
    event.fault = fault;
    event.fault_mask = faults_.mask();
    event.capacity_amps = state_.current_capacity_amps;
    event.ev_connected = ev_.state().connected;
    pending_events_.push_back(event);
}

void EvseStateMachine::tick(double dt_s) {
    if (dt_s <= 0.0) {
        return;
    }
    const double volts = state_.voltage_millivolts / 1000.0;
    if (state_.state == EvseStateCode::Charging) {
        const double amps = ev_.advance(state_.current_capacity_amps, volts, dt_s);
        state_.actual_current_milliamps = static_cast<int>(std::lround(amps * 1000.0));
        const double wh = ev_.state().actual_charge_rate_kw * dt_s * 1000.0 / 3600.0;
        state_.session.energy_wh += wh;
        state_.total_energy_wh += wh;
        state_.session.elapsed_seconds += dt_s;
        if (params_.temperature_simulation) {
            const double load = amps / kHardwareMaxAmps;
            const double target = kInitialTemperatureTenths + kFullLoadRiseTenths * load * load;
            auto heat = [&](double& tenths) {
                if (tenths < target) {
                    tenths = std::min(target, tenths + kHeatingTenthsPerSecond * dt_s);
                } else {
                    tenths = std::max(target, tenths - kCoolingTenthsPerSecond * dt_s);
                }
            };
            heat(state_.temperature_ds_tenths);
            heat(state_.temperature_mcp_tenths);
        }
    } else {
        ev_.stop_drawing();
        if (params_.temperature_simulation) {
            auto cool = [&](double& tenths) {
                if (tenths > kAmbientTemperatureTenths) {
                    tenths = std::max(kAmbientTemperatureTenths, tenths - kCoolingTenthsPerSecond * dt_s);
                }
            };
            cool(state_.temperature_ds_tenths);
            cool(state_.temperature_mcp_tenths);
        }
    }
    check_over_temperature();
    evaluate();
}

void EvseStateMachine::check_over_temperature() {
    const bool above = (!state_.temperature_ds_error && state_.temperature_ds_tenths > kOverTemperatureTenths) ||
                       (!state_.temperature_mcp_error && state_.temperature_mcp_tenths > kOverTemperatureTenths);
    if (!above) {
        over_temperature_armed_ = true;
        return;
    }
    if (over_temperature_armed_) {
        over_temperature_armed_ = false;
        faults_.trigger(Fault::OverTemperature);
        record_fault_event(TransitionEvent::Kind::FaultTriggered, Fault::OverTemperature);
    }
}

void EvseStateMachine::check_ev_error_mode() {
    const auto& ev = ev_.state();
    const bool pilot_fault = ev.connected && ev.error_mode &&
                             (*ev.error_mode == EvErrorMode::DiodeCheckFailure ||
                              *ev.error_mode == EvErrorMode::InvalidPilot);
    if (!pilot_fault) {
        diode_fault_latched_ = false;
        return;
    }
    if (!diode_fault_latched_) {
        diode_fault_latched_ = true;
        faults_.trigger(Fault::DiodeCheck);
        record_fault_event(TransitionEvent::Kind::FaultTriggered, Fault::DiodeCheck);
    }
}

bool EvseStateMachine::trigger_fault(Fault fault) {
    const bool newly_active = faults_.trigger(fault);
    record_fault_event(TransitionEvent::Kind::FaultTriggered, fault);
    evaluate();
    return newly_active;
}

bool EvseStateMachine::clear_fault(Fault fault) {
    const bool was_active = faults_.clear(fault);
    if (was_active) {
        record_fault_event(TransitionEvent::Kind::FaultCleared, fault);
    }
    evaluate();
    return was_active;
}

bool EvseStateMachine::clear_all_faults() {
    const bool any = faults_.clear_all();
    if (any) {
        record_fault_event(TransitionEvent::Kind::FaultCleared, std::nullopt);
    }
    evaluate();
    return any;
}

void EvseStateMachine::set_ventilation_required(bool required) {
    faults_.set_ventilation_required(required);
    evaluate();
}

std::optional<int> EvseStateMachine::set_current_capacity(int amps, CapacityMode mode) {
    if (mode == CapacityMode::Maximum) {
        if (state_.max_capacity_locked) {
            return std::nullopt;
        }
        const int applied = std::clamp(amps, params_.min_current_amps, params_.max_current_amps);
        state_.max_configured_capacity_amps = applied;
        state_.max_capacity_locked = true;
        state_.current_capacity_amps = std::min(state_.current_capacity_amps, applied);
        state_.persistent_capacity_amps = std::min(state_.persistent_capacity_amps, applied);
        evaluate();
        return applied;
    }

    const int applied = std::clamp(amps, params_.min_current_amps, allowed_max_amps());
    state_.current_capacity_amps = applied;
    if (mode == CapacityMode::Persistent) {
        state_.persistent_capacity_amps = applied;
    }
    evaluate();
    return applied;
}

void EvseStateMachine::set_service_level(ServiceLevel level) {
    state_.service_level = level;
    state_.voltage_millivolts = voltage_for(level);
    evaluate();
}

void EvseStateMachine::set_time_limit(int minutes) {
    state_.time_limit_minutes = std::max(0, minutes);
    evaluate();
}

void EvseStateMachine::set_energy_limit(int kwh) {
    state_.energy_limit_kwh = std::max(0, kwh);
    evaluate();
}

bool EvseStateMachine::enable() {
    if (faults_.any_active()) {
        return false;
    }
    state_.sleep_requested = false;
    if (state_.state != EvseStateCode::Sleep) {
        return true;
    }
    const auto& ev = ev_.state();
    EvseStateCode next = EvseStateCode::Ready;
    if (faults_.ventilation_required()) {
        next = EvseStateCode::VentilationRequired;
    } else if (ev.connected) {
        next = ev_.wants_charge() ? EvseStateCode::Charging : EvseStateCode::Connected;
    }
    transition_to(next);
    return true;
}

void EvseStateMachine::disable() {
    state_.sleep_requested = true;
    const auto current = state_.state;
    if (current == EvseStateCode::Sleep || current == EvseStateCode::Error ||
        current == EvseStateCode::VentilationRequired) {
        // Latched; observed once the fault or ventilation condition clears.
        return;
    }
    transition_to(EvseStateCode::Sleep);
}

void EvseStateMachine::reset() {
    if (faults_.clear_all()) {
        record_fault_event(TransitionEvent::Kind::FaultCleared, std::nullopt);
    }
    faults_.set_ventilation_required(false);
    ev_.request_charge(false);

    state_.sleep_requested = false;
    state_.current_capacity_amps = state_.persistent_capacity_amps;
    state_.service_level = params_.service_level;
    state_.voltage_millivolts = voltage_for(params_.service_level);
    state_.echo_mode = false;
    state_.gfci_self_test_enabled = params_.gfci_self_test;
    state_.time_limit_minutes = 0;
    state_.energy_limit_kwh = 0;
    state_.lcd = LcdDisplay{};
    state_.session = SessionClock{};
    state_.actual_current_milliamps = 0;

    const auto next = ev_.state().connected ? EvseStateCode::Connected : EvseStateCode::Ready;
    if (next != state_.state) {
        transition_to(next);
    }
}

bool EvseStateMachine::lcd_print(int x, int y, const std::string& text) {
    if (x < 0 || x >= static_cast<int>(kLcdColumns) || y < 0 || y > 1) {
        return false;
    }
    auto& row = state_.lcd.rows[static_cast<std::size_t>(y)];
    row.resize(kLcdColumns, ' ');
    for (std::size_t i = 0; i < text.size() && x + i < kLcdColumns; ++i) {
        char c = text[i];
        if (c == '\x11' || c == '\xFE') {
            c = ' ';
        }
        row[x + i] = c;
    }
    return true;
}

bool EvseStateMachine::lcd_backlight(int color) {
    if (color < 0 || color > 7) {
        return false;
    }
    state_.lcd.backlight_color = color;
    return true;
}

void EvseStateMachine::set_temperatures(std::optional<double> ds_tenths, std::optional<double> mcp_tenths) {
    if (ds_tenths) {
        state_.temperature_ds_tenths = *ds_tenths;
    }
    if (mcp_tenths) {
        state_.temperature_mcp_tenths = *mcp_tenths;
    }
    check_over_temperature();
    evaluate();
}

void EvseStateMachine::set_sensor_errors(bool ds_error, bool mcp_error) {
    state_.temperature_ds_error = ds_error;
    state_.temperature_mcp_error = mcp_error;
    check_over_temperature();
    evaluate();
}

std::vector<TransitionEvent> EvseStateMachine::take_events() {
    std::vector<TransitionEvent> events;
    events.swap(pending_events_);
    return events;
}

} // namespace evsemu
