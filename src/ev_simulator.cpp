// SPDX-License-Identifier: Apache-2.0
#include "ev_simulator.hpp"

#include <algorithm>
#include <cctype>

namespace evsemu {

namespace {
std::mt19937 make_rng(std::uint32_t seed) {
    if (seed != 0) {
        return std::mt19937(seed);
    }
    std::random_device rd;
    return std::mt19937(rd());
}
} // namespace

const char* to_string(EvErrorMode mode) {
    switch (mode) {
    case EvErrorMode::DiodeCheckFailure:
        return "diode_check_failure";
    case EvErrorMode::InvalidPilot:
        return "invalid_pilot";
    case EvErrorMode::CommTimeout:
        return "comm_timeout";
    }
    return "unknown";
}

std::optional<EvErrorMode> ev_error_mode_from_string(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto mode : {EvErrorMode::DiodeCheckFailure, EvErrorMode::InvalidPilot, EvErrorMode::CommTimeout}) {
        if (lowered == to_string(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

EvSimulator::EvSimulator(const EvParameters& params) : rng_(make_rng(params.variance_seed)) {
    state_.battery_capacity_kwh = params.battery_capacity_kwh > 0.0 ? params.battery_capacity_kwh : 75.0;
    state_.max_charge_rate_kw = std::max(0.0, params.max_charge_rate_kw);
    state_.soc_percent = std::clamp(params.initial_soc_percent, 0.0, 100.0);
    state_.realistic_charge_curve = params.realistic_charge_curve;
}

void EvSimulator::connect() {
    state_.connected = true;
}

void EvSimulator::disconnect() {
    state_.connected = false;
    state_.charge_requested = false;
    stop_drawing();
}

bool EvSimulator::request_charge(bool requested) {
    if (requested && !state_.connected) {
        return false;
    }
    state_.charge_requested = requested;
    if (!requested) {
        stop_drawing();
    }
    return true;
}

void EvSimulator::set_soc(double percent) {
    state_.soc_percent = std::clamp(percent, 0.0, 100.0);
}

void EvSimulator::set_battery_capacity(double kwh) {
    if (kwh > 0.0) {
        state_.battery_capacity_kwh = kwh;
    }
}

void EvSimulator::set_max_charge_rate(double kw) {
    state_.max_charge_rate_kw = std::max(0.0, kw);
}

void EvSimulator::set_direct_mode(bool enabled) {
    state_.direct_mode = enabled;
}

void EvSimulator::set_direct_current(double amps, int capacity_amps) {
    const double ceiling = std::max(0, capacity_amps) * kDirectCurrentHeadroom;
    state_.direct_current_amps = std::clamp(amps, 0.0, ceiling);
}

void EvSimulator::set_current_variance(bool enabled) {
    state_.current_variance_enabled = enabled;
}

void EvSimulator::set_error_mode(std::optional<EvErrorMode> mode) {
    state_.error_mode = mode;
    if (!wants_charge()) {
        stop_drawing();
    }
}

bool EvSimulator::wants_charge() const {
    return state_.connected && state_.charge_requested && state_.error_mode != EvErrorMode::CommTimeout;
}

void EvSimulator::stop_drawing() {
    state_.actual_charge_rate_kw = 0.0;
    state_.actual_current_amps = 0.0;
}

double EvSimulator::sample_variance() {
    if (!state_.current_variance_enabled) {
        return 1.0;
    }
    // Direct mode jitters around the setpoint, a battery never takes more than offered.
    const double low = -kVarianceFraction;
    const double high = state_.direct_mode ? kVarianceFraction : 0.0;
    std::uniform_real_distribution<double> dist(low, high);
    return 1.0 + dist(rng_);
}

double EvSimulator::taper_factor() const {
    if (!state_.realistic_charge_curve || state_.soc_percent <= kTaperStartSoc) {
        return 1.0;
    }
    const double progress = std::min(1.0, (state_.soc_percent - kTaperStartSoc) / kTaperRange);
    return 1.0 - progress * kMaxTaperReduction;
}

double EvSimulator::advance(int offered_amps, double volts, double dt_s) {
    if (!wants_charge() || volts <= 0.0 || dt_s <= 0.0) {
        stop_drawing();
        return 0.0;
    }

    if (state_.direct_mode) {
        const double ceiling = std::max(0, offered_amps) * kDirectCurrentHeadroom;
        const double amps = std::min(state_.direct_current_amps, ceiling) * sample_variance();
        state_.actual_current_amps = amps;
        state_.actual_charge_rate_kw = amps * volts / 1000.0;
        return amps;
    }

    if (state_.soc_percent >= 100.0) {
        stop_drawing();
        return 0.0;
    }

    const double offered_kw = std::max(0, offered_amps) * volts / 1000.0;
    double power_kw = std::min(offered_kw, state_.max_charge_rate_kw);
    power_kw *= taper_factor();
    power_kw *= sample_variance();

    const double added_kwh = power_kw * dt_s / 3600.0;
    state_.soc_percent = std::min(100.0, state_.soc_percent + added_kwh / state_.battery_capacity_kwh * 100.0);
    state_.actual_charge_rate_kw = power_kw;
    state_.actual_current_amps = power_kw * 1000.0 / volts;
    return state_.actual_current_amps;
}

} // namespace evsemu
