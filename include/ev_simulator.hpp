// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace evsemu {

enum class EvErrorMode { DiodeCheckFailure, InvalidPilot, CommTimeout };

const char* to_string(EvErrorMode mode);
std::optional<EvErrorMode> ev_error_mode_from_string(const std::string& name);

struct EvParameters {
    double battery_capacity_kwh{75.0};
    double max_charge_rate_kw{7.2};
    double initial_soc_percent{50.0};
    bool realistic_charge_curve{true};
    std::uint32_t variance_seed{0}; // 0 => seed from std::random_device
};

struct EvState {
    bool connected{false};
    bool charge_requested{false};
    double soc_percent{50.0};
    bool direct_mode{false};
    double direct_current_amps{0.0};
    double battery_capacity_kwh{75.0};
    double max_charge_rate_kw{7.2};
    bool current_variance_enabled{false};
    bool realistic_charge_curve{true};
    std::optional<EvErrorMode> error_mode;
    double actual_charge_rate_kw{0.0};
    double actual_current_amps{0.0};
};

/// \brief Battery and charging-demand model of the vehicle plugged into the station.
class EvSimulator {
public:
    static constexpr double kTaperStartSoc = 80.0;
    static constexpr double kTaperRange = 20.0;
    static constexpr double kMaxTaperReduction = 0.3;
    static constexpr double kDirectCurrentHeadroom = 1.1;
    static constexpr double kVarianceFraction = 0.01;

    explicit EvSimulator(const EvParameters& params);

    void connect();
    /// \brief Unplug; always drops the charge request.
    void disconnect();
    /// \brief Returns false when asked to request charge while unplugged.
    bool request_charge(bool requested);
    void set_soc(double percent);
    void set_battery_capacity(double kwh);
    void set_max_charge_rate(double kw);
    void set_direct_mode(bool enabled);
    /// \brief Clamped into [0, capacity_amps * 1.1].
    void set_direct_current(double amps, int capacity_amps);
    void set_current_variance(bool enabled);
    void set_realistic_charge_curve(bool enabled) { state_.realistic_charge_curve = enabled; }
    void set_error_mode(std::optional<EvErrorMode> mode);

    /// \brief True when the EV is plugged in, asking for energy, and still talking to the EVSE.
    bool wants_charge() const;

    /// \brief Draw energy for dt seconds from what the EVSE offers. Returns the current drawn in amps.
    double advance(int offered_amps, double volts, double dt_s);
    void stop_drawing();

    const EvState& state() const { return state_; }

private:
    double sample_variance();
    double taper_factor() const;

    EvState state_;
    std::mt19937 rng_;
};

} // namespace evsemu
