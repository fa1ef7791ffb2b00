// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "ev_simulator.hpp"
#include "fault_registry.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace evsemu {

/// \brief J1772 station states with their RAPI wire codes.
enum class EvseStateCode : std::uint8_t {
    Ready = 0x01,
    Connected = 0x02,
    Charging = 0x03,
    VentilationRequired = 0x04,
    Sleep = 0xFD,
    Error = 0xFE,
};

enum class ServiceLevel { L1, L2, Auto };

enum class CapacityMode { Persistent, Volatile, Maximum };

const char* to_string(EvseStateCode state);
const char* to_string(ServiceLevel level);

constexpr int kHardwareMinAmps = 6;
constexpr int kHardwareMaxAmps = 80;
constexpr int kL1VoltageMillivolts = 120000;
constexpr int kL2VoltageMillivolts = 240000;
constexpr double kOverTemperatureTenths = 650.0;
constexpr double kAmbientTemperatureTenths = 200.0;
constexpr double kInitialTemperatureTenths = 250.0;
constexpr double kHeatingTenthsPerSecond = 0.5;
constexpr double kCoolingTenthsPerSecond = 2.0;
// Steady-state rise above kInitialTemperatureTenths while drawing kHardwareMaxAmps; scales with I^2.
constexpr double kFullLoadRiseTenths = 500.0;
constexpr std::size_t kLcdColumns = 16;

struct EvseParameters {
    std::string firmware_version{"8.2.1"};
    std::string protocol_version{"5.0.1"};
    int default_current_amps{32};
    int min_current_amps{kHardwareMinAmps};
    int max_current_amps{kHardwareMaxAmps};
    ServiceLevel service_level{ServiceLevel::L2};
    bool gfci_self_test{true};
    bool temperature_simulation{true};
};

/// \brief Per-session accumulators. Reset on entry into CHARGING, frozen otherwise.
struct SessionClock {
    double elapsed_seconds{0.0};
    double energy_wh{0.0};
};

struct LcdDisplay {
    std::array<std::string, 2> rows{{"OpenEVSE        ", "Ready           "}};
    int backlight_color{2};
};

struct EvseState {
    EvseStateCode state{EvseStateCode::Ready};
    int current_capacity_amps{32};
    int persistent_capacity_amps{32};
    int max_configured_capacity_amps{kHardwareMaxAmps};
    bool max_capacity_locked{false};
    int actual_current_milliamps{0};
    int voltage_millivolts{kL2VoltageMillivolts};
    double temperature_ds_tenths{kInitialTemperatureTenths};
    double temperature_mcp_tenths{kInitialTemperatureTenths};
    bool temperature_ds_error{false};
    bool temperature_mcp_error{false};
    SessionClock session;
    double total_energy_wh{0.0};
    ServiceLevel service_level{ServiceLevel::L2};
    std::string firmware_version;
    std::string protocol_version;
    bool echo_mode{false};
    bool gfci_self_test_enabled{true};
    bool sleep_requested{false};
    int time_limit_minutes{0};  // 0 => no limit
    int energy_limit_kwh{0};    // 0 => no limit
    LcdDisplay lcd;
};

/// \brief One committed change, published to transition subscribers.
struct TransitionEvent {
    enum class Kind { StateChanged, FaultTriggered, FaultCleared };

    Kind kind{Kind::StateChanged};
    EvseStateCode from{EvseStateCode::Ready};
    EvseStateCode to{EvseStateCode::Ready};
    std::optional<Fault> fault;
    std::uint8_t fault_mask{0};
    int capacity_amps{0};
    bool ev_connected{false};
};

/// \brief Station-side charging logic. Rules are applied in priority order, one transition per event.
/// Not synchronized; EmulatorCore holds the lock around every call.
class EvseStateMachine {
public:
    EvseStateMachine(const EvseParameters& params, FaultRegistry& faults, EvSimulator& ev);

    const EvseState& state() const { return state_; }
    const EvseParameters& parameters() const { return params_; }
    const FaultRegistry& faults() const { return faults_; }
    const EvState& ev() const { return ev_.state(); }

    /// \brief Apply the first matching transition rule. Returns true if the state changed.
    bool evaluate();

    /// \brief Advance physical state by dt seconds and re-evaluate.
    void tick(double dt_s);

    bool trigger_fault(Fault fault);
    bool clear_fault(Fault fault);
    bool clear_all_faults();
    void set_ventilation_required(bool required);

    /// \brief Returns the applied amps, or nullopt when the request is refused (repeated Maximum).
    std::optional<int> set_current_capacity(int amps, CapacityMode mode);
    void set_service_level(ServiceLevel level);
    void set_echo(bool enabled) { state_.echo_mode = enabled; }
    void set_gfci_self_test(bool enabled) { state_.gfci_self_test_enabled = enabled; }
    void set_time_limit(int minutes);
    void set_energy_limit(int kwh);

    /// \brief Leave SLEEP. Fails while any fault is active.
    bool enable();
    void disable();
    void reset();

    bool lcd_print(int x, int y, const std::string& text);
    bool lcd_backlight(int color);

    void set_temperatures(std::optional<double> ds_tenths, std::optional<double> mcp_tenths);
    void set_sensor_errors(bool ds_error, bool mcp_error);

    /// \brief Drain events recorded since the last call.
    std::vector<TransitionEvent> take_events();

    int allowed_max_amps() const;
    int voltage_for(ServiceLevel level) const;

private:
    EvseStateCode next_state();
    void transition_to(EvseStateCode next);
    void check_over_temperature();
    void check_ev_error_mode();
    bool session_limit_reached() const;
    void record_fault_event(TransitionEvent::Kind kind, std::optional<Fault> fault);

    EvseParameters params_;
    FaultRegistry& faults_;
    EvSimulator& ev_;
    EvseState state_;
    std::vector<TransitionEvent> pending_events_;
    bool over_temperature_armed_{true};
    bool diode_fault_latched_{false};
};

} // namespace evsemu
