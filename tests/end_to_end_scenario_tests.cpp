// SPDX-License-Identifier: Apache-2.0
#include "emulator_core.hpp"
#include "simulation_clock.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include <nlohmann/json.hpp>

using namespace evsemu;

static EvParameters ev_params(bool taper) {
    EvParameters p;
    p.realistic_charge_curve = taper;
    p.variance_seed = 3;
    return p;
}

static void test_charging_session() {
    EmulatorCore core(EvseParameters{}, ev_params(false));
    assert(core.execute("$GS") == "$OK 1 0\r");

    core.connect_ev();
    assert(core.execute("$GS") == "$OK 2 0\r");
    assert(core.request_charge(true));
    assert(core.execute("$GS") == "$OK 3 0\r");

    core.advance_simulation(10.0);
    assert(core.execute("$GS") == "$OK 3 10\r");
    assert(core.execute("$GU") == "$OK 20 72000\r");
    assert(core.execute("$GG") == "$OK 30000 240000 3 0\r");

    // Lower the offer below the EV's limit.
    assert(core.execute("$SC 16") == "$OK\r");
    core.advance_simulation(1.0);
    assert(core.execute("$GG") == "$OK 16000 240000 3 0\r");

    // Ground fault mid-session, then recovery starts a new session.
    core.trigger_fault(Fault::Gfci);
    assert(core.execute("$GS") == "$OK 254 11\r");
    assert(core.execute("$GG") == "$OK 0 240000 254 1\r");
    assert(core.execute("$FE") == "$NK\r");
    core.clear_all_faults();
    assert(core.execute("$GS") == "$OK 2 11\r");
    core.advance_simulation(1.0);
    assert(core.execute("$GS") == "$OK 3 0\r");

    // Sleep and wake over RAPI.
    assert(core.execute("$FD") == "$OK\r");
    assert(core.execute("$GS") == "$OK 253 0\r");
    assert(core.execute("$FE") == "$OK\r");
    assert(core.execute("$GS") == "$OK 3 0\r");

    core.disconnect_ev();
    const auto snap = core.get_snapshot();
    assert(snap.evse.state == EvseStateCode::Ready);
    assert(!snap.ev.charge_requested);
    assert(snap.faults.count(Fault::Gfci) == 1);
}

static void test_battery_fills_up() {
    EmulatorCore core(EvseParameters{}, ev_params(true));
    core.connect_ev();
    core.request_charge(true);
    core.set_soc(99.9);
    core.advance_simulation(60.0);
    const auto snap = core.get_snapshot();
    assert(snap.ev.soc_percent == 100.0);
    assert(snap.evse.state == EvseStateCode::Connected);
    assert(snap.evse.actual_current_milliamps == 0);

    const nlohmann::json j = snap;
    assert(j["evse"]["state"] == "connected");
    assert(j["ev"]["socPercent"] == 100.0);
    assert(j["faults"]["mask"] == 0);
}

static void test_direct_mode_and_limits() {
    EmulatorCore core(EvseParameters{}, ev_params(false));
    core.connect_ev();
    core.set_direct_mode(true);
    core.set_direct_current(20.0);
    core.request_charge(true);
    core.advance_simulation(2.0);
    assert(core.execute("$GG") == "$OK 20000 240000 3 0\r");

    // Direct mode ignores SoC; only the time limit ends this session.
    core.set_soc(100.0);
    core.advance_simulation(1.0);
    assert(core.get_snapshot().evse.state == EvseStateCode::Charging);
    assert(core.execute("$ST 1") == "$OK\r");
    core.advance_simulation(60.0);
    assert(core.get_snapshot().evse.state == EvseStateCode::Connected);
}

static void test_ev_error_modes() {
    EmulatorCore core(EvseParameters{}, ev_params(false));
    core.connect_ev();
    core.request_charge(true);
    core.set_ev_error_mode(EvErrorMode::DiodeCheckFailure);
    assert(core.execute("$GS") == "$OK 254 0\r");
    assert(core.execute("$GE") == "$OK 32 8\r");
    core.set_ev_error_mode(std::nullopt);
    core.clear_fault(Fault::DiodeCheck);
    core.advance_simulation(1.0);
    assert(core.get_snapshot().evse.state == EvseStateCode::Charging);

    core.set_ev_error_mode(EvErrorMode::CommTimeout);
    core.advance_simulation(1.0);
    assert(core.get_snapshot().evse.state == EvseStateCode::Connected);
}

static void test_simulation_clock() {
    EmulatorCore core(EvseParameters{}, ev_params(false));
    core.connect_ev();
    core.request_charge(true);

    SimulationClock clock(core, std::chrono::milliseconds(20));
    clock.start();
    assert(clock.running());
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    clock.stop();
    assert(!clock.running());

    const auto elapsed = core.get_snapshot().evse.session.elapsed_seconds;
    assert(elapsed > 0.1);
    assert(elapsed < 5.0);
    // Stopped clock no longer advances time.
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    assert(core.get_snapshot().evse.session.elapsed_seconds == elapsed);
}

int main() {
    test_charging_session();
    test_battery_fills_up();
    test_direct_mode_and_limits();
    test_ev_error_modes();
    test_simulation_clock();

    std::cout << "end_to_end_scenario_tests passed\n";
    return 0;
}
