// SPDX-License-Identifier: Apache-2.0
#include "emulator_core.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using namespace evsemu;

namespace {

using namespace std::chrono_literals;

EvParameters ev_params() {
    EvParameters p;
    p.realistic_charge_curve = false;
    p.variance_seed = 11;
    return p;
}

void test_basic_delivery() {
    EmulatorCore core(EvseParameters{}, ev_params());
    auto sub = core.subscribe_to_transitions();
    assert(!sub->try_next().has_value());

    core.connect_ev();
    auto event = sub->next(100ms);
    assert(event.has_value());
    assert(event->kind == TransitionEvent::Kind::StateChanged);
    assert(event->from == EvseStateCode::Ready);
    assert(event->to == EvseStateCode::Connected);
    assert(event->ev_connected);
    assert(event->capacity_amps == 32);

    const nlohmann::json j = *event;
    assert(j["kind"] == "state_changed");
    assert(j["from"] == "ready");
    assert(j["to"] == "connected");
    assert(!j.contains("fault"));

    core.trigger_fault(Fault::NoGround);
    event = sub->next(100ms);
    assert(event && event->kind == TransitionEvent::Kind::FaultTriggered);
    assert(event->fault == Fault::NoGround);
    const nlohmann::json fj = *event;
    assert(fj["fault"] == "no_ground");
    event = sub->next(100ms);
    assert(event && event->to == EvseStateCode::Error);
    assert(event->fault_mask == 0x04);

    // Queries and rejected commands publish nothing.
    (void)core.execute("$GS");
    (void)core.execute("$SC nope");
    assert(!sub->next(20ms).has_value());
}

void test_every_subscriber_sees_every_event() {
    EmulatorCore core(EvseParameters{}, ev_params());
    auto a = core.subscribe_to_transitions();
    auto b = core.subscribe_to_transitions();
    core.connect_ev();
    core.request_charge(true);
    for (auto* sub : {a.get(), b.get()}) {
        auto first = sub->try_next();
        auto second = sub->try_next();
        assert(first && first->to == EvseStateCode::Connected);
        assert(second && second->to == EvseStateCode::Charging);
        assert(!sub->try_next());
    }

    // Dropping a subscription does not affect the others.
    a.reset();
    core.disconnect_ev();
    auto last = b->try_next();
    assert(last && last->to == EvseStateCode::Ready);
}

void test_slow_subscriber_drops_oldest() {
    EmulatorCore core(EvseParameters{}, ev_params());
    auto sub = core.subscribe_to_transitions(2);
    core.connect_ev();                 // Ready -> Connected
    core.request_charge(true);         // Connected -> Charging
    core.request_charge(false);        // Charging -> Connected
    core.disconnect_ev();              // Connected -> Ready
    assert(sub->dropped() == 2);
    auto first = sub->try_next();
    auto second = sub->try_next();
    assert(first && first->from == EvseStateCode::Charging && first->to == EvseStateCode::Connected);
    assert(second && second->to == EvseStateCode::Ready);
    assert(!sub->try_next());
}

void test_order_matches_commit_order() {
    EmulatorCore core(EvseParameters{}, ev_params());
    auto sub = core.subscribe_to_transitions(100000);

    std::thread plug([&]() {
        for (int i = 0; i < 200; ++i) {
            core.connect_ev();
            core.request_charge(true);
            core.disconnect_ev();
        }
    });
    std::thread sleeper([&]() {
        for (int i = 0; i < 200; ++i) {
            (void)core.execute("$FD");
            (void)core.execute("$FE");
        }
    });
    std::thread ticker([&]() {
        for (int i = 0; i < 200; ++i) {
            core.tick(0.1);
        }
    });
    plug.join();
    sleeper.join();
    ticker.join();

    assert(sub->dropped() == 0);
    auto previous = EvseStateCode::Ready;
    std::size_t changes = 0;
    while (auto event = sub->try_next()) {
        if (event->kind != TransitionEvent::Kind::StateChanged) {
            continue;
        }
        assert(event->from == previous);
        assert(event->from != event->to);
        previous = event->to;
        ++changes;
    }
    assert(changes > 0);
    assert(previous == core.get_snapshot().evse.state);
}

void test_close_on_shutdown() {
    std::shared_ptr<TransitionSubscription> sub;
    {
        EmulatorCore core(EvseParameters{}, ev_params());
        sub = core.subscribe_to_transitions();
        core.connect_ev();
    }
    assert(sub->closed());
    // Already queued events are still delivered after close.
    auto event = sub->next(10ms);
    assert(event && event->to == EvseStateCode::Connected);
    const auto start = std::chrono::steady_clock::now();
    assert(!sub->next(1s).has_value());
    assert(std::chrono::steady_clock::now() - start < 500ms);
}

} // namespace

int main() {
    test_basic_delivery();
    test_every_subscriber_sees_every_event();
    test_slow_subscriber_drops_oldest();
    test_order_matches_commit_order();
    test_close_on_shutdown();

    std::cout << "transition_events_tests passed\n";
    return 0;
}
