// SPDX-License-Identifier: Apache-2.0
#include "fault_registry.hpp"

#include <cassert>
#include <iostream>

using namespace evsemu;

int main() {
    FaultRegistry reg;
    assert(!reg.any_active());
    assert(reg.mask() == 0);

    // Re-triggering an active fault still counts.
    assert(reg.trigger(Fault::Gfci));
    assert(!reg.trigger(Fault::Gfci));
    assert(reg.count(Fault::Gfci) == 2);
    assert(reg.mask() == 0x01);

    reg.trigger(Fault::OverTemperature);
    assert(reg.mask() == 0x11);
    assert(reg.is_active(Fault::OverTemperature));
    assert(!reg.is_active(Fault::StuckRelay));

    assert(reg.clear(Fault::Gfci));
    assert(!reg.clear(Fault::Gfci));
    assert(reg.count(Fault::Gfci) == 2);
    assert(reg.mask() == 0x10);

    assert(reg.clear_all());
    assert(!reg.any_active());
    assert(!reg.clear_all());
    assert(reg.count(Fault::OverTemperature) == 1);
    assert(reg.count(Fault::NoGround) == 0);

    // Ventilation is tracked beside the fault flags.
    assert(reg.set_ventilation_required(true));
    assert(!reg.set_ventilation_required(true));
    assert(reg.ventilation_required());
    assert(!reg.any_active());
    assert(reg.mask() == 0);

    for (const auto fault : kAllFaults) {
        reg.trigger(fault);
    }
    assert(reg.mask() == 0x3F);

    assert(fault_from_string("GFCI") == Fault::Gfci);
    assert(fault_from_string("stuck_relay") == Fault::StuckRelay);
    assert(fault_from_string("gfci_self_test_failed") == Fault::GfciSelfTestFailed);
    assert(!fault_from_string("bogus").has_value());

    std::cout << "fault_registry_tests passed\n";
    return 0;
}
