// SPDX-License-Identifier: Apache-2.0
#include "rapi_protocol.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <string_view>

using namespace evsemu;

static bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

// Strips the trailing CR and checks the XOR checksum of an async notification.
static std::string_view checked_body(const std::string& message) {
    assert(!message.empty() && message.back() == '\r');
    std::string_view line(message.data(), message.size() - 1);
    std::string_view body;
    assert(verify_rapi_checksum(line, &body) == ChecksumStatus::Valid);
    assert(line[body.size()] == '^');
    return body;
}

int main() {
    // Known vectors
    assert(rapi_xor_checksum("$OK") == 0x20);
    assert(rapi_xor_checksum("$NK") == 0x21);
    assert(rapi_xor_checksum("OK") == 0x04);
    assert(rapi_xor_checksum("@@") == 0x00);
    assert(rapi_xor_checksum("$") == 0x24);
    assert(rapi_xor_checksum("") == 0x00);
    assert(rapi_xor_checksum("$GS") == 0x30);
    assert(rapi_additive_checksum("$GS") == 0xBE);
    assert(append_rapi_checksum("$OK 32") == "$OK 32^01");
    assert(append_rapi_checksum("$OK") == "$OK^20");

    std::string_view payload;
    assert(verify_rapi_checksum("$GS^30", &payload) == ChecksumStatus::Valid);
    assert(payload == "$GS");
    assert(verify_rapi_checksum("$GS*BE", &payload) == ChecksumStatus::Valid);
    assert(payload == "$GS");
    assert(verify_rapi_checksum("$GS^31", &payload) == ChecksumStatus::Invalid);
    assert(verify_rapi_checksum("$GS", &payload) == ChecksumStatus::Absent);
    assert(payload == "$GS");
    assert(verify_rapi_checksum("$GS^3G") == ChecksumStatus::Absent);
    assert(verify_rapi_checksum("$G") == ChecksumStatus::Absent);

    // Pilot codes and status flags
    assert(rapi_pilot_code(EvseStateCode::Charging, true) == 3);
    assert(rapi_pilot_code(EvseStateCode::Error, true) == 2);
    assert(rapi_pilot_code(EvseStateCode::Error, false) == 1);
    assert(rapi_pilot_code(EvseStateCode::Sleep, false) == 1);
    assert(rapi_vflags(EvseStateCode::Ready, 0) == 0x0000);
    assert(rapi_vflags(EvseStateCode::Connected, 0) == 0x0100);
    assert(rapi_vflags(EvseStateCode::Charging, 0) == 0x0140);
    assert(rapi_vflags(EvseStateCode::Error, 0x11) == 0x0011);

    // Async notifications always carry a checksum.
    const auto boot = make_boot_notification("8.2.1");
    assert(starts_with(boot, "$AB 00 8.2.1^"));
    assert(checked_body(boot) == "$AB 00 8.2.1");

    TransitionEvent charging;
    charging.from = EvseStateCode::Connected;
    charging.to = EvseStateCode::Charging;
    charging.capacity_amps = 32;
    charging.ev_connected = true;
    assert(checked_body(make_state_notification(charging)) == "$AT 03 03 32 0140");

    TransitionEvent fault;
    fault.from = EvseStateCode::Charging;
    fault.to = EvseStateCode::Error;
    fault.fault_mask = 0x01;
    fault.capacity_amps = 32;
    fault.ev_connected = true;
    assert(checked_body(make_state_notification(fault)) == "$AT FE 02 32 0001");

    TransitionEvent sleeping;
    sleeping.from = EvseStateCode::Ready;
    sleeping.to = EvseStateCode::Sleep;
    sleeping.capacity_amps = 6;
    assert(checked_body(make_state_notification(sleeping)) == "$AT FD 01 6 0000");

    std::cout << "rapi_checksum_tests passed\n";
    return 0;
}
