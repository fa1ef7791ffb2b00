// SPDX-License-Identifier: Apache-2.0
#include "fault_registry.hpp"

#include <algorithm>
#include <cctype>

namespace evsemu {

const char* to_string(Fault fault) {
    switch (fault) {
    case Fault::Gfci:
        return "gfci";
    case Fault::StuckRelay:
        return "stuck_relay";
    case Fault::NoGround:
        return "no_ground";
    case Fault::DiodeCheck:
        return "diode_check";
    case Fault::OverTemperature:
        return "over_temperature";
    case Fault::GfciSelfTestFailed:
        return "gfci_self_test_failed";
    }
    return "unknown";
}

std::optional<Fault> fault_from_string(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto fault : kAllFaults) {
        if (lowered == to_string(fault)) {
            return fault;
        }
    }
    return std::nullopt;
}

std::size_t FaultRegistry::index_of(Fault fault) {
    for (std::size_t i = 0; i < kAllFaults.size(); ++i) {
        if (kAllFaults[i] == fault) {
            return i;
        }
    }
    return 0;
}

bool FaultRegistry::trigger(Fault fault) {
    const bool was_active = is_active(fault);
    active_mask_ |= static_cast<std::uint8_t>(fault);
    ++counters_[index_of(fault)];
    return !was_active;
}

bool FaultRegistry::clear(Fault fault) {
    const bool was_active = is_active(fault);
    active_mask_ &= static_cast<std::uint8_t>(~static_cast<std::uint8_t>(fault));
    return was_active;
}

bool FaultRegistry::clear_all() {
    const bool any = any_active();
    active_mask_ = 0;
    return any;
}

std::uint32_t FaultRegistry::count(Fault fault) const {
    return counters_[index_of(fault)];
}

bool FaultRegistry::set_ventilation_required(bool required) {
    const bool changed = ventilation_required_ != required;
    ventilation_required_ = required;
    return changed;
}

} // namespace evsemu
