// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace evsemu {

/// \brief Simulated safety faults. Values are the bits reported in the RAPI error flags.
enum class Fault : std::uint8_t {
    Gfci = 0x01,
    StuckRelay = 0x02,
    NoGround = 0x04,
    DiodeCheck = 0x08,
    OverTemperature = 0x10,
    GfciSelfTestFailed = 0x20,
};

inline constexpr std::array<Fault, 6> kAllFaults{{Fault::Gfci, Fault::StuckRelay, Fault::NoGround, Fault::DiodeCheck,
                                                  Fault::OverTemperature, Fault::GfciSelfTestFailed}};

const char* to_string(Fault fault);
std::optional<Fault> fault_from_string(const std::string& name);

/// \brief Active fault flags plus monotonic trigger counters.
/// Not synchronized; the owning aggregate serializes access.
class FaultRegistry {
public:
    /// \brief Set the flag and bump its counter. Returns true if the flag was not already active.
    bool trigger(Fault fault);
    /// \brief Returns true if the flag was active. Counters are never touched.
    bool clear(Fault fault);
    bool clear_all();

    bool is_active(Fault fault) const { return (active_mask_ & static_cast<std::uint8_t>(fault)) != 0; }
    bool any_active() const { return active_mask_ != 0; }
    std::uint8_t mask() const { return active_mask_; }
    std::uint32_t count(Fault fault) const;

    // Ventilation is a separate condition, it drives VENTILATION_REQUIRED but is not an error flag.
    bool set_ventilation_required(bool required);
    bool ventilation_required() const { return ventilation_required_; }

private:
    static std::size_t index_of(Fault fault);

    std::uint8_t active_mask_{0};
    std::array<std::uint32_t, kAllFaults.size()> counters_{};
    bool ventilation_required_{false};
};

} // namespace evsemu
