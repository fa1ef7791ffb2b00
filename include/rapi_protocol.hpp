// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "evse_state_machine.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evsemu {

constexpr char kRapiOk[] = "$OK";
constexpr char kRapiNk[] = "$NK";
constexpr char kRapiTerminator = '\r';

constexpr std::uint16_t kVflagEvConnected = 0x0100;
constexpr std::uint16_t kVflagCharging = 0x0040;

enum class ChecksumStatus { Absent, Valid, Invalid };

/// \brief XOR of every byte, the `^HH` form.
std::uint8_t rapi_xor_checksum(std::string_view data);
/// \brief 8-bit sum of every byte, the legacy `*HH` form.
std::uint8_t rapi_additive_checksum(std::string_view data);
/// \brief Returns data followed by `^HH`.
std::string append_rapi_checksum(std::string_view data);
/// \brief Checks a trailing `^HH` or `*HH`. On Absent/Valid, payload receives the line without the checksum.
ChecksumStatus verify_rapi_checksum(std::string_view line, std::string_view* payload = nullptr);

int rapi_pilot_code(EvseStateCode state, bool ev_connected);
std::uint16_t rapi_vflags(EvseStateCode state, std::uint8_t fault_mask);

/// \brief `$AB 00 <fw>^HH\r`, sent when a client channel comes up.
std::string make_boot_notification(const std::string& firmware_version);
/// \brief `$AT <state> <pilot> <amps> <vflags>^HH\r`, sent per state change.
std::string make_state_notification(const TransitionEvent& event);

struct RapiOptions {
    bool append_checksum{false};
};

/// \brief Table-driven RAPI command engine. Callers serialize access to the state machine.
class RapiEngine {
public:
    using Params = std::vector<std::string>;
    /// Returns the data fields for `$OK`, or nullopt for `$NK`.
    using Handler = std::function<std::optional<std::string>(EvseStateMachine&, const Params&)>;

    struct ParamSpec {
        enum class Kind { Integer, Choice, Text };
        Kind kind{Kind::Integer};
        long min{std::numeric_limits<long>::min()};
        long max{std::numeric_limits<long>::max()};
        std::vector<std::string> choices; // upper case, matched case-insensitively
    };

    struct CommandSpec {
        std::size_t min_params{0};
        std::vector<ParamSpec> params; // max arity == params.size()
        Handler handler;
    };

    explicit RapiEngine(EvseStateMachine& machine, RapiOptions options = {});

    /// \brief Execute one line and return everything to write back, echo included.
    std::string process(std::string_view line);

    const RapiOptions& options() const { return options_; }

    static const std::map<std::string, CommandSpec>& command_table();

private:
    std::string format_response(const std::optional<std::string>& data) const;
    std::optional<std::string> dispatch(std::string_view payload);

    EvseStateMachine& machine_;
    RapiOptions options_;
};

} // namespace evsemu
