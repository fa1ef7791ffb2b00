// SPDX-License-Identifier: Apache-2.0
#include "rapi_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <stdexcept>

#include <everest/logging.hpp>

namespace evsemu {

namespace {

std::string to_upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::optional<long> parse_integer(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    long value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto result = std::from_chars(first, last, value);
    if (result.ec != std::errc() || result.ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return std::nullopt;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

struct Token {
    std::string_view text;
    std::size_t offset{0};
};

std::vector<Token> tokenize(std::string_view body) {
    std::vector<Token> tokens;
    std::size_t pos = 0;
    while (pos < body.size()) {
        while (pos < body.size() && body[pos] == ' ') {
            ++pos;
        }
        if (pos >= body.size()) {
            break;
        }
        const auto start = pos;
        while (pos < body.size() && body[pos] != ' ') {
            ++pos;
        }
        tokens.push_back({body.substr(start, pos - start), start});
    }
    return tokens;
}

RapiEngine::ParamSpec integer_param(long min = std::numeric_limits<long>::min(),
                                    long max = std::numeric_limits<long>::max()) {
    RapiEngine::ParamSpec spec;
    spec.kind = RapiEngine::ParamSpec::Kind::Integer;
    spec.min = min;
    spec.max = max;
    return spec;
}

RapiEngine::ParamSpec choice_param(std::vector<std::string> choices) {
    RapiEngine::ParamSpec spec;
    spec.kind = RapiEngine::ParamSpec::Kind::Choice;
    spec.choices = std::move(choices);
    return spec;
}

RapiEngine::ParamSpec text_param() {
    RapiEngine::ParamSpec spec;
    spec.kind = RapiEngine::ParamSpec::Kind::Text;
    return spec;
}

bool validate_param(const RapiEngine::ParamSpec& spec, const std::string& value) {
    switch (spec.kind) {
    case RapiEngine::ParamSpec::Kind::Integer: {
        const auto parsed = parse_integer(value);
        return parsed && *parsed >= spec.min && *parsed <= spec.max;
    }
    case RapiEngine::ParamSpec::Kind::Choice:
        return std::find(spec.choices.begin(), spec.choices.end(), to_upper(value)) != spec.choices.end();
    case RapiEngine::ParamSpec::Kind::Text:
        return true;
    }
    return false;
}

int as_int(const std::string& value) {
    const auto parsed = parse_integer(value);
    if (!parsed) {
        throw std::invalid_argument("not an integer: " + value);
    }
    const long clamped = std::clamp<long>(*parsed, std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
    return static_cast<int>(clamped);
}

long long round_ll(double value) {
    return std::llround(value);
}

std::string join(std::initializer_list<std::string> fields) {
    std::string out;
    for (const auto& f : fields) {
        if (!out.empty()) out += ' ';
        out += f;
    }
    return out;
}

std::map<std::string, RapiEngine::CommandSpec> build_command_table() {
    using Params = RapiEngine::Params;
    std::map<std::string, RapiEngine::CommandSpec> table;

    // Queries
    table["GS"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       const auto& s = m.state();
                       return join({std::to_string(static_cast<int>(s.state)),
                                    std::to_string(static_cast<long long>(s.session.elapsed_seconds))});
                   }};
    table["GG"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       const auto& s = m.state();
                       return join({std::to_string(s.actual_current_milliamps), std::to_string(s.voltage_millivolts),
                                    std::to_string(static_cast<int>(s.state)),
                                    std::to_string(static_cast<int>(m.faults().mask()))});
                   }};
    table["GP"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       const auto& s = m.state();
                       return join({std::to_string(round_ll(s.temperature_ds_tenths)),
                                    std::to_string(round_ll(s.temperature_mcp_tenths)),
                                    s.temperature_ds_error ? "1" : "0", s.temperature_mcp_error ? "1" : "0"});
                   }};
    table["GV"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       return join({m.state().firmware_version, m.state().protocol_version});
                   }};
    table["GU"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       const double wh = m.state().session.energy_wh;
                       return join({std::to_string(round_ll(wh)), std::to_string(round_ll(wh * 3600.0))});
                   }};
    table["GC"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       return std::to_string(m.state().current_capacity_amps);
                   }};
    table["GE"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       return join({std::to_string(m.state().current_capacity_amps),
                                    std::to_string(static_cast<int>(m.faults().mask()))});
                   }};
    table["GF"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       const auto& f = m.faults();
                       return join({std::to_string(f.count(Fault::Gfci)), std::to_string(f.count(Fault::NoGround)),
                                    std::to_string(f.count(Fault::StuckRelay))});
                   }};
    table["GT"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       return std::to_string(m.state().time_limit_minutes);
                   }};
    table["GH"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       return std::to_string(m.state().energy_limit_kwh);
                   }};

    // Settings
    table["SC"] = {1, {integer_param(), choice_param({"V", "M"})},
                   [](EvseStateMachine& m, const Params& p) -> std::optional<std::string> {
                       auto mode = CapacityMode::Persistent;
                       if (p.size() > 1) {
                           mode = to_upper(p[1]) == "M" ? CapacityMode::Maximum : CapacityMode::Volatile;
                       }
                       if (!m.set_current_capacity(as_int(p[0]), mode)) {
                           return std::nullopt;
                       }
                       return std::string{};
                   }};
    table["SL"] = {1, {choice_param({"1", "2", "A"})},
                   [](EvseStateMachine& m, const Params& p) -> std::optional<std::string> {
                       const auto level = to_upper(p[0]);
                       m.set_service_level(level == "1"   ? ServiceLevel::L1
                                           : level == "2" ? ServiceLevel::L2
                                                          : ServiceLevel::Auto);
                       return std::string{};
                   }};
    table["SE"] = {1, {integer_param()}, [](EvseStateMachine& m, const Params& p) -> std::optional<std::string> {
                       m.set_echo(as_int(p[0]) != 0);
                       return std::string{};
                   }};
    table["ST"] = {1, {integer_param(0, 65535)},
                   [](EvseStateMachine& m, const Params& p) -> std::optional<std::string> {
                       m.set_time_limit(as_int(p[0]));
                       return std::string{};
                   }};
    table["SH"] = {1, {integer_param(0, 65535)},
                   [](EvseStateMachine& m, const Params& p) -> std::optional<std::string> {
                       m.set_energy_limit(as_int(p[0]));
                       return std::string{};
                   }};

    // Functions
    table["FE"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       if (!m.enable()) {
                           return std::nullopt;
                       }
                       return std::string{};
                   }};
    table["FD"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       m.disable();
                       return std::string{};
                   }};
    table["FR"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       m.reset();
                       return std::string{};
                   }};
    table["F1"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       m.set_gfci_self_test(true);
                       return std::string{};
                   }};
    table["F0"] = {0, {}, [](EvseStateMachine& m, const Params&) -> std::optional<std::string> {
                       m.set_gfci_self_test(false);
                       return std::string{};
                   }};
    table["FB"] = {1, {integer_param(0, 7)}, [](EvseStateMachine& m, const Params& p) -> std::optional<std::string> {
                       if (!m.lcd_backlight(as_int(p[0]))) {
                           return std::nullopt;
                       }
                       return std::string{};
                   }};
    table["FP"] = {3, {integer_param(0, static_cast<long>(kLcdColumns) - 1), integer_param(0, 1), text_param()},
                   [](EvseStateMachine& m, const Params& p) -> std::optional<std::string> {
                       if (!m.lcd_print(as_int(p[0]), as_int(p[1]), p[2])) {
                           return std::nullopt;
                       }
                       return std::string{};
                   }};
    return table;
}

} // namespace

std::uint8_t rapi_xor_checksum(std::string_view data) {
    std::uint8_t sum = 0;
    for (const char c : data) {
        sum ^= static_cast<std::uint8_t>(c);
    }
    return sum;
}

std::uint8_t rapi_additive_checksum(std::string_view data) {
    std::uint8_t sum = 0;
    for (const char c : data) {
        sum = static_cast<std::uint8_t>(sum + static_cast<std::uint8_t>(c));
    }
    return sum;
}

std::string append_rapi_checksum(std::string_view data) {
    char suffix[4];
    std::snprintf(suffix, sizeof(suffix), "^%02X", rapi_xor_checksum(data));
    return std::string(data) + suffix;
}

ChecksumStatus verify_rapi_checksum(std::string_view line, std::string_view* payload) {
    if (payload) {
        *payload = line;
    }
    if (line.size() < 3) {
        return ChecksumStatus::Absent;
    }
    const auto marker_pos = line.size() - 3;
    const char marker = line[marker_pos];
    const auto hi = hex_value(line[marker_pos + 1]);
    const auto lo = hex_value(line[marker_pos + 2]);
    if ((marker != '^' && marker != '*') || !hi || !lo) {
        return ChecksumStatus::Absent;
    }
    const auto body = line.substr(0, marker_pos);
    const auto expected = static_cast<std::uint8_t>((*hi << 4) | *lo);
    const auto actual = marker == '^' ? rapi_xor_checksum(body) : rapi_additive_checksum(body);
    if (actual != expected) {
        return ChecksumStatus::Invalid;
    }
    if (payload) {
        *payload = body;
    }
    return ChecksumStatus::Valid;
}

int rapi_pilot_code(EvseStateCode state, bool ev_connected) {
    switch (state) {
    case EvseStateCode::Ready:
        return 0x01;
    case EvseStateCode::Connected:
        return 0x02;
    case EvseStateCode::Charging:
        return 0x03;
    case EvseStateCode::VentilationRequired:
        return 0x04;
    default:
        return ev_connected ? 0x02 : 0x01;
    }
}

std::uint16_t rapi_vflags(EvseStateCode state, std::uint8_t fault_mask) {
    std::uint16_t flags = fault_mask;
    if (state == EvseStateCode::Connected || state == EvseStateCode::Charging) {
        flags |= kVflagEvConnected;
    }
    if (state == EvseStateCode::Charging) {
        flags |= kVflagCharging;
    }
    return flags;
}

std::string make_boot_notification(const std::string& firmware_version) {
    return append_rapi_checksum("$AB 00 " + firmware_version) + kRapiTerminator;
}

std::string make_state_notification(const TransitionEvent& event) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "$AT %02X %02X %d %04X", static_cast<unsigned>(event.to),
                  static_cast<unsigned>(rapi_pilot_code(event.to, event.ev_connected)), event.capacity_amps,
                  static_cast<unsigned>(rapi_vflags(event.to, event.fault_mask)));
    return append_rapi_checksum(buf) + kRapiTerminator;
}

RapiEngine::RapiEngine(EvseStateMachine& machine, RapiOptions options) : machine_(machine), options_(options) {
}

const std::map<std::string, RapiEngine::CommandSpec>& RapiEngine::command_table() {
    static const auto table = build_command_table();
    return table;
}

std::string RapiEngine::format_response(const std::optional<std::string>& data) const {
    std::string body = data ? kRapiOk : kRapiNk;
    if (data && !data->empty()) {
        body += ' ';
        body += *data;
    }
    if (options_.append_checksum) {
        body = append_rapi_checksum(body);
    }
    body += kRapiTerminator;
    return body;
}

std::optional<std::string> RapiEngine::dispatch(std::string_view line) {
    if (line.empty() || line.front() != '$') {
        EVLOG_debug << "Rejected RAPI line without '$': " << std::string(line);
        return std::nullopt;
    }

    std::string_view payload;
    if (verify_rapi_checksum(line, &payload) == ChecksumStatus::Invalid) {
        EVLOG_debug << "Rejected RAPI line with bad checksum: " << std::string(line);
        return std::nullopt;
    }

    const auto body = trim(payload.substr(1));
    const auto tokens = tokenize(body);
    if (tokens.empty() || tokens.front().text.size() != 2) {
        EVLOG_debug << "Rejected malformed RAPI command: " << std::string(line);
        return std::nullopt;
    }

    const auto code = to_upper(tokens.front().text);
    const auto& table = command_table();
    const auto it = table.find(code);
    if (it == table.end()) {
        EVLOG_debug << "Rejected unknown RAPI command " << code;
        return std::nullopt;
    }
    const auto& spec = it->second;

    Params params;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto index = params.size();
        if (index < spec.params.size() && spec.params[index].kind == ParamSpec::Kind::Text) {
            // Free text runs to the end of the line, spaces included.
            params.emplace_back(trim(body.substr(tokens[i].offset)));
            break;
        }
        params.emplace_back(tokens[i].text);
    }
    if (params.size() < spec.min_params || params.size() > spec.params.size()) {
        EVLOG_debug << "Rejected RAPI " << code << ": wrong parameter count " << params.size();
        return std::nullopt;
    }
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (!validate_param(spec.params[i], params[i])) {
            EVLOG_debug << "Rejected RAPI " << code << ": invalid parameter '" << params[i] << "'";
            return std::nullopt;
        }
    }

    try {
        return spec.handler(machine_, params);
    } catch (const std::exception& e) {
        EVLOG_warning << "RAPI " << code << " handler failed: " << e.what();
        return std::nullopt;
    }
}

std::string RapiEngine::process(std::string_view line) {
    const auto text = trim(line);
    std::string out;
    if (machine_.state().echo_mode && !text.empty()) {
        out.append(text.data(), text.size());
        out += kRapiTerminator;
    }
    out += format_response(dispatch(text));
    return out;
}

} // namespace evsemu
