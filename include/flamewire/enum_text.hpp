/**
 * @file enum_text.hpp
 * @brief Text forms of the parameter enums: CLI tokens and human labels.
 *
 * Every enum in parameter.hpp numbers its values 0..N-1, so one table per enum
 * indexed by the raw byte covers both directions.
 *
 * | Form  | Used by                         | Example (FlameColor 1) |
 * |-------|---------------------------------|------------------------|
 * | token | settings values, kv/json output | `yellow-red`           |
 * | label | describe() blocks               | `Yellow/Red`           |
 *
 * A raw byte past the end of a table (an appliance state we do not know) renders as
 * `unknown(n)` / `Unknown(n)` and is never parsed back.
 */

#ifndef FLAMEWIRE_ENUM_TEXT_HPP
#define FLAMEWIRE_ENUM_TEXT_HPP

#include "flamewire/parameter.hpp"

#include <iterator>
#include <string>

namespace flamewire {

template <typename E>
struct EnumText;

template <> struct EnumText<TempUnit> {
    static constexpr const char* tokens[] = { "fahrenheit", "celsius" };
    static constexpr const char* labels[] = { "Fahrenheit", "Celsius" };
};

// The appliance calls Manual "On" in its own UI.
template <> struct EnumText<FireMode> {
    static constexpr const char* tokens[] = { "standby", "manual" };
    static constexpr const char* labels[] = { "Standby", "On" };
};

template <> struct EnumText<FlameEffect> {
    static constexpr const char* tokens[] = { "off", "on" };
    static constexpr const char* labels[] = { "Off", "On" };
};

template <> struct EnumText<Brightness> {
    static constexpr const char* tokens[] = { "high", "low" };
    static constexpr const char* labels[] = { "High", "Low" };
};

template <> struct EnumText<PulsatingEffect> {
    static constexpr const char* tokens[] = { "off", "on" };
    static constexpr const char* labels[] = { "Off", "On" };
};

template <> struct EnumText<HeatStatus> {
    static constexpr const char* tokens[] = { "off", "on" };
    static constexpr const char* labels[] = { "Off", "On" };
};

template <> struct EnumText<HeatMode> {
    static constexpr const char* tokens[] = { "normal", "boost", "eco", "fan-only", "schedule" };
    static constexpr const char* labels[] = { "Normal", "Boost", "Eco", "Fan Only", "Schedule" };
};

template <> struct EnumText<HeatControl> {
    static constexpr const char* tokens[] = { "software-disabled", "hardware-disabled", "enabled" };
    static constexpr const char* labels[] = { "Software Disabled", "Hardware Disabled", "Enabled" };
};

template <> struct EnumText<FlameColor> {
    static constexpr const char* tokens[] = {
        "all", "yellow-red", "yellow-blue", "blue", "red", "yellow", "blue-red"
    };
    static constexpr const char* labels[] = {
        "All", "Yellow/Red", "Yellow/Blue", "Blue", "Red", "Yellow", "Blue/Red"
    };
};

template <> struct EnumText<LightStatus> {
    static constexpr const char* tokens[] = { "off", "on" };
    static constexpr const char* labels[] = { "Off", "On" };
};

template <> struct EnumText<TimerStatus> {
    static constexpr const char* tokens[] = { "disabled", "enabled" };
    static constexpr const char* labels[] = { "Disabled", "Enabled" };
};

template <> struct EnumText<LogEffect> {
    static constexpr const char* tokens[] = { "off", "on" };
    static constexpr const char* labels[] = { "Off", "On" };
};

template <> struct EnumText<MediaTheme> {
    static constexpr const char* tokens[] = {
        "user-defined", "white", "blue", "purple", "red", "green", "prism", "kaleidoscope", "midnight"
    };
    static constexpr const char* labels[] = {
        "User Defined", "White", "Blue", "Purple", "Red", "Green", "Prism", "Kaleidoscope", "Midnight"
    };
};

// ---------------------------------------------------------------------------

/// Token for `e`, or nullptr when the raw value has no table entry.
template <typename E>
const char* enum_token(E e) {
    const size_t i = raw(e);
    return i < std::size(EnumText<E>::tokens) ? EnumText<E>::tokens[i] : nullptr;
}

/// Token, or `unknown(n)`.
template <typename E>
std::string enum_token_or_unknown(E e) {
    const char* t = enum_token(e);
    return t ? std::string(t) : "unknown(" + std::to_string(raw(e)) + ")";
}

/// Human label, or `Unknown(n)`.
template <typename E>
std::string enum_label(E e) {
    const size_t i = raw(e);
    if (i < std::size(EnumText<E>::labels)) return EnumText<E>::labels[i];
    return "Unknown(" + std::to_string(raw(e)) + ")";
}

/// Exact-match token lookup. False leaves `out` untouched.
template <typename E>
bool parse_enum_token(const std::string& token, E& out) {
    for (size_t i = 0; i < std::size(EnumText<E>::tokens); ++i) {
        if (token == EnumText<E>::tokens[i]) {
            out = static_cast<E>(i);
            return true;
        }
    }
    return false;
}

/// "a|b|c" for bad_value reasons.
template <typename E>
std::string enum_token_list() {
    std::string s;
    for (size_t i = 0; i < std::size(EnumText<E>::tokens); ++i) {
        if (i) s += '|';
        s += EnumText<E>::tokens[i];
    }
    return s;
}

} // namespace flamewire

#endif // FLAMEWIRE_ENUM_TEXT_HPP
