// -----------------------------------------------------------------------------
// Implementation for settings.hpp
//
// Read-modify-write of single fields. See settings.hpp for the table of names,
// accepted values, and reason strings.
//
// Notes for maintainers:
// - Parsing uses strtol/strtod; no exceptions.
// - A new setting needs: an entry in SETTING_NAMES and a branch in apply_setting().
// -----------------------------------------------------------------------------

#include "flamewire/settings.hpp"
#include "flamewire/enum_text.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace flamewire {

const NamedColor NAMED_COLORS[] = {
    { "dark-red",     { 180,   0,   0,  0 } },
    { "light-red",    { 255,   0,   0, 80 } },
    { "dark-yellow",  { 180, 120,   0,  0 } },
    { "light-yellow", { 255, 200,   0, 80 } },
    { "dark-green",   {   0, 180,   0,  0 } },
    { "light-green",  {   0, 255,   0, 80 } },
    { "dark-cyan",    {   0, 180, 180,  0 } },
    { "light-cyan",   {   0, 255, 255, 80 } },
    { "dark-blue",    {   0,   0, 180,  0 } },
    { "light-blue",   {   0,   0, 255, 80 } },
    { "dark-purple",  { 128,   0, 180,  0 } },
    { "light-purple", { 180,   0, 255, 80 } },
    { "dark-pink",    { 180,   0,  80,  0 } },
    { "light-pink",   { 255,   0, 128, 80 } },
};
const size_t NAMED_COLOR_COUNT = sizeof(NAMED_COLORS) / sizeof(NAMED_COLORS[0]);

const char* const SETTING_NAMES[] = {
    "mode", "flame-speed", "brightness", "pulsating", "flame-color", "media-theme",
    "flame-effect", "media-light", "overhead-light", "light-status", "ambient-sensor",
    "media-color", "overhead-color", "heat-mode", "heat-temp", "timer", "temp-unit",
    "volume", "log-effect",
};
const size_t SETTING_COUNT = sizeof(SETTING_NAMES) / sizeof(SETTING_NAMES[0]);

// ---------- local parsing helpers (no exceptions) ----------

static bool parse_uint(const std::string& s, unsigned long lo, unsigned long hi, unsigned long& out) {
    if (s.empty() || !std::isdigit((unsigned char)s[0])) return false;  // no sign, no spaces
    char* e = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &e, 10);
    if (!e || *e) return false;
    if (v < lo || v > hi) return false;
    out = v;
    return true;
}

static bool parse_temperature(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* e = nullptr;
    double v = std::strtod(s.c_str(), &e);
    if (!e || *e || !std::isfinite(v)) return false;
    if (v < 0.0 || v > 255.9) return false;
    out = v;
    return true;
}

static std::string lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool parse_color(const std::string& text, RGBWColor& out) {
    const std::string t = lower(text);
    for (size_t i = 0; i < NAMED_COLOR_COUNT; ++i) {
        if (t == NAMED_COLORS[i].name) { out = NAMED_COLORS[i].color; return true; }
    }

    // R,G,B,W
    unsigned long ch[4];
    size_t start = 0;
    for (int i = 0; i < 4; ++i) {
        const size_t comma = t.find(',', start);
        const bool last = (i == 3);
        if (last != (comma == std::string::npos)) return false;  // exactly three commas
        const std::string part = t.substr(start, last ? std::string::npos : comma - start);
        if (!parse_uint(part, 0, 255, ch[i])) return false;
        start = comma + 1;
    }
    out.red   = static_cast<uint8_t>(ch[0]);
    out.green = static_cast<uint8_t>(ch[1]);
    out.blue  = static_cast<uint8_t>(ch[2]);
    out.white = static_cast<uint8_t>(ch[3]);
    return true;
}

static std::string bad_value(const std::string& name, const std::string& allowed) {
    return "bad_value:" + name + "(" + allowed + ")";
}

template <typename T>
static bool require_current(const std::vector<Parameter>& current, T& out, std::string& err) {
    const T* hit = find_parameter<T>(current);
    if (!hit) {
        err = std::string("missing_current:") + parameter_name(T::ID);
        return false;
    }
    out = *hit;
    return true;
}

// Enum-valued FlameEffect field: parse token, copy current record, set one member.
template <typename E>
static bool set_flame_enum(const std::string& name, const std::string& value,
                           const std::vector<Parameter>& current, E FlameEffectParam::*field,
                           Parameter& out, std::string& err) {
    E v;
    if (!parse_enum_token(value, v)) { err = bad_value(name, enum_token_list<E>()); return false; }
    FlameEffectParam fe;
    if (!require_current(current, fe, err)) return false;
    fe.*field = v;
    out = fe;
    return true;
}

static double known_temperature(const ModeParam* m, const SettingDefaults& defaults) {
    return m ? m->temperature : defaults.temperature;
}

// ---------- name -> parameter ----------

bool apply_setting(const std::string& raw_name, const std::string& raw_value,
                   const std::vector<Parameter>& current, const SettingDefaults& defaults,
                   Parameter& out, std::string& err) {
    const std::string name  = lower(raw_name);
    const std::string value = lower(raw_value);

    if (name == "mode") {
        FireMode m;
        if (!parse_enum_token(value, m)) { err = bad_value(name, enum_token_list<FireMode>()); return false; }
        ModeParam p;
        p.mode        = m;
        p.temperature = known_temperature(find_parameter<ModeParam>(current), defaults);
        out = p;
        return true;
    }

    if (name == "flame-speed") {
        unsigned long speed;
        if (!parse_uint(value, 1, 5, speed)) { err = bad_value(name, "1..5"); return false; }
        FlameEffectParam fe;
        if (!require_current(current, fe, err)) return false;
        fe.flame_speed = static_cast<uint16_t>(speed);
        out = fe;
        return true;
    }

    if (name == "brightness") {
        Brightness b;
        if (!parse_enum_token(value, b)) { err = bad_value(name, enum_token_list<Brightness>()); return false; }
        FlameEffectParam fe;
        if (!require_current(current, fe, err)) return false;
        fe.brightness = with_brightness_level(fe.brightness, b);
        out = fe;
        return true;
    }

    if (name == "pulsating") {
        PulsatingEffect pe;
        if (!parse_enum_token(value, pe)) { err = bad_value(name, enum_token_list<PulsatingEffect>()); return false; }
        FlameEffectParam fe;
        if (!require_current(current, fe, err)) return false;
        fe.brightness = with_pulsating_effect(fe.brightness, pe);
        out = fe;
        return true;
    }

    if (name == "flame-color")    return set_flame_enum(name, value, current, &FlameEffectParam::flame_color, out, err);
    if (name == "media-theme")    return set_flame_enum(name, value, current, &FlameEffectParam::media_theme, out, err);
    if (name == "flame-effect")   return set_flame_enum(name, value, current, &FlameEffectParam::flame_effect, out, err);
    if (name == "media-light")    return set_flame_enum(name, value, current, &FlameEffectParam::media_light, out, err);
    if (name == "overhead-light") return set_flame_enum(name, value, current, &FlameEffectParam::overhead_light, out, err);
    if (name == "light-status")   return set_flame_enum(name, value, current, &FlameEffectParam::light_status, out, err);
    if (name == "ambient-sensor") return set_flame_enum(name, value, current, &FlameEffectParam::ambient_sensor, out, err);

    if (name == "media-color" || name == "overhead-color") {
        RGBWColor c;
        if (!parse_color(value, c)) { err = bad_value(name, "R,G,B,W|preset"); return false; }
        FlameEffectParam fe;
        if (!require_current(current, fe, err)) return false;
        if (name == "media-color") fe.media_color = c;
        else                       fe.overhead_color = c;
        out = fe;
        return true;
    }

    if (name == "heat-mode") {
        // Schedule is reported by the appliance but is not a mode a client selects.
        HeatMode hm;
        if (!parse_enum_token(value, hm) || hm == HeatMode::Schedule) {
            err = bad_value(name, "normal|boost|eco|fan-only");
            return false;
        }
        HeatSettingsParam hs;
        if (!require_current(current, hs, err)) return false;
        hs.heat_mode = hm;
        out = hs;
        return true;
    }

    if (name == "heat-temp") {
        double t;
        if (!parse_temperature(value, t)) { err = bad_value(name, "0.0..255.9"); return false; }
        HeatSettingsParam hs;
        if (!require_current(current, hs, err)) return false;
        hs.setpoint_temperature = t;
        out = hs;
        return true;
    }

    if (name == "timer") {
        unsigned long minutes;
        if (!parse_uint(value, 0, 65535, minutes)) { err = bad_value(name, "0..65535"); return false; }
        TimerParam tp;
        tp.timer_status = minutes > 0 ? TimerStatus::Enabled : TimerStatus::Disabled;
        tp.duration     = static_cast<uint16_t>(minutes);
        out = tp;
        return true;
    }

    if (name == "temp-unit") {
        TempUnit u;
        if (!parse_enum_token(value, u)) { err = bad_value(name, enum_token_list<TempUnit>()); return false; }
        TemperatureUnitParam tu;
        tu.unit = u;
        out = tu;
        return true;
    }

    if (name == "volume") {
        unsigned long vol;
        if (!parse_uint(value, 0, 255, vol)) { err = bad_value(name, "0..255"); return false; }
        SoundParam sp;
        if (!require_current(current, sp, err)) return false;
        sp.volume = static_cast<uint8_t>(vol);
        out = sp;
        return true;
    }

    if (name == "log-effect") {
        LogEffect le;
        if (!parse_enum_token(value, le)) { err = bad_value(name, enum_token_list<LogEffect>()); return false; }
        LogEffectParam lp;
        if (!require_current(current, lp, err)) return false;
        lp.log_effect = le;
        out = lp;
        return true;
    }

    err = "unknown_setting:" + raw_name;
    return false;
}

// ---------- power recipes ----------

std::vector<Parameter> make_turn_on(const std::vector<Parameter>& current, const SettingDefaults& defaults) {
    std::vector<Parameter> out;

    // Turn on reads the latest Mode / FlameEffect in the batch.
    ModeParam mode;
    mode.mode        = FireMode::Manual;
    mode.temperature = known_temperature(find_last_parameter<ModeParam>(current), defaults);
    out.push_back(mode);

    if (const FlameEffectParam* fe = find_last_parameter<FlameEffectParam>(current)) {
        FlameEffectParam on = *fe;
        on.flame_effect = FlameEffect::On;
        out.push_back(on);
    }
    return out;
}

std::vector<Parameter> make_turn_off(const std::vector<Parameter>& current, const SettingDefaults& defaults) {
    ModeParam mode;
    mode.mode        = FireMode::Standby;
    mode.temperature = known_temperature(find_parameter<ModeParam>(current), defaults);
    return { mode };
}

} // namespace flamewire
