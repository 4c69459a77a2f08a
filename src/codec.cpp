// -----------------------------------------------------------------------------
// @file codec.cpp
// @brief Per-kind frame readers and writers, plus the two dispatch entry points.
//
// Layout rules shared by every kind:
//  - Payload offsets start at 3, right after the header.
//  - Colors are R, B, G, W on the wire (read_color_rbgw / write_color_rbgw).
//  - Padding bytes are skipped on decode and written as zero on encode.
//  - Enum bytes are cast without range checks so unknown appliance states survive.
//
// Readers are called only after check_length() has passed for their kind.
// -----------------------------------------------------------------------------
#include "flamewire/codec.hpp"

namespace flamewire {

// =============================================================================
// Readers (one per kind)
// =============================================================================

static TemperatureUnitParam read_temperature_unit(const uint8_t* d) {
    TemperatureUnitParam p;
    p.unit = static_cast<TempUnit>(d[3]);
    return p;
}

static ModeParam read_mode(const uint8_t* d) {
    ModeParam p;
    p.mode        = static_cast<FireMode>(d[3]);
    p.temperature = read_temperature(d, 4);
    return p;
}

static FlameEffectParam read_flame_effect(const uint8_t* d) {
    FlameEffectParam p;
    p.flame_effect   = static_cast<FlameEffect>(d[3]);
    p.flame_speed    = static_cast<uint16_t>(d[4] + 1);  // wire 0..4 -> 1..5
    p.brightness     = d[5];
    p.media_theme    = static_cast<MediaTheme>(d[6]);
    p.media_light    = static_cast<LightStatus>(d[7]);
    p.media_color    = read_color_rbgw(d, 8);
    // d[12] padding
    p.overhead_light = static_cast<LightStatus>(d[13]);
    p.overhead_color = read_color_rbgw(d, 14);
    p.light_status   = static_cast<LightStatus>(d[18]);
    p.flame_color    = static_cast<FlameColor>(d[19]);
    // d[20], d[21] padding
    p.ambient_sensor = static_cast<LightStatus>(d[22]);
    return p;
}

static HeatSettingsParam read_heat_settings(const uint8_t* d) {
    HeatSettingsParam p;
    p.heat_status          = static_cast<HeatStatus>(d[3]);
    p.heat_mode            = static_cast<HeatMode>(d[4]);
    p.setpoint_temperature = read_temperature(d, 5);
    p.boost_duration       = read_u16_le(d, 7);
    return p;
}

static HeatModeParam read_heat_mode(const uint8_t* d) {
    HeatModeParam p;
    p.heat_control = static_cast<HeatControl>(d[3]);
    return p;
}

static TimerParam read_timer(const uint8_t* d) {
    TimerParam p;
    p.timer_status = static_cast<TimerStatus>(d[3]);
    p.duration     = read_u16_le(d, 4);
    return p;
}

static SoftwareVersionParam read_software_version(const uint8_t* d) {
    SoftwareVersionParam p;
    p.ui_major      = d[3];
    p.ui_minor      = d[4];
    p.ui_test       = d[5];
    p.control_major = d[6];
    p.control_minor = d[7];
    p.control_test  = d[8];
    p.relay_major   = d[9];
    p.relay_minor   = d[10];
    p.relay_test    = d[11];
    return p;
}

static ErrorParam read_error(const uint8_t* d) {
    ErrorParam p;
    p.byte1 = d[3];
    p.byte2 = d[4];
    p.byte3 = d[5];
    p.byte4 = d[6];
    return p;
}

static SoundParam read_sound(const uint8_t* d) {
    SoundParam p;
    p.volume     = d[3];
    p.sound_file = d[4];
    return p;
}

static LogEffectParam read_log_effect(const uint8_t* d) {
    LogEffectParam p;
    p.log_effect = static_cast<LogEffect>(d[3]);
    // d[4] theme, not modelled
    p.color      = read_color_rbgw(d, 5);
    p.pattern    = d[9];
    // d[10] padding
    return p;
}

// =============================================================================
// Decode dispatch
// =============================================================================

bool decode_parameter(uint16_t id, const uint8_t* data, size_t len,
                      Parameter& out, ProtocolError& err) {
    const ParameterInfo* info = find_parameter_info(id);
    if (!info) {
        err = ProtocolError::unknown_parameter(id);
        return false;
    }
    if (!data) len = 0;
    if (!check_length(info->id, len, err)) return false;

    switch (info->id) {
        case ParameterId::TemperatureUnit: out = read_temperature_unit(data); break;
        case ParameterId::Mode:            out = read_mode(data);             break;
        case ParameterId::FlameEffect:     out = read_flame_effect(data);     break;
        case ParameterId::HeatSettings:    out = read_heat_settings(data);    break;
        case ParameterId::HeatMode:        out = read_heat_mode(data);        break;
        case ParameterId::Timer:           out = read_timer(data);            break;
        case ParameterId::SoftwareVersion: out = read_software_version(data); break;
        case ParameterId::Error:           out = read_error(data);            break;
        case ParameterId::Sound:           out = read_sound(data);            break;
        case ParameterId::LogEffect:       out = read_log_effect(data);       break;
    }
    return true;
}

bool decode_parameter(uint16_t id, const std::vector<uint8_t>& frame,
                      Parameter& out, ProtocolError& err) {
    return decode_parameter(id, frame.data(), frame.size(), out, err);
}

// =============================================================================
// Writers (one overload per alternative; std::visit picks the right one)
// =============================================================================

static bool encode_frame(const TemperatureUnitParam& p, Frame& f, ProtocolError&) {
    write_header(f, p.ID);
    f.push_back(raw(p.unit));
    return true;
}

static bool encode_frame(const ModeParam& p, Frame& f, ProtocolError&) {
    write_header(f, p.ID);
    f.push_back(raw(p.mode));
    write_temperature(f, p.temperature);
    return true;
}

static bool encode_frame(const FlameEffectParam& p, Frame& f, ProtocolError&) {
    write_header(f, p.ID);
    f.push_back(raw(p.flame_effect));
    f.push_back(static_cast<uint8_t>(p.flame_speed > 0 ? p.flame_speed - 1 : 0));  // 1..5 -> 0..4
    f.push_back(p.brightness);
    f.push_back(raw(p.media_theme));
    f.push_back(raw(p.media_light));
    write_color_rbgw(f, p.media_color);
    write_padding(f, 1);
    f.push_back(raw(p.overhead_light));
    write_color_rbgw(f, p.overhead_color);
    f.push_back(raw(p.light_status));
    f.push_back(raw(p.flame_color));
    write_padding(f, 2);
    f.push_back(raw(p.ambient_sensor));
    return true;
}

static bool encode_frame(const HeatSettingsParam& p, Frame& f, ProtocolError&) {
    write_header(f, p.ID);
    f.push_back(raw(p.heat_status));
    f.push_back(raw(p.heat_mode));
    write_temperature(f, p.setpoint_temperature);
    write_u16_le(f, p.boost_duration);
    write_padding(f, 1);
    return true;
}

static bool encode_frame(const HeatModeParam& p, Frame& f, ProtocolError&) {
    write_header(f, p.ID);
    f.push_back(raw(p.heat_control));
    return true;
}

static bool encode_frame(const TimerParam& p, Frame& f, ProtocolError&) {
    write_header(f, p.ID);
    f.push_back(raw(p.timer_status));
    write_u16_le(f, p.duration);
    return true;
}

static bool encode_frame(const SoftwareVersionParam& p, Frame&, ProtocolError& err) {
    err = ProtocolError::read_only(to_raw(p.ID));
    return false;
}

static bool encode_frame(const ErrorParam& p, Frame&, ProtocolError& err) {
    err = ProtocolError::read_only(to_raw(p.ID));
    return false;
}

static bool encode_frame(const SoundParam& p, Frame& f, ProtocolError&) {
    write_header(f, p.ID);
    f.push_back(p.volume);
    f.push_back(p.sound_file);
    return true;
}

static bool encode_frame(const LogEffectParam& p, Frame& f, ProtocolError&) {
    write_header(f, p.ID);
    f.push_back(raw(p.log_effect));
    f.push_back(0);  // theme
    write_color_rbgw(f, p.color);
    f.push_back(p.pattern);
    write_padding(f, 1);
    return true;
}

// =============================================================================
// Encode dispatch
// =============================================================================

bool encode_parameter(const Parameter& param, Frame& out, ProtocolError& err) {
    out.clear();
    return std::visit([&](const auto& p) { return encode_frame(p, out, err); }, param);
}

bool encode_parameter(const Parameter& param, std::vector<uint8_t>& out, ProtocolError& err) {
    Frame f;
    if (!encode_parameter(param, f, err)) return false;
    out.assign(f.begin(), f.end());
    return true;
}

} // namespace flamewire
