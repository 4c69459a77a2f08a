#include <doctest/doctest.h>
#include "flamewire/codec.hpp"

#include <vector>

using namespace flamewire;

template <typename T>
static T decode_as(uint16_t id, const std::vector<uint8_t>& frame) {
    Parameter p;
    ProtocolError err;
    REQUIRE(decode_parameter(id, frame, p, err));
    REQUIRE(std::holds_alternative<T>(p));
    return std::get<T>(p);
}

TEST_CASE("Mode frame decodes to manual 22.5") {
    const std::vector<uint8_t> frame = { 0x41, 0x01, 0x03, 0x01, 0x16, 0x05 };
    ModeParam m = decode_as<ModeParam>(321, frame);
    CHECK(m.mode == FireMode::Manual);
    CHECK(m.temperature == 22.5);
}

TEST_CASE("TemperatureUnit and HeatMode are one payload byte") {
    TemperatureUnitParam tu = decode_as<TemperatureUnitParam>(236, { 0xEC, 0x00, 0x01, 0x00 });
    CHECK(tu.unit == TempUnit::Fahrenheit);

    HeatModeParam hm = decode_as<HeatModeParam>(325, { 0x45, 0x01, 0x01, 0x02 });
    CHECK(hm.heat_control == HeatControl::Enabled);
}

TEST_CASE("FlameEffect reads every field at its offset and skips padding") {
    const std::vector<uint8_t> frame = {
        0x42, 0x01, 0x14,
        0x01,                   // 3  flame effect on
        0x02,                   // 4  speed (wire 0-based)
        0x01,                   // 5  brightness byte
        0x06,                   // 6  prism
        0x01,                   // 7  media light on
        10, 20, 30, 40,         // 8-11 media color R B G W
        0xAA,                   // 12 padding
        0x00,                   // 13 overhead light off
        1, 2, 3, 4,             // 14-17 overhead color R B G W
        0x01,                   // 18 light status on
        0x04,                   // 19 flame color red
        0xEE, 0xEE,             // 20-21 padding
        0x01                    // 22 ambient sensor on
    };
    REQUIRE(frame.size() == 23);

    FlameEffectParam fe = decode_as<FlameEffectParam>(322, frame);
    CHECK(fe.flame_effect == FlameEffect::On);
    CHECK(fe.flame_speed == 3);
    CHECK(fe.brightness == 1);
    CHECK(fe.media_theme == MediaTheme::Prism);
    CHECK(fe.media_light == LightStatus::On);
    CHECK(fe.media_color == RGBWColor{10, 30, 20, 40});
    CHECK(fe.overhead_light == LightStatus::Off);
    CHECK(fe.overhead_color == RGBWColor{1, 3, 2, 4});
    CHECK(fe.light_status == LightStatus::On);
    CHECK(fe.flame_color == FlameColor::Red);
    CHECK(fe.ambient_sensor == LightStatus::On);
}

TEST_CASE("FlameEffect speed is exposed one-based") {
    std::vector<uint8_t> frame(23, 0);
    frame[0] = 0x42; frame[1] = 0x01; frame[2] = 20;

    frame[4] = 0;
    CHECK(decode_as<FlameEffectParam>(322, frame).flame_speed == 1);
    frame[4] = 2;
    CHECK(decode_as<FlameEffectParam>(322, frame).flame_speed == 3);
    frame[4] = 4;
    CHECK(decode_as<FlameEffectParam>(322, frame).flame_speed == 5);
}

TEST_CASE("HeatSettings reads setpoint and little-endian boost") {
    HeatSettingsParam hs = decode_as<HeatSettingsParam>(323,
        { 0x43, 0x01, 0x07, 0x01, 0x02, 0x15, 0x03, 0x2C, 0x01, 0x00 });
    CHECK(hs.heat_status == HeatStatus::On);
    CHECK(hs.heat_mode == HeatMode::Eco);
    CHECK(hs.setpoint_temperature == 21.3);
    CHECK(hs.boost_duration == 300);
}

TEST_CASE("Timer reads status and minutes") {
    TimerParam t = decode_as<TimerParam>(326, { 0x46, 0x01, 0x03, 0x01, 0x5A, 0x00 });
    CHECK(t.timer_status == TimerStatus::Enabled);
    CHECK(t.duration == 90);

    TimerParam max = decode_as<TimerParam>(326, { 0x46, 0x01, 0x03, 0x00, 0xFF, 0xFF });
    CHECK(max.timer_status == TimerStatus::Disabled);
    CHECK(max.duration == 65535);
}

TEST_CASE("SoftwareVersion reads three major/minor/test triples") {
    SoftwareVersionParam v = decode_as<SoftwareVersionParam>(327,
        { 0x47, 0x01, 0x09, 1, 2, 3, 4, 5, 6, 7, 8, 9 });
    CHECK(v.ui_major == 1);
    CHECK(v.ui_minor == 2);
    CHECK(v.ui_test == 3);
    CHECK(v.control_major == 4);
    CHECK(v.control_minor == 5);
    CHECK(v.control_test == 6);
    CHECK(v.relay_major == 7);
    CHECK(v.relay_minor == 8);
    CHECK(v.relay_test == 9);
}

TEST_CASE("Error frame keeps its four bytes opaque") {
    ErrorParam e = decode_as<ErrorParam>(329, { 0x49, 0x01, 0x04, 0xFF, 0x01, 0x80, 0x42 });
    CHECK(e.byte1 == 0xFF);
    CHECK(e.byte2 == 0x01);
    CHECK(e.byte3 == 0x80);
    CHECK(e.byte4 == 0x42);
    CHECK(e.has_faults());
}

TEST_CASE("Sound reads volume and file index") {
    SoundParam s = decode_as<SoundParam>(369, { 0x71, 0x01, 0x02, 200, 3 });
    CHECK(s.volume == 200);
    CHECK(s.sound_file == 3);
}

TEST_CASE("LogEffect skips the theme and padding bytes") {
    LogEffectParam le = decode_as<LogEffectParam>(370,
        { 0x72, 0x01, 0x08, 0x01, 0x05, 10, 20, 30, 40, 0x07, 0x99 });
    CHECK(le.log_effect == LogEffect::On);
    CHECK(le.color == RGBWColor{10, 30, 20, 40});
    CHECK(le.pattern == 7);
}

TEST_CASE("Out-of-domain enum bytes are kept as-is") {
    ModeParam m = decode_as<ModeParam>(321, { 0x41, 0x01, 0x03, 0x07, 0x14, 0x00 });
    CHECK(raw(m.mode) == 7);
    CHECK(m.temperature == 20.0);

    HeatModeParam hm = decode_as<HeatModeParam>(325, { 0x45, 0x01, 0x01, 0xFE });
    CHECK(raw(hm.heat_control) == 0xFE);
}

TEST_CASE("Decode reads the id from the caller, not the frame header") {
    // Same bytes, header says Mode, caller says Sound
    SoundParam s = decode_as<SoundParam>(369, { 0x41, 0x01, 0x03, 0x09, 0x02 });
    CHECK(s.volume == 9);
    CHECK(s.sound_file == 2);
}

TEST_CASE("Longer buffers decode from the fixed offsets") {
    ModeParam m = decode_as<ModeParam>(321, { 0x41, 0x01, 0x03, 0x00, 0x12, 0x00, 0xDE, 0xAD });
    CHECK(m.mode == FireMode::Standby);
    CHECK(m.temperature == 18.0);
}

TEST_CASE("Unknown id fails with UnknownParameter") {
    Parameter p;
    ProtocolError err;
    CHECK_FALSE(decode_parameter(9999, std::vector<uint8_t>{ 0x01, 0x02, 0x03, 0x04 }, p, err));
    CHECK(err.code == ErrorCode::UnknownParameter);
    CHECK(err.parameter_id == 9999);
    CHECK(err.to_string() == "unknown_parameter:9999");
}

TEST_CASE("Failed decode leaves the output untouched") {
    Parameter p = SoundParam{ 5, 6 };
    ProtocolError err;
    CHECK_FALSE(decode_parameter(321, std::vector<uint8_t>{ 0x41, 0x01 }, p, err));
    REQUIRE(std::holds_alternative<SoundParam>(p));
    CHECK(std::get<SoundParam>(p).volume == 5);
}

TEST_CASE("Null data is treated as empty") {
    Parameter p;
    ProtocolError err;
    CHECK_FALSE(decode_parameter(236, nullptr, 4, p, err));
    CHECK(err.code == ErrorCode::InsufficientData);
    CHECK(err.actual == 0);
}
