#include <doctest/doctest.h>
#include "flamewire/settings.hpp"

#include <string>
#include <vector>

using namespace flamewire;

static std::vector<Parameter> sample_state() {
    FlameEffectParam fe;
    fe.flame_effect = FlameEffect::Off;
    fe.flame_speed  = 2;
    fe.brightness   = 0x80 | 0x02;  // unknown high bit + pulsating, level high
    fe.flame_color  = FlameColor::Red;

    HeatSettingsParam hs{ HeatStatus::On, HeatMode::Eco, 20.0, 30 };

    return { ModeParam{ FireMode::Manual, 21.5 }, fe, hs, SoundParam{ 100, 2 }, LogEffectParam{} };
}

TEST_CASE("mode keeps the known temperature, or falls back to the default") {
    Parameter out;
    std::string err;

    REQUIRE(apply_setting("mode", "standby", sample_state(), {}, out, err));
    CHECK(out == Parameter{ ModeParam{ FireMode::Standby, 21.5 } });

    SettingDefaults d;
    d.temperature = 18.0;
    REQUIRE(apply_setting("MODE", "Manual", {}, d, out, err));
    CHECK(out == Parameter{ ModeParam{ FireMode::Manual, 18.0 } });
}

TEST_CASE("FlameEffect fields are changed one at a time") {
    const auto state = sample_state();
    Parameter out;
    std::string err;

    REQUIRE(apply_setting("flame-speed", "5", state, {}, out, err));
    auto fe = std::get<FlameEffectParam>(out);
    CHECK(fe.flame_speed == 5);
    CHECK(fe.flame_color == FlameColor::Red);

    REQUIRE(apply_setting("flame-color", "yellow-blue", state, {}, out, err));
    CHECK(std::get<FlameEffectParam>(out).flame_color == FlameColor::YellowBlue);

    REQUIRE(apply_setting("flame-effect", "on", state, {}, out, err));
    CHECK(std::get<FlameEffectParam>(out).flame_effect == FlameEffect::On);

    REQUIRE(apply_setting("media-theme", "midnight", state, {}, out, err));
    CHECK(std::get<FlameEffectParam>(out).media_theme == MediaTheme::Midnight);

    REQUIRE(apply_setting("ambient-sensor", "on", state, {}, out, err));
    CHECK(std::get<FlameEffectParam>(out).ambient_sensor == LightStatus::On);
}

TEST_CASE("brightness and pulsating touch only their own bit") {
    const auto state = sample_state();
    Parameter out;
    std::string err;

    REQUIRE(apply_setting("brightness", "low", state, {}, out, err));
    CHECK(std::get<FlameEffectParam>(out).brightness == (0x80 | 0x02 | 0x01));

    REQUIRE(apply_setting("pulsating", "off", state, {}, out, err));
    CHECK(std::get<FlameEffectParam>(out).brightness == 0x80);
}

TEST_CASE("colors accept presets and R,G,B,W") {
    const auto state = sample_state();
    Parameter out;
    std::string err;

    REQUIRE(apply_setting("media-color", "light-red", state, {}, out, err));
    CHECK(std::get<FlameEffectParam>(out).media_color == RGBWColor{ 255, 0, 0, 80 });

    REQUIRE(apply_setting("overhead-color", "1,2,3,4", state, {}, out, err));
    CHECK(std::get<FlameEffectParam>(out).overhead_color == RGBWColor{ 1, 2, 3, 4 });

    RGBWColor c;
    CHECK_FALSE(parse_color("1,2,3", c));
    CHECK_FALSE(parse_color("1,2,3,4,5", c));
    CHECK_FALSE(parse_color("1,2,3,256", c));
    CHECK_FALSE(parse_color("1,-2,3,4", c));
    CHECK_FALSE(parse_color("mauve", c));
    CHECK(NAMED_COLOR_COUNT == 14);
}

TEST_CASE("heat settings") {
    const auto state = sample_state();
    Parameter out;
    std::string err;

    REQUIRE(apply_setting("heat-mode", "boost", state, {}, out, err));
    CHECK(out == Parameter{ HeatSettingsParam{ HeatStatus::On, HeatMode::Boost, 20.0, 30 } });

    REQUIRE(apply_setting("heat-temp", "23.5", state, {}, out, err));
    CHECK(std::get<HeatSettingsParam>(out).setpoint_temperature == 23.5);

    CHECK_FALSE(apply_setting("heat-mode", "schedule", state, {}, out, err));
    CHECK(err == "bad_value:heat-mode(normal|boost|eco|fan-only)");

    CHECK_FALSE(apply_setting("heat-temp", "300", state, {}, out, err));
    CHECK(err == "bad_value:heat-temp(0.0..255.9)");
}

TEST_CASE("standalone settings need no current state") {
    Parameter out;
    std::string err;

    REQUIRE(apply_setting("timer", "90", {}, {}, out, err));
    CHECK(out == Parameter{ TimerParam{ TimerStatus::Enabled, 90 } });

    REQUIRE(apply_setting("timer", "0", {}, {}, out, err));
    CHECK(out == Parameter{ TimerParam{ TimerStatus::Disabled, 0 } });

    REQUIRE(apply_setting("temp-unit", "fahrenheit", {}, {}, out, err));
    CHECK(out == Parameter{ TemperatureUnitParam{ TempUnit::Fahrenheit } });
}

TEST_CASE("sound and log effect") {
    const auto state = sample_state();
    Parameter out;
    std::string err;

    REQUIRE(apply_setting("volume", "255", state, {}, out, err));
    CHECK(out == Parameter{ SoundParam{ 255, 2 } });

    REQUIRE(apply_setting("log-effect", "on", state, {}, out, err));
    CHECK(std::get<LogEffectParam>(out).log_effect == LogEffect::On);
}

TEST_CASE("rejections carry stable reasons") {
    const auto state = sample_state();
    Parameter out;
    std::string err;

    CHECK_FALSE(apply_setting("flame-speed", "0", state, {}, out, err));
    CHECK(err == "bad_value:flame-speed(1..5)");

    CHECK_FALSE(apply_setting("flame-speed", "3", {}, {}, out, err));
    CHECK(err == "missing_current:FlameEffect");

    CHECK_FALSE(apply_setting("volume", "10", {}, {}, out, err));
    CHECK(err == "missing_current:Sound");

    CHECK_FALSE(apply_setting("brightness", "medium", state, {}, out, err));
    CHECK(err == "bad_value:brightness(high|low)");

    CHECK_FALSE(apply_setting("Sparkle", "on", state, {}, out, err));
    CHECK(err == "unknown_setting:Sparkle");

    CHECK_FALSE(apply_setting("timer", "-5", {}, {}, out, err));
    CHECK(err == "bad_value:timer(0..65535)");
}

TEST_CASE("every listed setting name is recognised") {
    for (size_t i = 0; i < SETTING_COUNT; ++i) {
        Parameter out;
        std::string err;
        apply_setting(SETTING_NAMES[i], "?", sample_state(), {}, out, err);
        CHECK_MESSAGE(err.rfind("unknown_setting:", 0) != 0, SETTING_NAMES[i]);
    }
}

TEST_CASE("turn on / turn off recipes") {
    const auto state = sample_state();

    const auto on = make_turn_on(state, {});
    REQUIRE(on.size() == 2);
    CHECK(on[0] == Parameter{ ModeParam{ FireMode::Manual, 21.5 } });
    const auto& fe = std::get<FlameEffectParam>(on[1]);
    CHECK(fe.flame_effect == FlameEffect::On);
    CHECK(fe.flame_speed == 2);

    const auto on_bare = make_turn_on({}, {});
    REQUIRE(on_bare.size() == 1);
    CHECK(on_bare[0] == Parameter{ ModeParam{ FireMode::Manual, 22.0 } });

    const auto off = make_turn_off(state, {});
    REQUIRE(off.size() == 1);
    CHECK(off[0] == Parameter{ ModeParam{ FireMode::Standby, 21.5 } });
}

TEST_CASE("read-modify-write keeps an out-of-range flame speed") {
    FlameEffectParam fe;
    fe.flame_speed = 256;  // decoded from wire byte 0xFF
    Parameter out;
    std::string err;
    REQUIRE(apply_setting("brightness", "low", { fe }, {}, out, err));
    CHECK(std::get<FlameEffectParam>(out).flame_speed == 256);
}

TEST_CASE("turn on reads the last Mode and FlameEffect, turn off the first Mode") {
    FlameEffectParam early;
    early.flame_speed = 1;
    FlameEffectParam late;
    late.flame_speed = 4;
    const std::vector<Parameter> state = {
        ModeParam{ FireMode::Standby, 18.0 }, early,
        ModeParam{ FireMode::Standby, 24.5 }, late,
    };

    const auto on = make_turn_on(state, {});
    REQUIRE(on.size() == 2);
    CHECK(on[0] == Parameter{ ModeParam{ FireMode::Manual, 24.5 } });
    CHECK(std::get<FlameEffectParam>(on[1]).flame_speed == 4);

    const auto off = make_turn_off(state, {});
    REQUIRE(off.size() == 1);
    CHECK(off[0] == Parameter{ ModeParam{ FireMode::Standby, 18.0 } });
}
