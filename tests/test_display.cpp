#include <doctest/doctest.h>
#include "flamewire/display.hpp"
#include "flamewire/enum_text.hpp"

#include <string>

using namespace flamewire;

static bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

TEST_CASE("decode_pretty: one kv line per kind") {
    CHECK(decode_pretty(ModeParam{ FireMode::Manual, 22.5 }) == "id=321 kind=Mode mode=manual temperature=22.5");
    CHECK(decode_pretty(TemperatureUnitParam{ TempUnit::Fahrenheit }) == "id=236 kind=TemperatureUnit unit=fahrenheit");
    CHECK(decode_pretty(TimerParam{ TimerStatus::Enabled, 90 }) == "id=326 kind=Timer timer_status=enabled duration=90");
    CHECK(decode_pretty(SoundParam{ 200, 3 }) == "id=369 kind=Sound volume=200 sound_file=3");
    CHECK(decode_pretty(ErrorParam{ 0xFF, 0, 0, 0 }) ==
          "id=329 kind=Error byte1=0xFF byte2=0x00 byte3=0x00 byte4=0x00 faults=yes");
    CHECK(decode_pretty(ErrorParam{}) ==
          "id=329 kind=Error byte1=0x00 byte2=0x00 byte3=0x00 byte4=0x00 faults=none");
}

TEST_CASE("decode_pretty: FlameEffect splits the brightness byte and prints colors as csv") {
    FlameEffectParam fe;
    fe.flame_effect   = FlameEffect::On;
    fe.flame_speed    = 3;
    fe.brightness     = 0x03;
    fe.media_color    = { 10, 20, 30, 40 };
    fe.flame_color    = FlameColor::YellowBlue;
    const std::string line = decode_pretty(fe);
    CHECK(line.rfind("id=322 kind=FlameEffect flame_effect=on flame_speed=3 brightness=low pulsating=on", 0) == 0);
    CHECK(contains(line, "media_color=10,20,30,40"));
    CHECK(contains(line, "flame_color=yellow-blue"));
}

TEST_CASE("Unknown enum bytes render as unknown(n)") {
    ModeParam m{ static_cast<FireMode>(7), 20.0 };
    CHECK(decode_pretty(m) == "id=321 kind=Mode mode=unknown(7) temperature=20.0");
    CHECK(contains(describe(Parameter{ m }), "Unknown(7)"));
    CHECK(to_json(Parameter{ m })["mode"] == 7);
}

TEST_CASE("describe: titled blocks") {
    const std::string mode = describe(Parameter{ ModeParam{ FireMode::Manual, 22.0 } });
    CHECK(mode.rfind("  [321] Mode\n", 0) == 0);
    CHECK(contains(mode, "    Mode:           On\n"));
    CHECK(contains(mode, "    Temperature:    22.0\xC2\xB0\n"));

    const std::string timer = describe(Parameter{ TimerParam{ TimerStatus::Enabled, 90 } });
    CHECK(contains(timer, "[326] Timer Mode"));
    CHECK(contains(timer, "90 min (1h 30m)"));

    const std::string err = describe(Parameter{ ErrorParam{ 0x05, 0, 0, 0 } });
    CHECK(contains(err, "Error Byte 1:   0x05 (00000101)"));
    CHECK(contains(err, "Active Faults:  Yes"));

    const std::string ver = describe(Parameter{ SoftwareVersionParam{ 1, 2, 3, 4, 5, 6, 7, 8, 9 } });
    CHECK(contains(ver, "UI Version:      1.2.3"));
    CHECK(contains(ver, "Relay Version:   7.8.9"));

    CHECK(contains(describe(Parameter{ SoundParam{ 200, 1 } }), "200 / 255"));
}

TEST_CASE("describe: fire identity uses N/A for missing text") {
    Fire f;
    f.fire_id          = "abc";
    f.friendly_name    = "Den";
    f.connection_state = ConnectionState::Connected;
    f.with_heat        = true;
    const std::string s = describe(f);
    CHECK(contains(s, "  Name:             Den\n"));
    CHECK(contains(s, "  Brand:            N/A\n"));
    CHECK(contains(s, "  Connection:       Connected\n"));
    CHECK(contains(s, "  Has Heat:         Yes\n"));
    CHECK(contains(s, "  Is IoT Fire:      No\n"));
}

TEST_CASE("to_json: tokens, numbers, nested colors") {
    FlameEffectParam fe;
    fe.brightness     = 0x01;
    fe.overhead_color = { 1, 2, 3, 4 };
    const auto j = to_json(Parameter{ fe });
    CHECK(j["id"] == 322);
    CHECK(j["kind"] == "FlameEffect");
    CHECK(j["brightness"] == "low");
    CHECK(j["pulsating"] == "off");
    CHECK(j["brightness_raw"] == 1);
    CHECK(j["overhead_color"]["blue"] == 3);

    const auto h = to_json(Parameter{ HeatSettingsParam{ HeatStatus::On, HeatMode::FanOnly, 19.5, 15 } });
    CHECK(h["heat_mode"] == "fan-only");
    CHECK(h["setpoint_temperature"] == 19.5);
    CHECK(h["boost_duration"] == 15);

    Fire f;
    f.fire_id          = "x";
    f.connection_state = ConnectionState::UpdatingFirmware;
    CHECK(to_json(f)["connection_state"] == "updating-firmware");
}

TEST_CASE("Formatting helpers") {
    CHECK(format_temperature(22) == "22.0");
    CHECK(format_temperature(19.45) == "19.4");  // binary 19.45 sits just below the midpoint
    CHECK(format_rgbw({ 255, 0, 0, 80 }) == "RGBW(255, 0, 0, 80)");
    CHECK(connection_state_label(ConnectionState::NotConnected) == "Not Connected");
    CHECK(connection_state_label(static_cast<ConnectionState>(9)) == "Unknown(9)");
}

TEST_CASE("Enum text tables") {
    CHECK(enum_label(FlameColor::BlueRed) == "Blue/Red");
    CHECK(enum_token_list<HeatMode>() == "normal|boost|eco|fan-only|schedule");

    MediaTheme t = MediaTheme::White;
    CHECK(parse_enum_token("kaleidoscope", t));
    CHECK(t == MediaTheme::Kaleidoscope);
    CHECK_FALSE(parse_enum_token("Kaleidoscope", t));
    CHECK(t == MediaTheme::Kaleidoscope);
}
