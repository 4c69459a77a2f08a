// -----------------------------------------------------------------------------
// @file display.cpp
// @brief kv lines, human blocks, and JSON objects for every parameter kind.
//
// Each rendering has one overload per variant alternative and a std::visit entry
// point, the same shape as the encoder in codec.cpp.
// -----------------------------------------------------------------------------
#include "flamewire/display.hpp"
#include "flamewire/enum_text.hpp"

#include <iomanip>
#include <sstream>

using nlohmann::json;

namespace flamewire {

// ============================================================================
// Shared formatting
// ============================================================================

std::string format_temperature(double value) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << value;
    return os.str();
}

std::string format_rgbw(const RGBWColor& c) {
    std::ostringstream os;
    os << "RGBW(" << unsigned(c.red) << ", " << unsigned(c.green) << ", "
       << unsigned(c.blue) << ", " << unsigned(c.white) << ")";
    return os.str();
}

// "r,g,b,w", the form the settings layer accepts for colors.
static std::string rgbw_csv(const RGBWColor& c) {
    std::ostringstream os;
    os << unsigned(c.red) << ',' << unsigned(c.green) << ',' << unsigned(c.blue) << ',' << unsigned(c.white);
    return os.str();
}

std::string connection_state_label(ConnectionState s) {
    switch (s) {
        case ConnectionState::Unknown:          return "Unknown";
        case ConnectionState::NotConnected:     return "Not Connected";
        case ConnectionState::Connected:        return "Connected";
        case ConnectionState::UpdatingFirmware: return "Updating Firmware";
    }
    return "Unknown(" + std::to_string(static_cast<unsigned>(s)) + ")";
}

static const char* connection_state_token(ConnectionState s) {
    switch (s) {
        case ConnectionState::Unknown:          return "unknown";
        case ConnectionState::NotConnected:     return "not-connected";
        case ConnectionState::Connected:        return "connected";
        case ConnectionState::UpdatingFirmware: return "updating-firmware";
    }
    return "unknown";
}

// Title + rule, then rows of "Label:" padded to a fixed column.
static void block_title(std::ostream& os, ParameterId id, const char* title) {
    os << "  [" << to_raw(id) << "] " << title << "\n";
    os << "  ";
    for (int i = 0; i < 40; ++i) os << "\xE2\x94\x80";  // U+2500
    os << "\n";
}

static void row(std::ostream& os, const std::string& label, const std::string& value, int width = 16) {
    os << "    " << std::left << std::setw(width) << (label + ":") << value << "\n";
}

static std::string hex_byte(uint8_t v) {
    std::ostringstream os;
    os << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << unsigned(v);
    return os.str();
}

static std::string bin_byte(uint8_t v) {
    std::string s;
    for (int bit = 7; bit >= 0; --bit) s.push_back(((v >> bit) & 1) ? '1' : '0');
    return s;
}

template <typename E>
static json enum_json(E e) {
    const char* t = enum_token(e);
    if (t) return json(t);
    return json(static_cast<unsigned>(raw(e)));
}

static json color_json(const RGBWColor& c) {
    return json{{"red", c.red}, {"green", c.green}, {"blue", c.blue}, {"white", c.white}};
}

// ============================================================================
// decode_pretty: one line of key=value
// ============================================================================

static void kv_fields(std::ostream& os, const TemperatureUnitParam& p) {
    os << " unit=" << enum_token_or_unknown(p.unit);
}

static void kv_fields(std::ostream& os, const ModeParam& p) {
    os << " mode=" << enum_token_or_unknown(p.mode)
       << " temperature=" << format_temperature(p.temperature);
}

static void kv_fields(std::ostream& os, const FlameEffectParam& p) {
    os << " flame_effect="   << enum_token_or_unknown(p.flame_effect)
       << " flame_speed="    << unsigned(p.flame_speed)
       << " brightness="     << enum_token_or_unknown(brightness_level(p.brightness))
       << " pulsating="      << enum_token_or_unknown(pulsating_effect(p.brightness))
       << " media_theme="    << enum_token_or_unknown(p.media_theme)
       << " media_light="    << enum_token_or_unknown(p.media_light)
       << " media_color="    << rgbw_csv(p.media_color)
       << " overhead_light=" << enum_token_or_unknown(p.overhead_light)
       << " overhead_color=" << rgbw_csv(p.overhead_color)
       << " light_status="   << enum_token_or_unknown(p.light_status)
       << " flame_color="    << enum_token_or_unknown(p.flame_color)
       << " ambient_sensor=" << enum_token_or_unknown(p.ambient_sensor);
}

static void kv_fields(std::ostream& os, const HeatSettingsParam& p) {
    os << " heat_status=" << enum_token_or_unknown(p.heat_status)
       << " heat_mode="   << enum_token_or_unknown(p.heat_mode)
       << " setpoint="    << format_temperature(p.setpoint_temperature)
       << " boost_duration=" << p.boost_duration;
}

static void kv_fields(std::ostream& os, const HeatModeParam& p) {
    os << " heat_control=" << enum_token_or_unknown(p.heat_control);
}

static void kv_fields(std::ostream& os, const TimerParam& p) {
    os << " timer_status=" << enum_token_or_unknown(p.timer_status)
       << " duration=" << p.duration;
}

static void kv_fields(std::ostream& os, const SoftwareVersionParam& p) {
    os << " ui=" << unsigned(p.ui_major) << '.' << unsigned(p.ui_minor) << '.' << unsigned(p.ui_test)
       << " control=" << unsigned(p.control_major) << '.' << unsigned(p.control_minor) << '.' << unsigned(p.control_test)
       << " relay=" << unsigned(p.relay_major) << '.' << unsigned(p.relay_minor) << '.' << unsigned(p.relay_test);
}

static void kv_fields(std::ostream& os, const ErrorParam& p) {
    os << " byte1=" << hex_byte(p.byte1)
       << " byte2=" << hex_byte(p.byte2)
       << " byte3=" << hex_byte(p.byte3)
       << " byte4=" << hex_byte(p.byte4)
       << " faults=" << (p.has_faults() ? "yes" : "none");
}

static void kv_fields(std::ostream& os, const SoundParam& p) {
    os << " volume=" << unsigned(p.volume) << " sound_file=" << unsigned(p.sound_file);
}

static void kv_fields(std::ostream& os, const LogEffectParam& p) {
    os << " log_effect=" << enum_token_or_unknown(p.log_effect)
       << " color=" << rgbw_csv(p.color)
       << " pattern=" << unsigned(p.pattern);
}

std::string decode_pretty(const Parameter& param) {
    std::ostringstream os;
    const ParameterId id = parameter_id_of(param);
    os << "id=" << to_raw(id) << " kind=" << parameter_name(id);
    std::visit([&](const auto& p) { kv_fields(os, p); }, param);
    return os.str();
}

// ============================================================================
// describe: human block
// ============================================================================

static void block(std::ostream& os, const TemperatureUnitParam& p) {
    block_title(os, p.ID, "Temperature Unit");
    row(os, "Unit", enum_label(p.unit));
}

static void block(std::ostream& os, const ModeParam& p) {
    block_title(os, p.ID, "Mode");
    row(os, "Mode", enum_label(p.mode));
    row(os, "Temperature", format_temperature(p.temperature) + "\xC2\xB0");
}

static void block(std::ostream& os, const FlameEffectParam& p) {
    block_title(os, p.ID, "Flame Effect");
    row(os, "Flame", enum_label(p.flame_effect));
    row(os, "Flame Speed", std::to_string(p.flame_speed) + " / 5");
    row(os, "Brightness", enum_label(brightness_level(p.brightness)));
    row(os, "Pulsating", enum_label(pulsating_effect(p.brightness)));
    row(os, "Flame Color", enum_label(p.flame_color));
    row(os, "Fuel Bed Light", enum_label(p.media_light) + " | " + enum_label(p.media_theme) + " | " + format_rgbw(p.media_color));
    row(os, "Overhead Light", enum_label(p.overhead_light) + " | " + format_rgbw(p.overhead_color));
    row(os, "Light Status", enum_label(p.light_status));
    row(os, "Ambient Sensor", enum_label(p.ambient_sensor));
}

static void block(std::ostream& os, const HeatSettingsParam& p) {
    block_title(os, p.ID, "Heat Settings");
    row(os, "Heat", enum_label(p.heat_status));
    row(os, "Heat Mode", enum_label(p.heat_mode));
    row(os, "Setpoint Temp", format_temperature(p.setpoint_temperature) + "\xC2\xB0");
    row(os, "Boost Duration", std::to_string(p.boost_duration));
}

static void block(std::ostream& os, const HeatModeParam& p) {
    block_title(os, p.ID, "Heat Mode");
    row(os, "Heat Control", enum_label(p.heat_control));
}

static void block(std::ostream& os, const TimerParam& p) {
    block_title(os, p.ID, "Timer Mode");
    row(os, "Timer", enum_label(p.timer_status));
    row(os, "Duration", std::to_string(p.duration) + " min ("
                        + std::to_string(p.duration / 60) + "h "
                        + std::to_string(p.duration % 60) + "m)");
}

static void block(std::ostream& os, const SoftwareVersionParam& p) {
    auto ver = [](uint8_t a, uint8_t b, uint8_t c) {
        return std::to_string(a) + "." + std::to_string(b) + "." + std::to_string(c);
    };
    block_title(os, p.ID, "Software Version");
    row(os, "UI Version",      ver(p.ui_major, p.ui_minor, p.ui_test), 17);
    row(os, "Control Version", ver(p.control_major, p.control_minor, p.control_test), 17);
    row(os, "Relay Version",   ver(p.relay_major, p.relay_minor, p.relay_test), 17);
}

static void block(std::ostream& os, const ErrorParam& p) {
    block_title(os, p.ID, "Error");
    const uint8_t bytes[4] = { p.byte1, p.byte2, p.byte3, p.byte4 };
    for (int i = 0; i < 4; ++i) {
        row(os, "Error Byte " + std::to_string(i + 1), hex_byte(bytes[i]) + " (" + bin_byte(bytes[i]) + ")");
    }
    row(os, "Active Faults", p.has_faults() ? "Yes" : "None");
}

static void block(std::ostream& os, const SoundParam& p) {
    block_title(os, p.ID, "Sound");
    row(os, "Volume", std::to_string(p.volume) + " / 255");
    row(os, "Sound File", std::to_string(p.sound_file));
}

static void block(std::ostream& os, const LogEffectParam& p) {
    block_title(os, p.ID, "Log Effect");
    row(os, "Log Effect", enum_label(p.log_effect));
    row(os, "Colors", format_rgbw(p.color));
    row(os, "Pattern", std::to_string(p.pattern));
}

std::string describe(const Parameter& param) {
    std::ostringstream os;
    std::visit([&](const auto& p) { block(os, p); }, param);
    return os.str();
}

std::string describe(const Fire& fire) {
    std::ostringstream os;
    auto yes_no = [](bool b) { return std::string(b ? "Yes" : "No"); };
    auto line = [&](const char* label, const std::string& value) {
        os << "  " << std::left << std::setw(18) << (std::string(label) + ":")
           << (value.empty() ? std::string("N/A") : value) << "\n";
    };
    line("Name",          fire.friendly_name);
    line("Fire ID",       fire.fire_id);
    line("Brand",         fire.brand);
    line("Product Type",  fire.product_type);
    line("Product Model", fire.product_model);
    line("Item Code",     fire.item_code);
    line("Connection",    connection_state_label(fire.connection_state));
    line("Has Heat",      yes_no(fire.with_heat));
    line("Is IoT Fire",   yes_no(fire.is_iot_fire));
    return os.str();
}

// ============================================================================
// to_json
// ============================================================================

static void json_fields(json& j, const TemperatureUnitParam& p) {
    j["unit"] = enum_json(p.unit);
}

static void json_fields(json& j, const ModeParam& p) {
    j["mode"]        = enum_json(p.mode);
    j["temperature"] = p.temperature;
}

static void json_fields(json& j, const FlameEffectParam& p) {
    j["flame_effect"]   = enum_json(p.flame_effect);
    j["flame_speed"]    = p.flame_speed;
    j["brightness"]     = enum_json(brightness_level(p.brightness));
    j["pulsating"]      = enum_json(pulsating_effect(p.brightness));
    j["brightness_raw"] = p.brightness;
    j["media_theme"]    = enum_json(p.media_theme);
    j["media_light"]    = enum_json(p.media_light);
    j["media_color"]    = color_json(p.media_color);
    j["overhead_light"] = enum_json(p.overhead_light);
    j["overhead_color"] = color_json(p.overhead_color);
    j["light_status"]   = enum_json(p.light_status);
    j["flame_color"]    = enum_json(p.flame_color);
    j["ambient_sensor"] = enum_json(p.ambient_sensor);
}

static void json_fields(json& j, const HeatSettingsParam& p) {
    j["heat_status"]          = enum_json(p.heat_status);
    j["heat_mode"]            = enum_json(p.heat_mode);
    j["setpoint_temperature"] = p.setpoint_temperature;
    j["boost_duration"]       = p.boost_duration;
}

static void json_fields(json& j, const HeatModeParam& p) {
    j["heat_control"] = enum_json(p.heat_control);
}

static void json_fields(json& j, const TimerParam& p) {
    j["timer_status"] = enum_json(p.timer_status);
    j["duration"]     = p.duration;
}

static void json_fields(json& j, const SoftwareVersionParam& p) {
    j["ui"]      = {{"major", p.ui_major}, {"minor", p.ui_minor}, {"test", p.ui_test}};
    j["control"] = {{"major", p.control_major}, {"minor", p.control_minor}, {"test", p.control_test}};
    j["relay"]   = {{"major", p.relay_major}, {"minor", p.relay_minor}, {"test", p.relay_test}};
}

static void json_fields(json& j, const ErrorParam& p) {
    j["bytes"]  = json::array({p.byte1, p.byte2, p.byte3, p.byte4});
    j["faults"] = p.has_faults();
}

static void json_fields(json& j, const SoundParam& p) {
    j["volume"]     = p.volume;
    j["sound_file"] = p.sound_file;
}

static void json_fields(json& j, const LogEffectParam& p) {
    j["log_effect"] = enum_json(p.log_effect);
    j["color"]      = color_json(p.color);
    j["pattern"]    = p.pattern;
}

json to_json(const Parameter& param) {
    const ParameterId id = parameter_id_of(param);
    json j;
    j["id"]   = to_raw(id);
    j["kind"] = parameter_name(id);
    std::visit([&](const auto& p) { json_fields(j, p); }, param);
    return j;
}

json to_json(const Fire& fire) {
    return json{
        {"fire_id",          fire.fire_id},
        {"friendly_name",    fire.friendly_name},
        {"brand",            fire.brand},
        {"product_type",     fire.product_type},
        {"product_model",    fire.product_model},
        {"item_code",        fire.item_code},
        {"connection_state", connection_state_token(fire.connection_state)},
        {"with_heat",        fire.with_heat},
        {"is_iot_fire",      fire.is_iot_fire}
    };
}

} // namespace flamewire
