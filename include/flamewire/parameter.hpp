/**
 * @file parameter.hpp
 * @brief flamewire Parameter model: one immutable record per parameter kind.
 *
 * The fireplace exposes ten parameter kinds (see parameter_id.hpp). Each kind has its
 * own plain struct below, and `Parameter` is the closed `std::variant` over all ten.
 * The set is fixed by the wire protocol, so a variant (not a class hierarchy) keeps
 * `std::visit` exhaustive: adding an eleventh kind without teaching the encoder about
 * it is a compile error, not a silent fallthrough.
 *
 * ### Enum fields
 * Small enums are `enum class X : uint8_t`. A decoded byte outside the documented
 * domain is kept as-is (e.g. `static_cast<FireMode>(7)`), so unknown appliance states
 * are forwarded instead of rejected. Display code renders those as `Unknown(n)`.
 *
 * ### Value conventions
 * - Temperatures are `double` with one decimal digit (22.5); on the wire they are two
 *   bytes: integer part, then tenths digit.
 * - `FlameEffectParam::flame_speed` is 1..5 here; the wire byte is 0..4. The field is
 *   wider than the byte so an out-of-range wire value (255 -> 256) survives re-encoding.
 * - `FlameEffectParam::brightness` is the raw wire byte. Bit 0 is the level
 *   (0 = high, 1 = low) and bit 1 the pulsating effect; see the helpers at the end.
 * - `RGBWColor` is stored R,G,B,W here; the wire order is R,B,G,W.
 *
 * Read-only kinds: SoftwareVersionParam and ErrorParam. They are produced by decode
 * but the encoder refuses them.
 */

#ifndef FLAMEWIRE_PARAMETER_HPP
#define FLAMEWIRE_PARAMETER_HPP

#include "flamewire/parameter_id.hpp"

#include <stdint.h>
#include <type_traits>
#include <variant>
#include <vector>

namespace flamewire {

// =============================== Enums ===============================

enum class TempUnit : uint8_t { Fahrenheit = 0, Celsius = 1 };

enum class FireMode : uint8_t { Standby = 0, Manual = 1 };

enum class FlameEffect : uint8_t { Off = 0, On = 1 };

enum class Brightness : uint8_t { High = 0, Low = 1 };

enum class PulsatingEffect : uint8_t { Off = 0, On = 1 };

enum class HeatStatus : uint8_t { Off = 0, On = 1 };

enum class HeatMode : uint8_t { Normal = 0, Boost = 1, Eco = 2, FanOnly = 3, Schedule = 4 };

/// Heat control availability reported by the HeatMode (325) parameter.
enum class HeatControl : uint8_t { SoftwareDisabled = 0, HardwareDisabled = 1, Enabled = 2 };

enum class FlameColor : uint8_t {
    All        = 0,
    YellowRed  = 1,
    YellowBlue = 2,
    Blue       = 3,
    Red        = 4,
    Yellow     = 5,
    BlueRed    = 6
};

enum class LightStatus : uint8_t { Off = 0, On = 1 };

enum class TimerStatus : uint8_t { Disabled = 0, Enabled = 1 };

enum class LogEffect : uint8_t { Off = 0, On = 1 };

/// Fuel-bed media theme preset.
enum class MediaTheme : uint8_t {
    UserDefined  = 0,
    White        = 1,
    Blue         = 2,
    Purple       = 3,
    Red          = 4,
    Green        = 5,
    Prism        = 6,
    Kaleidoscope = 7,
    Midnight     = 8
};

/// Raw byte value of any of the enums above.
template <typename E>
constexpr uint8_t raw(E e) { return static_cast<uint8_t>(e); }

// ============================ Value objects ===========================

/**
 * @struct RGBWColor
 * @brief Four independent 0..255 channels. No clamping is done anywhere in the codec.
 */
struct RGBWColor {
    uint8_t red   = 0;
    uint8_t green = 0;
    uint8_t blue  = 0;
    uint8_t white = 0;
};

inline bool operator==(const RGBWColor& a, const RGBWColor& b) {
    return a.red == b.red && a.green == b.green && a.blue == b.blue && a.white == b.white;
}
inline bool operator!=(const RGBWColor& a, const RGBWColor& b) { return !(a == b); }

// ========================= Parameter records ==========================

/// TemperatureUnit (236): 1 payload byte.
struct TemperatureUnitParam {
    static constexpr ParameterId ID = ParameterId::TemperatureUnit;
    TempUnit unit = TempUnit::Celsius;
};

/// Mode (321): mode byte + 2-byte temperature.
struct ModeParam {
    static constexpr ParameterId ID = ParameterId::Mode;
    FireMode mode        = FireMode::Standby;
    double   temperature = 0.0;
};

/**
 * @struct FlameEffectParam
 * @brief FlameEffect (322): the flame, fuel bed and overhead lighting in one 20-byte payload.
 *
 * | Offset | Field           | Notes                               |
 * |--------|-----------------|-------------------------------------|
 * | 3      | flame_effect    |                                     |
 * | 4      | flame_speed     | wire 0..4, model 1..5               |
 * | 5      | brightness      | raw byte (bit0 level, bit1 pulsing) |
 * | 6      | media_theme     |                                     |
 * | 7      | media_light     |                                     |
 * | 8–11   | media_color     | R, B, G, W                          |
 * | 12     |:               | padding                             |
 * | 13     | overhead_light  |                                     |
 * | 14–17  | overhead_color  | R, B, G, W                          |
 * | 18     | light_status    |                                     |
 * | 19     | flame_color     |                                     |
 * | 20–21  |:               | padding                             |
 * | 22     | ambient_sensor  |                                     |
 */
struct FlameEffectParam {
    static constexpr ParameterId ID = ParameterId::FlameEffect;
    FlameEffect flame_effect   = FlameEffect::Off;
    uint16_t    flame_speed    = 1;  ///< wire byte + 1, so wire 255 stays 256
    uint8_t     brightness     = 0;
    MediaTheme  media_theme    = MediaTheme::UserDefined;
    LightStatus media_light    = LightStatus::Off;
    RGBWColor   media_color;
    LightStatus overhead_light = LightStatus::Off;
    RGBWColor   overhead_color;
    LightStatus light_status   = LightStatus::Off;
    FlameColor  flame_color    = FlameColor::All;
    LightStatus ambient_sensor = LightStatus::Off;
};

/// HeatSettings (323): status, mode, setpoint, little-endian boost duration.
struct HeatSettingsParam {
    static constexpr ParameterId ID = ParameterId::HeatSettings;
    HeatStatus heat_status          = HeatStatus::Off;
    HeatMode   heat_mode            = HeatMode::Normal;
    double     setpoint_temperature = 0.0;
    uint16_t   boost_duration       = 0;
};

/// HeatMode (325): heat control availability.
struct HeatModeParam {
    static constexpr ParameterId ID = ParameterId::HeatMode;
    HeatControl heat_control = HeatControl::SoftwareDisabled;
};

/// Timer (326): status + little-endian duration in minutes.
struct TimerParam {
    static constexpr ParameterId ID = ParameterId::Timer;
    TimerStatus timer_status = TimerStatus::Disabled;
    uint16_t    duration     = 0;
};

/// SoftwareVersion (327, read-only): major/minor/test for UI, control and relay boards.
struct SoftwareVersionParam {
    static constexpr ParameterId ID = ParameterId::SoftwareVersion;
    uint8_t ui_major      = 0;
    uint8_t ui_minor      = 0;
    uint8_t ui_test       = 0;
    uint8_t control_major = 0;
    uint8_t control_minor = 0;
    uint8_t control_test  = 0;
    uint8_t relay_major   = 0;
    uint8_t relay_minor   = 0;
    uint8_t relay_test    = 0;
};

/// Error (329, read-only): four opaque fault-flag bytes.
struct ErrorParam {
    static constexpr ParameterId ID = ParameterId::Error;
    uint8_t byte1 = 0;
    uint8_t byte2 = 0;
    uint8_t byte3 = 0;
    uint8_t byte4 = 0;

    bool has_faults() const { return (byte1 | byte2 | byte3 | byte4) != 0; }
};

/// Sound (369): volume + sound file index.
struct SoundParam {
    static constexpr ParameterId ID = ParameterId::Sound;
    uint8_t volume     = 0;
    uint8_t sound_file = 0;
};

/// LogEffect (370): effect, RBGW color, pattern. The theme byte on the wire is not modelled.
struct LogEffectParam {
    static constexpr ParameterId ID = ParameterId::LogEffect;
    LogEffect log_effect = LogEffect::Off;
    RGBWColor color;
    uint8_t   pattern    = 0;
};

// ----- structural equality -----

inline bool operator==(const TemperatureUnitParam& a, const TemperatureUnitParam& b) { return a.unit == b.unit; }

inline bool operator==(const ModeParam& a, const ModeParam& b) {
    return a.mode == b.mode && a.temperature == b.temperature;
}

inline bool operator==(const FlameEffectParam& a, const FlameEffectParam& b) {
    return a.flame_effect == b.flame_effect
        && a.flame_speed == b.flame_speed
        && a.brightness == b.brightness
        && a.media_theme == b.media_theme
        && a.media_light == b.media_light
        && a.media_color == b.media_color
        && a.overhead_light == b.overhead_light
        && a.overhead_color == b.overhead_color
        && a.light_status == b.light_status
        && a.flame_color == b.flame_color
        && a.ambient_sensor == b.ambient_sensor;
}

inline bool operator==(const HeatSettingsParam& a, const HeatSettingsParam& b) {
    return a.heat_status == b.heat_status
        && a.heat_mode == b.heat_mode
        && a.setpoint_temperature == b.setpoint_temperature
        && a.boost_duration == b.boost_duration;
}

inline bool operator==(const HeatModeParam& a, const HeatModeParam& b) { return a.heat_control == b.heat_control; }

inline bool operator==(const TimerParam& a, const TimerParam& b) {
    return a.timer_status == b.timer_status && a.duration == b.duration;
}

inline bool operator==(const SoftwareVersionParam& a, const SoftwareVersionParam& b) {
    return a.ui_major == b.ui_major && a.ui_minor == b.ui_minor && a.ui_test == b.ui_test
        && a.control_major == b.control_major && a.control_minor == b.control_minor
        && a.control_test == b.control_test
        && a.relay_major == b.relay_major && a.relay_minor == b.relay_minor
        && a.relay_test == b.relay_test;
}

inline bool operator==(const ErrorParam& a, const ErrorParam& b) {
    return a.byte1 == b.byte1 && a.byte2 == b.byte2 && a.byte3 == b.byte3 && a.byte4 == b.byte4;
}

inline bool operator==(const SoundParam& a, const SoundParam& b) {
    return a.volume == b.volume && a.sound_file == b.sound_file;
}

inline bool operator==(const LogEffectParam& a, const LogEffectParam& b) {
    return a.log_effect == b.log_effect && a.color == b.color && a.pattern == b.pattern;
}

// ============================ The union ===============================

/**
 * @brief Closed sum over every parameter kind.
 *
 * `std::variant` supplies `operator==` once every alternative has one (above).
 */
using Parameter = std::variant<
    TemperatureUnitParam,
    ModeParam,
    FlameEffectParam,
    HeatSettingsParam,
    HeatModeParam,
    TimerParam,
    SoftwareVersionParam,
    ErrorParam,
    SoundParam,
    LogEffectParam>;

static_assert(std::variant_size_v<Parameter> == PARAMETER_COUNT,
              "Parameter variant and catalog must list the same kinds");

/// Wire id of whichever alternative `param` holds.
inline ParameterId parameter_id_of(const Parameter& param) {
    return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::ID; }, param);
}

/// First parameter of type T in a decoded batch, or nullptr.
template <typename T>
const T* find_parameter(const std::vector<Parameter>& params) {
    for (const auto& p : params) {
        if (const T* hit = std::get_if<T>(&p)) return hit;
    }
    return nullptr;
}

/// Last parameter of type T in a decoded batch, or nullptr.
template <typename T>
const T* find_last_parameter(const std::vector<Parameter>& params) {
    const T* last = nullptr;
    for (const auto& p : params) {
        if (const T* hit = std::get_if<T>(&p)) last = hit;
    }
    return last;
}

// ================== FlameEffect brightness byte bits ==================

inline Brightness brightness_level(uint8_t brightness_byte) {
    return static_cast<Brightness>(brightness_byte & 0x01);
}

inline PulsatingEffect pulsating_effect(uint8_t brightness_byte) {
    return static_cast<PulsatingEffect>((brightness_byte >> 1) & 0x01);
}

/// Replace bit 0 only; every other bit of the appliance byte is kept.
inline uint8_t with_brightness_level(uint8_t brightness_byte, Brightness level) {
    return static_cast<uint8_t>((brightness_byte & ~0x01) | (raw(level) & 0x01));
}

/// Replace bit 1 only.
inline uint8_t with_pulsating_effect(uint8_t brightness_byte, PulsatingEffect effect) {
    return static_cast<uint8_t>((brightness_byte & ~0x02) | ((raw(effect) & 0x01) << 1));
}

} // namespace flamewire

#endif // FLAMEWIRE_PARAMETER_HPP
