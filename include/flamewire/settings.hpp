#pragma once
/**
 * @file settings.hpp
 * @brief Named settings → one writable Parameter, plus the turn on / turn off recipes.
 *
 * @details
 * PURPOSE
 * -------
 * The fireplace has no "set flame speed" message. Every write sends a whole parameter
 * record, so changing one field means: find the current record, copy it, change the
 * field, encode the copy. This layer owns that read-modify-write step so the CLI only
 * deals in `<setting> <value>` strings.
 *
 * SETTINGS
 * --------
 * | Name            | Value                                   | Writes          | Needs current |
 * |-----------------|-----------------------------------------|-----------------|---------------|
 * | mode            | standby, manual                         | Mode            | no (temp kept)|
 * | flame-speed     | 1..5                                    | FlameEffect     | yes           |
 * | brightness      | high, low                               | FlameEffect     | yes           |
 * | pulsating       | on, off                                 | FlameEffect     | yes           |
 * | flame-color     | all, yellow-red, ... blue-red           | FlameEffect     | yes           |
 * | media-theme     | user-defined, white, ... midnight       | FlameEffect     | yes           |
 * | flame-effect    | on, off                                 | FlameEffect     | yes           |
 * | media-light     | on, off                                 | FlameEffect     | yes           |
 * | overhead-light  | on, off                                 | FlameEffect     | yes           |
 * | light-status    | on, off                                 | FlameEffect     | yes           |
 * | ambient-sensor  | on, off                                 | FlameEffect     | yes           |
 * | media-color     | R,G,B,W or preset                       | FlameEffect     | yes           |
 * | overhead-color  | R,G,B,W or preset                       | FlameEffect     | yes           |
 * | heat-mode       | normal, boost, eco, fan-only            | HeatSettings    | yes           |
 * | heat-temp       | 0.0..255.9                              | HeatSettings    | yes           |
 * | timer           | minutes 0..65535 (0 disables)           | Timer           | no            |
 * | temp-unit       | fahrenheit, celsius                     | TemperatureUnit | no            |
 * | volume          | 0..255                                  | Sound           | yes           |
 * | log-effect      | on, off                                 | LogEffect       | yes           |
 *
 * Brightness and pulsating share the FlameEffect brightness byte (bit 0, bit 1);
 * setting one leaves the other bit and any unknown bits as the appliance sent them.
 *
 * ERRORS
 * ------
 * Stable reason strings, same shape as the rest of flamewire:
 *   - `unknown_setting:<name>`
 *   - `bad_value:<name>(<allowed>)`   e.g. `bad_value:flame-speed(1..5)`
 *   - `missing_current:<Kind>`        e.g. `missing_current:FlameEffect`
 *
 * EXAMPLE
 * -------
 *   flamewire::Parameter out;
 *   std::string err;
 *   if (!flamewire::apply_setting("flame-speed", "4", overview.parameters, {}, out, err)) {
 *       std::cerr << "status=error reason=" << err << "\n";
 *       return 2;
 *   }
 */

#include "flamewire/parameter.hpp"

#include <stddef.h>
#include <string>
#include <vector>

namespace flamewire {

/// Fallbacks for fields a write needs but the current state does not supply.
struct SettingDefaults {
    double temperature = 22.0;  ///< Mode temperature when no Mode record is known
};

struct NamedColor {
    const char* name;
    RGBWColor   color;
};

/// Color presets accepted wherever a color value is.
extern const NamedColor NAMED_COLORS[];
extern const size_t     NAMED_COLOR_COUNT;

/// Every setting name, in table order.
extern const char* const SETTING_NAMES[];
extern const size_t      SETTING_COUNT;

/// Preset name (e.g. "light-red") or "R,G,B,W" with each channel 0..255.
bool parse_color(const std::string& text, RGBWColor& out);

/**
 * @brief Build the one parameter that applies `name = value`.
 * @param current  Parameters last decoded from the fireplace (may be empty).
 * @param out      The parameter to encode and write.
 * @param err      Reason string on failure.
 */
bool apply_setting(const std::string& name, const std::string& value,
                   const std::vector<Parameter>& current, const SettingDefaults& defaults,
                   Parameter& out, std::string& err);

/// Mode=Manual keeping the temperature of the last Mode in `current`, plus the last
/// FlameEffect switched on when one is known.
std::vector<Parameter> make_turn_on(const std::vector<Parameter>& current, const SettingDefaults& defaults);

/// Mode=Standby keeping the temperature of the first Mode in `current`.
std::vector<Parameter> make_turn_off(const std::vector<Parameter>& current, const SettingDefaults& defaults);

} // namespace flamewire
