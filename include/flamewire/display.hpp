/**
 * @file display.hpp
 * @brief Presentation of decoded parameters: one-line kv, human blocks, JSON.
 *
 * Three renderings of the same Parameter, for three audiences:
 *
 * - `decode_pretty()`: one grep-friendly line for scripts and logs:
 *   `id=321 kind=Mode mode=manual temperature=22.5`
 * - `describe()`: a titled block for people at a terminal:
 * @code
 *   [321] Mode
 *   ────────────────────────────────────────
 *     Mode:           On
 *     Temperature:    22.5°
 * @endcode
 * - `to_json()`: structured object for `--format json`.
 *
 * Enum fields use enum_text.hpp (tokens in kv/json, labels in blocks). Colors print as
 * `RGBW(r, g, b, w)` in blocks and `r,g,b,w` in kv. Temperatures always show one
 * decimal (22.0, not 22).
 */

#ifndef FLAMEWIRE_DISPLAY_HPP
#define FLAMEWIRE_DISPLAY_HPP

#include "flamewire/envelope.hpp"
#include "flamewire/parameter.hpp"

#include "nlohmann/json.hpp"

#include <string>

namespace flamewire {

std::string decode_pretty(const Parameter& param);

std::string describe(const Parameter& param);

nlohmann::json to_json(const Parameter& param);

/// Identity block for one fireplace (name, id, brand, model, connection, heat).
std::string describe(const Fire& fire);

nlohmann::json to_json(const Fire& fire);

/// "Unknown" | "Not Connected" | "Connected" | "Updating Firmware" | "Unknown(n)"
std::string connection_state_label(ConnectionState s);

std::string format_temperature(double value);

/// "RGBW(255, 0, 0, 80)"
std::string format_rgbw(const RGBWColor& c);

} // namespace flamewire

#endif // FLAMEWIRE_DISPLAY_HPP
