/**
 * @file config.hpp
 * @brief flamewire CLI configuration: where it lives, what it holds, how it is saved.
 *
 * File: `$XDG_CONFIG_HOME/flamewire/config.json`, falling back to
 * `~/.config/flamewire/config.json`. The CLI's `--config <path>` overrides it.
 *
 * @code
 *   {
 *     "fire_id": "a1b2c3",
 *     "default_temperature": 22.0,
 *     "log_level": "warn"
 *   }
 * @endcode
 *
 * - A missing file is not an error: defaults are used.
 * - A malformed file (bad JSON, wrong types, unknown log level) reports `bad_config:...`
 *   and leaves `out` at defaults.
 * - Saving writes `<path>.tmp` first and renames it over the target, so a crash never
 *   leaves a half-written config.
 */

#ifndef FLAMEWIRE_CONFIG_HPP
#define FLAMEWIRE_CONFIG_HPP

#include "nlohmann/json.hpp"

#include <filesystem>
#include <string>

namespace flamewire {

struct Config {
    std::string fire_id;                     ///< default target for set/on/off
    double      default_temperature = 22.0;  ///< Mode temperature when none is known
    std::string log_level           = "warn";
};

/// `$XDG_CONFIG_HOME/flamewire/config.json` or `$HOME/.config/flamewire/config.json`.
std::filesystem::path default_config_path();

bool config_from_json(const nlohmann::json& j, Config& out, std::string& err);

nlohmann::json config_to_json(const Config& cfg);

/// @return true when the file is absent or valid; false with `bad_config:...` otherwise.
bool load_config(const std::filesystem::path& path, Config& out, std::string& err);

/// Atomic write (tmp + rename). Creates parent directories.
bool save_config(const std::filesystem::path& path, const Config& cfg, std::string& err);

} // namespace flamewire

#endif // FLAMEWIRE_CONFIG_HPP
