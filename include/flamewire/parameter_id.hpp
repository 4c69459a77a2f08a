/**
 * @file parameter_id.hpp
 * @brief flamewire ParameterId: wire identifiers and fixed frame sizes for every parameter kind.
 *
 * Every record the fireplace exchanges with the cloud relay is a small, fixed-layout
 * binary frame. The frame starts with a 3-byte header:
 *
 * | Byte | Contents        | Description                                   |
 * |------|-----------------|-----------------------------------------------|
 * | 0–1  | `parameter id`  | unsigned 16-bit, little-endian                |
 * | 2    | `payload len`   | unsigned 8-bit, header NOT included           |
 *
 * followed by a payload whose length is fixed per kind. The catalog below is the
 * single source of truth for those sizes; decoders, encoders and tests all read it.
 *
 * | Kind            | Id  | Total len | Writable |
 * |-----------------|-----|-----------|----------|
 * | TemperatureUnit | 236 | 4         | yes      |
 * | Mode            | 321 | 6         | yes      |
 * | FlameEffect     | 322 | 23        | yes      |
 * | HeatSettings    | 323 | 10        | yes      |
 * | HeatMode        | 325 | 4         | yes      |
 * | Timer           | 326 | 6         | yes      |
 * | SoftwareVersion | 327 | 12        | no       |
 * | Error           | 329 | 7         | no       |
 * | Sound           | 369 | 5         | yes      |
 * | LogEffect       | 370 | 11        | yes      |
 *
 * ### Example
 * A Mode frame `[0x41, 0x01, 0x03, 0x01, 0x16, 0x05]` reads as:
 * - `id = 0x0141 = 321`
 * - `payload len = 3`
 * - payload `[0x01, 0x16, 0x05]` (manual, 22.5 degrees)
 *
 * @note Ids and lengths are part of the appliance contract. Never renumber them.
 */

#ifndef FLAMEWIRE_PARAMETER_ID_HPP
#define FLAMEWIRE_PARAMETER_ID_HPP

#include <stdint.h>
#include <stddef.h>

namespace flamewire {

/**
 * @enum ParameterId
 * @brief Wire identifier of each parameter kind (bytes 0–1 of every frame).
 */
enum class ParameterId : uint16_t {
    TemperatureUnit = 236,
    Mode            = 321,
    FlameEffect     = 322,
    HeatSettings    = 323,
    HeatMode        = 325,
    Timer           = 326,
    SoftwareVersion = 327,
    Error           = 329,
    Sound           = 369,
    LogEffect       = 370
};

static constexpr size_t HEADER_LEN    = 3;   ///< id (2) + payload length (1)
static constexpr size_t MAX_FRAME_LEN = 23;  ///< FlameEffect, the largest frame

/**
 * @brief One row of the parameter catalog.
 */
struct ParameterInfo {
    ParameterId id;         ///< Wire identifier
    const char* name;       ///< Stable kind name used in logs and error reasons
    uint8_t     frame_len;  ///< Total frame length, header included
    bool        read_only;  ///< Reported by the appliance only; never encoded
};

/// Catalog of every known kind, ordered by id.
inline constexpr ParameterInfo PARAMETER_CATALOG[] = {
    { ParameterId::TemperatureUnit, "TemperatureUnit",  4, false },
    { ParameterId::Mode,            "Mode",             6, false },
    { ParameterId::FlameEffect,     "FlameEffect",     23, false },
    { ParameterId::HeatSettings,    "HeatSettings",    10, false },
    { ParameterId::HeatMode,        "HeatMode",         4, false },
    { ParameterId::Timer,           "Timer",            6, false },
    { ParameterId::SoftwareVersion, "SoftwareVersion", 12, true  },
    { ParameterId::Error,           "Error",            7, true  },
    { ParameterId::Sound,           "Sound",            5, false },
    { ParameterId::LogEffect,       "LogEffect",       11, false }
};

inline constexpr size_t PARAMETER_COUNT = sizeof(PARAMETER_CATALOG) / sizeof(PARAMETER_CATALOG[0]);

/// Raw 16-bit value of a ParameterId.
constexpr uint16_t to_raw(ParameterId id) { return static_cast<uint16_t>(id); }

/**
 * @brief Look up a catalog row by raw wire id.
 * @return Pointer into PARAMETER_CATALOG, or nullptr when the id is not a known kind.
 */
constexpr const ParameterInfo* find_parameter_info(uint16_t raw_id) {
    for (size_t i = 0; i < PARAMETER_COUNT; ++i) {
        if (to_raw(PARAMETER_CATALOG[i].id) == raw_id) return &PARAMETER_CATALOG[i];
    }
    return nullptr;
}

/// Kind name for logs ("Mode", "FlameEffect", ...); "Unknown" for ids outside the catalog.
constexpr const char* parameter_name(uint16_t raw_id) {
    const ParameterInfo* info = find_parameter_info(raw_id);
    return info ? info->name : "Unknown";
}

constexpr const char* parameter_name(ParameterId id) { return parameter_name(to_raw(id)); }

/// Fixed total frame length (header included); 0 for ids outside the catalog.
constexpr size_t frame_length(ParameterId id) {
    const ParameterInfo* info = find_parameter_info(to_raw(id));
    return info ? info->frame_len : 0;
}

constexpr bool is_read_only(ParameterId id) {
    const ParameterInfo* info = find_parameter_info(to_raw(id));
    return info && info->read_only;
}

static_assert(PARAMETER_COUNT == 10, "parameter catalog changed; update codec dispatch and tests");
static_assert(frame_length(ParameterId::FlameEffect) == MAX_FRAME_LEN, "MAX_FRAME_LEN must cover the largest frame");

} // namespace flamewire

#endif // FLAMEWIRE_PARAMETER_ID_HPP
