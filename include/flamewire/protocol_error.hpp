/**
 * @file protocol_error.hpp
 * @brief Typed codec failure: what went wrong, for which parameter id, and by how much.
 *
 * The codec never throws and never logs. A failed decode or encode returns `false`
 * and fills a ProtocolError, so batch callers can skip one entry and keep going.
 *
 * | Code             | Raised by | Meaning                                             |
 * |------------------|-----------|-----------------------------------------------------|
 * | InsufficientData | decode    | buffer shorter than the kind's fixed frame length   |
 * | UnknownParameter | decode    | id is not in the parameter catalog                  |
 * | ReadOnly         | encode    | SoftwareVersion / Error are never sent to the fire  |
 *
 * `to_string()` gives the stable reason used in logs and CLI output:
 * - `insufficient_data:FlameEffect(23/10)` (expected / actual bytes)
 * - `unknown_parameter:9999`
 * - `read_only:SoftwareVersion`
 */

#ifndef FLAMEWIRE_PROTOCOL_ERROR_HPP
#define FLAMEWIRE_PROTOCOL_ERROR_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>

namespace flamewire {

enum class ErrorCode : uint8_t {
    None = 0,
    InsufficientData,
    UnknownParameter,
    ReadOnly
};

struct ProtocolError {
    ErrorCode code         = ErrorCode::None;
    uint16_t  parameter_id = 0;  ///< raw wire id the failure refers to
    size_t    expected     = 0;  ///< InsufficientData only: required frame length
    size_t    actual       = 0;  ///< InsufficientData only: bytes supplied

    static ProtocolError insufficient_data(uint16_t id, size_t expected_len, size_t actual_len);
    static ProtocolError unknown_parameter(uint16_t id);
    static ProtocolError read_only(uint16_t id);

    bool ok() const { return code == ErrorCode::None; }

    std::string to_string() const;
};

inline bool operator==(const ProtocolError& a, const ProtocolError& b) {
    return a.code == b.code && a.parameter_id == b.parameter_id
        && a.expected == b.expected && a.actual == b.actual;
}

/// Short token for an error code ("insufficient_data", ...).
const char* error_code_name(ErrorCode code);

} // namespace flamewire

#endif // FLAMEWIRE_PROTOCOL_ERROR_HPP
