/**
 * @file codec.hpp
 * @brief flamewire wire codec: raw frame bytes <-> typed Parameter.
 *
 * Two entry points, both pure and thread-safe (no state, no I/O, no logging):
 *
 * - `decode_parameter(id, bytes)`: dispatches on the numeric id to one fixed-layout
 *   reader. Fails with UnknownParameter or InsufficientData.
 * - `encode_parameter(param)`: dispatches on the variant alternative to one
 *   fixed-layout writer. Fails with ReadOnly for SoftwareVersion and Error.
 *
 * The id passed to decode comes from the envelope (`ParameterId` next to the base64
 * `Value`), not from the frame header. Frame bytes are the full frame, header included.
 *
 * Law: for every writable kind, `decode(id_of(v), encode(v)) == v`.
 *
 * ### Example
 * @code
 *   const uint8_t raw[] = { 0x41, 0x01, 0x03, 0x01, 0x16, 0x05 };
 *   flamewire::Parameter p;
 *   flamewire::ProtocolError err;
 *   if (!flamewire::decode_parameter(321, raw, sizeof(raw), p, err)) {
 *       std::cerr << "status=error reason=" << err.to_string() << "\n";
 *   }
 *   // std::get<ModeParam>(p) == { Manual, 22.5 }
 * @endcode
 */

#ifndef FLAMEWIRE_CODEC_HPP
#define FLAMEWIRE_CODEC_HPP

#include "flamewire/parameter.hpp"
#include "flamewire/protocol_error.hpp"
#include "flamewire/wire.hpp"

#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace flamewire {

/**
 * @brief Decode one full frame.
 * @param id   Wire id as delivered next to the frame.
 * @param data Frame bytes (header included); may be longer than needed.
 * @param len  Number of bytes at `data`.
 * @param out  Receives the decoded parameter on success; untouched on failure.
 * @param err  Receives the failure reason on error.
 */
bool decode_parameter(uint16_t id, const uint8_t* data, size_t len,
                      Parameter& out, ProtocolError& err);

bool decode_parameter(uint16_t id, const std::vector<uint8_t>& frame,
                      Parameter& out, ProtocolError& err);

/**
 * @brief Encode one writable parameter into its fixed-length frame.
 * `out` is cleared first. On success `out.size() == frame_length(parameter_id_of(param))`.
 */
bool encode_parameter(const Parameter& param, Frame& out, ProtocolError& err);

/// Convenience overload for callers that want a heap vector (base64, JSON).
bool encode_parameter(const Parameter& param, std::vector<uint8_t>& out, ProtocolError& err);

} // namespace flamewire

#endif // FLAMEWIRE_CODEC_HPP
