/**
 * @file wire.hpp
 * @brief Low-level frame helpers shared by every per-kind decoder and encoder.
 *
 * A frame is built into a bounded `etl::vector` (no heap); its capacity is the largest
 * fixed frame, so an encoder can never emit more than MAX_FRAME_LEN bytes.
 *
 * ### Building a frame
 * @code
 *   Frame f;
 *   write_header(f, ParameterId::Mode, 3);  // 41 01 03
 *   f.push_back(1);                         // manual
 *   write_temperature(f, 22.5);             // 16 05
 * @endcode
 *
 * ### Reading a frame
 * Every decoder calls `check_length()` once with its kind's fixed total length, then
 * reads at fixed offsets. Nothing here reads past `len`.
 *
 * ### Temperature
 * Two bytes: integer part, then tenths digit. Encoding goes through total tenths
 * (`lround(value * 10)`) so 22.7 stays 22.7 even though `22.7 * 10` is 226.99999...
 * Values outside [0, 255.9] wrap in the integer byte; the caller must range-check.
 */

#ifndef FLAMEWIRE_WIRE_HPP
#define FLAMEWIRE_WIRE_HPP

#include "flamewire/parameter.hpp"
#include "flamewire/parameter_id.hpp"
#include "flamewire/protocol_error.hpp"

#include "etl/vector.h"

#include <stdint.h>
#include <stddef.h>

namespace flamewire {

/// One encoded frame, header included.
using Frame = etl::vector<uint8_t, MAX_FRAME_LEN>;

// ---------------- header ----------------

/// Append the 3-byte header: id (little-endian) + payload length.
void write_header(Frame& out, uint16_t id, uint8_t payload_len);

/// Header for a catalog kind, payload length taken from its fixed frame length.
void write_header(Frame& out, ParameterId id);

/**
 * @brief Read the 3-byte header.
 * @return false when fewer than HEADER_LEN bytes are present.
 */
bool read_header(const uint8_t* data, size_t len, uint16_t& id, uint8_t& payload_len);

// ---------------- length guard ----------------

/**
 * @brief Confirm `len` covers the whole fixed frame of `id`.
 * On failure fills `err` with InsufficientData and returns false.
 */
bool check_length(ParameterId id, size_t len, ProtocolError& err);

// ---------------- scalar fields ----------------

uint16_t read_u16_le(const uint8_t* data, size_t offset);
void     write_u16_le(Frame& out, uint16_t v);

double read_temperature(const uint8_t* data, size_t offset);
void   write_temperature(Frame& out, double value);

/// Append `count` zero bytes (reserved / padding offsets).
void write_padding(Frame& out, size_t count);

// ---------------- colors ----------------

/// Four bytes in R, B, G, W wire order -> model RGBW.
RGBWColor read_color_rbgw(const uint8_t* data, size_t offset);

/// Model RGBW -> four bytes in R, B, G, W wire order.
void write_color_rbgw(Frame& out, const RGBWColor& c);

} // namespace flamewire

#endif // FLAMEWIRE_WIRE_HPP
