/**
 * @file transport_encoding.hpp
 * @brief Text encodings for frames in transit: base64 (cloud envelope) and hex (CLI, logs).
 *
 * The codec only deals in raw bytes. The cloud relay carries each frame as a base64
 * string in the `Value` field, so the envelope layer converts on both sides of it.
 *
 * Base64 is RFC 4648 standard alphabet with `=` padding. Decoding is strict:
 * - ASCII whitespace is stripped first (relay responses are sometimes wrapped)
 * - remaining length must be a multiple of 4
 * - at most two `=` and only at the end
 * - any other character outside the alphabet fails
 *
 * Hex is upper-case, no separators: `410103011605`.
 */

#ifndef FLAMEWIRE_TRANSPORT_ENCODING_HPP
#define FLAMEWIRE_TRANSPORT_ENCODING_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace flamewire {

std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const std::vector<uint8_t>& bytes);

/// @return false (and `out` cleared) on malformed input.
bool base64_decode(const std::string& text, std::vector<uint8_t>& out);

std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const std::vector<uint8_t>& bytes);

/**
 * @brief Parse a hex string; optional "0x" prefix, spaces between bytes allowed.
 * @return false on odd digit count or a non-hex character.
 */
bool hex_to_bytes(const std::string& text, std::vector<uint8_t>& out);

} // namespace flamewire

#endif // FLAMEWIRE_TRANSPORT_ENCODING_HPP
