// -----------------------------------------------------------------------------
// @file transport_encoding.cpp
// @brief base64 (on mbedtls) and hex conversions for frames carried in JSON or printed by the CLI.
// -----------------------------------------------------------------------------
#include "flamewire/transport_encoding.hpp"

#include <mbedtls/base64.h>

namespace flamewire {

static const char* HEX_DIGITS = "0123456789ABCDEF";

static bool hex_char_to_val(char c, uint8_t& out) {
    if (c >= '0' && c <= '9') { out = static_cast<uint8_t>(c - '0');      return true; }
    if (c >= 'A' && c <= 'F') { out = static_cast<uint8_t>(c - 'A' + 10); return true; }
    if (c >= 'a' && c <= 'f') { out = static_cast<uint8_t>(c - 'a' + 10); return true; }
    return false;
}

static bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// =============================================================================
// base64
// =============================================================================

std::string base64_encode(const uint8_t* data, size_t len) {
    if (len == 0) return std::string();

    // mbedtls writes a trailing NUL, so leave room for it
    std::vector<unsigned char> buf(((len + 2) / 3) * 4 + 1);
    size_t olen = 0;
    if (mbedtls_base64_encode(buf.data(), buf.size(), &olen, data, len) != 0) return std::string();
    return std::string(reinterpret_cast<const char*>(buf.data()), olen);
}

std::string base64_encode(const std::vector<uint8_t>& bytes) {
    return base64_encode(bytes.data(), bytes.size());
}

bool base64_decode(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();

    // mbedtls tolerates some line breaks and short groups; strip and check here so
    // only the alphabet and padding placement are left to it.
    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (!is_ascii_space(c)) s.push_back(c);
    }
    if (s.size() % 4 != 0) return false;
    if (s.empty()) return true;

    std::vector<uint8_t> buf((s.size() / 4) * 3);
    size_t olen = 0;
    const int rc = mbedtls_base64_decode(buf.data(), buf.size(), &olen,
                                         reinterpret_cast<const unsigned char*>(s.data()), s.size());
    if (rc != 0) return false;

    buf.resize(olen);
    out.swap(buf);
    return true;
}

// =============================================================================
// hex
// =============================================================================

std::string to_hex(const uint8_t* data, size_t len) {
    std::string s;
    s.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        s.push_back(HEX_DIGITS[data[i] >> 4]);
        s.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return s;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

bool hex_to_bytes(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();

    size_t start = 0;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) start = 2;

    std::string digits;
    digits.reserve(text.size());
    for (size_t i = start; i < text.size(); ++i) {
        if (!is_ascii_space(text[i])) digits.push_back(text[i]);
    }
    if (digits.size() % 2 != 0) return false;

    out.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        uint8_t hi = 0, lo = 0;
        if (!hex_char_to_val(digits[i], hi) || !hex_char_to_val(digits[i + 1], lo)) {
            out.clear();
            return false;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

} // namespace flamewire
