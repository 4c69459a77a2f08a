// -----------------------------------------------------------------------------
// @file wire.cpp
// @brief Header, length guard, and fixed-point helpers for flamewire frames.
//
// Everything here is byte shuffling with explicit offsets. The per-kind layouts
// live in codec.cpp; this file only knows about the shared building blocks.
// -----------------------------------------------------------------------------
#include "flamewire/wire.hpp"

#include <cmath>

namespace flamewire {

// =============================================================================
// Header
// =============================================================================

void write_header(Frame& out, uint16_t id, uint8_t payload_len) {
    out.push_back(static_cast<uint8_t>(id & 0xFF));  // low byte first
    out.push_back(static_cast<uint8_t>(id >> 8));    // high byte
    out.push_back(payload_len);                      // header not counted
}

void write_header(Frame& out, ParameterId id) {
    write_header(out, to_raw(id), static_cast<uint8_t>(frame_length(id) - HEADER_LEN));
}

bool read_header(const uint8_t* data, size_t len, uint16_t& id, uint8_t& payload_len) {
    if (!data || len < HEADER_LEN) return false;
    id          = read_u16_le(data, 0);
    payload_len = data[2];
    return true;
}

// =============================================================================
// Length guard
// =============================================================================

bool check_length(ParameterId id, size_t len, ProtocolError& err) {
    const size_t need = frame_length(id);
    if (len < need) {
        err = ProtocolError::insufficient_data(to_raw(id), need, len);
        return false;
    }
    return true;
}

// =============================================================================
// Scalars
// =============================================================================

uint16_t read_u16_le(const uint8_t* data, size_t offset) {
    return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

void write_u16_le(Frame& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

// Integer byte + tenths digit. Summing as tenths first keeps 22.5 == 225 / 10.0
// bit-identical to the literal 22.5.
double read_temperature(const uint8_t* data, size_t offset) {
    const unsigned tenths = static_cast<unsigned>(data[offset]) * 10u + data[offset + 1];
    return tenths / 10.0;
}

void write_temperature(Frame& out, double value) {
    const long tenths = std::lround(value * 10.0);
    out.push_back(static_cast<uint8_t>(tenths / 10));  // wraps outside 0..255
    out.push_back(static_cast<uint8_t>(tenths % 10));
}

void write_padding(Frame& out, size_t count) {
    for (size_t i = 0; i < count; ++i) out.push_back(0);
}

// =============================================================================
// Colors (wire order R, B, G, W)
// =============================================================================

RGBWColor read_color_rbgw(const uint8_t* data, size_t offset) {
    RGBWColor c;
    c.red   = data[offset + 0];
    c.blue  = data[offset + 1];
    c.green = data[offset + 2];
    c.white = data[offset + 3];
    return c;
}

void write_color_rbgw(Frame& out, const RGBWColor& c) {
    out.push_back(c.red);
    out.push_back(c.blue);
    out.push_back(c.green);
    out.push_back(c.white);
}

} // namespace flamewire
