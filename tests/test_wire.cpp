#include <doctest/doctest.h>
#include "flamewire/wire.hpp"

using namespace flamewire;

TEST_CASE("Header is id little-endian then payload length") {
    Frame f;
    write_header(f, ParameterId::Mode);
    REQUIRE(f.size() == 3);
    CHECK(f[0] == 0x41);
    CHECK(f[1] == 0x01);
    CHECK(f[2] == 0x03);

    Frame g;
    write_header(g, 0xBEEF, 7);
    CHECK(g[0] == 0xEF);
    CHECK(g[1] == 0xBE);
    CHECK(g[2] == 7);
}

TEST_CASE("Header payload length excludes the header for every kind") {
    for (const auto& info : PARAMETER_CATALOG) {
        Frame f;
        write_header(f, info.id);
        CHECK(f[2] == info.frame_len - HEADER_LEN);
    }
}

TEST_CASE("read_header parses and refuses short input") {
    const uint8_t raw[] = { 0x72, 0x01, 0x08 };
    uint16_t id = 0;
    uint8_t len = 0;
    REQUIRE(read_header(raw, sizeof(raw), id, len));
    CHECK(id == 370);
    CHECK(len == 8);

    CHECK_FALSE(read_header(raw, 2, id, len));
    CHECK_FALSE(read_header(nullptr, 3, id, len));
}

TEST_CASE("check_length reports expected and actual") {
    ProtocolError err;
    CHECK(check_length(ParameterId::FlameEffect, 23, err));
    CHECK(check_length(ParameterId::FlameEffect, 40, err));

    REQUIRE_FALSE(check_length(ParameterId::FlameEffect, 10, err));
    CHECK(err.code == ErrorCode::InsufficientData);
    CHECK(err.parameter_id == 322);
    CHECK(err.expected == 23);
    CHECK(err.actual == 10);
    CHECK(err.to_string() == "insufficient_data:FlameEffect(23/10)");
}

TEST_CASE("Temperature is integer byte then tenths digit") {
    const uint8_t raw[] = { 0x16, 0x05 };
    CHECK(read_temperature(raw, 0) == 22.5);

    Frame f;
    write_temperature(f, 22.5);
    REQUIRE(f.size() == 2);
    CHECK(f[0] == 22);
    CHECK(f[1] == 5);
}

TEST_CASE("Temperature encode survives binary fractions") {
    // 22.7 * 10 is 226.99999... in binary floating point
    Frame f;
    write_temperature(f, 22.7);
    CHECK(f[0] == 22);
    CHECK(f[1] == 7);

    Frame g;
    write_temperature(g, 0.1);
    CHECK(g[0] == 0);
    CHECK(g[1] == 1);
}

TEST_CASE("Temperature boundaries 0.0 and 255.9") {
    Frame f;
    write_temperature(f, 0.0);
    write_temperature(f, 255.9);
    REQUIRE(f.size() == 4);
    CHECK(f[0] == 0);
    CHECK(f[1] == 0);
    CHECK(f[2] == 255);
    CHECK(f[3] == 9);

    const uint8_t raw[] = { 255, 9 };
    CHECK(read_temperature(raw, 0) == 255.9);
}

TEST_CASE("u16 fields are little-endian") {
    Frame f;
    write_u16_le(f, 0x012C);
    CHECK(f[0] == 0x2C);
    CHECK(f[1] == 0x01);

    const uint8_t raw[] = { 0x00, 0xFF, 0xFF };
    CHECK(read_u16_le(raw, 1) == 65535);
}

TEST_CASE("Colors go R, B, G, W on the wire") {
    const uint8_t raw[] = { 10, 20, 30, 40 };  // R=10 B=20 G=30 W=40
    RGBWColor c = read_color_rbgw(raw, 0);
    CHECK(c.red == 10);
    CHECK(c.green == 30);
    CHECK(c.blue == 20);
    CHECK(c.white == 40);

    Frame f;
    write_color_rbgw(f, c);
    REQUIRE(f.size() == 4);
    CHECK(f[0] == 10);
    CHECK(f[1] == 20);
    CHECK(f[2] == 30);
    CHECK(f[3] == 40);
}

TEST_CASE("Padding is zero bytes") {
    Frame f;
    write_padding(f, 3);
    REQUIRE(f.size() == 3);
    CHECK(f[0] == 0);
    CHECK(f[1] == 0);
    CHECK(f[2] == 0);
}

TEST_CASE("Catalog lookups") {
    CHECK(find_parameter_info(9999) == nullptr);
    CHECK(std::string(parameter_name(uint16_t(9999))) == "Unknown");
    CHECK(std::string(parameter_name(ParameterId::HeatSettings)) == "HeatSettings");
    CHECK(frame_length(ParameterId::SoftwareVersion) == 12);
    CHECK(is_read_only(ParameterId::SoftwareVersion));
    CHECK(is_read_only(ParameterId::Error));
    CHECK_FALSE(is_read_only(ParameterId::Mode));
}
