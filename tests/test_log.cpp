#include <doctest/doctest.h>
#include "flamewire/log.hpp"

#include <sstream>
#include <string>

using namespace flamewire;

// Restores level and sink after each case.
struct CaptureLog {
    std::ostringstream out;
    log::Level saved = log::level();
    CaptureLog() { log::set_sink(&out); }
    ~CaptureLog() {
        log::set_sink(nullptr);
        log::set_level(saved);
    }
};

TEST_CASE("records below the level are dropped") {
    CaptureLog cap;
    log::set_level(log::Level::Warn);

    log::Line(log::Level::Info, "quiet").kv("x", 1);
    log::Line(log::Level::Error, "loud").kv("x", 2);

    CHECK(cap.out.str() == "level=error event=loud x=2\n");
}

TEST_CASE("values with spaces are quoted") {
    CaptureLog cap;
    log::set_level(log::Level::Debug);

    log::Line(log::Level::Debug, "fire").kv("name", std::string("Living Room")).kv("id", 321);
    CHECK(cap.out.str() == "level=debug event=fire name=\"Living Room\" id=321\n");
}

TEST_CASE("off silences everything") {
    CaptureLog cap;
    log::set_level(log::Level::Off);
    log::Line(log::Level::Error, "nothing");
    CHECK(cap.out.str().empty());
    CHECK_FALSE(log::enabled(log::Level::Error));
}

TEST_CASE("parse_level") {
    log::Level l = log::Level::Warn;
    CHECK(log::parse_level("DEBUG", l));
    CHECK(l == log::Level::Debug);
    CHECK(log::parse_level("none", l));
    CHECK(l == log::Level::Off);
    CHECK_FALSE(log::parse_level("verbose", l));
    CHECK(l == log::Level::Off);
    CHECK(std::string(log::level_name(log::Level::Info)) == "info");
}
