// -----------------------------------------------------------------------------
// @file log.cpp
// @brief Level filter and stderr sink for flamewire::log.
// -----------------------------------------------------------------------------
#include "flamewire/log.hpp"

#include <cctype>
#include <iostream>

namespace flamewire {
namespace log {

static Level         g_level = Level::Warn;
static std::ostream* g_sink  = nullptr;

void set_level(Level lvl) { g_level = lvl; }

Level level() { return g_level; }

bool enabled(Level lvl) {
    return lvl != Level::Off && g_level != Level::Off
        && static_cast<uint8_t>(lvl) >= static_cast<uint8_t>(g_level);
}

bool parse_level(const std::string& name, Level& out) {
    std::string s = name;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);

    if (s == "debug")                   { out = Level::Debug; return true; }
    if (s == "info")                    { out = Level::Info;  return true; }
    if (s == "warn" || s == "warning")  { out = Level::Warn;  return true; }
    if (s == "error")                   { out = Level::Error; return true; }
    if (s == "off" || s == "none")      { out = Level::Off;   return true; }
    return false;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Off:   return "off";
    }
    return "unknown";
}

void set_sink(std::ostream* sink) { g_sink = sink; }

// ---------------------------------------------------------------------------
// Line
// ---------------------------------------------------------------------------

Line::Line(Level lvl, const char* event) : active_(enabled(lvl)) {
    if (active_) os_ << "level=" << level_name(lvl) << " event=" << event;
}

Line::~Line() {
    if (!active_) return;
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << os_.str() << '\n';
}

void Line::append(const char* key, const std::string& value) {
    os_ << ' ' << key << '=';
    if (value.find(' ') != std::string::npos) os_ << '"' << value << '"';
    else                                      os_ << value;
}

} // namespace log
} // namespace flamewire
