/**
 * @file log.hpp
 * @brief Single-line key=value logging to stderr, filtered by a process-wide level.
 *
 * Output shape, one record per line:
 * @code
 *   level=warn event=decode_skip id=322 reason=insufficient_data:FlameEffect(23/10)
 * @endcode
 *
 * Records are assembled with a temporary `Line` and flushed when it goes out of scope:
 * @code
 *   log::Line(log::Level::Warn, "decode_skip").kv("id", id).kv("reason", err.to_string());
 * @endcode
 *
 * Values containing spaces are double-quoted so the line stays grep/awk friendly.
 * The codec does not log; only envelope, settings callers and the CLI do.
 */

#ifndef FLAMEWIRE_LOG_HPP
#define FLAMEWIRE_LOG_HPP

#include <stdint.h>
#include <ostream>
#include <sstream>
#include <string>

namespace flamewire {
namespace log {

enum class Level : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void  set_level(Level lvl);
Level level();
bool  enabled(Level lvl);

/// "debug" | "info" | "warn" | "error" | "off" (case-insensitive). False if unknown.
bool        parse_level(const std::string& name, Level& out);
const char* level_name(Level lvl);

/// Redirect output (tests). Pass nullptr to restore stderr.
void set_sink(std::ostream* sink);

class Line {
public:
    Line(Level lvl, const char* event);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <typename T>
    Line& kv(const char* key, const T& value) {
        if (active_) {
            std::ostringstream v;
            v << value;
            append(key, v.str());
        }
        return *this;
    }

    Line& kv(const char* key, const std::string& value) {
        if (active_) append(key, value);
        return *this;
    }

private:
    void append(const char* key, const std::string& value);

    bool               active_;
    std::ostringstream os_;
};

} // namespace log
} // namespace flamewire

#endif // FLAMEWIRE_LOG_HPP
