// -----------------------------------------------------------------------------
// @file config.cpp
// @brief Load / validate / atomically save the flamewire config.json.
// -----------------------------------------------------------------------------
#include "flamewire/config.hpp"
#include "flamewire/log.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

using nlohmann::json;
namespace fs = std::filesystem;

namespace flamewire {

fs::path default_config_path() {
    const char* xdg  = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    fs::path base = (xdg && *xdg)   ? fs::path(xdg)
                  : (home && *home) ? fs::path(home) / ".config"
                                    : fs::path(".config");
    return base / "flamewire" / "config.json";
}

bool config_from_json(const json& j, Config& out, std::string& err) {
    Config cfg;
    if (!j.is_object()) { err = "bad_config:not_an_object"; return false; }

    if (auto it = j.find("fire_id"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) { err = "bad_config:fire_id"; return false; }
        cfg.fire_id = it->get<std::string>();
    }
    if (auto it = j.find("default_temperature"); it != j.end() && !it->is_null()) {
        if (!it->is_number()) { err = "bad_config:default_temperature"; return false; }
        const double t = it->get<double>();
        if (!std::isfinite(t) || t < 0.0 || t > 255.9) { err = "bad_config:default_temperature(0.0..255.9)"; return false; }
        cfg.default_temperature = t;
    }
    if (auto it = j.find("log_level"); it != j.end() && !it->is_null()) {
        log::Level lvl;
        if (!it->is_string() || !log::parse_level(it->get<std::string>(), lvl)) {
            err = "bad_config:log_level(debug|info|warn|error|off)";
            return false;
        }
        cfg.log_level = log::level_name(lvl);
    }

    out = cfg;
    return true;
}

json config_to_json(const Config& cfg) {
    json j;
    j["fire_id"]             = cfg.fire_id;
    j["default_temperature"] = cfg.default_temperature;
    j["log_level"]           = cfg.log_level;
    return j;
}

bool load_config(const fs::path& path, Config& out, std::string& err) {
    out = Config{};

    std::error_code ec;
    if (!fs::exists(path, ec)) return true;

    std::ifstream in(path);
    if (!in) { err = "bad_config:unreadable"; return false; }

    try {
        json j;
        in >> j;
        return config_from_json(j, out, err);
    } catch (const json::exception& e) {
        err = std::string("bad_config:") + e.what();
        return false;
    }
}

bool save_config(const fs::path& path, const Config& cfg, std::string& err) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) { err = "io_error:" + ec.message(); return false; }
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) { err = "io_error:open " + tmp.string(); return false; }
        out << config_to_json(cfg).dump(2) << "\n";
        out.flush();
        if (!out) { err = "io_error:write " + tmp.string(); return false; }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        err = "io_error:rename " + path.string();
        return false;
    }
    log::Line(log::Level::Debug, "config_saved").kv("path", path.string());
    return true;
}

} // namespace flamewire
