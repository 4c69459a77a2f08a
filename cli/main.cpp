/**
 * @file main.cpp
 * @brief flamewire CLI: offline front end over the fireplace parameter codec.
 *
 * Responsibilities:
 *  - Parse subcommands and options (CLI11).
 *  - Load config from XDG (~/.config/flamewire/config.json) or --config.
 *  - decode:  one base64/hex frame -> parameter (pretty | kv | json).
 *  - encode:  <setting> <value> -> frame bytes (hex + base64).
 *  - status:  saved GetFireOverview response -> decoded parameters + skipped entries.
 *  - fires:   saved GetFires response -> fireplace list.
 *  - set/on/off: build the WriteWifiParameters body from the saved overview.
 *  - config:  show or persist settings (atomic write).
 *
 * Notes:
 *  - No network. JSON comes from a file, or stdin when the path is "-".
 *  - Exit codes: 0 ok, 1 I/O, 2 usage / bad value, 3 protocol (decode/encode) failure.
 *  - Errors go to stderr as "status=error reason=<reason>".
 */

#include <cstdio>
#include <cstdint>
#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "flamewire/codec.hpp"
#include "flamewire/config.hpp"
#include "flamewire/display.hpp"
#include "flamewire/envelope.hpp"
#include "flamewire/log.hpp"
#include "flamewire/settings.hpp"
#include "flamewire/transport_encoding.hpp"
#include "flamewire/wire.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace flamewire;

// ---------- exit codes ----------

static constexpr int EXIT_OK       = 0;
static constexpr int EXIT_IO       = 1;
static constexpr int EXIT_USAGE    = 2;
static constexpr int EXIT_PROTOCOL = 3;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static int fail(int code, const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
  return code;
}

// "-" reads stdin.
static bool read_text(const std::string& path, std::string& out) {
  if (path == "-") {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

// Optional overview: empty path means "no current state".
static int load_overview(const std::string& path, FireOverview& ov) {
  if (path.empty()) return EXIT_OK;
  std::string text;
  if (!read_text(path, text)) return fail(EXIT_IO, "io_error:read " + path);
  std::string err;
  if (!parse_overview(text, ov, err)) return fail(EXIT_USAGE, err);
  return EXIT_OK;
}

static void print_frame(const Parameter& p, const std::vector<uint8_t>& frame, const std::string& format) {
  const uint16_t id = to_raw(parameter_id_of(p));
  if (format == "json") {
    json j;
    j["id"]        = id;
    j["kind"]      = parameter_name(id);
    j["hex"]       = to_hex(frame);
    j["base64"]    = base64_encode(frame);
    j["parameter"] = to_json(p);
    std::cout << j.dump(2) << "\n";
  } else {
    std::cout << "id=" << id << " kind=" << parameter_name(id) << " len=" << frame.size()
              << " hex=" << to_hex(frame) << " base64=" << base64_encode(frame) << "\n";
  }
}

static void print_parameter(const Parameter& p, const std::string& format) {
  if (format == "json")    std::cout << to_json(p).dump(2) << "\n";
  else if (format == "kv") std::cout << decode_pretty(p) << "\n";
  else                     std::cout << describe(p);
}

static std::string resolve_fire_id(const std::string& opt, const Config& cfg, const FireOverview& ov) {
  if (!opt.empty()) return opt;
  if (!cfg.fire_id.empty()) return cfg.fire_id;
  return ov.fire.fire_id;
}

static int emit_write(const std::string& fire_id, const std::vector<Parameter>& params) {
  if (fire_id.empty()) return fail(EXIT_USAGE, "missing_fire_id");
  json body;
  std::string err;
  if (!build_write_payload(fire_id, params, body, err)) return fail(EXIT_PROTOCOL, err);
  std::cout << body.dump(2) << "\n";
  return EXIT_OK;
}

// ---------- main ----------

int main(int argc, char** argv) {
  // Global options
  std::string opt_config;
  std::string opt_log_level;
  bool opt_verbose = false;
  bool opt_no_color = false;

  // Subcommand options
  uint32_t    opt_id = 0;
  std::string opt_value;
  std::string opt_hex;
  std::string opt_format = "pretty";
  std::string opt_file;
  std::string opt_fire_id;
  std::string opt_setting;
  std::string opt_setting_value;
  std::string opt_set_fire_id;
  double      opt_set_default_temp = 0.0;
  std::string opt_set_log_level;

  CLI::App app{"flamewire: fireplace parameter codec"};
  app.require_subcommand(1);

  app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/flamewire/config.json)");
  app.add_option("--log-level", opt_log_level, "debug|info|warn|error|off")
     ->check(CLI::IsMember({"debug","info","warn","error","off"}));
  app.add_flag("-v,--verbose", opt_verbose, "Same as --log-level debug");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  const auto formats = CLI::IsMember({"pretty","kv","json"});

  auto* dec = app.add_subcommand("decode", "Decode one frame");
  dec->add_option("--id", opt_id, "Parameter id")->required()->check(CLI::Range(0u, 65535u));
  auto* dec_value = dec->add_option("--value", opt_value, "Frame as base64");
  auto* dec_hex   = dec->add_option("--hex", opt_hex, "Frame as hex");
  dec_value->excludes(dec_hex);
  dec->add_option("--format", opt_format, "pretty|kv|json")->check(formats);

  auto* enc = app.add_subcommand("encode", "Encode <setting> <value> into a frame");
  enc->add_option("setting", opt_setting, "Setting name")->required();
  enc->add_option("value", opt_setting_value, "Setting value")->required();
  enc->add_option("--file", opt_file, "Current GetFireOverview JSON (or - for stdin)");
  enc->add_option("--format", opt_format, "kv|json")->check(formats);

  auto* status = app.add_subcommand("status", "Decode a saved fire overview");
  status->add_option("--file", opt_file, "GetFireOverview JSON (or - for stdin)")->required();
  status->add_option("--format", opt_format, "pretty|kv|json")->check(formats);

  auto* fires = app.add_subcommand("fires", "List fireplaces from a saved GetFires response");
  fires->add_option("--file", opt_file, "GetFires JSON (or - for stdin)")->required();
  fires->add_option("--format", opt_format, "pretty|kv|json")->check(formats);

  auto* set = app.add_subcommand("set", "Build a write payload for <setting> <value>");
  set->add_option("setting", opt_setting, "Setting name")->required();
  set->add_option("value", opt_setting_value, "Setting value")->required();
  set->add_option("--file", opt_file, "Current GetFireOverview JSON (or - for stdin)");
  set->add_option("--fire-id", opt_fire_id, "Target fire (default: config, then overview)");

  auto* on = app.add_subcommand("on", "Build a turn-on write payload");
  on->add_option("--file", opt_file, "Current GetFireOverview JSON (or - for stdin)");
  on->add_option("--fire-id", opt_fire_id, "Target fire");

  auto* off = app.add_subcommand("off", "Build a turn-off write payload");
  off->add_option("--file", opt_file, "Current GetFireOverview JSON (or - for stdin)");
  off->add_option("--fire-id", opt_fire_id, "Target fire");

  auto* cfg_cmd = app.add_subcommand("config", "Show or update configuration");
  auto* set_fire = cfg_cmd->add_option("--set-fire-id", opt_set_fire_id, "Persist default fire id");
  auto* set_temp = cfg_cmd->add_option("--set-default-temp", opt_set_default_temp, "Persist default temperature")
                          ->check(CLI::Range(0.0, 255.9));
  auto* set_lvl  = cfg_cmd->add_option("--set-log-level", opt_set_log_level, "Persist log level")
                          ->check(CLI::IsMember({"debug","info","warn","error","off"}));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format == "pretty";

  // Config, then log level: config < --log-level < -v
  const fs::path config_path = opt_config.empty() ? default_config_path() : fs::path(opt_config);
  Config cfg;
  std::string cfg_err;
  const bool cfg_ok = load_config(config_path, cfg, cfg_err);

  log::Level lvl = log::Level::Warn;
  if (!log::parse_level(cfg.log_level, lvl)) lvl = log::Level::Warn;
  if (!opt_log_level.empty() && !log::parse_level(opt_log_level, lvl)) {
    return fail(EXIT_USAGE, "bad_value:--log-level(debug|info|warn|error|off)");
  }
  if (opt_verbose) lvl = log::Level::Debug;
  log::set_level(lvl);

  if (!cfg_ok) {
    log::Line(log::Level::Warn, "config_ignored").kv("path", config_path.string()).kv("reason", cfg_err);
  }

  SettingDefaults defaults;
  defaults.temperature = cfg.default_temperature;

  // ---- decode ----
  if (*dec) {
    std::vector<uint8_t> frame;
    if (!opt_value.empty()) {
      if (!base64_decode(opt_value, frame)) return fail(EXIT_USAGE, "bad_base64");
    } else if (!opt_hex.empty()) {
      if (!hex_to_bytes(opt_hex, frame)) return fail(EXIT_USAGE, "bad_hex");
    } else {
      return fail(EXIT_USAGE, "missing_value:--value|--hex");
    }

    uint16_t header_id = 0;
    uint8_t header_len = 0;
    if (read_header(frame.data(), frame.size(), header_id, header_len) && header_id != opt_id) {
      log::Line(log::Level::Warn, "header_mismatch").kv("id", opt_id).kv("header_id", header_id);
    }

    Parameter p;
    ProtocolError perr;
    if (!decode_parameter(static_cast<uint16_t>(opt_id), frame, p, perr)) {
      return fail(EXIT_PROTOCOL, perr.to_string());
    }
    if (opt_format == "pretty") std::cout << ansi.dim("frame: " + to_hex(frame)) << "\n";
    print_parameter(p, opt_format);
    return EXIT_OK;
  }

  // ---- encode ----
  if (*enc) {
    FireOverview ov;
    if (int rc = load_overview(opt_file, ov)) return rc;

    Parameter p;
    std::string err;
    if (!apply_setting(opt_setting, opt_setting_value, ov.parameters, defaults, p, err)) {
      return fail(EXIT_USAGE, err);
    }
    std::vector<uint8_t> frame;
    ProtocolError perr;
    if (!encode_parameter(p, frame, perr)) return fail(EXIT_PROTOCOL, perr.to_string());
    print_frame(p, frame, opt_format);
    return EXIT_OK;
  }

  // ---- status ----
  if (*status) {
    FireOverview ov;
    if (int rc = load_overview(opt_file, ov)) return rc;

    if (opt_format == "json") {
      json j;
      j["fire"] = to_json(ov.fire);
      j["parameters"] = json::array();
      for (const auto& p : ov.parameters) j["parameters"].push_back(to_json(p));
      j["skipped"] = json::array();
      for (const auto& s : ov.skipped) j["skipped"].push_back({{"id", s.parameter_id}, {"reason", s.reason}});
      std::cout << j.dump(2) << "\n";
    } else if (opt_format == "kv") {
      std::cout << "fire_id=" << ov.fire.fire_id
                << " connection=" << static_cast<unsigned>(ov.fire.connection_state)
                << " parameters=" << ov.parameters.size()
                << " skipped=" << ov.skipped.size() << "\n";
      for (const auto& p : ov.parameters) std::cout << decode_pretty(p) << "\n";
      for (const auto& s : ov.skipped) std::cout << "skipped id=" << s.parameter_id << " reason=" << s.reason << "\n";
    } else {
      std::cout << ansi.bold("Fireplace: " + ov.fire.friendly_name) << " (" << ov.fire.fire_id << ")\n";
      std::cout << "Connection: " << connection_state_label(ov.fire.connection_state) << "\n";
      if (ov.parameters.empty()) {
        std::cout << "\nNo parameters returned (fireplace may be offline).\n";
      } else {
        std::cout << "\n" << ov.parameters.size() << " parameter(s) reported:\n";
        for (const auto& p : ov.parameters) std::cout << "\n" << describe(p);
      }
      if (!ov.skipped.empty()) {
        std::cout << "\n" << ansi.red(std::to_string(ov.skipped.size()) + " entry(ies) skipped:") << "\n";
        for (const auto& s : ov.skipped) std::cout << "  [" << s.parameter_id << "] " << s.reason << "\n";
      }
    }
    return EXIT_OK;
  }

  // ---- fires ----
  if (*fires) {
    std::string text;
    if (!read_text(opt_file, text)) return fail(EXIT_IO, "io_error:read " + opt_file);
    std::vector<Fire> list;
    std::string err;
    if (!parse_fire_list(text, list, err)) return fail(EXIT_USAGE, err);

    if (opt_format == "json") {
      json arr = json::array();
      for (const auto& f : list) arr.push_back(to_json(f));
      std::cout << arr.dump(2) << "\n";
    } else if (opt_format == "kv") {
      for (const auto& f : list) {
        std::cout << "fire_id=" << f.fire_id
                  << " connection=" << static_cast<unsigned>(f.connection_state) << "\n";
      }
    } else if (list.empty()) {
      std::cout << "No fireplaces registered to this account.\n";
    } else {
      std::cout << "Found " << list.size() << " fireplace(s):\n";
      size_t idx = 1;
      for (const auto& f : list) {
        std::cout << "\n" << ansi.bold("Fireplace #" + std::to_string(idx++)) << "\n" << describe(f);
      }
    }
    return EXIT_OK;
  }

  // ---- set / on / off ----
  if (*set || *on || *off) {
    FireOverview ov;
    if (int rc = load_overview(opt_file, ov)) return rc;
    const std::string fire_id = resolve_fire_id(opt_fire_id, cfg, ov);

    std::vector<Parameter> params;
    if (*set) {
      Parameter p;
      std::string err;
      if (!apply_setting(opt_setting, opt_setting_value, ov.parameters, defaults, p, err)) {
        return fail(EXIT_USAGE, err);
      }
      params.push_back(p);
    } else if (*on) {
      params = make_turn_on(ov.parameters, defaults);
    } else {
      params = make_turn_off(ov.parameters, defaults);
    }
    return emit_write(fire_id, params);
  }

  // ---- config ----
  if (*cfg_cmd) {
    const bool changing = set_fire->count() || set_temp->count() || set_lvl->count();
    if (changing) {
      if (set_fire->count()) cfg.fire_id = opt_set_fire_id;
      if (set_temp->count()) cfg.default_temperature = opt_set_default_temp;
      if (set_lvl->count())  cfg.log_level = opt_set_log_level;
      std::string err;
      if (!save_config(config_path, cfg, err)) return fail(EXIT_IO, err);
    }
    std::cout << ansi.dim("config: " + config_path.string()) << "\n";
    std::cout << config_to_json(cfg).dump(2) << "\n";
    return EXIT_OK;
  }

  return fail(EXIT_USAGE, "no_subcommand");
}
