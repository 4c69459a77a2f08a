// -----------------------------------------------------------------------------
// @file envelope.cpp
// @brief nlohmann::json <-> flamewire types for the relay's overview and write bodies.
//
// nlohmann throws on malformed text and on type-mismatched get<>(); every public
// function here catches json::exception and turns it into a reason string.
// -----------------------------------------------------------------------------
#include "flamewire/envelope.hpp"
#include "flamewire/codec.hpp"
#include "flamewire/log.hpp"
#include "flamewire/transport_encoding.hpp"
#include "flamewire/wire.hpp"

using nlohmann::json;

namespace flamewire {

// ---------- small field readers (missing or wrong type -> default) ----------

static std::string str_or(const json& j, const char* key, const std::string& def) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return def;
    return it->get<std::string>();
}

static bool bool_or(const json& j, const char* key, bool def) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) return def;
    return it->get<bool>();
}

static long long_or(const json& j, const char* key, long def) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return def;
    return it->get<long>();
}

static bool parse_fire(const json& j, Fire& out, std::string& err) {
    if (!j.is_object()) { err = "bad_field:fire"; return false; }

    auto id = j.find("FireId");
    if (id == j.end() || !id->is_string()) { err = "missing_field:FireId"; return false; }

    out.fire_id          = id->get<std::string>();
    out.friendly_name    = str_or(j, "FriendlyName", out.fire_id);
    out.brand            = str_or(j, "Brand", "");
    out.product_type     = str_or(j, "ProductType", "");
    out.product_model    = str_or(j, "ProductModel", "");
    out.item_code        = str_or(j, "ItemCode", "");
    out.connection_state = static_cast<ConnectionState>(long_or(j, "IoTConnectionState", 0));
    out.with_heat        = bool_or(j, "WithHeat", false);
    out.is_iot_fire      = bool_or(j, "IsIotFire", false);
    return true;
}

// =============================================================================
// Inbound
// =============================================================================

bool decode_entry(const json& entry, Parameter& out, long& parameter_id, std::string& reason) {
    parameter_id = -1;
    if (!entry.is_object()) { reason = "bad_entry"; return false; }

    auto id = entry.find("ParameterId");
    if (id == entry.end() || !id->is_number_integer()) {
        reason = "missing_field:ParameterId";
        return false;
    }
    parameter_id = id->get<long>();
    if (parameter_id < 0 || parameter_id > 0xFFFF) {
        reason = "bad_field:ParameterId";
        return false;
    }

    auto value = entry.find("Value");
    if (value == entry.end() || !value->is_string()) {
        reason = "missing_field:Value";
        return false;
    }

    std::vector<uint8_t> frame;
    if (!base64_decode(value->get<std::string>(), frame)) {
        reason = "bad_base64";
        return false;
    }

    // The envelope id wins; a disagreeing frame header is only reported.
    uint16_t header_id  = 0;
    uint8_t  header_len = 0;
    if (read_header(frame.data(), frame.size(), header_id, header_len) && header_id != parameter_id) {
        log::Line(log::Level::Warn, "header_mismatch").kv("id", parameter_id).kv("header_id", header_id);
    }

    ProtocolError perr;
    if (!decode_parameter(static_cast<uint16_t>(parameter_id), frame, out, perr)) {
        reason = perr.to_string();
        return false;
    }
    return true;
}

bool parse_overview(const std::string& json_text, FireOverview& out, std::string& err) {
    out = FireOverview{};
    try {
        const json doc = json::parse(json_text);
        if (!doc.is_object()) { err = "bad_field:overview"; return false; }

        // Full response wraps the overview; tools often save the inner object only.
        auto wrapped = doc.find("WifiFireOverview");
        const json& wifi = (wrapped != doc.end()) ? *wrapped : doc;

        if (!parse_fire(wifi, out.fire, err)) return false;

        auto params = wifi.find("Parameters");
        if (params == wifi.end() || params->is_null()) return true;
        if (!params->is_array()) { err = "bad_field:Parameters"; return false; }

        for (const auto& entry : *params) {
            Parameter p;
            long id = -1;
            std::string reason;
            if (decode_entry(entry, p, id, reason)) {
                log::Line(log::Level::Debug, "decode_ok").kv("id", id).kv("kind", parameter_name(static_cast<uint16_t>(id)));
                out.parameters.push_back(p);
            } else {
                log::Line(log::Level::Warn, "decode_skip").kv("id", id).kv("reason", reason);
                out.skipped.push_back(SkippedEntry{id, reason});
            }
        }
        return true;
    } catch (const json::exception& e) {
        err = std::string("bad_json:") + e.what();
        return false;
    }
}

bool parse_fire_list(const std::string& json_text, std::vector<Fire>& out, std::string& err) {
    out.clear();
    try {
        const json doc = json::parse(json_text);
        if (!doc.is_array()) { err = "bad_field:fires"; return false; }

        for (const auto& entry : doc) {
            Fire f;
            if (!parse_fire(entry, f, err)) {
                out.clear();
                return false;
            }
            out.push_back(f);
        }
        return true;
    } catch (const json::exception& e) {
        err = std::string("bad_json:") + e.what();
        return false;
    }
}

// =============================================================================
// Outbound
// =============================================================================

bool build_write_payload(const std::string& fire_id, const std::vector<Parameter>& params,
                         json& out, std::string& err) {
    if (fire_id.empty()) { err = "missing_field:FireId"; return false; }

    json wire = json::array();
    for (const auto& p : params) {
        std::vector<uint8_t> frame;
        ProtocolError perr;
        if (!encode_parameter(p, frame, perr)) {
            err = "encode_failed:" + perr.to_string();
            return false;
        }
        const uint16_t id = to_raw(parameter_id_of(p));
        log::Line(log::Level::Debug, "encode_ok").kv("id", id).kv("hex", to_hex(frame));
        wire.push_back({{"ParameterId", id}, {"Value", base64_encode(frame)}});
    }

    out = json::object();
    out["FireId"]     = fire_id;
    out["Parameters"] = wire;
    return true;
}

bool build_write_payload(const std::string& fire_id, const std::vector<Parameter>& params,
                         std::string& json_out, std::string& err) {
    json j;
    if (!build_write_payload(fire_id, params, j, err)) return false;
    json_out = j.dump();
    return true;
}

} // namespace flamewire
