/**
 * @file envelope.hpp
 * @brief JSON envelope of the cloud relay: fire overviews in, write payloads out.
 *
 * The relay never sends raw frames. Each parameter arrives as
 * `{"ParameterId": 322, "Value": "<base64 frame>"}`, inside either a
 * `GetFireOverview` response or a `GetFires` list. This layer converts those into
 * flamewire types and back, using nlohmann::json.
 *
 * ### Inbound (parse_overview)
 * - Accepts `{"WifiFireOverview": {...}}` or the inner object directly.
 * - `FireId` is required. `FriendlyName` defaults to the FireId; other identity
 *   fields default to empty / 0 / false.
 * - Each parameter entry is base64-decoded and handed to the codec. An entry that
 *   fails (missing field, bad base64, ProtocolError) is logged at warn, recorded in
 *   `FireOverview::skipped`, and the rest of the batch continues.
 *
 * ### Outbound (build_write_payload)
 * @code
 *   {"FireId": "abc", "Parameters": [{"ParameterId": 321, "Value": "QQEDARYF"}]}
 * @endcode
 * Any encode failure (e.g. read_only) aborts the whole payload.
 *
 * Errors: `bool` + reason string, e.g. `bad_json:...`, `missing_field:FireId`,
 * `bad_field:Parameters`, `encode_failed:read_only:SoftwareVersion`.
 */

#ifndef FLAMEWIRE_ENVELOPE_HPP
#define FLAMEWIRE_ENVELOPE_HPP

#include "flamewire/parameter.hpp"

#include "nlohmann/json.hpp"

#include <stdint.h>
#include <string>
#include <vector>

namespace flamewire {

/// Cloud connectivity of a fireplace (`IoTConnectionState`).
enum class ConnectionState : uint8_t {
    Unknown          = 0,
    NotConnected     = 1,
    Connected        = 2,
    UpdatingFirmware = 3
};

/// Registration / identity of one fireplace.
struct Fire {
    std::string     fire_id;
    std::string     friendly_name;
    std::string     brand;
    std::string     product_type;
    std::string     product_model;
    std::string     item_code;
    ConnectionState connection_state = ConnectionState::Unknown;
    bool            with_heat        = false;
    bool            is_iot_fire      = false;
};

/// A parameter entry the batch decode dropped, and why.
struct SkippedEntry {
    long        parameter_id = -1;  ///< -1 when the entry had no usable ParameterId
    std::string reason;
};

struct FireOverview {
    Fire                      fire;
    std::vector<Parameter>    parameters;
    std::vector<SkippedEntry> skipped;
};

/**
 * @brief Decode one `{ParameterId, Value}` entry.
 * @param reason On failure: `missing_field:ParameterId`, `bad_base64`, or a ProtocolError reason.
 */
bool decode_entry(const nlohmann::json& entry, Parameter& out, long& parameter_id, std::string& reason);

bool parse_overview(const std::string& json_text, FireOverview& out, std::string& err);

/// Parse a `GetFires` response: a JSON array of fire objects.
bool parse_fire_list(const std::string& json_text, std::vector<Fire>& out, std::string& err);

/// Build the write payload as a JSON value.
bool build_write_payload(const std::string& fire_id, const std::vector<Parameter>& params,
                         nlohmann::json& out, std::string& err);

/// Same, serialized compactly (`dump()`).
bool build_write_payload(const std::string& fire_id, const std::vector<Parameter>& params,
                         std::string& json_out, std::string& err);

} // namespace flamewire

#endif // FLAMEWIRE_ENVELOPE_HPP
