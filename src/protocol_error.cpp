// -----------------------------------------------------------------------------
// @file protocol_error.cpp
// @brief Factories and reason-string rendering for ProtocolError.
// -----------------------------------------------------------------------------
#include "flamewire/protocol_error.hpp"
#include "flamewire/parameter_id.hpp"

#include <sstream>

namespace flamewire {

ProtocolError ProtocolError::insufficient_data(uint16_t id, size_t expected_len, size_t actual_len) {
    ProtocolError e;
    e.code         = ErrorCode::InsufficientData;
    e.parameter_id = id;
    e.expected     = expected_len;
    e.actual       = actual_len;
    return e;
}

ProtocolError ProtocolError::unknown_parameter(uint16_t id) {
    ProtocolError e;
    e.code         = ErrorCode::UnknownParameter;
    e.parameter_id = id;
    return e;
}

ProtocolError ProtocolError::read_only(uint16_t id) {
    ProtocolError e;
    e.code         = ErrorCode::ReadOnly;
    e.parameter_id = id;
    return e;
}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:             return "ok";
        case ErrorCode::InsufficientData: return "insufficient_data";
        case ErrorCode::UnknownParameter: return "unknown_parameter";
        case ErrorCode::ReadOnly:         return "read_only";
    }
    return "unknown_error";
}

std::string ProtocolError::to_string() const {
    std::ostringstream os;
    os << error_code_name(code);
    switch (code) {
        case ErrorCode::None:
            break;
        case ErrorCode::InsufficientData:
            os << ':' << parameter_name(parameter_id) << '(' << expected << '/' << actual << ')';
            break;
        case ErrorCode::UnknownParameter:
            // no kind name for an unknown id
            os << ':' << parameter_id;
            break;
        case ErrorCode::ReadOnly:
            os << ':' << parameter_name(parameter_id);
            break;
    }
    return os.str();
}

} // namespace flamewire
