#pragma once

#include <cstdint>
#include <string_view>


namespace enginewire::core::protocol::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ok             = 0,            // Parsed successfully
    InvalidJson    = 1,            // Structural failure
    InvalidSchema  = 2,            // Schema validation failure (missing required field, type mismatch, etc.)
    InvalidValue   = 3             // Field present but semantically invalid
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:             return "Ok";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        default:                     return "unknown";
    }
}

} // namespace enginewire::core::protocol::parser
