#pragma once

#include <cstdint>
#include <string_view>


namespace enginewire::core::transport {

// ===============================================================
// CONNECTION STATUS ENUM
// ===============================================================
//
// Per physical attempt:  Closed -> Opening -> Connected -> Closed
//                        Closed -> Opening -> Closed
//
enum class Status : uint8_t {
    Closed,
    Opening,
    Connected
};

// ------------------------------------------------------------
// Status -> string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Closed:    return "Closed";
        case Status::Opening:   return "Opening";
        case Status::Connected: return "Connected";
        default:                return "Unknown";
    }
}

} // namespace enginewire::core::transport
