#pragma once

#include <cstdint>
#include <string>
#include <string_view>


namespace enginewire::core::protocol {

// ===============================================
// Engine.IO packet types (protocol revision 4)
// ===============================================
//
// The numeric value is the leading character of a text frame ('0'..'6').
// Binary is not a wire digit: it travels as a binary WebSocket frame, or as
// 'b' + base64 where only text is available.
enum class PacketType : std::uint8_t {
    Open    = 0,
    Close   = 1,
    Ping    = 2,
    Pong    = 3,
    Message = 4,
    Upgrade = 5,
    Noop    = 6,
    Binary  = 7
};

[[nodiscard]]
inline constexpr std::string_view to_string(PacketType t) noexcept {
    switch (t) {
        case PacketType::Open:    return "OPEN";
        case PacketType::Close:   return "CLOSE";
        case PacketType::Ping:    return "PING";
        case PacketType::Pong:    return "PONG";
        case PacketType::Message: return "MESSAGE";
        case PacketType::Upgrade: return "UPGRADE";
        case PacketType::Noop:    return "NOOP";
        case PacketType::Binary:  return "BINARY";
        default:                  return "UNKNOWN";
    }
}

struct Packet {
    PacketType type = PacketType::Noop;
    std::string body;
};

} // namespace enginewire::core::protocol
