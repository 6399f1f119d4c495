#pragma once

#include <cstdint>
#include <string>
#include <string_view>


namespace enginewire::core::transport::websocket {

// WebSocket data frame opcode as seen by the Connection
enum class FrameKind : uint8_t {
    Text,
    Binary
};

[[nodiscard]]
inline constexpr std::string_view to_string(FrameKind k) noexcept {
    switch (k) {
        case FrameKind::Text:   return "Text";
        case FrameKind::Binary: return "Binary";
        default:                return "Unknown";
    }
}

// One complete message read from the transport.
// The payload is owned by the frame; the reader loop moves it into events.
struct Frame {
    FrameKind kind = FrameKind::Text;
    std::string data;
};

} // namespace enginewire::core::transport::websocket
