#pragma once

#include <string_view>

namespace enginewire::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Error classification shared by the transport, the codec and the Connection
state machine.

Library-specific failures (Boost.Beast / Asio error codes, simdjson error
codes) are mapped onto this enum at the boundary where they occur; the
original detail is written to the log at that point.

Error::None doubles as the "graceful" cause: a Connection torn down with
Error::None (remote CLOSE packet) never schedules a reconnection, any other
value does unless the caller requested close().
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,        // Malformed or unsupported URL (scheme, host, port)
    InvalidState,      // Operation not allowed in the current transport state
    AlreadyConnected,  // dial() while Opening or Connected
    Cancelled,         // Context was cancelled by a local lifecycle decision

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,     // Transport closed by the local endpoint
    RemoteClosed,      // Remote endpoint closed the WebSocket

    // --- Transient / recoverable failures -----------------------------------
    Timeout,           // Dial or I/O deadline exceeded
    ConnectionFailed,  // DNS, TCP connect or routing failure
    HandshakeFailed,   // TLS or WebSocket upgrade rejected

    // --- Keepalive ----------------------------------------------------------
    PingTimeout,       // No frame within pingInterval + pingTimeout

    // --- Protocol violations ------------------------------------------------
    ProtocolError,     // Frame payload is not a valid Engine.IO packet
    MultipleOpen,      // OPEN received while not Opening
    UnsupportedPacket, // Packet type this client does not handle
    InvalidHandshake,  // OPEN body is not a usable handshake object

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure,
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::AlreadyConnected:  return "AlreadyConnected";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::PingTimeout:       return "PingTimeout";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::MultipleOpen:      return "MultipleOpen";
    case Error::UnsupportedPacket: return "UnsupportedPacket";
    case Error::InvalidHandshake:  return "InvalidHandshake";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

// Human readable description, used in disconnect logs
inline constexpr std::string_view describe(Error err) noexcept {
    switch (err) {
    case Error::None:              return "closed gracefully";
    case Error::AlreadyConnected:  return "Engine.IO: socket was already connected";
    case Error::PingTimeout:       return "Engine.IO: did not receive PING packet for a long time";
    case Error::MultipleOpen:      return "Engine.IO: socket was already opened";
    case Error::UnsupportedPacket: return "Engine.IO: unsupported packet type";
    case Error::InvalidHandshake:  return "Engine.IO: malformed OPEN handshake";
    case Error::ProtocolError:     return "Engine.IO: malformed packet";
    default:                       return to_string(err);
    }
}

} // namespace transport
} // namespace enginewire::core
