/*
===============================================================================
WebSocketConcept (Blocking, Thread-Safe Writes)
===============================================================================

Defines the minimal transport contract required by Connection.

The WebSocket implementation:

  • Establishes the socket, the optional TLS session and the HTTP upgrade
    within a caller supplied time budget
  • Delivers complete messages one at a time through a blocking read()
  • Accepts writes from any thread while a read() is in flight
  • Is fully lifecycle-managed by Connection (one instance per attempt)

No callbacks.
No dynamic dispatch.

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

Reader thread:
  - Connection reader loop, the only caller of read()

Writer threads:
  - Caller threads (emit / close), the reader loop (PONG replies), and the
    handshake flush. write() serializes them internally.

close() may be called from any thread, more than once, and must unblock a
pending read() (which then returns an Error).

===============================================================================
*/
#pragma once

#include <chrono>
#include <string_view>
#include <concepts>

#include "enginewire/core/transport/error.hpp"
#include "enginewire/core/transport/options.hpp"
#include "enginewire/core/transport/url.hpp"
#include "enginewire/core/transport/websocket/frame.hpp"
#include "enginewire/core/transport/telemetry/websocket.hpp"


namespace enginewire::core::transport {

template<class WS>
concept WebSocketConcept =
    std::constructible_from<WS, telemetry::WebSocket&> &&
    requires(
        WS ws,
        const ParsedUrl& url,
        const Headers& headers,
        std::chrono::milliseconds timeout,
        websocket::Frame& frame,
        websocket::FrameKind kind,
        std::string_view payload
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(url, headers, timeout) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Receiving
    // ---------------------------------------------------------------------

    { ws.read(frame) } noexcept -> std::same_as<Error>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.write(kind, payload) } noexcept -> std::same_as<Error>;
};

} // namespace enginewire::core::transport
