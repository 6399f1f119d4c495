#pragma once

/*
================================================================================
enginewire Core: Engine.IO Client Architecture
================================================================================

Entry point of the Engine.IO client core:

    enginewire::core::transport::ConnectionT

A thin, explicit composition of:
  - the Engine.IO connection state machine (transport::Connection)
  - a concrete WebSocket backend (Boost.Beast, plain and TLS)

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------

Threads per connection:

    [1] Reader thread       (one per physical attempt)
    [2] Watchdog thread     (one per physical attempt)
    [3] Scheduler thread    (one per Connection, runs redial attempts)
    [4] Transport I/O thread (one per WebSocket instance, owned by the backend)

and any number of caller threads invoking dial / emit / close.

Listener callbacks run on the reader thread (message, pong, binary, receive,
connect, disconnect), on the scheduler thread (reconnect, dial-error of a
retry) or on the calling thread (dial-error of dial(), send). They must not
block for long: the reader does not consume the next frame until every
listener of the current one returned.

-------------------------------------------------------------------------------
Summary
-------------------------------------------------------------------------------

    [Transport I/O]   recv -> queue
    [Reader]          queue -> decode -> dispatch -> listeners
    [Watchdog]        deadline -> PingTimeout teardown
    [Scheduler]       backoff delay -> redial

================================================================================
*/

#include "enginewire/core/transport/websocket_concept.hpp"
#include "enginewire/core/transport/beast/websocket.hpp"
#include "enginewire/core/transport/connection.hpp"


namespace enginewire::core::transport {

    using WebSocketT = beast::WebSocket;

    // Assert that WebSocketT conforms to transport::WebSocketConcept concept
    static_assert(WebSocketConcept<WebSocketT>);

    using ConnectionT = Connection<WebSocketT>;

} // namespace enginewire::core::transport
