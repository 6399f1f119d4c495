#pragma once

/*
===============================================================================
enginewire: Public API Entry Point
===============================================================================

Engine.IO (protocol revision 4) client over WebSocket:

    enginewire::Options opts;
    opts.host = "ws://localhost:3000";

    enginewire::Client client(opts);
    client.on_message([](std::string_view msg) { ... });
    if (client.dial() != enginewire::Error::None) { ... }
    client.emit("hello");

The connection reconnects on its own after unexpected failures until close()
is called, the dial context is cancelled, or a dial-error listener calls
cancel_reconnect().
===============================================================================
*/

#include <enginewire/client.hpp>
