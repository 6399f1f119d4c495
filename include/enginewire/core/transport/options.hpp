/*
================================================================================
enginewire Connection Options
================================================================================

Caller-supplied configuration of a transport::Connection. Immutable once the
Connection is constructed.

  host          [<scheme>://]<host>[:<port>]. A "ws" or "http" scheme forces
                a plain connection, any other scheme forces TLS and overrides
                `secure`.
  path          Engine.IO endpoint, "/engine.io/" by default.
  extra_query   Additional query parameters. EIO and transport are always
                set by the library and replace caller values of the same key.
  extra_headers Sent with the WebSocket upgrade request.
  dial_timeout  Upper bound for one dial (resolve + connect + TLS + upgrade).
                Zero selects the transport default.

The two reconnect delays drive the exponential backoff of the reconnection
scheduler (base doubles per failed attempt, capped at max).
================================================================================
*/
#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>


namespace enginewire::core::transport {

// Engine.IO protocol revision spoken by this client
inline constexpr int PROTOCOL_VERSION = 4;

using Headers = std::vector<std::pair<std::string, std::string>>;
using Query   = std::vector<std::pair<std::string, std::string>>;

inline constexpr auto DEFAULT_RECONNECT_BASE_DELAY = std::chrono::milliseconds(1000);
inline constexpr auto DEFAULT_RECONNECT_MAX_DELAY  = std::chrono::milliseconds(5 * 60 * 1000);

struct Options {
    bool secure                                  = true;
    std::string host;
    std::string path                             = "/engine.io/";
    Query extra_query;
    Headers extra_headers;
    std::chrono::milliseconds dial_timeout{0};
    std::chrono::milliseconds reconnect_base_delay = DEFAULT_RECONNECT_BASE_DELAY;
    std::chrono::milliseconds reconnect_max_delay  = DEFAULT_RECONNECT_MAX_DELAY;
};

} // namespace enginewire::core::transport
