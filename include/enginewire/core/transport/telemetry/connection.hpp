#pragma once

#include <ostream>
#include <type_traits>

#include "enginewire/core/transport/telemetry/websocket.hpp"

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace enginewire::core::transport::telemetry {

// ============================================================================
// Connection Telemetry
//
// Observes connection-level state transitions and decisions of the Engine.IO
// state machine. Does NOT duplicate WebSocket telemetry.
// Mechanical facts only.
// ============================================================================

struct Connection final {
    // ---------------------------------------------------------------------
    // Lifecycle & state transitions
    // ---------------------------------------------------------------------

    // dial() invoked by user
    lcr::metrics::atomic::counter32 dial_calls_total;

    // Explicit dial() rejected because the connection was not Closed
    lcr::metrics::atomic::counter32 dial_rejected_total;

    // Transport opened (explicit dial or redial)
    lcr::metrics::atomic::counter32 transport_open_total;

    // Transport failed to open
    lcr::metrics::atomic::counter32 transport_open_failure_total;

    // OPEN handshake accepted (Opening -> Connected)
    lcr::metrics::atomic::counter32 handshakes_total;

    // Explicit close() invoked by user
    lcr::metrics::atomic::counter32 close_calls_total;

    // Attempt torn down (any cause)
    lcr::metrics::atomic::counter32 disconnect_events_total;

    // ---------------------------------------------------------------------
    // Keepalive
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 pings_rx_total;
    lcr::metrics::atomic::counter64 pongs_rx_total;
    lcr::metrics::atomic::counter32 ping_timeouts_total;

    // ---------------------------------------------------------------------
    // Retry mechanics (decisions, not timing)
    // ---------------------------------------------------------------------

    // Reconnection timer armed
    lcr::metrics::atomic::counter32 retry_scheduled_total;

    // Reconnect attempt initiated
    lcr::metrics::atomic::counter32 retry_attempts_total;

    // Reconnect succeeded
    lcr::metrics::atomic::counter32 retry_success_total;

    // Reconnect failed (attempted but did not connect)
    lcr::metrics::atomic::counter32 retry_failure_total;

    // ---------------------------------------------------------------------
    // Protocol
    // ---------------------------------------------------------------------

    // Frames that closed the attempt (undecodable, unsupported, bad OPEN)
    lcr::metrics::atomic::counter32 protocol_errors_total;

    // MESSAGE and BINARY packets forwarded to listeners
    lcr::metrics::atomic::counter64 messages_forwarded_total;

    // ---------------------------------------------------------------------
    // Send path
    // ---------------------------------------------------------------------

    // Packets written immediately
    lcr::metrics::atomic::counter64 packets_sent_total;

    // Packets appended to the outbound buffer
    lcr::metrics::atomic::counter64 packets_buffered_total;

    // Packets drained from the outbound buffer at handshake
    lcr::metrics::atomic::counter64 packets_flushed_total;

    // ---------------------------------------------------------------------
    // Sub-telemetry
    // ---------------------------------------------------------------------

    transport::telemetry::WebSocket websocket;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Connection& other) const noexcept {
        dial_calls_total.copy_to(other.dial_calls_total);
        dial_rejected_total.copy_to(other.dial_rejected_total);
        transport_open_total.copy_to(other.transport_open_total);
        transport_open_failure_total.copy_to(other.transport_open_failure_total);
        handshakes_total.copy_to(other.handshakes_total);
        close_calls_total.copy_to(other.close_calls_total);
        disconnect_events_total.copy_to(other.disconnect_events_total);

        pings_rx_total.copy_to(other.pings_rx_total);
        pongs_rx_total.copy_to(other.pongs_rx_total);
        ping_timeouts_total.copy_to(other.ping_timeouts_total);

        retry_scheduled_total.copy_to(other.retry_scheduled_total);
        retry_attempts_total.copy_to(other.retry_attempts_total);
        retry_success_total.copy_to(other.retry_success_total);
        retry_failure_total.copy_to(other.retry_failure_total);

        protocol_errors_total.copy_to(other.protocol_errors_total);
        messages_forwarded_total.copy_to(other.messages_forwarded_total);

        packets_sent_total.copy_to(other.packets_sent_total);
        packets_buffered_total.copy_to(other.packets_buffered_total);
        packets_flushed_total.copy_to(other.packets_flushed_total);

        // Sub-telemetry
        websocket.copy_to(other.websocket);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Connection Telemetry ===\n";

        os << "Lifecycle\n";
        os << "  Dial calls            : " << lcr::format_number_exact(dial_calls_total.load()) << '\n';
        os << "  Dial rejected         : " << lcr::format_number_exact(dial_rejected_total.load()) << '\n';
        os << "  Transport opened      : " << lcr::format_number_exact(transport_open_total.load()) << '\n';
        os << "  Transport open failed : " << lcr::format_number_exact(transport_open_failure_total.load()) << '\n';
        os << "  Handshakes            : " << lcr::format_number_exact(handshakes_total.load()) << '\n';
        os << "  Close calls           : " << lcr::format_number_exact(close_calls_total.load()) << '\n';
        os << "  Disconnect events     : " << lcr::format_number_exact(disconnect_events_total.load()) << '\n';

        os << "\nKeepalive\n";
        os << "  PING received         : " << lcr::format_number_exact(pings_rx_total.load()) << '\n';
        os << "  PONG received         : " << lcr::format_number_exact(pongs_rx_total.load()) << '\n';
        os << "  Ping timeouts         : " << lcr::format_number_exact(ping_timeouts_total.load()) << '\n';

        os << "\nRetry\n";
        os << "  Retry scheduled       : " << lcr::format_number_exact(retry_scheduled_total.load()) << '\n';
        os << "  Retry attempts        : " << lcr::format_number_exact(retry_attempts_total.load()) << '\n';
        os << "  Retry success         : " << lcr::format_number_exact(retry_success_total.load()) << '\n';
        os << "  Retry failure         : " << lcr::format_number_exact(retry_failure_total.load()) << '\n';

        os << "\nProtocol\n";
        os << "  Protocol errors       : " << lcr::format_number_exact(protocol_errors_total.load()) << '\n';
        os << "  Messages forwarded    : " << lcr::format_number_exact(messages_forwarded_total.load()) << '\n';

        os << "\nSend\n";
        os << "  Packets sent          : " << lcr::format_number_exact(packets_sent_total.load()) << '\n';
        os << "  Packets buffered      : " << lcr::format_number_exact(packets_buffered_total.load()) << '\n';
        os << "  Packets flushed       : " << lcr::format_number_exact(packets_flushed_total.load()) << '\n';

        websocket.debug_dump(os);
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Connection>, "telemetry::Connection must be standard layout");
static_assert(!std::is_polymorphic_v<Connection>, "telemetry::Connection must not be polymorphic");

} // namespace enginewire::core::transport::telemetry
