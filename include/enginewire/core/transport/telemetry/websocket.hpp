#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace enginewire::core::transport::telemetry {

// ============================================================================
// WebSocket Telemetry
//
// Transport-level observability contract shared by all WebSocket backends.
// Captures ONLY mechanical socket behavior (frames, bytes, failures).
// Engine.IO semantics live in telemetry::Connection.
// ============================================================================

struct WebSocket final {
    // ---------------------------------------------------------------------
    // Throughput (cumulative, monotonic)
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 bytes_rx_total;
    lcr::metrics::atomic::counter64 bytes_tx_total;

    lcr::metrics::atomic::counter64 text_frames_rx_total;
    lcr::metrics::atomic::counter64 binary_frames_rx_total;
    lcr::metrics::atomic::counter64 frames_tx_total;

    // ---------------------------------------------------------------------
    // Errors & lifecycle
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter32 connect_errors_total;
    lcr::metrics::atomic::counter32 receive_errors_total;
    lcr::metrics::atomic::counter32 send_errors_total;
    lcr::metrics::atomic::counter32 close_events_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(WebSocket& other) const noexcept {
        bytes_rx_total.copy_to(other.bytes_rx_total);
        bytes_tx_total.copy_to(other.bytes_tx_total);
        text_frames_rx_total.copy_to(other.text_frames_rx_total);
        binary_frames_rx_total.copy_to(other.binary_frames_rx_total);
        frames_tx_total.copy_to(other.frames_tx_total);

        connect_errors_total.copy_to(other.connect_errors_total);
        receive_errors_total.copy_to(other.receive_errors_total);
        send_errors_total.copy_to(other.send_errors_total);
        close_events_total.copy_to(other.close_events_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== WebSocket Telemetry ===\n";
        // ---------------------------------------------------------------------
        // Traffic (cumulative)
        // ---------------------------------------------------------------------
        os << "Traffic\n";
        os << "  RX bytes:         " << lcr::format_number_exact(bytes_rx_total.load()) << '\n';
        os << "  TX bytes:         " << lcr::format_number_exact(bytes_tx_total.load()) << '\n';
        os << "  RX text frames:   " << lcr::format_number_exact(text_frames_rx_total.load()) << '\n';
        os << "  RX binary frames: " << lcr::format_number_exact(binary_frames_rx_total.load()) << '\n';
        os << "  TX frames:        " << lcr::format_number_exact(frames_tx_total.load()) << '\n';

        // ---------------------------------------------------------------------
        // Errors & lifecycle
        // ---------------------------------------------------------------------
        os << "\nErrors / lifecycle\n";
        os << "  Connect errors:   " << lcr::format_number_exact(connect_errors_total.load()) << '\n';
        os << "  Receive errors:   " << lcr::format_number_exact(receive_errors_total.load()) << '\n';
        os << "  Send errors   :   " << lcr::format_number_exact(send_errors_total.load()) << '\n';
        os << "  Close events  :   " << lcr::format_number_exact(close_events_total.load()) << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants (safe, non-fragile)
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<WebSocket>, "telemetry::WebSocket must be standard layout");
static_assert(!std::is_polymorphic_v<WebSocket>, "telemetry::WebSocket must not be polymorphic");

} // namespace enginewire::core::transport::telemetry
