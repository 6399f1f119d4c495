#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <iterator>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "enginewire/core/context.hpp"
#include "enginewire/core/event/handler_list.hpp"
#include "enginewire/core/protocol/codec.hpp"
#include "enginewire/core/protocol/handshake.hpp"
#include "enginewire/core/protocol/packet.hpp"
#include "enginewire/core/telemetry.hpp"
#include "enginewire/core/transport/backoff.hpp"
#include "enginewire/core/transport/connection/dial_error.hpp"
#include "enginewire/core/transport/connection/reconnect_scheduler.hpp"
#include "enginewire/core/transport/connection/watchdog.hpp"
#include "enginewire/core/transport/error.hpp"
#include "enginewire/core/transport/options.hpp"
#include "enginewire/core/transport/state.hpp"
#include "enginewire/core/transport/telemetry/connection.hpp"
#include "enginewire/core/transport/url.hpp"
#include "enginewire/core/transport/websocket/frame.hpp"
#include "enginewire/core/transport/websocket_concept.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"


namespace enginewire::core::transport {

/*
===============================================================================
 enginewire::core::transport::Connection
===============================================================================

Engine.IO (protocol revision 4) client endpoint over a WebSocket transport
conforming to transport::WebSocketConcept.

A Connection represents a *logical* endpoint whose identity remains stable
across physical reconnections. Each physical attempt gets a fresh transport
instance, a fresh attempt Context and a new epoch.

-------------------------------------------------------------------------------
 Lifecycle
-------------------------------------------------------------------------------
  dial()          Closed -> Opening (compare-and-swap), transport connect.
  OPEN packet     Opening -> Connected, outbound buffer flushed FIFO.
  teardown        any -> Closed (read error, CLOSE packet, ping timeout,
                  protocol violation, write failure).
  reconnection    scheduled after a teardown with an error, unless close()
                  was requested. Delay grows 1 s, 2 s, 4 s ... capped, and
                  resets on every successful dial.

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
Per physical attempt:
  - reader thread    sole consumer of frames, delivers events in frame order
  - watchdog thread  idle until the handshake, then closes the attempt with
                     Error::PingTimeout when no frame arrives within
                     pingInterval + pingTimeout

Per Connection:
  - one ReconnectScheduler worker thread running redial attempts

A single std::shared_mutex guards sid, timing, the outbound buffer, the
transport handle, contexts, epoch and backoff. Status is an atomic. Every
activity carries the epoch it was started for and re-checks it under the
lock before tearing anything down: a late teardown of a retired attempt is a
no-op.

Events are fired outside the lock, so listeners may call any public method,
including dial() from a disconnect listener and close() from anywhere.

-------------------------------------------------------------------------------
 Notes
-------------------------------------------------------------------------------
- close() is graceful: a CLOSE packet is sent (or buffered while Opening) and
  the teardown happens when the peer drops the transport, or at the latest
  pingTimeout after close() (Error::None). Frames received meanwhile no
  longer extend the watchdog.
- Packets emitted after close() are buffered and delivered at the next
  explicit dial() handshake. Buffered CLOSE and PONG packets are dropped when
  a new attempt starts: they belong to the session that queued them.
- No event and no reconnection is produced once the destructor has started.
===============================================================================
*/

template<transport::WebSocketConcept WS>
class Connection {
public:
    using ConnectHandler    = event::HandlerList<>::Handler;
    using DisconnectHandler = event::HandlerList<Error>::Handler;
    using DialErrorHandler  = event::HandlerList<connection::DialErrorContext&>::Handler;
    using PayloadHandler    = event::HandlerList<std::string_view>::Handler;

    explicit Connection(Options options)
        : Connection(std::move(options), own_telemetry_)
    {}

    Connection(Options options, telemetry::Connection& telemetry)
        : options_(std::move(options))
        , url_(build_url(options_))
        , telemetry_(telemetry)
        , root_(Context::make())
        , lineage_(root_)
        , backoff_(options_.reconnect_base_delay, options_.reconnect_max_delay)
    {}

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Force-closes the transport and joins every thread.
    // No events and no reconnection after this point.
    ~Connection() {
        destroying_.store(true, std::memory_order_release);
        closing_.store(true, std::memory_order_release);
        abort_transports_();
        scheduler_.stop();
        abort_transports_();   // a redial may have completed meanwhile
        reap_workers_(true);
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Opens a new physical connection governed by a fresh root context owned
    // by this Connection.
    [[nodiscard]]
    inline Error dial() {
        return dial(nullptr);
    }

    // Opens a new physical connection. `parent` governs the whole
    // reconnection lineage: once it is cancelled no further redial happens.
    [[nodiscard]]
    Error dial(Context::Ptr parent) {
        EW_TL1( telemetry_.dial_calls_total.inc() );
        Status expected = Status::Closed;
        if (!status_.compare_exchange_strong(expected, Status::Opening, std::memory_order_acq_rel)) {
            EW_WARN("[CONN] dial() called while " << to_string(expected) << ". Ignoring.");
            EW_TL1( telemetry_.dial_rejected_total.inc() );
            return Error::AlreadyConnected;
        }
        EW_DEBUG("[CONN] Dialing " << url_);
        closing_.store(false, std::memory_order_release);
        scheduler_.cancel();   // explicit intent overrides a pending retry
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            lineage_ = parent ? std::move(parent) : root_;
        }
        const Error err = open_attempt_(false);
        if (err != Error::None) {
            status_.store(Status::Closed, std::memory_order_release);
            EW_ERROR("[CONN] Dial to " << url_ << " failed (" << to_string(err) << ")");
            connection::DialErrorContext ctx(-1, err);
            if (!destroying_.load(std::memory_order_acquire)) {
                dial_error_.call(ctx);
            }
            return err;
        }
        return Error::None;
    }

    // Graceful shutdown request. Cancels a pending reconnection and sends a
    // CLOSE packet; no reconnection follows the resulting teardown.
    void close() {
        EW_TL1( telemetry_.close_calls_total.inc() );
        scheduler_.cancel();
        closing_.store(true, std::memory_order_release);
        const Status status = status_.load(std::memory_order_acquire);
        if (status == Status::Closed) {
            return;
        }
        EW_INFO("[CONN] Closing connection to " << url_ << " (" << to_string(status) << ")");
        send_(protocol::Packet{protocol::PacketType::Close, {}}, true);
        seal_watchdog_();
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------

    // MESSAGE packet, written now when Connected, buffered otherwise
    inline void emit(std::string_view payload) {
        send_(protocol::Packet{protocol::PacketType::Message, std::string(payload)}, false);
    }

    // BINARY packet (binary WebSocket frame)
    inline void emit_binary(std::string_view payload) {
        send_(protocol::Packet{protocol::PacketType::Binary, std::string(payload)}, false);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Status status() const noexcept {
        return status_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline bool connected() const noexcept {
        return status() == Status::Connected;
    }

    // Session id of the current handshake, empty before it
    [[nodiscard]]
    std::string id() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return sid_;
    }

    [[nodiscard]]
    inline const std::string& url() const noexcept {
        return url_;
    }

    [[nodiscard]]
    inline const Options& options() const noexcept {
        return options_;
    }

    // Context of the current physical attempt (nullptr before the first dial)
    [[nodiscard]]
    Context::Ptr context() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return ctx_;
    }

    [[nodiscard]]
    std::uint64_t epoch() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return epoch_;
    }

    [[nodiscard]]
    std::chrono::milliseconds ping_interval() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return ping_interval_;
    }

    [[nodiscard]]
    std::chrono::milliseconds ping_timeout() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return ping_timeout_;
    }

    [[nodiscard]]
    std::int64_t max_payload() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return max_payload_;
    }

    // Packets waiting for the next handshake
    [[nodiscard]]
    std::size_t buffered() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return outbound_.size();
    }

    [[nodiscard]]
    inline bool reconnect_pending() const {
        return scheduler_.pending();
    }

    [[nodiscard]]
    inline const telemetry::Connection& telemetry() const noexcept {
        return telemetry_;
    }

    // -------------------------------------------------------------------------
    // Listener registration (on_* persistent, once_* one-shot)
    // -------------------------------------------------------------------------

    // Handshake completed (status is Connected, buffer flushed)
    void on_connect(ConnectHandler h)           { connect_.on(std::move(h)); }
    void once_connect(ConnectHandler h)         { connect_.once(std::move(h)); }

    // Attempt torn down; Error::None for a CLOSE packet from the peer
    void on_disconnect(DisconnectHandler h)     { disconnect_.on(std::move(h)); }
    void once_disconnect(DisconnectHandler h)   { disconnect_.once(std::move(h)); }

    // Transport failed to open (count -1 for dial(), 1.. for retries)
    void on_dial_error(DialErrorHandler h)      { dial_error_.on(std::move(h)); }
    void once_dial_error(DialErrorHandler h)    { dial_error_.once(std::move(h)); }

    // Automatic retry opened the transport again
    void on_reconnect(ConnectHandler h)         { reconnect_.on(std::move(h)); }
    void once_reconnect(ConnectHandler h)       { reconnect_.once(std::move(h)); }

    void on_pong(PayloadHandler h)              { pong_.on(std::move(h)); }
    void once_pong(PayloadHandler h)            { pong_.once(std::move(h)); }

    void on_binary(PayloadHandler h)            { binary_.on(std::move(h)); }
    void once_binary(PayloadHandler h)          { binary_.once(std::move(h)); }

    void on_message(PayloadHandler h)           { message_.on(std::move(h)); }
    void once_message(PayloadHandler h)         { message_.once(std::move(h)); }

    // Raw text frames as received, before decoding
    void on_receive(PayloadHandler h)           { receive_.on(std::move(h)); }
    void once_receive(PayloadHandler h)         { receive_.once(std::move(h)); }

    // Serialized text frames, after they were written
    void on_send(PayloadHandler h)              { send_event_.on(std::move(h)); }
    void once_send(PayloadHandler h)            { send_event_.once(std::move(h)); }

#ifdef EW_UNIT_TEST
public:
    // Transport of the current attempt
    std::shared_ptr<WS> ws() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return ws_;
    }

    // Next reconnection delay the backoff would hand out
    std::chrono::milliseconds next_reconnect_delay() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return backoff_.current();
    }

    // Simulates a teardown request racing with others
    void force_on_close(std::uint64_t epoch, Error err) {
        on_close_(epoch, err);
    }
#endif // EW_UNIT_TEST

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    // -------------------------------------------------------------------------
    // Attempt management
    // -------------------------------------------------------------------------

    // Opens a transport and installs it as the current attempt.
    // Caller owns the Opening status. A retry is abandoned when close() was
    // requested while it was connecting.
    [[nodiscard]]
    Error open_attempt_(bool retry) {
        ParsedUrl target;
        if (const Error err = parse_url(url_, target); err != Error::None) {
            EW_ERROR("[CONN] Invalid URL: " << url_);
            return err;
        }
        Context::Ptr lineage;
        std::size_t dropped = 0;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            lineage = lineage_;
            dropped = std::erase_if(outbound_, [](const protocol::Packet& pkt) {
                return pkt.type == protocol::PacketType::Close || pkt.type == protocol::PacketType::Pong;
            });
        }
        if (dropped > 0) {
            EW_DEBUG("[CONN] Dropped " << dropped << " stale control packet(s) of a previous session");
        }
        if (lineage->done()) {
            EW_DEBUG("[CONN] Lineage context already cancelled");
            return Error::Cancelled;
        }

        retire_attempt_();
        reap_workers_(false);

        std::shared_ptr<WS> ws;
        try {
            ws = std::make_shared<WS>(telemetry_.websocket);
        } catch (const std::exception& e) {
            EW_ERROR("[CONN] Could not create transport: " << e.what());
            return Error::TransportFailure;
        }
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            connecting_ = ws;
        }
        const Error err = ws->connect(target, options_.extra_headers, options_.dial_timeout);
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            connecting_.reset();
        }
        if (err != Error::None) {
            EW_TL1( telemetry_.transport_open_failure_total.inc() );
            ws->close();
            return err;
        }
        if (destroying_.load(std::memory_order_acquire)) {
            ws->close();
            return Error::Cancelled;
        }
        EW_TL1( telemetry_.transport_open_total.inc() );

        std::uint64_t epoch = 0;
        std::shared_ptr<connection::Watchdog> watchdog;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (retry && closing_.load(std::memory_order_acquire)) {
                epoch = 0;
            } else {
                epoch = ++epoch_;
                ctx_ = lineage->derive();
                ws_ = ws;
                watchdog_ = std::make_shared<connection::Watchdog>(ctx_);
                watchdog = watchdog_;
                sid_.clear();
                redial_count_ = 0;
                backoff_.reset();
            }
        }
        if (epoch == 0) {
            EW_DEBUG("[RETRY] close() requested while reconnecting, dropping the new transport");
            ws->close();
            return Error::Cancelled;
        }
        EW_DEBUG("[CONN] Transport open (epoch " << epoch << "), waiting for handshake");

        spawn_([this, epoch, ws, watchdog] { read_loop_(epoch, ws, watchdog); });
        spawn_([this, epoch, watchdog] {
            if (!watchdog->wait()) {
                return;
            }
            if (watchdog->sealed()) {
                EW_INFO("[WATCHDOG] Peer did not complete the close in time (epoch " << epoch << ")");
                on_close_(epoch, Error::None);
                return;
            }
            EW_WARN("[WATCHDOG] No frame within pingInterval + pingTimeout (epoch " << epoch << ")");
            EW_TL1( telemetry_.ping_timeouts_total.inc() );
            on_close_(epoch, Error::PingTimeout);
        });
        return Error::None;
    }

    // Releases the transport and context of the previous attempt
    void retire_attempt_() {
        std::shared_ptr<WS> ws;
        Context::Ptr ctx;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            ws = std::move(ws_);
            ctx = std::move(ctx_);
            watchdog_.reset();
        }
        if (ws) {
            ws->close();
        }
        if (ctx) {
            ctx->cancel(Error::Cancelled);
        }
    }

    // Redial on the scheduler thread
    void redial_() {
        if (destroying_.load(std::memory_order_acquire) || closing_.load(std::memory_order_acquire)) {
            return;
        }
        Status expected = Status::Closed;
        if (!status_.compare_exchange_strong(expected, Status::Opening, std::memory_order_acq_rel)) {
            EW_DEBUG("[RETRY] Connection is " << to_string(expected) << ", skipping reconnection");
            return;
        }
        if (closing_.load(std::memory_order_acquire)) {
            // close() ran between the check above and the claim
            status_.store(Status::Closed, std::memory_order_release);
            return;
        }
        EW_TL1( telemetry_.retry_attempts_total.inc() );
        EW_DEBUG("[RETRY] Reconnecting to " << url_);

        const Error err = open_attempt_(true);
        if (err == Error::None) {
            EW_TL1( telemetry_.retry_success_total.inc() );
            EW_INFO("[RETRY] Transport re-established with " << url_);
            if (!destroying_.load(std::memory_order_acquire)) {
                reconnect_.call();
            }
            return;
        }

        status_.store(Status::Closed, std::memory_order_release);
        if (closing_.load(std::memory_order_acquire)) {
            return;
        }
        EW_TL1( telemetry_.retry_failure_total.inc() );
        int count = 0;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            count = ++redial_count_;
        }
        EW_WARN("[RETRY] Reconnection attempt " << count << " failed (" << to_string(err) << ")");
        if (destroying_.load(std::memory_order_acquire)) {
            return;
        }
        connection::DialErrorContext ctx(count, err);
        dial_error_.call(ctx);
        if (ctx.reconnect_cancelled()) {
            EW_INFO("[RETRY] Reconnection cancelled by listener after " << count << " attempt(s)");
            return;
        }
        schedule_reconnect_();
    }

    void schedule_reconnect_() {
        if (destroying_.load(std::memory_order_acquire) || closing_.load(std::memory_order_acquire)) {
            return;
        }
        std::chrono::milliseconds delay{0};
        Context::Ptr lineage;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            delay = backoff_.next();
            lineage = lineage_;
        }
        EW_INFO("[RETRY] Next reconnection attempt in " << lcr::format_delay(delay));
        EW_TL1( telemetry_.retry_scheduled_total.inc() );
        scheduler_.schedule(delay, std::move(lineage), [this] { redial_(); });
    }

    // Tears down attempt `epoch` once. Later or stale calls are no-ops.
    void on_close_(std::uint64_t epoch, Error err) {
        std::shared_ptr<WS> ws;
        Context::Ptr ctx;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (epoch != epoch_ || torn_down_ == epoch) {
                return;
            }
            torn_down_ = epoch;
            status_.store(Status::Closed, std::memory_order_release);
            ws = ws_;
            ctx = ctx_;
        }
        EW_TL1( telemetry_.disconnect_events_total.inc() );
        if (ws) {
            ws->close();
        }
        if (ctx) {
            ctx->cancel(err);
        }
        if (err == Error::None) {
            EW_INFO("[CONN] Disconnected from " << url_ << " (" << describe(err) << ")");
        } else {
            EW_WARN("[CONN] Disconnected from " << url_ << " (" << describe(err) << ")");
        }
        if (destroying_.load(std::memory_order_acquire)) {
            return;
        }
        disconnect_.call(err);
        if (err != Error::None && !closing_.load(std::memory_order_acquire)) {
            schedule_reconnect_();
        }
    }

    // -------------------------------------------------------------------------
    // Reader loop
    // -------------------------------------------------------------------------

    void read_loop_(std::uint64_t epoch, std::shared_ptr<WS> ws, std::shared_ptr<connection::Watchdog> watchdog) {
        websocket::Frame frame;
        while (true) {
            if (const Error err = ws->read(frame); err != Error::None) {
                on_close_(epoch, err);
                return;
            }
            std::chrono::milliseconds window{0};
            {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                window = ping_interval_ + ping_timeout_;
            }
            watchdog->arm(window);

            if (frame.kind == websocket::FrameKind::Binary) {
                EW_TL1( telemetry_.messages_forwarded_total.inc() );
                binary_.call(std::string_view(frame.data));
                continue;
            }

            receive_.call(std::string_view(frame.data));
            protocol::Packet pkt;
            if (const auto r = protocol::decode(frame.data, pkt); r != protocol::parser::Result::Ok) {
                EW_WARN("[CODEC] Undecodable frame (" << protocol::parser::to_string(r) << "), " << frame.data.size() << " bytes");
                EW_TL1( telemetry_.protocol_errors_total.inc() );
                on_close_(epoch, Error::ProtocolError);
                return;
            }
            if (!dispatch_(epoch, pkt, *watchdog)) {
                return;
            }
        }
    }

    // Returns false when the packet ended the attempt
    bool dispatch_(std::uint64_t epoch, protocol::Packet& pkt, connection::Watchdog& watchdog) {
        EW_TRACE("[CONN] <- " << protocol::to_string(pkt.type) << " (" << pkt.body.size() << " bytes)");
        switch (pkt.type) {
        case protocol::PacketType::Binary:
            EW_TL1( telemetry_.messages_forwarded_total.inc() );
            binary_.call(std::string_view(pkt.body));
            return true;

        case protocol::PacketType::Open:
            return on_handshake_(epoch, pkt.body, watchdog);

        case protocol::PacketType::Close:
            on_close_(epoch, Error::None);
            return false;

        case protocol::PacketType::Ping:
            EW_TL1( telemetry_.pings_rx_total.inc() );
            send_(protocol::Packet{protocol::PacketType::Pong, std::move(pkt.body)}, true);
            return true;

        case protocol::PacketType::Pong:
            EW_TL1( telemetry_.pongs_rx_total.inc() );
            pong_.call(std::string_view(pkt.body));
            return true;

        case protocol::PacketType::Message:
            EW_TL1( telemetry_.messages_forwarded_total.inc() );
            message_.call(std::string_view(pkt.body));
            return true;

        case protocol::PacketType::Noop:
            return true;

        default:
            EW_WARN("[CONN] Unsupported packet type " << protocol::to_string(pkt.type));
            EW_TL1( telemetry_.protocol_errors_total.inc() );
            on_close_(epoch, Error::UnsupportedPacket);
            return false;
        }
    }

    bool on_handshake_(std::uint64_t epoch, const std::string& body, connection::Watchdog& watchdog) {
        const Status status = status_.load(std::memory_order_acquire);
        if (status != Status::Opening) {
            EW_WARN("[CONN] OPEN packet received while " << to_string(status));
            EW_TL1( telemetry_.protocol_errors_total.inc() );
            on_close_(epoch, Error::MultipleOpen);
            return false;
        }
        protocol::Handshake hs;
        if (const auto r = protocol::parse_handshake(body, hs); r != protocol::parser::Result::Ok) {
            EW_ERROR("[CONN] Malformed handshake (" << protocol::parser::to_string(r) << "): " << body);
            EW_TL1( telemetry_.protocol_errors_total.inc() );
            on_close_(epoch, Error::InvalidHandshake);
            return false;
        }

        std::vector<std::string> written;
        Error flush_error = Error::None;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (epoch != epoch_ || torn_down_ == epoch) {
                return false;
            }
            sid_ = hs.sid;
            ping_interval_ = hs.ping_interval;
            ping_timeout_ = hs.ping_timeout;
            max_payload_ = hs.max_payload;

            // Drain FIFO; a packet leaves the buffer only once written
            while (!outbound_.empty()) {
                const protocol::Packet& pkt = outbound_.front();
                if (pkt.type == protocol::PacketType::Binary) {
                    flush_error = ws_->write(websocket::FrameKind::Binary, pkt.body);
                    if (flush_error != Error::None) {
                        break;
                    }
                } else {
                    std::string wire = protocol::encode(pkt);
                    flush_error = ws_->write(websocket::FrameKind::Text, wire);
                    if (flush_error != Error::None) {
                        break;
                    }
                    written.push_back(std::move(wire));
                }
                outbound_.pop_front();
                EW_TL1( telemetry_.packets_flushed_total.inc() );
            }
            if (flush_error == Error::None) {
                status_.store(Status::Connected, std::memory_order_release);
            }
        }
        if (flush_error != Error::None) {
            EW_ERROR("[CONN] Flushing buffered packets failed (" << to_string(flush_error) << ")");
            on_close_(epoch, flush_error);
            return false;
        }
        for (const auto& wire : written) {
            send_event_.call(std::string_view(wire));
        }

        watchdog.start(hs.ping_interval + hs.ping_timeout);
        if (closing_.load(std::memory_order_acquire)) {
            watchdog.seal(hs.ping_timeout);   // close() was requested while Opening
        }
        EW_TL1( telemetry_.handshakes_total.inc() );
        EW_INFO("[CONN] Connected to " << url_ << " (sid " << hs.sid
                << ", ping " << hs.ping_interval.count() << "/" << hs.ping_timeout.count() << " ms)");
        connect_.call();
        return true;
    }

    // -------------------------------------------------------------------------
    // Send path
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool writable_(bool control) const noexcept {
        return status_.load(std::memory_order_acquire) == Status::Connected &&
               (control || !closing_.load(std::memory_order_acquire));
    }

    // Control packets (PONG, CLOSE) are written even while closing
    void send_(protocol::Packet pkt, bool control) {
        std::shared_ptr<WS> ws;
        std::uint64_t epoch = 0;
        if (writable_(control)) {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            if (writable_(control)) {
                ws = ws_;
                epoch = epoch_;
            }
        }
        if (!ws) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (writable_(control)) {
                ws = ws_;
                epoch = epoch_;
            } else {
                EW_TRACE("[CONN] Buffering " << protocol::to_string(pkt.type) << " (" << to_string(status_.load()) << ")");
                outbound_.push_back(std::move(pkt));
                EW_TL1( telemetry_.packets_buffered_total.inc() );
                return;
            }
        }
        write_packet_(epoch, ws, pkt);
    }

    // Bounds the wait for the peer to complete a requested close
    void seal_watchdog_() {
        std::shared_ptr<connection::Watchdog> watchdog;
        std::chrono::milliseconds window{0};
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            if (status_.load(std::memory_order_acquire) != Status::Connected) {
                return;   // Opening: sealed by the handshake, Closed: nothing to wait for
            }
            watchdog = watchdog_;
            window = ping_timeout_;
        }
        if (watchdog) {
            watchdog->seal(window);
        }
    }

    void write_packet_(std::uint64_t epoch, const std::shared_ptr<WS>& ws, const protocol::Packet& pkt) {
        Error err = Error::None;
        if (pkt.type == protocol::PacketType::Binary) {
            err = ws->write(websocket::FrameKind::Binary, pkt.body);
            if (err == Error::None) {
                EW_TL1( telemetry_.packets_sent_total.inc() );
                return;
            }
        } else {
            const std::string wire = protocol::encode(pkt);
            err = ws->write(websocket::FrameKind::Text, wire);
            if (err == Error::None) {
                EW_TL1( telemetry_.packets_sent_total.inc() );
                send_event_.call(std::string_view(wire));
                return;
            }
        }
        EW_WARN("[CONN] Writing " << protocol::to_string(pkt.type) << " failed (" << to_string(err) << ")");
        on_close_(epoch, err);
    }

    // -------------------------------------------------------------------------
    // Threads
    // -------------------------------------------------------------------------

    template<typename Fn>
    void spawn_(Fn&& fn) {
        auto finished = std::make_shared<std::atomic<bool>>(false);
        std::thread thread([fn = std::forward<Fn>(fn), finished]() mutable {
            fn();
            finished->store(true, std::memory_order_release);
        });
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(Worker{std::move(thread), std::move(finished)});
    }

    // Joins finished attempt threads (all of them when `all`)
    void reap_workers_(bool all) {
        std::vector<Worker> done;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            auto it = std::stable_partition(workers_.begin(), workers_.end(), [all](const Worker& w) {
                return !(all || w.finished->load(std::memory_order_acquire));
            });
            std::move(it, workers_.end(), std::back_inserter(done));
            workers_.erase(it, workers_.end());
        }
        for (auto& w : done) {
            if (w.thread.get_id() == std::this_thread::get_id()) {
                w.thread.detach();
            } else if (w.thread.joinable()) {
                w.thread.join();
            }
        }
    }

    // Closes the current and the in-flight transport, cancels the attempt
    void abort_transports_() {
        std::shared_ptr<WS> ws;
        std::shared_ptr<WS> connecting;
        Context::Ptr ctx;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            ws = ws_;
            connecting = connecting_;
            ctx = ctx_;
        }
        if (connecting) {
            connecting->close();
        }
        if (ws) {
            ws->close();
        }
        if (ctx) {
            ctx->cancel(Error::LocalShutdown);
        }
    }

private:
    telemetry::Connection own_telemetry_;           // used when no external telemetry is given

    const Options options_;
    const std::string url_;
    telemetry::Connection& telemetry_;              // Telemetry reference (not owned)

    std::atomic<Status> status_{Status::Closed};
    std::atomic<bool> closing_{false};              // close() requested, cleared by dial()
    std::atomic<bool> destroying_{false};

    // --- guarded by mutex_ ---------------------------------------------------
    mutable std::shared_mutex mutex_;
    std::string sid_;
    std::chrono::milliseconds ping_interval_{0};
    std::chrono::milliseconds ping_timeout_{0};
    std::int64_t max_payload_{0};
    std::deque<protocol::Packet> outbound_;
    std::shared_ptr<WS> ws_;                        // transport of the current attempt
    std::shared_ptr<WS> connecting_;                // transport being dialed
    Context::Ptr root_;                             // lineage used by dial()
    Context::Ptr lineage_;
    Context::Ptr ctx_;                              // current attempt
    std::shared_ptr<connection::Watchdog> watchdog_;  // of the current attempt
    std::uint64_t epoch_{0};
    std::uint64_t torn_down_{0};                    // last epoch passed through on_close_
    int redial_count_{0};
    Backoff backoff_;

    // --- listeners -----------------------------------------------------------
    event::HandlerList<> connect_;
    event::HandlerList<Error> disconnect_;
    event::HandlerList<connection::DialErrorContext&> dial_error_;
    event::HandlerList<> reconnect_;
    event::HandlerList<std::string_view> pong_;
    event::HandlerList<std::string_view> binary_;
    event::HandlerList<std::string_view> message_;
    event::HandlerList<std::string_view> receive_;
    event::HandlerList<std::string_view> send_event_;

    // --- threads -------------------------------------------------------------
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
    connection::ReconnectScheduler scheduler_;
};

} // namespace enginewire::core::transport
