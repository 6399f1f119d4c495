#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "enginewire/core/transport/error.hpp"
#include "enginewire/core/transport/options.hpp"
#include "enginewire/core/transport/url.hpp"
#include "enginewire/core/transport/websocket/frame.hpp"
#include "enginewire/core/transport/telemetry/websocket.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast)
================================================================================

Satisfies transport::WebSocketConcept on top of Boost.Beast / Boost.Asio with
OpenSSL for wss://.

Design highlights:
  • Single-connection transport primitive: no retries, no reconnection logic,
    no Engine.IO knowledge. Policy lives in transport::Connection.
  • Each instance owns an io_context driven by one internal I/O thread. All
    Beast operations run on that thread; the public methods hand work over
    and wait for its completion, which makes them safe to call from the
    Connection reader, the watchdog and caller threads at the same time.
  • connect() is bounded by one time budget covering name resolution, TCP
    connect, TLS handshake (with SNI and host name verification) and the
    HTTP upgrade.
  • Received messages are queued by the I/O thread and handed out by the
    blocking read(). close() unblocks it immediately.
  • write() waits at most the write timeout and fails fast once the I/O
    thread is gone.
  • Failure-first signaling: Beast / Asio error codes are mapped onto
    transport::Error where they occur and logged with their message.
================================================================================
*/

namespace enginewire::core::transport::beast {

// Used when Options::dial_timeout is zero
inline constexpr auto DEFAULT_HANDSHAKE_TIMEOUT = std::chrono::milliseconds(30 * 1000);

// Upper bound for one write() to be taken by the socket
inline constexpr auto DEFAULT_WRITE_TIMEOUT = std::chrono::milliseconds(30 * 1000);

inline constexpr std::string_view USER_AGENT = "enginewire/1.0";

class WebSocket {
    using tcp_stream   = boost::beast::tcp_stream;
    using plain_stream = boost::beast::websocket::stream<tcp_stream>;
    using tls_stream   = boost::beast::websocket::stream<boost::beast::ssl_stream<tcp_stream>>;

    struct DialRequest;

public:
    explicit WebSocket(telemetry::WebSocket& telemetry,
                       std::chrono::milliseconds write_timeout = DEFAULT_WRITE_TIMEOUT);
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    Error connect(const ParsedUrl& url, const Headers& headers, std::chrono::milliseconds timeout) noexcept;

    // Blocks until a complete message is available or the transport ends
    [[nodiscard]]
    Error read(websocket::Frame& out) noexcept;

    // Blocks until the message is handed to the socket. Closes the transport
    // and returns Error::Timeout when that takes longer than the write timeout.
    [[nodiscard]]
    Error write(websocket::FrameKind kind, std::string_view payload) noexcept;

    // Idempotent, callable from any thread
    void close() noexcept;

private:
    // --- I/O thread side ---------------------------------------------------
    void start_dial_(std::shared_ptr<DialRequest> req);

    template<class Stream>
    void on_resolved_(Stream& ws, std::shared_ptr<DialRequest> req,
                      const boost::asio::ip::tcp::resolver::results_type& results);

    template<class Stream>
    void upgrade_(Stream& ws, std::shared_ptr<DialRequest> req);

    template<class Stream>
    void read_next_(Stream& ws);

    void finish_reads_(Error error);

    template<class Fn>
    void with_stream_(Fn&& fn);

private:
    telemetry::WebSocket& telemetry_;
    const std::chrono::milliseconds write_timeout_;

    boost::asio::io_context ioc_;
    boost::asio::ssl::context tls_ctx_;
    boost::asio::ip::tcp::resolver resolver_;
    std::unique_ptr<plain_stream> plain_;   // ws://  (I/O thread only)
    std::unique_ptr<tls_stream> tls_;       // wss:// (I/O thread only)
    boost::beast::flat_buffer rx_buffer_;   // I/O thread only

    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> io_running_{true};    // cleared when the I/O thread exits

    // Received messages (I/O thread -> reader)
    std::mutex rx_mutex_;
    std::condition_variable rx_cv_;
    std::deque<websocket::Frame> rx_queue_;
    Error rx_error_{Error::None};

    // One outstanding write at a time
    std::mutex tx_mutex_;

    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread io_thread_;
};

} // namespace enginewire::core::transport::beast
