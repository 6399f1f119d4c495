#include "enginewire/core/transport/beast/websocket.hpp"

#include <type_traits>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket/error.hpp>

#include <openssl/ssl.h>

#include "enginewire/core/telemetry.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"


namespace enginewire::core::transport::beast {

namespace net  = boost::asio;
namespace ssl  = boost::asio::ssl;
namespace bws  = boost::beast::websocket;
namespace http = boost::beast::http;
using tcp      = boost::asio::ip::tcp;
using error_code = boost::system::error_code;

namespace {

// Maps a Beast / Asio failure onto the transport classification.
// `fallback` is the stage-specific default (connect, handshake, I/O).
Error map_error(const error_code& ec, Error fallback) noexcept {
    if (ec == net::error::operation_aborted) {
        return Error::LocalShutdown;
    }
    if (ec == boost::beast::error::timeout) {
        return Error::Timeout;
    }
    if (ec == bws::error::closed ||
        ec == net::error::eof ||
        ec == net::error::connection_reset ||
        ec == net::error::broken_pipe ||
        ec == ssl::error::stream_truncated) {
        return Error::RemoteClosed;
    }
    return fallback;
}

// Host header for the upgrade request (IPv6 literals keep their brackets)
std::string host_header(const ParsedUrl& url) {
    std::string host = (url.host.find(':') != std::string::npos) ? "[" + url.host + "]" : url.host;
    return host + ':' + url.port;
}

} // namespace


// One connect() call, shared by the chain of completion handlers
struct WebSocket::DialRequest {
    ParsedUrl url;
    Headers headers;
    std::chrono::milliseconds timeout;
    std::promise<Error> done;
    bool completed = false;

    void complete(Error err) {
        if (!completed) {
            completed = true;
            done.set_value(err);
        }
    }
};


template<class Fn>
void WebSocket::with_stream_(Fn&& fn) {
    if (tls_) {
        fn(*tls_);
    } else if (plain_) {
        fn(*plain_);
    }
}


WebSocket::WebSocket(telemetry::WebSocket& telemetry, std::chrono::milliseconds write_timeout)
    : telemetry_(telemetry)
    , write_timeout_(write_timeout)
    , ioc_(1)
    , tls_ctx_(ssl::context::tls_client)
    , resolver_(ioc_)
    , work_(net::make_work_guard(ioc_))
{
    error_code ec;
    tls_ctx_.set_default_verify_paths(ec);
    if (ec) {
        EW_WARN("[WS] Could not load the default certificate store: " << ec.message());
    }
    tls_ctx_.set_verify_mode(ssl::verify_peer);

    io_thread_ = std::thread([this] {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            EW_ERROR("[WS] I/O thread terminated: " << e.what());
            finish_reads_(Error::TransportFailure);
        }
        io_running_.store(false, std::memory_order_release);
    });
}

WebSocket::~WebSocket() {
    close();
    work_.reset();
    ioc_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

// -----------------------------------------------------------------------------
// connect
// -----------------------------------------------------------------------------

Error WebSocket::connect(const ParsedUrl& url, const Headers& headers, std::chrono::milliseconds timeout) noexcept {
    if (closed_.load(std::memory_order_acquire)) {
        return Error::LocalShutdown;
    }
    if (connected_.load(std::memory_order_acquire)) {
        return Error::InvalidState;
    }
    if (timeout <= std::chrono::milliseconds::zero()) {
        timeout = DEFAULT_HANDSHAKE_TIMEOUT;
    }
    EW_DEBUG("[WS] Connecting to " << (url.secure ? "wss://" : "ws://") << host_header(url) << url.target
             << " (timeout " << lcr::format_delay(timeout) << ")");
    try {
        auto req = std::make_shared<DialRequest>();
        req->url = url;
        req->headers = headers;
        req->timeout = timeout;
        auto result = req->done.get_future();

        net::post(ioc_, [this, req] { start_dial_(req); });

        if (result.wait_for(timeout) != std::future_status::ready) {
            EW_WARN("[WS] Connect to " << host_header(url) << " timed out after " << lcr::format_delay(timeout));
            EW_TL1( telemetry_.connect_errors_total.inc() );
            close();
            return Error::Timeout;
        }
        const Error err = result.get();
        if (err != Error::None) {
            EW_TL1( telemetry_.connect_errors_total.inc() );
            return err;
        }
    } catch (const std::exception& e) {
        EW_ERROR("[WS] connect() failed: " << e.what());
        EW_TL1( telemetry_.connect_errors_total.inc() );
        return Error::TransportFailure;
    }

    connected_.store(true, std::memory_order_release);
    net::post(ioc_, [this] {
        if (closed_.load(std::memory_order_acquire)) {
            return;
        }
        with_stream_([this](auto& ws) { read_next_(ws); });
    });
    EW_DEBUG("[WS] Connected to " << host_header(url));
    return Error::None;
}

void WebSocket::start_dial_(std::shared_ptr<DialRequest> req) {
    if (closed_.load(std::memory_order_acquire)) {
        req->complete(Error::LocalShutdown);
        return;
    }
    if (req->url.secure) {
        tls_ = std::make_unique<tls_stream>(ioc_, tls_ctx_);
    } else {
        plain_ = std::make_unique<plain_stream>(ioc_);
    }
    resolver_.async_resolve(req->url.host, req->url.port,
        [this, req](const error_code& ec, const tcp::resolver::results_type& results) {
            if (ec) {
                EW_ERROR("[WS] Resolve '" << req->url.host << "' failed: " << ec.message());
                req->complete(map_error(ec, Error::ConnectionFailed));
                return;
            }
            if (closed_.load(std::memory_order_acquire)) {
                req->complete(Error::LocalShutdown);
                return;
            }
            with_stream_([&](auto& ws) { on_resolved_(ws, req, results); });
        });
}

template<class Stream>
void WebSocket::on_resolved_(Stream& ws, std::shared_ptr<DialRequest> req, const tcp::resolver::results_type& results) {
    auto& socket = boost::beast::get_lowest_layer(ws);
    socket.expires_after(req->timeout);
    socket.async_connect(results, [this, &ws, req](const error_code& ec, const tcp::endpoint&) {
        if (ec) {
            EW_ERROR("[WS] TCP connect to " << host_header(req->url) << " failed: " << ec.message());
            req->complete(map_error(ec, Error::ConnectionFailed));
            return;
        }
        if (closed_.load(std::memory_order_acquire)) {
            req->complete(Error::LocalShutdown);
            return;
        }
        if constexpr (std::is_same_v<Stream, tls_stream>) {
            auto& tls = ws.next_layer();
            if (!SSL_set_tlsext_host_name(tls.native_handle(), req->url.host.c_str())) {
                EW_ERROR("[WS] Could not set SNI host name '" << req->url.host << "'");
                req->complete(Error::HandshakeFailed);
                return;
            }
            tls.set_verify_callback(ssl::host_name_verification(req->url.host));
            tls.async_handshake(ssl::stream_base::client, [this, &ws, req](const error_code& ec) {
                if (ec) {
                    EW_ERROR("[WS] TLS handshake with " << req->url.host << " failed: " << ec.message());
                    req->complete(map_error(ec, Error::HandshakeFailed));
                    return;
                }
                upgrade_(ws, req);
            });
        } else {
            upgrade_(ws, req);
        }
    });
}

template<class Stream>
void WebSocket::upgrade_(Stream& ws, std::shared_ptr<DialRequest> req) {
    if (closed_.load(std::memory_order_acquire)) {
        req->complete(Error::LocalShutdown);
        return;
    }
    ws.set_option(bws::stream_base::decorator([headers = req->headers](bws::request_type& r) {
        r.set(http::field::user_agent, boost::beast::string_view{USER_AGENT.data(), USER_AGENT.size()});
        for (const auto& [name, value] : headers) {
            r.set(name, value);
        }
    }));
    ws.async_handshake(host_header(req->url), req->url.target, [this, &ws, req](const error_code& ec) {
        if (ec) {
            EW_ERROR("[WS] WebSocket upgrade rejected by " << req->url.host << ": " << ec.message());
            req->complete(map_error(ec, Error::HandshakeFailed));
            return;
        }
        // The dial budget only covers the handshake
        boost::beast::get_lowest_layer(ws).expires_never();
        ws.set_option(bws::stream_base::timeout::suggested(boost::beast::role_type::client));
        req->complete(Error::None);
    });
}

// -----------------------------------------------------------------------------
// read
// -----------------------------------------------------------------------------

template<class Stream>
void WebSocket::read_next_(Stream& ws) {
    ws.async_read(rx_buffer_, [this, &ws](const error_code& ec, std::size_t bytes) {
        if (ec) {
            const Error err = map_error(ec, Error::TransportFailure);
            if (err == Error::TransportFailure) {
                EW_ERROR("[WS] Receive failed: " << ec.message());
            } else {
                EW_DEBUG("[WS] Receive ended: " << ec.message());
            }
            EW_TL1( telemetry_.receive_errors_total.inc() );
            finish_reads_(err);
            return;
        }
        websocket::Frame frame;
        frame.kind = ws.got_text() ? websocket::FrameKind::Text : websocket::FrameKind::Binary;
        frame.data = boost::beast::buffers_to_string(rx_buffer_.data());
        rx_buffer_.consume(rx_buffer_.size());

        EW_TL1( telemetry_.bytes_rx_total.inc(bytes) );
        EW_TL1( frame.kind == websocket::FrameKind::Text ? telemetry_.text_frames_rx_total.inc()
                                                         : telemetry_.binary_frames_rx_total.inc() );
        {
            std::lock_guard<std::mutex> lock(rx_mutex_);
            rx_queue_.push_back(std::move(frame));
        }
        rx_cv_.notify_one();
        read_next_(ws);
    });
}

void WebSocket::finish_reads_(Error error) {
    {
        std::lock_guard<std::mutex> lock(rx_mutex_);
        if (rx_error_ == Error::None) {
            rx_error_ = error;
        }
    }
    rx_cv_.notify_all();
}

Error WebSocket::read(websocket::Frame& out) noexcept {
    if (!connected_.load(std::memory_order_acquire)) {
        return Error::InvalidState;
    }
    std::unique_lock<std::mutex> lock(rx_mutex_);
    rx_cv_.wait(lock, [this] { return !rx_queue_.empty() || rx_error_ != Error::None; });
    if (closed_.load(std::memory_order_acquire)) {
        return Error::LocalShutdown;
    }
    if (!rx_queue_.empty()) {
        out = std::move(rx_queue_.front());
        rx_queue_.pop_front();
        return Error::None;
    }
    return rx_error_;
}

// -----------------------------------------------------------------------------
// write
// -----------------------------------------------------------------------------

Error WebSocket::write(websocket::FrameKind kind, std::string_view payload) noexcept {
    try {
        std::lock_guard<std::mutex> lock(tx_mutex_);
        if (closed_.load(std::memory_order_acquire)) {
            return Error::LocalShutdown;
        }
        if (!connected_.load(std::memory_order_acquire)) {
            return Error::InvalidState;
        }
        auto data = std::make_shared<std::string>(payload);
        auto done = std::make_shared<std::promise<Error>>();
        auto result = done->get_future();

        net::post(ioc_, [this, kind, data, done] {
            with_stream_([&](auto& ws) {
                ws.binary(kind == websocket::FrameKind::Binary);
                ws.async_write(net::buffer(*data), [data, done](const error_code& ec, std::size_t) {
                    if (ec) {
                        EW_DEBUG("[WS] Send failed: " << ec.message());
                        done->set_value(map_error(ec, Error::TransportFailure));
                        return;
                    }
                    done->set_value(Error::None);
                });
            });
        });

        // Poll in slices: a stopped I/O thread never completes the promise
        constexpr auto slice = std::chrono::milliseconds(50);
        const auto deadline = std::chrono::steady_clock::now() + write_timeout_;
        while (result.wait_for(slice) != std::future_status::ready) {
            if (!io_running_.load(std::memory_order_acquire)) {
                EW_ERROR("[WS] write() with the I/O thread stopped");
                EW_TL1( telemetry_.send_errors_total.inc() );
                return Error::TransportFailure;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                EW_WARN("[WS] write() not completed after " << lcr::format_delay(write_timeout_) << ", closing");
                EW_TL1( telemetry_.send_errors_total.inc() );
                close();
                return Error::Timeout;
            }
        }
        const Error err = result.get();
        if (err != Error::None) {
            EW_TL1( telemetry_.send_errors_total.inc() );
            return err;
        }
        EW_TL1( telemetry_.bytes_tx_total.inc(payload.size()) );
        EW_TL1( telemetry_.frames_tx_total.inc() );
        return Error::None;
    } catch (const std::exception& e) {
        EW_ERROR("[WS] write() failed: " << e.what());
        EW_TL1( telemetry_.send_errors_total.inc() );
        return Error::TransportFailure;
    }
}

// -----------------------------------------------------------------------------
// close
// -----------------------------------------------------------------------------

void WebSocket::close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    EW_TRACE("[WS] Closing WebSocket ...");
    EW_TL1( telemetry_.close_events_total.inc() );
    finish_reads_(Error::LocalShutdown);
    try {
        net::post(ioc_, [this] {
            resolver_.cancel();
            with_stream_([](auto& ws) {
                boost::beast::get_lowest_layer(ws).close();
            });
        });
    } catch (const std::exception& e) {
        EW_WARN("[WS] close() could not reach the I/O thread: " << e.what());
    }
}

} // namespace enginewire::core::transport::beast
