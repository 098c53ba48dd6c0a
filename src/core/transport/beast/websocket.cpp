#include "repsync/core/transport/beast/websocket.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include "repsync/core/config/ring_sizes.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"


namespace repsync::core::transport::beast {

namespace asio = boost::asio;
namespace ssl  = boost::asio::ssl;
namespace http = boost::beast::http;
namespace bws  = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;
using error_code = boost::system::error_code;

namespace {

constexpr auto CLOSE_TIMEOUT = std::chrono::seconds(1);
constexpr const char* USER_AGENT = "repsync/1.0";

// Maps a rejected upgrade response to the caller-visible taxonomy
[[nodiscard]]
inline Error classify_upgrade_(unsigned status) noexcept {
    if (status == 401 || status == 403) {
        return Error::Unauthorized;
    }
    if (status >= 500 && status < 600) {
        return Error::ServerError;
    }
    return Error::HandshakeFailed;
}

} // namespace


class WebSocket::Impl {
    using clock        = std::chrono::steady_clock;
    using strand_type  = asio::strand<asio::io_context::executor_type>;
    using PlainStream  = bws::stream<boost::beast::tcp_stream>;
    using TlsStream    = bws::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

public:
    Impl()
        : strand_(asio::make_strand(ioc_))
    {}

    ~Impl() {
        close();
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------
    [[nodiscard]]
    Error connect(const websocket::Request& req) noexcept {
        if (open_.load(std::memory_order_acquire) || closing_.load(std::memory_order_acquire)) {
            RS_ERROR("[WS] connect() called on a transport that was already used");
            return Error::ConnectionFailed;
        }
        try {
            const auto deadline = clock::now() + req.timeout;
            Error err;
            if (req.secure) {
                tls_ctx_.emplace(ssl::context::tls_client);
                tls_ctx_->set_default_verify_paths();
                tls_ctx_->set_verify_mode(ssl::verify_peer);
                tls_ = std::make_unique<TlsStream>(strand_, *tls_ctx_);
                err = open_stream_(*tls_, req, deadline);
            }
            else {
                plain_ = std::make_unique<PlainStream>(strand_);
                err = open_stream_(*plain_, req, deadline);
            }
            if (err != Error::None) {
                tls_.reset();
                plain_.reset();
                return err;
            }

            RS_INFO("[WS] Connected to " << (req.secure ? "wss://" : "ws://") << req.host << ":" << req.port << req.target);
            open_.store(true, std::memory_order_release);

            // From here on the socket belongs to the IO thread
            asio::post(strand_, [this] {
                with_stream_([this](auto& ws) { read_(ws); });
            });
            work_.emplace(asio::make_work_guard(ioc_));
            ioc_.restart();
            io_thread_ = std::thread(&Impl::run_io_, this);
            return Error::None;
        }
        catch (const std::exception& e) {
            RS_ERROR("[WS] connect() failed: " << e.what());
            tls_.reset();
            plain_.reset();
            return Error::ConnectionFailed;
        }
    }

    // Idempotent. Sends a CLOSE frame if the socket is still open, then stops
    // the IO thread.
    void close() noexcept {
        if (closing_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        std::promise<void> closed;
        try {
            if (open_.exchange(false, std::memory_order_acq_rel) && io_thread_.joinable()) {
                RS_TRACE("[WS] Closing WebSocket ...");
                auto fut = closed.get_future();
                asio::post(strand_, [this, &closed] {
                    with_stream_([&closed](auto& ws) {
                        ws.async_close(bws::close_code::normal, [&closed](const error_code& ec) {
                            if (ec) {
                                RS_DEBUG("[WS] async_close: " << ec.message());
                            }
                            closed.set_value();
                        });
                    });
                });
                if (fut.wait_for(CLOSE_TIMEOUT) != std::future_status::ready) {
                    RS_WARN("[WS] Close handshake timed out -> dropping socket");
                }
            }
        }
        catch (const std::exception& e) {
            RS_ERROR("[WS] close() failed: " << e.what());
        }
        work_.reset();
        ioc_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        RS_TRACE("[WS] WebSocket closed.");
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------
    [[nodiscard]]
    bool send(std::string_view text) noexcept {
        if (!open_.load(std::memory_order_acquire)) {
            RS_ERROR("[WS] send() called on unconnected WebSocket");
            return false;
        }
        try {
            asio::post(strand_, [this, msg = std::string(text)]() mutable {
                write_queue_.push_back(std::move(msg));
                if (write_queue_.size() == 1) {
                    with_stream_([this](auto& ws) { write_(ws); });
                }
            });
            return true;
        }
        catch (const std::exception& e) {
            RS_ERROR("[WS] send() failed: " << e.what());
            return false;
        }
    }

    [[nodiscard]]
    bool ping() noexcept {
        if (!open_.load(std::memory_order_acquire)) {
            return false;
        }
        if (ping_pending_.exchange(true, std::memory_order_acq_rel)) {
            return true; // previous ping still in flight
        }
        try {
            asio::post(strand_, [this] {
                with_stream_([this](auto& ws) {
                    ws.async_ping({}, [this, &ws](const error_code& ec) {
                        ping_pending_.store(false, std::memory_order_release);
                        if (ec) {
                            fail_(ws, ec, "ping");
                        }
                    });
                });
            });
            return true;
        }
        catch (const std::exception& e) {
            ping_pending_.store(false, std::memory_order_release);
            RS_ERROR("[WS] ping() failed: " << e.what());
            return false;
        }
    }

    // -------------------------------------------------------------------------
    // Receiving
    // -------------------------------------------------------------------------
    [[nodiscard]] bool poll_event(websocket::Event& out) noexcept {
        return events_.pop(out);
    }

    [[nodiscard]] bool poll_message(std::string& out) noexcept {
        return frames_.pop(out);
    }

private:
    template <class Fn>
    void with_stream_(Fn&& fn) {
        if (tls_) {
            fn(*tls_);
        }
        else if (plain_) {
            fn(*plain_);
        }
    }

    // Drives the io_context on the calling thread until `done` or the deadline
    [[nodiscard]]
    bool run_until_(const bool& done, clock::time_point deadline) {
        ioc_.restart();
        while (!done && clock::now() < deadline) {
            ioc_.run_one_until(deadline);
            if (ioc_.stopped()) {
                ioc_.restart();
            }
        }
        return done;
    }

    // Lets cancelled handlers complete before their captures go out of scope
    void drain_() {
        ioc_.restart();
        ioc_.run();
    }

    template <class Stream>
    [[nodiscard]]
    Error open_stream_(Stream& ws, const websocket::Request& req, clock::time_point deadline) {
        auto& lowest = boost::beast::get_lowest_layer(ws);
        error_code ec;
        bool done = false;

        // 1) Resolve
        tcp::resolver resolver(ioc_);
        tcp::resolver::results_type endpoints;
        resolver.async_resolve(req.host, req.port,
            [&](const error_code& e, tcp::resolver::results_type results) {
                ec = e;
                endpoints = std::move(results);
                done = true;
            });
        if (!run_until_(done, deadline)) {
            resolver.cancel();
            drain_();
            RS_ERROR("[WS] Timed out resolving " << req.host);
            return Error::Timeout;
        }
        if (ec) {
            RS_ERROR("[WS] Failed to resolve " << req.host << ": " << ec.message());
            return Error::ConnectionFailed;
        }

        // 2) TCP connect
        done = false;
        lowest.expires_at(deadline);
        lowest.async_connect(endpoints, [&](const error_code& e, const tcp::endpoint&) {
            ec = e;
            done = true;
        });
        if (!run_until_(done, deadline)) {
            lowest.cancel();
            drain_();
            RS_ERROR("[WS] Timed out connecting to " << req.host << ":" << req.port);
            return Error::Timeout;
        }
        if (ec) {
            RS_ERROR("[WS] TCP connect to " << req.host << ":" << req.port << " failed: " << ec.message());
            return ec == boost::beast::error::timeout ? Error::Timeout : Error::ConnectionFailed;
        }

        // 3) TLS handshake (SNI + hostname verification)
        if constexpr (std::is_same_v<Stream, TlsStream>) {
            auto& tls = ws.next_layer();
            if (!SSL_set_tlsext_host_name(tls.native_handle(), req.host.c_str())) {
                RS_ERROR("[WS] Failed to set SNI host name " << req.host);
                return Error::HandshakeFailed;
            }
            tls.set_verify_callback(ssl::host_name_verification(req.host));
            done = false;
            tls.async_handshake(ssl::stream_base::client, [&](const error_code& e) {
                ec = e;
                done = true;
            });
            if (!run_until_(done, deadline)) {
                lowest.cancel();
                drain_();
                RS_ERROR("[WS] TLS handshake with " << req.host << " timed out");
                return Error::Timeout;
            }
            if (ec) {
                RS_ERROR("[WS] TLS handshake with " << req.host << " failed: " << ec.message());
                return ec == boost::beast::error::timeout ? Error::Timeout : Error::HandshakeFailed;
            }
        }

        // 4) HTTP upgrade; the websocket layer owns timeouts from here on
        lowest.expires_never();
        const auto remaining = std::max<clock::duration>(deadline - clock::now(), std::chrono::milliseconds(1));
        ws.set_option(bws::stream_base::timeout{remaining, bws::stream_base::none(), false});
        ws.set_option(bws::stream_base::decorator([headers = req.headers](bws::request_type& r) {
            r.set(http::field::user_agent, USER_AGENT);
            for (const auto& h : headers) {
                r.set(h.first, h.second);
            }
        }));

        bws::response_type res;
        done = false;
        ws.async_handshake(res, req.host + ":" + req.port, req.target, [&](const error_code& e) {
            ec = e;
            done = true;
        });
        if (!run_until_(done, deadline + std::chrono::milliseconds(100))) {
            lowest.cancel();
            drain_();
            RS_ERROR("[WS] WebSocket upgrade with " << req.host << " timed out");
            return Error::Timeout;
        }
        if (ec) {
            if (ec == boost::beast::error::timeout) {
                RS_ERROR("[WS] WebSocket upgrade with " << req.host << " timed out");
                return Error::Timeout;
            }
            const unsigned status = res.result_int();
            RS_ERROR("[WS] WebSocket upgrade rejected (HTTP " << status << "): " << ec.message());
            return classify_upgrade_(status);
        }
        return Error::None;
    }

    void run_io_() noexcept {
        try {
            ioc_.run();
        }
        catch (const std::exception& e) {
            RS_ERROR("[WS] IO thread terminated: " << e.what());
            if (open_.exchange(false, std::memory_order_acq_rel)) {
                push_event_(websocket::Event::make_error(Error::TransportFailure));
                push_event_(websocket::Event::make_close());
            }
        }
    }

    template <class Stream>
    void read_(Stream& ws) {
        ws.async_read(rx_buffer_, [this, &ws](const error_code& ec, std::size_t) {
            if (ec) {
                fail_(ws, ec, "read");
                return;
            }
            std::string frame = boost::beast::buffers_to_string(rx_buffer_.data());
            rx_buffer_.consume(rx_buffer_.size());
            if (!frames_.push(std::move(frame))) {
                RS_WARN("[WS] Inbound frame ring full -> closing transport");
                fail_with_(ws, Error::Backpressure);
                return;
            }
            read_(ws);
        });
    }

    template <class Stream>
    void write_(Stream& ws) {
        ws.text(true);
        ws.async_write(asio::buffer(write_queue_.front()), [this, &ws](const error_code& ec, std::size_t) {
            if (ec) {
                write_queue_.clear();
                fail_(ws, ec, "write");
                return;
            }
            write_queue_.pop_front();
            if (!write_queue_.empty()) {
                write_(ws);
            }
        });
    }

    // Strand only. Reports a failure exactly once, then tears the socket down.
    template <class Stream>
    void fail_(Stream& ws, const error_code& ec, const char* op) {
        if (ec == bws::error::closed) {
            if (open_.exchange(false, std::memory_order_acq_rel)) {
                RS_INFO("[WS] Received WebSocket close frame.");
                push_event_(websocket::Event::make_close());
            }
            return;
        }
        if (closing_.load(std::memory_order_acquire)) {
            return; // local close in progress
        }
        RS_ERROR("[WS] " << op << " failed: " << ec.message());
        fail_with_(ws, Error::TransportFailure);
    }

    template <class Stream>
    void fail_with_(Stream& ws, Error err) {
        if (!open_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        push_event_(websocket::Event::make_error(err));
        push_event_(websocket::Event::make_close());
        error_code ignored;
        boost::beast::get_lowest_layer(ws).socket().close(ignored);
    }

    void push_event_(const websocket::Event& ev) noexcept {
        if (!events_.push(ev)) {
            RS_ERROR("[WS] Event ring full -> event dropped");
        }
    }

private:
    asio::io_context ioc_;
    strand_type strand_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::thread io_thread_;

    std::optional<ssl::context> tls_ctx_;
    std::unique_ptr<TlsStream> tls_;
    std::unique_ptr<PlainStream> plain_;

    boost::beast::flat_buffer rx_buffer_;
    std::deque<std::string> write_queue_;   // strand only

    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
    std::atomic<bool> ping_pending_{false};

    lcr::lockfree::spsc_ring<std::string, config::transport_frame_ring> frames_;
    lcr::lockfree::spsc_ring<websocket::Event, config::transport_event_ring> events_;
};


// -----------------------------------------------------------------------------
// WebSocket (pImpl forwarding)
// -----------------------------------------------------------------------------
WebSocket::WebSocket()
    : impl_(std::make_unique<Impl>())
{}

WebSocket::~WebSocket() = default;

Error WebSocket::connect(const websocket::Request& request) noexcept {
    return impl_->connect(request);
}

void WebSocket::close() noexcept {
    impl_->close();
}

bool WebSocket::send(std::string_view text) noexcept {
    return impl_->send(text);
}

bool WebSocket::ping() noexcept {
    return impl_->ping();
}

bool WebSocket::poll_event(websocket::Event& out) noexcept {
    return impl_->poll_event(out);
}

bool WebSocket::poll_message(std::string& out) noexcept {
    return impl_->poll_message(out);
}

} // namespace repsync::core::transport::beast
