#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "repsync/core/transport/error.hpp"
#include "repsync/core/transport/websocket/events.hpp"
#include "repsync/core/transport/websocket/request.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast implementation)
================================================================================

Production transport for transport::Connection, built on Boost.Beast / Asio
with OpenSSL for wss:// endpoints.

Design highlights:
  • Single-connection transport primitive: no retries, no reconnection logic.
    Recovery policy lives in Connection.
  • connect() blocks the caller for at most Request::timeout (resolve, TCP
    connect, TLS handshake with SNI + peer verification, HTTP upgrade).
  • Once open, a private IO thread owns the socket. Reads, writes and pings
    are serialized on one strand.
  • Inbound text frames and control events are handed to the owner through
    two SPSC rings (poll_message / poll_event); no callbacks.
  • Upgrade rejections are classified: 401/403 -> Unauthorized,
    5xx -> ServerError, anything else -> HandshakeFailed.
  • Boost exceptions never cross this boundary; they are logged and mapped
    to transport::Error.

Boost headers are confined to the implementation file.
================================================================================
*/

namespace repsync::core::transport::beast {

class WebSocket {
public:
    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // Lifecycle
    [[nodiscard]] Error connect(const websocket::Request& request) noexcept;
    void close() noexcept;

    // Sending (queued on the IO strand; false if the socket is not open)
    [[nodiscard]] bool send(std::string_view text) noexcept;
    [[nodiscard]] bool ping() noexcept;

    // Receiving (pull-based, single consumer)
    [[nodiscard]] bool poll_event(websocket::Event& out) noexcept;
    [[nodiscard]] bool poll_message(std::string& out) noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace repsync::core::transport::beast
