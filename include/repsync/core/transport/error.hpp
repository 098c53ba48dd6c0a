#pragma once

#include <string_view>

namespace repsync::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Error classification shared by the transport, the connection lifecycle and
the channel registry.

The first block is the caller-visible taxonomy. The second block carries
transport internals that only ever surface as the reason of a failed
connection state or through the logs.

Payload-bearing cases (server error message, unknown channel id) keep their
payload next to the code: the connection state reason text and the registry
log line respectively.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Caller-visible taxonomy --------------------------------------------
    InvalidURL,             // Base URL scheme not http/https/ws/wss, or malformed authority
    ConnectionFailed,       // Socket could not be opened or the attempt budget is exhausted
    Disconnected,           // send() while not connected
    AuthenticationRequired, // Server demands credentials that were not provided
    EncodingError,          // Outgoing message could not be serialized
    DecodingError,          // Incoming frame could not be decoded
    ServerError,            // Server rejected the upgrade (5xx) or reported an error
    Timeout,                // Connect attempt exceeded connect_timeout_seconds
    Unauthorized,           // Server rejected the supplied credentials (401/403)
    ChannelNotFound,        // No connection registered under the given channel id

    // --- Transport internals ------------------------------------------------
    InvalidConfig,          // ChannelConfig failed validation
    Cancelled,              // Attempt superseded by disconnect() or a newer connect()
    RemoteClosed,           // Peer sent a CLOSE frame
    HandshakeFailed,        // TLS or WebSocket upgrade failed
    TransportFailure,       // Read / write / ping failure on an open socket
    Backpressure,           // Inbound frames not drained fast enough
};


[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                   return "None";
    case Error::InvalidURL:             return "InvalidURL";
    case Error::ConnectionFailed:       return "ConnectionFailed";
    case Error::Disconnected:           return "Disconnected";
    case Error::AuthenticationRequired: return "AuthenticationRequired";
    case Error::EncodingError:          return "EncodingError";
    case Error::DecodingError:          return "DecodingError";
    case Error::ServerError:            return "ServerError";
    case Error::Timeout:                return "Timeout";
    case Error::Unauthorized:           return "Unauthorized";
    case Error::ChannelNotFound:        return "ChannelNotFound";
    case Error::InvalidConfig:          return "InvalidConfig";
    case Error::Cancelled:              return "Cancelled";
    case Error::RemoteClosed:           return "RemoteClosed";
    case Error::HandshakeFailed:        return "HandshakeFailed";
    case Error::TransportFailure:       return "TransportFailure";
    case Error::Backpressure:           return "Backpressure";
    default:                            return "Unknown";
    }
}

// Human readable text, used as the reason of a failed connection state
[[nodiscard]]
inline constexpr std::string_view describe(Error err) noexcept {
    switch (err) {
    case Error::None:                   return "No error";
    case Error::InvalidURL:             return "Invalid WebSocket URL";
    case Error::ConnectionFailed:       return "Failed to connect to WebSocket";
    case Error::Disconnected:           return "WebSocket is disconnected";
    case Error::AuthenticationRequired: return "Authentication required";
    case Error::EncodingError:          return "Failed to encode message";
    case Error::DecodingError:          return "Failed to decode message";
    case Error::ServerError:            return "Server error";
    case Error::Timeout:                return "Connection timeout";
    case Error::Unauthorized:           return "Unauthorized access";
    case Error::ChannelNotFound:        return "Connection not found";
    case Error::InvalidConfig:          return "Invalid channel configuration";
    case Error::Cancelled:              return "Connection attempt cancelled";
    case Error::RemoteClosed:           return "Connection closed by server";
    case Error::HandshakeFailed:        return "WebSocket handshake failed";
    case Error::TransportFailure:       return "WebSocket transport failure";
    case Error::Backpressure:           return "Inbound message backlog overflow";
    default:                            return "Unknown error";
    }
}

// Auth rejections are never retried automatically
[[nodiscard]]
inline constexpr bool is_auth_error(Error err) noexcept {
    return err == Error::Unauthorized || err == Error::AuthenticationRequired;
}

} // namespace transport
} // namespace repsync::core
