#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>

#include "repsync/core/transport/error.hpp"


namespace repsync::core::transport {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
enum class State : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Failed
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:  return "Disconnected";
        case State::Connecting:    return "Connecting";
        case State::Connected:     return "Connected";
        case State::Reconnecting:  return "Reconnecting";
        case State::Failed:        return "Failed";
        default:                   return "Unknown";
    }
}


// ===============================================================
// CONNECTION STATE VALUE
// ===============================================================
//
// Observable value of a connection: the state kind plus, for Failed,
// the error that caused it and its human readable reason.
//
// Equality: kinds must match; Failed values additionally compare
// their reason text.
//
struct ConnectionState {
    State kind{State::Disconnected};
    Error error{Error::None};
    std::string reason{};

    [[nodiscard]] static ConnectionState disconnected() { return {}; }
    [[nodiscard]] static ConnectionState connecting()   { return {State::Connecting}; }
    [[nodiscard]] static ConnectionState connected()    { return {State::Connected}; }
    [[nodiscard]] static ConnectionState reconnecting() { return {State::Reconnecting}; }

    [[nodiscard]] static ConnectionState failed(Error err) {
        return {State::Failed, err, std::string(describe(err))};
    }

    [[nodiscard]] static ConnectionState failed(Error err, std::string reason) {
        return {State::Failed, err, std::move(reason)};
    }

    [[nodiscard]] inline bool is_connected() const noexcept { return kind == State::Connected; }

    [[nodiscard]] friend bool operator==(const ConnectionState& a, const ConnectionState& b) noexcept {
        if (a.kind != b.kind) return false;
        return a.kind != State::Failed || a.reason == b.reason;
    }
};

inline std::ostream& operator<<(std::ostream& os, const ConnectionState& s) {
    os << to_string(s.kind);
    if (s.kind == State::Failed) {
        os << "(" << s.reason << ")";
    }
    return os;
}


// ===============================================================
// FSM EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    ConnectRequested,
    DisconnectRequested,

    // --- Transport lifecycle ---
    TransportConnected,
    TransportConnectFailed,      // explicit connect() attempt failed
    TransportReconnectFailed,    // automatic attempt failed
    TransportFailed,             // receive error / remote close / ping failure

    // --- Retry ---
    RetryTimerExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::ConnectRequested:          return "ConnectRequested";
        case Event::DisconnectRequested:       return "DisconnectRequested";
        case Event::TransportConnected:        return "TransportConnected";
        case Event::TransportConnectFailed:    return "TransportConnectFailed";
        case Event::TransportReconnectFailed:  return "TransportReconnectFailed";
        case Event::TransportFailed:           return "TransportFailed";
        case Event::RetryTimerExpired:         return "RetryTimerExpired";
        default:                               return "UnknownEvent";
    }
}

} // namespace repsync::core::transport
