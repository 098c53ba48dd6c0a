#pragma once

/*
===============================================================================
 repsync::core::transport::websocket::Event
===============================================================================

Control-plane event emitted by a WebSocket transport and delivered to the
owning Connection through an SPSC ring drained in Connection::poll().

    • Close  → transport closed (remote CLOSE frame, read failure, local close)
    • Error  → transport-level failure, always followed by a Close

Text frames travel on a separate data-plane ring (poll_message()).

Events are trivially copyable. Losing a Close breaks the reconnect logic, so
a transport whose event ring is full must stop reading.
===============================================================================
*/

#include <cstdint>
#include <type_traits>

#include "repsync/core/transport/error.hpp"

namespace repsync::core::transport::websocket {

enum class EventType : std::uint8_t {
    Close = 0,
    Error = 1,
};

struct Event {
    EventType type{EventType::Close};
    transport::Error error{transport::Error::None}; // valid only if type == EventType::Error

    static constexpr Event make_close() noexcept {
        return Event{EventType::Close, transport::Error::None};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");
static_assert(sizeof(Event) <= 16, "websocket::Event should remain small and cache-friendly");

} // namespace repsync::core::transport::websocket
