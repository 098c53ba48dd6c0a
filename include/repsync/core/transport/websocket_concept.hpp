/*
===============================================================================
WebSocketConcept (Pull-Based)
===============================================================================

Minimal transport contract required by Connection.

The WebSocket implementation:

  • Opens one socket per connect() call, bounded by Request::timeout
  • Owns its receive thread once connected
  • Pushes complete text frames into a data-plane ring (poll_message)
  • Pushes control-plane events (Close / Error) into an event ring (poll_event)
  • Serializes its own writes and pings
  • Is lifecycle-managed by Connection: one instance per connection attempt

No callbacks.
No dynamic dispatch.

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

Producer thread:  transport IO thread (frames, events)
Consumer thread:  Connection::poll() caller (poll_message, poll_event)
Any thread:       send(), ping(), close()

===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "repsync/core/transport/error.hpp"
#include "repsync/core/transport/websocket/events.hpp"
#include "repsync/core/transport/websocket/request.hpp"


namespace repsync::core::transport {

template<class WS>
concept WebSocketConcept =
    std::default_initializable<WS> &&
    requires(
        WS ws,
        const websocket::Request& request,
        std::string_view msg,
        websocket::Event& ev,
        std::string& frame
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(request) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(msg) } noexcept -> std::same_as<bool>;
    { ws.ping() } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Receiving (pull-based)
    // ---------------------------------------------------------------------

    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
    { ws.poll_message(frame) } noexcept -> std::same_as<bool>;
};

} // namespace repsync::core::transport
