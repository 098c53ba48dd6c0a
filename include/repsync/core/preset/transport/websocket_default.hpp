#pragma once

#include "repsync/core/transport/websocket_concept.hpp"
#include "repsync/core/transport/beast/websocket.hpp"


namespace repsync::core::preset::transport {

    using DefaultWebSocket = repsync::core::transport::beast::WebSocket;

    // Assert that DefaultWebSocket conforms to transport::WebSocketConcept concept
    static_assert(repsync::core::transport::WebSocketConcept<DefaultWebSocket>);

} // namespace repsync::core::preset::transport
