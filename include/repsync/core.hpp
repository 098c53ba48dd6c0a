#pragma once

/*
================================================================================
RepSync Core - Live Exercise Session Client
================================================================================

Entry point for the poll-driven session client:

    Connection<WS, Policies>   one managed WebSocket channel (FSM, retry, heartbeat)
    Registry<WS, Policies>     channels by id
    protocol::*                envelope, typed payloads, encoders
    session::Store             authoritative SessionState / SessionDocument
    session::ProtocolHandler   Connection + Store, local mutations out, events in

-------------------------------------------------------------------------------
Execution model
-------------------------------------------------------------------------------

    [Transport Thread]   (owned by transport::beast::WebSocket)
        read -> push frame into SPSC ring

    [Application Thread]
        handler.poll() -> connection.poll() -> envelope -> payload -> Store

There are no other background threads. Nothing advances unless poll() is
called. Store snapshots are immutable and may be read from any thread.
================================================================================
*/

#include "repsync/core/observable.hpp"
#include "repsync/core/timestamp.hpp"

#include "repsync/core/transport/channel_config.hpp"
#include "repsync/core/transport/connection.hpp"
#include "repsync/core/transport/registry.hpp"
#include "repsync/core/transport/state.hpp"

#include "repsync/core/protocol/message.hpp"
#include "repsync/core/protocol/message_id.hpp"
#include "repsync/core/protocol/payload.hpp"
#include "repsync/core/protocol/parser/envelope.hpp"
#include "repsync/core/protocol/writer.hpp"

#include "repsync/core/session/colors.hpp"
#include "repsync/core/session/handler.hpp"
#include "repsync/core/session/helper.hpp"
#include "repsync/core/session/store.hpp"

#include "repsync/core/preset/channel/exercise_session.hpp"
#include "repsync/core/preset/transport/connection_default.hpp"
