#pragma once

#include "repsync/core/transport/connection.hpp"
#include "repsync/core/transport/registry.hpp"
#include "repsync/core/policy/transport/connection_bundle.hpp"
#include "repsync/core/preset/transport/websocket_default.hpp"


namespace repsync::core::preset::transport {

    using DefaultConnection =
        repsync::core::transport::Connection<
            DefaultWebSocket,
            repsync::core::policy::transport::ConnectionDefault
        >;

    using DefaultRegistry =
        repsync::core::transport::Registry<
            DefaultWebSocket,
            repsync::core::policy::transport::ConnectionDefault
        >;

} // namespace repsync::core::preset::transport
