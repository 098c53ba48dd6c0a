#pragma once

#include "repsync/core/policy/transport/backoff.hpp"

namespace repsync::core::policy::transport {

/*
===============================================================================
 Connection Policy Bundle
===============================================================================

Single injection point for compile-time connection behavior. Runtime
settings (endpoint, attempt budget, delays) live in ChannelConfig; the bundle
only selects mechanics.

The bundle currently forwards:

  - backoff policy (delay shape between reconnect attempts)

-------------------------------------------------------------------------------
 Example
-------------------------------------------------------------------------------

using MyConnectionPolicies = connection_bundle<
    backoff::Exponential<60000>
>;

using MyConnection =
    Connection<MyWebSocket, MyConnectionPolicies>;

===============================================================================
*/

template<
    BackoffPolicy BackoffT = backoff::Constant
>
struct connection_bundle {

    using backoff = BackoffT;
};


// ============================================================================
// Default Bundle
// ============================================================================

using ConnectionDefault = connection_bundle<>;

} // namespace repsync::core::policy::transport
