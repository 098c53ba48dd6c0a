#pragma once

#include <cstddef>

namespace repsync::core::config {

/*
===============================================================================
SPSC Ring Buffer Sizes
===============================================================================

Transport → Connection hand-off buffers. All sizes are compile-time constants
and must be powers of two.
===============================================================================
*/

// -----------------------------------------------------------------------------
// Control-plane events (close / error), low frequency
// -----------------------------------------------------------------------------
inline constexpr std::size_t transport_event_ring = 1 << 4; // 16

// -----------------------------------------------------------------------------
// Inbound text frames between two poll() calls
// -----------------------------------------------------------------------------
inline constexpr std::size_t transport_frame_ring = 1 << 10; // 1024

// -----------------------------------------------------------------------------
// Per-subscription backlog before the oldest frames are dropped
// -----------------------------------------------------------------------------
inline constexpr std::size_t subscription_backlog = 1 << 12; // 4096

} // namespace repsync::core::config
