#pragma once

#include <chrono>
#include <concepts>
#include <algorithm>

namespace repsync::core::policy::transport {

/*
===============================================================================
 Reconnect Backoff Policy
===============================================================================

Defines the delay between two automatic reconnection attempts.

The policy is:

- Compile-time selected
- Stateless
- Driven by the channel's configured base delay and the 1-based attempt number

The attempt budget (max_reconnect_attempts) is enforced by the Connection,
never by the policy.

-------------------------------------------------------------------------------
 Modes
-------------------------------------------------------------------------------

1) Constant
   - Every attempt waits exactly the configured base delay

2) Exponential<CapMs>
   - base * 2^(attempt-1), never above CapMs

-------------------------------------------------------------------------------
 Example
-------------------------------------------------------------------------------

using MyConnectionPolicies = transport::connection_bundle<
    backoff::Exponential<30000>
>;

===============================================================================
*/


// ============================================================================
// Backoff Policy Concept
// ============================================================================
//
// A valid BackoffPolicy must expose:
//
//   static std::chrono::milliseconds delay(std::chrono::milliseconds base, int attempt) noexcept;
//
// ============================================================================

template<typename P>
concept BackoffPolicy =
requires(std::chrono::milliseconds base, int attempt) {
    { P::delay(base, attempt) } noexcept -> std::same_as<std::chrono::milliseconds>;
};


namespace backoff {

// ============================================================================
// Constant delay
// ============================================================================

struct Constant {
    [[nodiscard]]
    static constexpr std::chrono::milliseconds delay(std::chrono::milliseconds base, int) noexcept {
        return base;
    }
};


// ============================================================================
// Exponential delay with cap
// ============================================================================
//
// Example (base 2s, cap 30s): 2s, 4s, 8s, 16s, 30s, 30s ...
//
// ============================================================================

template<long long CapMs = 30000>
struct Exponential {
    static_assert(CapMs > 0, "Exponential backoff cap must be positive");

    [[nodiscard]]
    static constexpr std::chrono::milliseconds delay(std::chrono::milliseconds base, int attempt) noexcept {
        constexpr std::chrono::milliseconds cap{CapMs};
        // Clamp the exponent to avoid overflow
        const int exponent = std::clamp(attempt - 1, 0, 20);
        const auto scaled = base * (1LL << exponent);
        return std::min<std::chrono::milliseconds>(scaled, cap);
    }
};

} // namespace backoff

static_assert(BackoffPolicy<backoff::Constant>);
static_assert(BackoffPolicy<backoff::Exponential<>>);

} // namespace repsync::core::policy::transport
