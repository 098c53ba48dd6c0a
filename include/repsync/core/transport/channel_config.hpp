#pragma once

#include <string>
#include <vector>
#include <utility>
#include <chrono>
#include <functional>
#include <ostream>
#include <cstdint>

#include "repsync/core/transport/error.hpp"
#include "lcr/optional.hpp"


namespace repsync::core::transport {

// ----------------------------------------------------------------------------
// Credential provider
//
// Returns the current bearer token, or an empty optional when the user is
// signed out. Called on every connection attempt, so token refreshes are
// picked up by reconnects.
// ----------------------------------------------------------------------------
using TokenProvider = std::function<lcr::optional<std::string>()>;

using Header = std::pair<std::string, std::string>;


/*
===============================================================================
 transport::ChannelConfig
===============================================================================

Immutable per-channel settings. A Connection copies its config at
construction and never mutates it.

  id                          unique channel name (registry key)
  endpoint                    path that replaces the base URL path
  requires_auth               attach "Authorization: Bearer <token>" when a token exists
  auto_reconnect              schedule automatic attempts after runtime failures
  max_reconnect_attempts      attempt budget per failure cycle (>= 0)
  reconnect_delay_seconds     base delay between attempts (> 0)
  heartbeat_interval_seconds  transport ping period (> 0)
  connect_timeout_seconds     bound on a single connect attempt (> 0)
  extra_headers               additional upgrade request headers
===============================================================================
*/
struct ChannelConfig {
    std::string id;
    std::string endpoint{"/"};
    bool requires_auth{true};
    bool auto_reconnect{true};
    int max_reconnect_attempts{5};
    double reconnect_delay_seconds{2.0};
    double heartbeat_interval_seconds{30.0};
    double connect_timeout_seconds{10.0};
    std::vector<Header> extra_headers{};

    [[nodiscard]]
    inline Error validate() const noexcept {
        if (id.empty()) return Error::InvalidConfig;
        if (endpoint.empty() || endpoint.front() != '/') return Error::InvalidConfig;
        if (max_reconnect_attempts < 0) return Error::InvalidConfig;
        if (!(reconnect_delay_seconds > 0.0)) return Error::InvalidConfig;
        if (!(heartbeat_interval_seconds > 0.0)) return Error::InvalidConfig;
        if (!(connect_timeout_seconds > 0.0)) return Error::InvalidConfig;
        return Error::None;
    }

    [[nodiscard]]
    inline std::chrono::milliseconds reconnect_delay() const noexcept {
        return to_ms_(reconnect_delay_seconds);
    }

    [[nodiscard]]
    inline std::chrono::milliseconds heartbeat_interval() const noexcept {
        return to_ms_(heartbeat_interval_seconds);
    }

    [[nodiscard]]
    inline std::chrono::milliseconds connect_timeout() const noexcept {
        return to_ms_(connect_timeout_seconds);
    }

private:
    [[nodiscard]]
    static inline std::chrono::milliseconds to_ms_(double seconds) noexcept {
        return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
    }
};

inline std::ostream& operator<<(std::ostream& os, const ChannelConfig& c) {
    os << "[" << c.id << "] endpoint=" << c.endpoint
       << " auth=" << (c.requires_auth ? "yes" : "no")
       << " reconnect=" << (c.auto_reconnect ? "yes" : "no")
       << " max_attempts=" << c.max_reconnect_attempts
       << " delay=" << c.reconnect_delay_seconds << "s"
       << " heartbeat=" << c.heartbeat_interval_seconds << "s"
       << " timeout=" << c.connect_timeout_seconds << "s";
    return os;
}

} // namespace repsync::core::transport
