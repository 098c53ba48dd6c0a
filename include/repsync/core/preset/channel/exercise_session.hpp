#pragma once

#include <string>
#include <utility>

#include "repsync/core/transport/channel_config.hpp"


namespace repsync::core::preset::channel {

// Live collaborative workout channel (3 attempts, 2s apart)
[[nodiscard]]
inline core::transport::ChannelConfig exercise_session() {
    core::transport::ChannelConfig cfg;
    cfg.id = "exercise_session";
    cfg.endpoint = "/session/ws/";
    cfg.requires_auth = true;
    cfg.auto_reconnect = true;
    cfg.max_reconnect_attempts = 3;
    cfg.reconnect_delay_seconds = 2.0;
    cfg.heartbeat_interval_seconds = 30.0;
    cfg.connect_timeout_seconds = 10.0;
    return cfg;
}

// Any other channel: library defaults with the given id and endpoint
[[nodiscard]]
inline core::transport::ChannelConfig default_channel(std::string id, std::string endpoint) {
    core::transport::ChannelConfig cfg;
    cfg.id = std::move(id);
    cfg.endpoint = std::move(endpoint);
    return cfg;
}

} // namespace repsync::core::preset::channel
