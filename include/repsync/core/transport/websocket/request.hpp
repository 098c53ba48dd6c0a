#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <string_view>

#include "repsync/core/transport/channel_config.hpp"


namespace repsync::core::transport::websocket {

// Everything a transport needs to open one socket.
// Built by Connection from the ChannelConfig, the base URL and the current token.
struct Request {
    bool secure{false};
    std::string host;
    std::string port;
    std::string target{"/"};
    std::chrono::milliseconds timeout{10000};
    std::vector<Header> headers{};

    [[nodiscard]] inline const std::string* header(std::string_view name) const noexcept {
        for (const auto& h : headers) {
            if (h.first == name) {
                return &h.second;
            }
        }
        return nullptr;
    }
};

} // namespace repsync::core::transport::websocket
