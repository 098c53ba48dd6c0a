#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>
#include <cctype>

#include "repsync/core/transport/error.hpp"


namespace repsync::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure{false};   // true = wss, false = ws
        std::string host;
        std::string port;
        std::string path;     // endpoint path (query of the base URL is dropped)

        [[nodiscard]] inline std::string url() const {
            return std::string(secure ? "wss://" : "ws://") + host + ":" + port + path;
        }
    };


    // ---------------------------------------------------------------------
    // Scheme translation: http -> ws, https -> wss, ws / wss pass through.
    // Case-insensitive. Any other scheme is InvalidURL.
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error translate_scheme(std::string_view scheme, bool& secure) noexcept {
        std::string lower;
        lower.reserve(scheme.size());
        for (char c : scheme) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lower == "http" || lower == "ws") {
            secure = false;
            return Error::None;
        }
        if (lower == "https" || lower == "wss") {
            secure = true;
            return Error::None;
        }
        return Error::InvalidURL;
    }


    // ---------------------------------------------------------------------
    // Builds the WebSocket endpoint for a channel from the application base
    // URL. The base URL path is replaced by `endpoint`.
    //
    // Example inputs:
    //   https://api.example.com        + /session/ws/ -> wss://api.example.com:443/session/ws/
    //   http://localhost:8000/api/v1   + /session/ws/ -> ws://localhost:8000/session/ws/
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error build_ws_url(std::string_view base_url, std::string_view endpoint, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract and translate scheme
        const std::size_t sep = base_url.find("://");
        if (sep == std::string_view::npos || sep == 0) {
            return Error::InvalidURL;
        }
        if (translate_scheme(base_url.substr(0, sep), out.secure) != Error::None) {
            return Error::InvalidURL;
        }
        const std::size_t pos = sep + 3;
        // 2) Extract host[:port] (authority ends at path, query or fragment)
        std::size_t end = base_url.find_first_of("/?#", pos);
        std::string_view hostport = (end == std::string_view::npos) ? base_url.substr(pos) : base_url.substr(pos, end - pos);
        if (hostport.empty() || hostport.find('@') != std::string_view::npos) {
            return Error::InvalidURL;
        }
        // 3) Split host and port
        std::size_t colon = hostport.rfind(':');
        if (colon != std::string_view::npos && hostport.find(']') == std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = out.secure ? "443" : "80";
        }
        // 4) Endpoint replaces the path
        out.path = endpoint.empty() ? std::string("/") : std::string(endpoint);

        // Invariants check --------------------------------
        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidURL;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidURL;
            }
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidURL;
        }
        if (out.path[0] != '/') {
            return Error::InvalidURL;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace repsync::core::transport
