#pragma once

#include <string>

#include <CLI/CLI.hpp>


namespace repsync::examples::cli {

// -------------------------------------------------------------
// Base URL validator (http, https, ws, wss)
// -------------------------------------------------------------
inline auto base_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        for (const char* scheme : {"http://", "https://", "ws://", "wss://"}) {
            if (value.rfind(scheme, 0) == 0) {
                return {};
            }
        }
        return "URL must start with http://, https://, ws:// or wss://";
    },
    "Base URL validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"});

} // namespace repsync::examples::cli
