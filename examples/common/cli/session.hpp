#pragma once

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"


namespace repsync::examples::cli::session {

struct Params {
    std::string url        = "http://localhost:8000";
    std::string token      = "";
    std::string session_id = "";
    std::string account_id = "";
    int seconds            = 60;   // 0 = until Ctrl+C
    std::string log_level  = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL       : " << url << "\n"
           << "  Token     : " << (token.empty() ? "(none)" : "(set)") << "\n"
           << "  Session   : " << session_id << "\n"
           << "  Account   : " << (account_id.empty() ? "(from token)" : account_id) << "\n"
           << "  Runtime   : " << (seconds > 0 ? std::to_string(seconds) + "s" : std::string("until interrupted")) << "\n"
           << "  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.url, "API base URL (the channel endpoint replaces its path)")->check(base_url_validator)->default_val(params.url);
    app.add_option("-t,--token", params.token, "Access token (sent as Bearer)");
    app.add_option("-s,--session", params.session_id, "Session id to join")->required();
    app.add_option("-a,--account", params.account_id, "Account id announced on join");
    app.add_option("--seconds", params.seconds, "Runtime in seconds (0 = until interrupted)")->check(CLI::NonNegativeNumber)->default_val(params.seconds);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | off")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Joins one live exercise session and mirrors it locally.\n"
        "Every change received from the server is printed as it is applied."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr) == 0 ? EXIT_SUCCESS : EXIT_FAILURE);
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace repsync::examples::cli::session
