/*
===============================================================================
 transport::build_ws_url - Unit Tests
===============================================================================

Scheme translation and endpoint substitution performed before any socket is
opened. Every failure here must surface as Error::InvalidURL.
===============================================================================
*/

#include <iostream>
#include <string>

#include "repsync/core/transport/parse_url.hpp"
#include "common/test_check.hpp"

using namespace repsync::core::transport;


void test_scheme_translation() {
    std::cout << "[TEST] Scheme translation (http/https/ws/wss)\n";

    bool secure = true;
    TEST_CHECK(translate_scheme("http", secure) == Error::None && !secure);
    TEST_CHECK(translate_scheme("https", secure) == Error::None && secure);
    TEST_CHECK(translate_scheme("ws", secure) == Error::None && !secure);
    TEST_CHECK(translate_scheme("wss", secure) == Error::None && secure);
    TEST_CHECK(translate_scheme("HTTPS", secure) == Error::None && secure);

    TEST_CHECK(translate_scheme("ftp", secure) == Error::InvalidURL);
    TEST_CHECK(translate_scheme("file", secure) == Error::InvalidURL);
    TEST_CHECK(translate_scheme("", secure) == Error::InvalidURL);

    std::cout << "[TEST] OK\n";
}

void test_endpoint_replaces_path() {
    std::cout << "[TEST] Endpoint replaces the base URL path\n";

    ParsedUrl url;
    TEST_CHECK(build_ws_url("https://api.example.com/api/v1?x=1", "/session/ws/", url) == Error::None);
    TEST_CHECK(url.secure);
    TEST_CHECK(url.host == "api.example.com");
    TEST_CHECK(url.port == "443");
    TEST_CHECK(url.path == "/session/ws/");
    TEST_CHECK(url.url() == "wss://api.example.com:443/session/ws/");

    TEST_CHECK(build_ws_url("http://localhost:8000/api", "/session/ws/", url) == Error::None);
    TEST_CHECK(!url.secure);
    TEST_CHECK(url.host == "localhost");
    TEST_CHECK(url.port == "8000");
    TEST_CHECK(url.url() == "ws://localhost:8000/session/ws/");

    TEST_CHECK(build_ws_url("ws://10.0.0.2", "/ws", url) == Error::None);
    TEST_CHECK(url.port == "80");
    TEST_CHECK(url.path == "/ws");

    std::cout << "[TEST] OK\n";
}

void test_invalid_urls() {
    std::cout << "[TEST] Malformed base URLs are rejected\n";

    ParsedUrl url;
    TEST_CHECK(build_ws_url("ftp://example.com", "/ws", url) == Error::InvalidURL);
    TEST_CHECK(build_ws_url("example.com/ws", "/ws", url) == Error::InvalidURL);
    TEST_CHECK(build_ws_url("https://", "/ws", url) == Error::InvalidURL);
    TEST_CHECK(build_ws_url("https://example.com:notaport", "/ws", url) == Error::InvalidURL);
    TEST_CHECK(build_ws_url("https://example.com:70000", "/ws", url) == Error::InvalidURL);
    TEST_CHECK(build_ws_url("https://user@example.com", "/ws", url) == Error::InvalidURL);
    TEST_CHECK(build_ws_url("https://example.com", "ws", url) == Error::InvalidURL);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_scheme_translation();
    test_endpoint_replaces_path();
    test_invalid_urls();

    std::cout << "\n[URL MAPPING TESTS PASSED]\n";
    return 0;
}
