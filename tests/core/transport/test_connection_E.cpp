/*
===============================================================================
 transport::Connection - Group E Unit Tests
===============================================================================

Scope:
------
Data plane and liveness on an established connection.

Covered Requirements:
---------------------
E1. Heartbeat pings only when due; a failed ping is a transport failure
E2. send(): Disconnected when not connected, EncodingError for an
    unrepresentable envelope, TransportFailure on write failure
E3. Subscriptions receive every decodable frame in order; malformed frames
    and unknown types are dropped without ending the sequence
E4. Type masks filter per subscription
E5. A subscription outlives reconnections
E6. observe_status() mirrors Connected
===============================================================================
*/

#include <iostream>
#include <string>
#include <vector>

#include "common/harness/connection.hpp"
#include "common/json_helpers.hpp"
#include "repsync/core/protocol/payload.hpp"


namespace {

const std::string COMPLETE_PAYLOAD = json::payload::set_complete("e1", "s1", true);
const char* CURSOR_PAYLOAD = R"({"account_id":"acc-2","cursor":{"exercise_id":"e1","exercise_set_id":"s1"}})";

} // namespace


// -----------------------------------------------------------------------------
// Group E1: Heartbeat
// -----------------------------------------------------------------------------
void test_heartbeat() {
    std::cout << "[TEST] Group E1: heartbeat pings when due\n";
    test::ConnectionHarness h;

    TEST_CHECK(h.connection->connect(TEST_BASE_URL) == Error::None);

    // Not due yet
    h.connection->poll();
    TEST_CHECK(WebSocketUnderTest::ping_count() == 0);

    h.connection->force_heartbeat_due();
    h.connection->poll();
    TEST_CHECK(WebSocketUnderTest::ping_count() == 1);
    TEST_CHECK(h.connection->heartbeats() == 1);

    // Rescheduled one interval ahead
    h.connection->poll();
    TEST_CHECK(WebSocketUnderTest::ping_count() == 1);

    WebSocketUnderTest::set_ping_result(false);
    h.connection->force_heartbeat_due();
    h.connection->poll();
    TEST_CHECK(h.kind() == State::Reconnecting);
    TEST_CHECK(h.connection->heartbeats() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E2: Sending
// -----------------------------------------------------------------------------
void test_send() {
    std::cout << "[TEST] Group E2: send\n";
    test::ConnectionHarness h;

    protocol::Message msg;
    TEST_CHECK(protocol::encode(protocol::schema::SetComplete{"e1", "s1", true}, 4, msg, std::string("sess-1")));

    TEST_CHECK(h.connection->send(msg) == Error::Disconnected);
    TEST_CHECK(h.connection->tx_messages() == 0);

    TEST_CHECK(h.connection->connect(TEST_BASE_URL) == Error::None);
    TEST_CHECK(h.connection->send(msg) == Error::None);
    TEST_CHECK(h.connection->tx_messages() == 1);
    TEST_CHECK(WebSocketUnderTest::sent().size() == 1);

    const std::string& wire = WebSocketUnderTest::sent().front();
    TEST_CHECK(wire.find("\"type\":\"set_complete\"") != std::string::npos);
    TEST_CHECK(wire.find("\"session_id\":\"sess-1\"") != std::string::npos);
    TEST_CHECK(wire.find("\"version\":4") != std::string::npos);
    TEST_CHECK(wire.find("\"complete\":true") != std::string::npos);

    protocol::Message unknown;
    TEST_CHECK(h.connection->send(unknown) == Error::EncodingError);

    WebSocketUnderTest::set_send_result(false);
    TEST_CHECK(h.connection->send_text("{}") == Error::TransportFailure);
    TEST_CHECK(h.connection->tx_messages() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E3: Malformed frames never end the sequence
// -----------------------------------------------------------------------------
void test_subscription_skips_bad_frames() {
    std::cout << "[TEST] Group E3: subscription skips undecodable frames\n";
    test::ConnectionHarness h;

    auto sub = h.connection->subscribe();
    TEST_CHECK(h.connection->connect(TEST_BASE_URL) == Error::None);

    auto ws = h.connection->ws();
    ws->emit_message(json::envelope("set_complete", COMPLETE_PAYLOAD, 1));
    ws->emit_message(json::envelope("warmup_started", "{}", 2));
    ws->emit_message("not json at all");
    ws->emit_message(R"({"type":"set_complete","payload":{},"version":3})"); // no timestamp
    ws->emit_message(json::envelope("cursor_move", CURSOR_PAYLOAD, 5));
    h.connection->poll();

    TEST_CHECK(h.connection->rx_messages() == 5);

    protocol::Message msg;
    TEST_CHECK(sub->next(msg));
    TEST_CHECK(msg.type == protocol::OperationType::SetComplete);
    TEST_CHECK(msg.version == 1);
    TEST_CHECK(!msg.id.empty());

    TEST_CHECK(sub->next(msg));
    TEST_CHECK(msg.type == protocol::OperationType::CursorMove);
    TEST_CHECK(msg.version == 5);

    TEST_CHECK(!sub->next(msg));
    TEST_CHECK(sub->delivered() == 2);
    TEST_CHECK(sub->decode_failures() == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E4: Type masks
// -----------------------------------------------------------------------------
void test_subscription_mask() {
    std::cout << "[TEST] Group E4: subscription type mask\n";
    test::ConnectionHarness h;

    auto sets = h.connection->subscribe(protocol::OperationType::SetComplete | protocol::OperationType::SetAdd);
    auto all  = h.connection->subscribe();
    TEST_CHECK(h.connection->connect(TEST_BASE_URL) == Error::None);

    h.connection->ws()->emit_message(json::envelope("cursor_move", CURSOR_PAYLOAD));
    h.connection->ws()->emit_message(json::envelope("set_complete", COMPLETE_PAYLOAD));
    h.connection->poll();

    protocol::Message msg;
    TEST_CHECK(sets->next(msg));
    TEST_CHECK(msg.type == protocol::OperationType::SetComplete);
    TEST_CHECK(!sets->next(msg));
    TEST_CHECK(sets->filtered() == 1);

    int count = 0;
    while (all->next(msg)) {
        ++count;
    }
    TEST_CHECK(count == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E5: Subscription survives reconnection
// -----------------------------------------------------------------------------
void test_subscription_survives_reconnect() {
    std::cout << "[TEST] Group E5: subscription survives reconnection\n";
    test::ConnectionHarness h;

    auto sub = h.connection->subscribe();
    TEST_CHECK(h.connection->connect(TEST_BASE_URL) == Error::None);

    // Frames received before the close are still delivered
    h.connection->ws()->emit_message(json::envelope("set_complete", COMPLETE_PAYLOAD, 1));
    h.connection->ws()->emit_close();
    h.connection->poll();
    TEST_CHECK(h.kind() == State::Reconnecting);

    h.fire_retry();
    TEST_CHECK(h.kind() == State::Connected);
    h.connection->ws()->emit_message(json::envelope("set_complete", COMPLETE_PAYLOAD, 2));
    h.connection->poll();

    protocol::Message msg;
    TEST_CHECK(sub->next(msg) && msg.version == 1);
    TEST_CHECK(sub->next(msg) && msg.version == 2);
    TEST_CHECK(!sub->next(msg));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E6: Connected status stream
// -----------------------------------------------------------------------------
void test_status_stream() {
    std::cout << "[TEST] Group E6: status stream\n";
    test::ConnectionHarness h;

    std::vector<bool> seen;
    auto token = h.connection->observe_status().subscribe([&](bool connected) {
        seen.push_back(connected);
    });

    TEST_CHECK(h.connection->connect(TEST_BASE_URL) == Error::None);
    h.connection->disconnect();
    h.connection->observe_status().unsubscribe(token);

    TEST_CHECK(seen.size() == 3);
    TEST_CHECK(seen[0] == false);
    TEST_CHECK(seen[1] == true);
    TEST_CHECK(seen[2] == false);

    // Recorded state sequence: initial, Connecting, Connected, Disconnected
    TEST_CHECK(h.states.size() == 4);
    TEST_CHECK(h.states[1].kind == State::Connecting);
    TEST_CHECK(h.states[2].kind == State::Connected);
    TEST_CHECK(h.states[3].kind == State::Disconnected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_heartbeat();
    test_send();
    test_subscription_skips_bad_frames();
    test_subscription_mask();
    test_subscription_survives_reconnect();
    test_status_stream();

    std::cout << "\n[GROUP E - DATA PLANE TESTS PASSED]\n";
    return 0;
}
