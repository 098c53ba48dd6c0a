#include <iostream>
#include <string>
#include <string_view>

#include "simdjson.h"

#include "repsync/core/protocol/parser/envelope.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace repsync::core;
using namespace repsync::core::protocol;


/*
================================================================================
Envelope Parser - Unit Tests
================================================================================

Validates the decoding of raw frames into protocol::Message:
  • Required fields (type, timestamp, version) are enforced
  • A missing or empty id is replaced by a locally generated one
  • The payload must be an object and is kept as raw text
  • Unknown operation types and malformed JSON are rejected, never thrown
================================================================================
*/


void test_envelope_success() {
    std::cout << "[TEST] Envelope parser (success)..." << std::endl;

    constexpr std::string_view raw = R"json(
    {
        "id": "abc-1",
        "type": "set_complete",
        "session_id": "sess-1",
        "payload": { "exercise_id": "e1", "set_id": "s1", "complete": true },
        "timestamp": "2024-05-01T10:00:00.500Z",
        "version": 7,
        "correlation_id": "corr-9"
    }
    )json";

    simdjson::dom::parser dom;
    Message msg;
    TEST_CHECK(parser::parse_envelope(dom, raw, msg) == parser::Result::Parsed);

    TEST_CHECK(msg.id == "abc-1");
    TEST_CHECK(msg.type == OperationType::SetComplete);
    TEST_CHECK(msg.session_id.has() && msg.session_id.value() == "sess-1");
    TEST_CHECK(msg.payload == R"({"exercise_id":"e1","set_id":"s1","complete":true})");
    TEST_CHECK(to_string(msg.timestamp) == "2024-05-01T10:00:00.500Z");
    TEST_CHECK(msg.version == 7);
    TEST_CHECK(msg.correlation_id.has() && msg.correlation_id.value() == "corr-9");

    std::cout << "[TEST] OK" << std::endl;
}

void test_envelope_generates_id() {
    std::cout << "[TEST] Envelope parser (id generated when absent)..." << std::endl;

    simdjson::dom::parser dom;
    Message a;
    Message b;
    TEST_CHECK(parser::parse_envelope(dom, R"({"type":"sync_request","timestamp":"2024-05-01T10:00:00Z","version":0})", a) == parser::Result::Parsed);
    TEST_CHECK(parser::parse_envelope(dom, R"({"id":"","type":"sync_request","timestamp":"2024-05-01T10:00:00Z","version":0})", b) == parser::Result::Parsed);

    TEST_CHECK(a.id.size() == 36);
    TEST_CHECK(b.id.size() == 36);
    TEST_CHECK(a.id != b.id);
    TEST_CHECK(a.payload == "{}");
    TEST_CHECK(!a.session_id.has());
    TEST_CHECK(!a.correlation_id.has());

    std::cout << "[TEST] OK" << std::endl;
}

void test_envelope_timestamp_forms() {
    std::cout << "[TEST] Envelope parser (timestamp forms)..." << std::endl;

    simdjson::dom::parser dom;
    const char* forms[] = {
        "2024-05-01T12:00:00.000+02:00",
        "2024-05-01T12:00:00+02:00",
        "2024-05-01T10:00:00Z",
        "2024-05-01T10:00:00",
    };
    for (const char* ts : forms) {
        std::string raw = std::string(R"({"type":"sync_request","timestamp":")") + ts + R"(","version":1})";
        Message msg;
        TEST_CHECK(parser::parse_envelope(dom, raw, msg) == parser::Result::Parsed);
        TEST_CHECK(to_string(msg.timestamp) == "2024-05-01T10:00:00.000Z");
    }

    std::cout << "[TEST] OK" << std::endl;
}

void test_envelope_missing_required() {
    std::cout << "[TEST] Envelope parser (missing required fields)..." << std::endl;

    simdjson::dom::parser dom;
    Message msg;

    // No type
    TEST_CHECK(parser::parse_envelope(dom, R"({"timestamp":"2024-05-01T10:00:00Z","version":1})", msg) == parser::Result::InvalidSchema);
    // No timestamp
    TEST_CHECK(parser::parse_envelope(dom, R"({"type":"sync_request","version":1})", msg) == parser::Result::InvalidSchema);
    // No version
    TEST_CHECK(parser::parse_envelope(dom, R"({"type":"sync_request","timestamp":"2024-05-01T10:00:00Z"})", msg) == parser::Result::InvalidSchema);

    std::cout << "[TEST] OK" << std::endl;
}

void test_envelope_invalid_values() {
    std::cout << "[TEST] Envelope parser (invalid values)..." << std::endl;

    simdjson::dom::parser dom;
    Message msg;

    // Unknown operation type
    TEST_CHECK(parser::parse_envelope(dom, json::envelope("warmup_started", "{}"), msg) == parser::Result::InvalidValue);
    // Unparseable timestamp
    TEST_CHECK(parser::parse_envelope(dom, R"({"type":"sync_request","timestamp":"yesterday","version":1})", msg) == parser::Result::InvalidValue);
    // Payload is not an object
    TEST_CHECK(parser::parse_envelope(dom, json::envelope("sync_request", "[1,2,3]"), msg) == parser::Result::InvalidSchema);
    // Version is not an integer
    TEST_CHECK(parser::parse_envelope(dom, R"({"type":"sync_request","timestamp":"2024-05-01T10:00:00Z","version":"7"})", msg) == parser::Result::InvalidSchema);
    // Root is not an object
    TEST_CHECK(parser::parse_envelope(dom, R"(["sync_request"])", msg) == parser::Result::InvalidSchema);
    // Not JSON
    TEST_CHECK(parser::parse_envelope(dom, R"({"type":)", msg) == parser::Result::InvalidJson);

    std::cout << "[TEST] OK" << std::endl;
}

void test_envelope_write_json() {
    std::cout << "[TEST] Envelope writer..." << std::endl;

    Message msg;
    msg.id = "abc-1";
    msg.type = OperationType::SessionJoin;
    msg.session_id = std::string("sess-1");
    msg.payload = R"({"session_id":"sess-1"})";
    TEST_CHECK(parse_iso8601("2024-05-01T10:00:00Z", msg.timestamp));
    msg.version = 3;

    TEST_CHECK(msg.to_json() ==
        R"({"id":"abc-1","type":"session_join","session_id":"sess-1","payload":{"session_id":"sess-1"},)"
        R"("timestamp":"2024-05-01T10:00:00.000Z","version":3})");

    // The encoded envelope decodes back to the same fields
    simdjson::dom::parser dom;
    Message back;
    TEST_CHECK(parser::parse_envelope(dom, msg.to_json(), back) == parser::Result::Parsed);
    TEST_CHECK(back.id == msg.id);
    TEST_CHECK(back.type == msg.type);
    TEST_CHECK(back.payload == msg.payload);
    TEST_CHECK(back.timestamp == msg.timestamp);
    TEST_CHECK(back.version == msg.version);

    // Unknown type cannot be represented
    Message unknown;
    std::string out;
    TEST_CHECK(!unknown.write_json(out));
    TEST_CHECK(unknown.to_json().empty());

    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    test_envelope_success();
    test_envelope_generates_id();
    test_envelope_timestamp_forms();
    test_envelope_missing_required();
    test_envelope_invalid_values();
    test_envelope_write_json();

    std::cout << "\n[ENVELOPE PARSER TESTS PASSED]" << std::endl;
    return 0;
}
