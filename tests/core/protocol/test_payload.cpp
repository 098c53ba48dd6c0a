#include <iostream>
#include <string>
#include <variant>

#include "simdjson.h"

#include "repsync/core/protocol/payload.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace repsync::core;
using namespace repsync::core::protocol;


/*
================================================================================
Typed Payload Decoding / Encoding - Unit Tests
================================================================================

Every operation type decodes into its own schema struct, selected by the
envelope type. Schema violations (missing required ids, unknown enum values,
negative durations) are rejected with a Result code and no exception.
Encoding stamps a fresh id and timestamp and keeps the caller's version.
================================================================================
*/

namespace {

simdjson::dom::parser dom;

Message make(OperationType type, std::string payload) {
    Message msg;
    msg.type = type;
    msg.payload = std::move(payload);
    return msg;
}

template <class Schema>
const Schema& expect(const Payload& p) {
    TEST_CHECK(std::holds_alternative<Schema>(p));
    return std::get<Schema>(p);
}

} // namespace


void test_decode_session_messages() {
    std::cout << "[TEST] Decode session_* payloads..." << std::endl;
    Payload p;

    TEST_CHECK(decode_payload(dom, make(OperationType::SessionJoin, json::payload::membership("sess-1", "acc-2")), p) == parser::Result::Parsed);
    const auto& join = expect<schema::SessionJoin>(p);
    TEST_CHECK(join.session_id == "sess-1");
    TEST_CHECK(join.account_id.has() && join.account_id.value() == "acc-2");

    TEST_CHECK(decode_payload(dom, make(OperationType::SessionLeave, R"({"session_id":"sess-1"})"), p) == parser::Result::Parsed);
    TEST_CHECK(!expect<schema::SessionLeave>(p).account_id.has());

    TEST_CHECK(decode_payload(dom, make(OperationType::SessionUpdate, R"({"status":"complete"})"), p) == parser::Result::Parsed);
    const auto& upd = expect<schema::SessionUpdate>(p);
    TEST_CHECK(!upd.name.has());
    TEST_CHECK(upd.status.has() && upd.status.value() == session::SessionStatus::Complete);

    TEST_CHECK(decode_payload(dom, make(OperationType::SessionUpdate, R"({"status":"paused"})"), p) == parser::Result::InvalidValue);

    const std::string items = "[" + json::payload::exercise("e1", "[" + json::payload::set("s1", 1) + "]") + "]";
    TEST_CHECK(decode_payload(dom, make(OperationType::SessionSync, json::payload::session_sync("sess-1", 12, items)), p) == parser::Result::Parsed);
    const auto& sync = expect<schema::SessionSync>(p);
    TEST_CHECK(sync.state.version == 12);
    TEST_CHECK(sync.state.items.size() == 1);
    TEST_CHECK(sync.state.items[0].meta[0].type == session::ExerciseType::WeightReps);
    TEST_CHECK(sync.state.items[0].sets[0].metrics.reps.value() == 10);
    TEST_CHECK(sync.state.items[0].sets[0].metrics.weight.value().unit == session::WeightUnit::Kg);

    // State without items
    TEST_CHECK(decode_payload(dom, make(OperationType::SessionSync, R"({"state":{"session_id":"s","account_id":"a","version":1}})"), p) == parser::Result::InvalidSchema);

    std::cout << "[TEST] OK" << std::endl;
}

void test_decode_exercise_messages() {
    std::cout << "[TEST] Decode exercise_* payloads..." << std::endl;
    Payload p;

    TEST_CHECK(decode_payload(dom, make(OperationType::ExerciseAdd, json::payload::exercise_add(json::payload::exercise("e9"))), p) == parser::Result::Parsed);
    const auto& add = expect<schema::ExerciseAdd>(p);
    TEST_CHECK(add.exercise.id == "e9");
    TEST_CHECK(add.exercise.order == 0);
    TEST_CHECK(add.exercise.sets.empty());

    TEST_CHECK(decode_payload(dom, make(OperationType::ExerciseUpdate, R"({"exercise_id":"e1","set_order":["s2","s1"]})"), p) == parser::Result::Parsed);
    const auto& upd = expect<schema::ExerciseUpdate>(p);
    TEST_CHECK(!upd.rest.has());
    TEST_CHECK(upd.set_order.has() && upd.set_order.value().size() == 2 && upd.set_order.value()[0] == "s2");

    TEST_CHECK(decode_payload(dom, make(OperationType::ExerciseUpdate, R"({"exercise_id":"e1","rest":-5})"), p) == parser::Result::InvalidValue);
    TEST_CHECK(decode_payload(dom, make(OperationType::ExerciseDelete, R"({"exercise_id":""})"), p) == parser::Result::InvalidValue);
    TEST_CHECK(decode_payload(dom, make(OperationType::ExerciseDelete, R"({"exercise_id":"e1"})"), p) == parser::Result::Parsed);
    TEST_CHECK(expect<schema::ExerciseDelete>(p).exercise_id == "e1");

    // Unknown item type
    TEST_CHECK(decode_payload(dom, make(OperationType::ExerciseAdd, R"({"exercise":{"id":"e1","type":"circuit","meta":[]}})"), p) == parser::Result::InvalidValue);

    std::cout << "[TEST] OK" << std::endl;
}

void test_decode_set_messages() {
    std::cout << "[TEST] Decode set_* payloads..." << std::endl;
    Payload p;

    TEST_CHECK(decode_payload(dom, make(OperationType::SetAdd, json::payload::set_add("e1", json::payload::set("s3", 0))), p) == parser::Result::Parsed);
    const auto& add = expect<schema::SetAdd>(p);
    TEST_CHECK(add.exercise_id == "e1");
    TEST_CHECK(add.set.id == "s3");
    TEST_CHECK(add.set.type == session::SetType::Working);

    TEST_CHECK(decode_payload(dom, make(OperationType::SetUpdate,
        R"({"exercise_id":"e1","set":{"id":"s1","order":1,"type":"super","complete":false,"metrics":{"duration":{"value":45},"distance":{"value":1.5,"unit":"km"}}}})"), p) == parser::Result::Parsed);
    const auto& upd = expect<schema::SetUpdate>(p);
    TEST_CHECK(upd.set.type == session::SetType::Superset);
    TEST_CHECK(upd.set.metrics.duration.value().seconds == 45);
    TEST_CHECK(upd.set.metrics.distance.value().to_meters() == 1500.0);
    TEST_CHECK(!upd.set.metrics.reps.has());

    TEST_CHECK(decode_payload(dom, make(OperationType::SetDelete, R"({"exercise_id":"e1"})"), p) == parser::Result::InvalidSchema);
    TEST_CHECK(decode_payload(dom, make(OperationType::SetComplete, json::payload::set_complete("e1", "s1", true)), p) == parser::Result::Parsed);
    TEST_CHECK(expect<schema::SetComplete>(p).complete);
    TEST_CHECK(decode_payload(dom, make(OperationType::SetComplete, R"({"exercise_id":"e1","set_id":"s1","complete":"yes"})"), p) == parser::Result::InvalidSchema);

    // Unknown set type and unit
    TEST_CHECK(decode_payload(dom, make(OperationType::SetAdd, R"({"exercise_id":"e1","set":{"id":"s1","order":1,"type":"pyramid","complete":false}})"), p) == parser::Result::InvalidValue);
    TEST_CHECK(decode_payload(dom, make(OperationType::SetAdd, R"({"exercise_id":"e1","set":{"id":"s1","order":1,"type":"working","complete":false,"metrics":{"weight":{"value":5,"unit":"stone"}}}})"), p) == parser::Result::InvalidValue);

    std::cout << "[TEST] OK" << std::endl;
}

void test_decode_presence_and_sync() {
    std::cout << "[TEST] Decode cursor_move / sync_* payloads..." << std::endl;
    Payload p;

    TEST_CHECK(decode_payload(dom, make(OperationType::CursorMove, R"({"account_id":"acc-2","cursor":{"exercise_id":"e1","exercise_set_id":"s2"}})"), p) == parser::Result::Parsed);
    const auto& cur = expect<schema::CursorMove>(p);
    TEST_CHECK(cur.account_id == "acc-2");
    TEST_CHECK(cur.cursor.exercise_set_id == "s2");

    TEST_CHECK(decode_payload(dom, make(OperationType::SyncRequest, R"({"since_version":41})"), p) == parser::Result::Parsed);
    TEST_CHECK(expect<schema::SyncRequest>(p).since_version.value() == 41);

    TEST_CHECK(decode_payload(dom, make(OperationType::SyncResponse, json::payload::sync_response("sess-1", 3)), p) == parser::Result::Parsed);
    const auto& resp = expect<schema::SyncResponse>(p);
    TEST_CHECK(resp.session.name.value() == "Push day");
    TEST_CHECK(resp.session.status == session::SessionStatus::Active);
    TEST_CHECK(resp.session.participants.size() == 1);
    TEST_CHECK(to_string(resp.session.updated_at) == "2024-05-01T07:30:00.250Z");
    TEST_CHECK(resp.state.version == 3);

    // Payload text is not an object / not JSON
    TEST_CHECK(decode_payload(dom, make(OperationType::SyncRequest, "[]"), p) == parser::Result::InvalidSchema);
    TEST_CHECK(decode_payload(dom, make(OperationType::SyncRequest, "{"), p) == parser::Result::InvalidJson);
    TEST_CHECK(decode_payload(dom, make(OperationType::Unknown, "{}"), p) == parser::Result::InvalidValue);

    std::cout << "[TEST] OK" << std::endl;
}

void test_encode() {
    std::cout << "[TEST] Encode typed payloads..." << std::endl;

    schema::ExerciseUpdate upd;
    upd.exercise_id = "e1";
    upd.set_order = std::vector<std::string>{"s2", "s1"};

    Message msg;
    TEST_CHECK(encode(upd, 8, msg, std::string("sess-1")));
    TEST_CHECK(msg.type == OperationType::ExerciseUpdate);
    TEST_CHECK(msg.version == 8);
    TEST_CHECK(msg.id.size() == 36);
    TEST_CHECK(msg.payload == R"({"exercise_id":"e1","set_order":["s2","s1"]})");

    Message other;
    TEST_CHECK(encode(Payload{schema::SyncRequest{std::int64_t{5}}}, 5, other));
    TEST_CHECK(other.type == OperationType::SyncRequest);
    TEST_CHECK(other.payload == R"({"since_version":5})");
    TEST_CHECK(other.id != msg.id);

    // Set metrics keep the wire names and units
    schema::SetUpdate set_upd;
    set_upd.exercise_id = "e1";
    set_upd.set.id = "s1";
    set_upd.set.order = 2;
    set_upd.set.type = session::SetType::Superset;
    set_upd.set.metrics.reps = std::int64_t{8};
    set_upd.set.metrics.weight = session::Weight{100.0, session::WeightUnit::Lb};
    std::string body;
    TEST_CHECK(set_upd.write_json(body));
    TEST_CHECK(body.find(R"("type":"super")") != std::string::npos);
    TEST_CHECK(body.find(R"("unit":"lb")") != std::string::npos);
    TEST_CHECK(body.find(R"("reps":8)") != std::string::npos);

    // Decoding the encoded body yields the same set
    Payload p;
    TEST_CHECK(decode_payload(dom, make(OperationType::SetUpdate, body), p) == parser::Result::Parsed);
    TEST_CHECK(expect<schema::SetUpdate>(p) == set_upd);

    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    test_decode_session_messages();
    test_decode_exercise_messages();
    test_decode_set_messages();
    test_decode_presence_and_sync();
    test_encode();

    std::cout << "\n[PAYLOAD TESTS PASSED]" << std::endl;
    return 0;
}
