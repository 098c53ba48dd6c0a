#pragma once

#include <string>
#include <string_view>
#include <cstdint>

// ----------------------------------------------------------------------------
// Helper JSON frames (wire envelopes and payload bodies)
// ----------------------------------------------------------------------------

namespace json {

inline constexpr const char* TEST_TIMESTAMP = "2024-05-01T10:00:00Z";

// -----------------------------------------------------------------------------
// Envelope
// -----------------------------------------------------------------------------

inline std::string envelope(std::string_view type, std::string_view payload, std::int64_t version = 1) {
    std::string out = R"({"id":"msg-)" + std::to_string(version) + R"(","type":")";
    out += type;
    out += R"(","payload":)";
    out += payload;
    out += R"(,"timestamp":")";
    out += TEST_TIMESTAMP;
    out += R"(","version":)";
    out += std::to_string(version);
    out += '}';
    return out;
}

namespace payload {

// -----------------------------------------------------------------------------
// Sets
// -----------------------------------------------------------------------------

inline std::string set(std::string_view id, std::int64_t order, bool complete = false) {
    return std::string(R"({"id":")") + std::string(id) + R"(","order":)" + std::to_string(order) +
           R"(,"metrics":{"reps":10,"weight":{"value":60.0,"unit":"kg"}},"type":"working","complete":)" +
           (complete ? "true" : "false") + "}";
}

inline std::string set_complete(std::string_view exercise_id, std::string_view set_id, bool complete) {
    return std::string(R"({"exercise_id":")") + std::string(exercise_id) + R"(","set_id":")" +
           std::string(set_id) + R"(","complete":)" + (complete ? "true" : "false") + "}";
}

inline std::string set_add(std::string_view exercise_id, const std::string& set_json) {
    return std::string(R"({"exercise_id":")") + std::string(exercise_id) + R"(","set":)" + set_json + "}";
}

// -----------------------------------------------------------------------------
// Exercises
// -----------------------------------------------------------------------------

inline std::string exercise(std::string_view id, const std::string& sets_json = "[]") {
    return std::string(R"({"id":")") + std::string(id) +
           R"(","type":"single","meta":[{"internal_id":"bench","name":"Bench Press","type":"weight_reps"}],"sets":)" +
           sets_json + "}";
}

inline std::string exercise_add(const std::string& exercise_json) {
    return R"({"exercise":)" + exercise_json + "}";
}

// -----------------------------------------------------------------------------
// Session
// -----------------------------------------------------------------------------

inline std::string state(std::string_view session_id, std::int64_t version, const std::string& items_json = "[]") {
    return std::string(R"({"session_id":")") + std::string(session_id) +
           R"(","account_id":"acc-1","version":)" + std::to_string(version) +
           R"(,"items":)" + items_json + "}";
}

inline std::string session_sync(std::string_view session_id, std::int64_t version, const std::string& items_json = "[]") {
    return R"({"state":)" + state(session_id, version, items_json) + "}";
}

inline std::string document(std::string_view session_id) {
    return std::string(R"({"id":")") + std::string(session_id) +
           R"(","name":"Push day","status":"active","owner_id":"acc-1",)"
           R"("created_at":"2024-05-01T09:00:00Z","updated_at":"2024-05-01T09:30:00.250+02:00",)"
           R"("participants":[{"id":"acc-1","color":"#FF6B6B"}],"invitations":[]})";
}

inline std::string sync_response(std::string_view session_id, std::int64_t version, const std::string& items_json = "[]") {
    return R"({"session":)" + document(session_id) + R"(,"state":)" + state(session_id, version, items_json) + "}";
}

inline std::string membership(std::string_view session_id, std::string_view account_id) {
    return std::string(R"({"session_id":")") + std::string(session_id) + R"(","account_id":")" + std::string(account_id) + R"("})";
}

} // namespace payload
} // namespace json
