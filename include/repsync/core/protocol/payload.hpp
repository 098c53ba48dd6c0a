#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "repsync/core/protocol/message.hpp"
#include "repsync/core/protocol/message_id.hpp"
#include "repsync/core/protocol/schema/session.hpp"
#include "repsync/core/protocol/schema/exercise.hpp"
#include "repsync/core/protocol/schema/set.hpp"
#include "repsync/core/protocol/schema/presence.hpp"
#include "repsync/core/protocol/schema/sync.hpp"
#include "repsync/core/protocol/parser/result.hpp"
#include "repsync/core/protocol/parser/session.hpp"
#include "repsync/core/protocol/parser/exercise.hpp"
#include "repsync/core/protocol/parser/set.hpp"
#include "repsync/core/protocol/parser/presence.hpp"
#include "repsync/core/protocol/parser/sync.hpp"
#include "repsync/core/timestamp.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"


namespace repsync::core::protocol {

/*
===============================================================================
 protocol::Payload (closed set of typed payloads)
===============================================================================

Alternative index == static_cast<size_t>(OperationType). Reconciliation code
only ever sees these types, never raw JSON.
===============================================================================
*/
using Payload = std::variant<
    schema::SessionJoin,
    schema::SessionLeave,
    schema::SessionUpdate,
    schema::SessionSync,
    schema::ExerciseAdd,
    schema::ExerciseUpdate,
    schema::ExerciseDelete,
    schema::SetAdd,
    schema::SetUpdate,
    schema::SetDelete,
    schema::SetComplete,
    schema::CursorMove,
    schema::SyncRequest,
    schema::SyncResponse
>;

static_assert(std::variant_size_v<Payload> == OPERATION_TYPE_COUNT,
    "Payload alternatives must cover every OperationType");

namespace detail {

template <std::size_t I>
constexpr bool payload_index_matches_() {
    if constexpr (I == std::variant_size_v<Payload>) {
        return true;
    } else {
        return std::variant_alternative_t<I, Payload>::type == static_cast<OperationType>(I)
            && payload_index_matches_<I + 1>();
    }
}

static_assert(payload_index_matches_<0>(), "Payload alternative order must follow OperationType");

template <class Schema, class Parser>
[[nodiscard]]
inline parser::Result decode_as_(const simdjson::dom::element& root, Payload& out) {
    Schema value{};
    auto r = Parser::parse(root, value);
    if (r == parser::Result::Parsed) {
        out = std::move(value);
    }
    return r;
}

} // namespace detail


[[nodiscard]]
inline OperationType type_of(const Payload& p) noexcept {
    return static_cast<OperationType>(p.index());
}

// ----------------------------------------------------------------------------
// Decoding
// ----------------------------------------------------------------------------
//
// Validates `msg.payload` against the schema registered for `msg.type`.
// Failures are logged by the per-type parsers; the caller only drops.
//
[[nodiscard]]
inline parser::Result decode_payload(simdjson::dom::parser& json, const Message& msg, Payload& out) {
    simdjson::dom::element root;
    auto error = json.parse(msg.payload).get(root);
    if (error) {
        RS_WARN("[PARSER] Payload of " << to_string(msg.type) << " is not valid JSON: " << simdjson::error_message(error));
        return parser::Result::InvalidJson;
    }
    if (parser::helper::require_object(root) != parser::Result::Parsed) {
        RS_DEBUG("[PARSER] Payload of " << to_string(msg.type) << " is not an object -> ignore message.");
        return parser::Result::InvalidSchema;
    }

    switch (msg.type) {
        case OperationType::SessionJoin:    return detail::decode_as_<schema::SessionJoin,    parser::session_join>(root, out);
        case OperationType::SessionLeave:   return detail::decode_as_<schema::SessionLeave,   parser::session_leave>(root, out);
        case OperationType::SessionUpdate:  return detail::decode_as_<schema::SessionUpdate,  parser::session_update>(root, out);
        case OperationType::SessionSync:    return detail::decode_as_<schema::SessionSync,    parser::session_sync>(root, out);
        case OperationType::ExerciseAdd:    return detail::decode_as_<schema::ExerciseAdd,    parser::exercise_add>(root, out);
        case OperationType::ExerciseUpdate: return detail::decode_as_<schema::ExerciseUpdate, parser::exercise_update>(root, out);
        case OperationType::ExerciseDelete: return detail::decode_as_<schema::ExerciseDelete, parser::exercise_delete>(root, out);
        case OperationType::SetAdd:         return detail::decode_as_<schema::SetAdd,         parser::set_add>(root, out);
        case OperationType::SetUpdate:      return detail::decode_as_<schema::SetUpdate,      parser::set_update>(root, out);
        case OperationType::SetDelete:      return detail::decode_as_<schema::SetDelete,      parser::set_delete>(root, out);
        case OperationType::SetComplete:    return detail::decode_as_<schema::SetComplete,    parser::set_complete>(root, out);
        case OperationType::CursorMove:     return detail::decode_as_<schema::CursorMove,     parser::cursor_move>(root, out);
        case OperationType::SyncRequest:    return detail::decode_as_<schema::SyncRequest,    parser::sync_request>(root, out);
        case OperationType::SyncResponse:   return detail::decode_as_<schema::SyncResponse,   parser::sync_response>(root, out);
        default:
            RS_DEBUG("[PARSER] No payload schema for type " << to_string(msg.type) << " -> ignore message.");
            return parser::Result::InvalidValue;
    }
}

// ----------------------------------------------------------------------------
// Encoding
// ----------------------------------------------------------------------------
//
// Stamps a fresh id and the current time; version and correlation id are
// supplied by the caller. Returns false if the payload cannot be serialized.
//
template <class Schema>
[[nodiscard]]
inline bool encode(const Schema& payload, std::int64_t version, Message& out,
                   lcr::optional<std::string> session_id = {},
                   lcr::optional<std::string> correlation_id = {}) {
    std::string body;
    if (!payload.write_json(body)) {
        return false;
    }
    out.id = make_message_id();
    out.type = Schema::type;
    out.session_id = std::move(session_id);
    out.payload = std::move(body);
    out.timestamp = now();
    out.version = version;
    out.correlation_id = std::move(correlation_id);
    return true;
}

[[nodiscard]]
inline bool encode(const Payload& payload, std::int64_t version, Message& out,
                   lcr::optional<std::string> session_id = {},
                   lcr::optional<std::string> correlation_id = {}) {
    return std::visit([&](const auto& p) {
        return encode(p, version, out, std::move(session_id), std::move(correlation_id));
    }, payload);
}

} // namespace repsync::core::protocol
