#pragma once

#include <string>
#include <string_view>

#include "repsync/core/protocol/message.hpp"
#include "repsync/core/protocol/message_id.hpp"
#include "repsync/core/protocol/parser/result.hpp"
#include "repsync/core/protocol/parser/helpers.hpp"
#include "repsync/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace repsync::core::protocol::parser {

/*
===============================================================================
 Envelope parser
===============================================================================

Decodes one raw text frame into a protocol::Message.

Rules:
  - The frame MUST be a JSON object
  - `type` is required and MUST be a known operation type
  - `id` is generated locally when absent
  - `payload` MUST be an object when present; absent means {}
  - `timestamp` is required and accepts every supported ISO-8601 shape
  - `version` is required (integer)

The payload is stored minified; its schema is validated later by
protocol::decode_payload().
===============================================================================
*/
[[nodiscard]]
inline Result parse_envelope(simdjson::dom::parser& json, std::string_view raw, Message& out) {
    simdjson::dom::element root;
    auto error = json.parse(raw.data(), raw.size()).get(root);
    if (error) {
        RS_WARN("[PARSER] Failed to parse frame as JSON: " << simdjson::error_message(error));
        return Result::InvalidJson;
    }
    if (helper::require_object(root) != Result::Parsed) {
        RS_WARN("[PARSER] Root is not an object -> ignore message.");
        return Result::InvalidSchema;
    }

    out = Message{};

    // type (required)
    std::string_view type_sv;
    auto r = helper::parse_string_required(root, "type", type_sv);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Field 'type' missing or invalid in envelope -> ignore message.");
        return r;
    }
    out.type = to_operation_type_enum(type_sv);
    if (out.type == OperationType::Unknown) {
        RS_DEBUG("[PARSER] Unknown operation type '" << type_sv << "' -> ignore message.");
        return Result::InvalidValue;
    }

    // id (client-generated if absent)
    lcr::optional<std::string> id;
    r = helper::parse_string_optional(root, "id", id);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Field 'id' invalid in envelope -> ignore message.");
        return r;
    }
    out.id = (id.has() && !id.value().empty()) ? std::move(id.value()) : make_message_id();

    // session_id (optional)
    r = helper::parse_string_optional(root, "session_id", out.session_id);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Field 'session_id' invalid in envelope -> ignore message.");
        return r;
    }

    // payload (object, optional)
    simdjson::dom::element payload;
    bool present = false;
    r = helper::parse_object_optional(root, "payload", payload, present);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Field 'payload' is not an object in envelope -> ignore message.");
        return r;
    }
    out.payload = present ? simdjson::minify(payload) : std::string("{}");

    // timestamp (required)
    r = adapter::parse_timestamp_required(root, "timestamp", out.timestamp);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Field 'timestamp' missing or invalid in envelope -> ignore message.");
        return r;
    }

    // version (required)
    r = helper::parse_int64_required(root, "version", out.version);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Field 'version' missing or invalid in envelope -> ignore message.");
        return r;
    }

    // correlation_id (optional)
    r = helper::parse_string_optional(root, "correlation_id", out.correlation_id);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Field 'correlation_id' invalid in envelope -> ignore message.");
        return r;
    }

    return Result::Parsed;
}

} // namespace repsync::core::protocol::parser
