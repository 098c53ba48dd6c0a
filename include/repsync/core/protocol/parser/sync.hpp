#pragma once

#include "repsync/core/protocol/schema/sync.hpp"
#include "repsync/core/protocol/parser/helpers.hpp"
#include "repsync/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace repsync::core::protocol::parser {

struct sync_request {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::SyncRequest& out) {
        auto r = helper::parse_int64_optional(root, "since_version", out.since_version);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'since_version' invalid in sync_request -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

struct sync_response {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::SyncResponse& out) {
        // session object (required)
        simdjson::dom::element obj;
        auto r = helper::parse_object_required(root, "session", obj);
        if (r != Result::Parsed) {
            RS_WARN("[PARSER] Field 'session' missing or invalid in sync_response -> ignore message.");
            return r;
        }
        r = adapter::parse_document(obj, out.session);
        if (r != Result::Parsed) {
            RS_WARN("[PARSER] Invalid session in sync_response (" << to_string(r) << ") -> ignore message.");
            return r;
        }

        // state object (required)
        r = helper::parse_object_required(root, "state", obj);
        if (r != Result::Parsed) {
            RS_WARN("[PARSER] Field 'state' missing or invalid in sync_response -> ignore message.");
            return r;
        }
        r = adapter::parse_state(obj, out.state);
        if (r != Result::Parsed) {
            RS_WARN("[PARSER] Invalid state in sync_response (" << to_string(r) << ") -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace repsync::core::protocol::parser
