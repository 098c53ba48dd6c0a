#pragma once

#include "repsync/core/protocol/schema/session.hpp"
#include "repsync/core/protocol/parser/helpers.hpp"
#include "repsync/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace repsync::core::protocol::parser {

namespace detail {

template <class Schema>
[[nodiscard]]
inline Result parse_membership_(const simdjson::dom::element& root, Schema& out, const char* what) {
    auto r = helper::require_object(root);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Payload not an object in " << what << " -> ignore message.");
        return r;
    }

    // session_id (required)
    r = helper::parse_string_required(root, "session_id", out.session_id);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Field 'session_id' missing or invalid in " << what << " -> ignore message.");
        return r;
    }

    // account_id (optional)
    r = helper::parse_string_optional(root, "account_id", out.account_id);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Field 'account_id' invalid in " << what << " -> ignore message.");
        return r;
    }
    return Result::Parsed;
}

} // namespace detail


struct session_join {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::SessionJoin& out) {
        return detail::parse_membership_(root, out, "session_join");
    }
};

struct session_leave {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::SessionLeave& out) {
        return detail::parse_membership_(root, out, "session_leave");
    }
};

struct session_update {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::SessionUpdate& out) {
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Payload not an object in session_update -> ignore message.");
            return r;
        }

        // name (optional)
        r = helper::parse_string_optional(root, "name", out.name);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'name' invalid in session_update -> ignore message.");
            return r;
        }

        // status (optional)
        out.status.reset();
        lcr::optional<std::string> status;
        r = helper::parse_string_optional(root, "status", status);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'status' invalid in session_update -> ignore message.");
            return r;
        }
        if (status.has()) {
            auto s = session::to_session_status_enum(status.value());
            if (s == session::SessionStatus::Unknown) {
                RS_DEBUG("[PARSER] Unknown status '" << status.value() << "' in session_update -> ignore message.");
                return Result::InvalidValue;
            }
            out.status = s;
        }
        return Result::Parsed;
    }
};

struct session_sync {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::SessionSync& out) {
        // state object (required)
        simdjson::dom::element state;
        auto r = helper::parse_object_required(root, "state", state);
        if (r != Result::Parsed) {
            RS_WARN("[PARSER] Field 'state' missing or invalid in session_sync -> ignore message.");
            return r;
        }
        r = adapter::parse_state(state, out.state);
        if (r != Result::Parsed) {
            RS_WARN("[PARSER] Invalid state in session_sync (" << to_string(r) << ") -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace repsync::core::protocol::parser
