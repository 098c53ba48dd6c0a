#pragma once

#include "repsync/core/protocol/schema/set.hpp"
#include "repsync/core/protocol/parser/helpers.hpp"
#include "repsync/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace repsync::core::protocol::parser {

namespace detail {

// Shared shape of set_add / set_update: { exercise_id, set }
template <class Schema>
[[nodiscard]]
inline Result parse_set_carrier_(const simdjson::dom::element& root, Schema& out, const char* what) {
    auto r = adapter::parse_id_required(root, "exercise_id", out.exercise_id);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Field 'exercise_id' missing or invalid in " << what << " -> ignore message.");
        return r;
    }
    simdjson::dom::element set;
    r = helper::parse_object_required(root, "set", set);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Field 'set' missing or invalid in " << what << " -> ignore message.");
        return r;
    }
    r = adapter::parse_set(set, out.set);
    if (r != Result::Parsed) {
        RS_DEBUG("[PARSER] Invalid set in " << what << " (" << to_string(r) << ") -> ignore message.");
        return r;
    }
    return Result::Parsed;
}

} // namespace detail


struct set_add {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::SetAdd& out) {
        return detail::parse_set_carrier_(root, out, "set_add");
    }
};

struct set_update {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::SetUpdate& out) {
        return detail::parse_set_carrier_(root, out, "set_update");
    }
};

struct set_delete {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::SetDelete& out) {
        auto r = adapter::parse_id_required(root, "exercise_id", out.exercise_id);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'exercise_id' missing or invalid in set_delete -> ignore message.");
            return r;
        }
        r = adapter::parse_id_required(root, "set_id", out.set_id);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'set_id' missing or invalid in set_delete -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

struct set_complete {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::SetComplete& out) {
        auto r = adapter::parse_id_required(root, "exercise_id", out.exercise_id);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'exercise_id' missing or invalid in set_complete -> ignore message.");
            return r;
        }
        r = adapter::parse_id_required(root, "set_id", out.set_id);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'set_id' missing or invalid in set_complete -> ignore message.");
            return r;
        }
        r = helper::parse_bool_required(root, "complete", out.complete);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'complete' missing or invalid in set_complete -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace repsync::core::protocol::parser
