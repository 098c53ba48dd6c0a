#pragma once

#include "repsync/core/protocol/schema/presence.hpp"
#include "repsync/core/protocol/parser/helpers.hpp"
#include "repsync/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace repsync::core::protocol::parser {

struct cursor_move {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::CursorMove& out) {
        auto r = adapter::parse_id_required(root, "account_id", out.account_id);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'account_id' missing or invalid in cursor_move -> ignore message.");
            return r;
        }
        simdjson::dom::element cursor;
        r = helper::parse_object_required(root, "cursor", cursor);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'cursor' missing or invalid in cursor_move -> ignore message.");
            return r;
        }
        r = adapter::parse_cursor(cursor, out.cursor);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Invalid cursor in cursor_move -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace repsync::core::protocol::parser
