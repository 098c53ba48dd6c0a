#pragma once

#include <string>

#include "repsync/core/protocol/enums/operation_type.hpp"
#include "repsync/core/protocol/writer.hpp"
#include "repsync/core/session/model.hpp"
#include "lcr/json.hpp"


namespace repsync::core {
namespace protocol {
namespace schema {

// ===============================================
// cursor_move
// ===============================================
struct CursorMove {
    static constexpr OperationType type = OperationType::CursorMove;

    std::string account_id;
    session::Cursor cursor{};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        out += "{\"account_id\":";
        lcr::json::append_string(out, account_id);
        out += ",\"cursor\":";
        writer::write_cursor(out, cursor);
        out += '}';
        return true;
    }

    bool operator==(const CursorMove&) const = default;
};

} // namespace schema
} // namespace protocol
} // namespace repsync::core
