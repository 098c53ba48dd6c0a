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
// set_add
// ===============================================
//
// An order of 0 means "append": the receiver assigns count + 1.
//
struct SetAdd {
    static constexpr OperationType type = OperationType::SetAdd;

    std::string exercise_id;
    session::ExerciseSet set{};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        out += "{\"exercise_id\":";
        lcr::json::append_string(out, exercise_id);
        out += ",\"set\":";
        if (!writer::write_set(out, set)) {
            return false;
        }
        out += '}';
        return true;
    }

    bool operator==(const SetAdd&) const = default;
};

// ===============================================
// set_update (wholesale replace of one set)
// ===============================================
struct SetUpdate {
    static constexpr OperationType type = OperationType::SetUpdate;

    std::string exercise_id;
    session::ExerciseSet set{};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        out += "{\"exercise_id\":";
        lcr::json::append_string(out, exercise_id);
        out += ",\"set\":";
        if (!writer::write_set(out, set)) {
            return false;
        }
        out += '}';
        return true;
    }

    bool operator==(const SetUpdate&) const = default;
};

// ===============================================
// set_delete
// ===============================================
struct SetDelete {
    static constexpr OperationType type = OperationType::SetDelete;

    std::string exercise_id;
    std::string set_id;

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        out += "{\"exercise_id\":";
        lcr::json::append_string(out, exercise_id);
        out += ",\"set_id\":";
        lcr::json::append_string(out, set_id);
        out += '}';
        return true;
    }

    bool operator==(const SetDelete&) const = default;
};

// ===============================================
// set_complete (explicit flag, not a toggle)
// ===============================================
struct SetComplete {
    static constexpr OperationType type = OperationType::SetComplete;

    std::string exercise_id;
    std::string set_id;
    bool complete{false};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        out += "{\"exercise_id\":";
        lcr::json::append_string(out, exercise_id);
        out += ",\"set_id\":";
        lcr::json::append_string(out, set_id);
        out += ",\"complete\":";
        lcr::json::append_bool(out, complete);
        out += '}';
        return true;
    }

    bool operator==(const SetComplete&) const = default;
};

} // namespace schema
} // namespace protocol
} // namespace repsync::core
