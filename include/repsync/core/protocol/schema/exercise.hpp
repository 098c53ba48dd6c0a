#pragma once

#include <string>
#include <vector>

#include "repsync/core/protocol/enums/operation_type.hpp"
#include "repsync/core/protocol/writer.hpp"
#include "repsync/core/session/model.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace repsync::core {
namespace protocol {
namespace schema {

// ===============================================
// exercise_add
// ===============================================
//
// Payload: { "exercise": { id, type, rest?, meta[], participants? } }
// The receiver assigns the order (count + 1). Sets may be carried along.
//
struct ExerciseAdd {
    static constexpr OperationType type = OperationType::ExerciseAdd;

    session::Exercise exercise{};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        out += "{\"exercise\":";
        if (!writer::write_exercise(out, exercise, false)) {
            return false;
        }
        // Sets travel only when present
        if (!exercise.sets.empty()) {
            out.pop_back();
            out += ",\"sets\":[";
            for (std::size_t i = 0; i < exercise.sets.size(); ++i) {
                if (i) out += ',';
                if (!writer::write_set(out, exercise.sets[i])) {
                    return false;
                }
            }
            out += "]}";
        }
        out += '}';
        return true;
    }

    bool operator==(const ExerciseAdd&) const = default;
};

// ===============================================
// exercise_update
// ===============================================
//
// Either field may be absent. `set_order` lists set ids in their new order.
//
struct ExerciseUpdate {
    static constexpr OperationType type = OperationType::ExerciseUpdate;

    std::string exercise_id;
    lcr::optional<session::Duration> rest{};
    lcr::optional<std::vector<std::string>> set_order{};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        bool first = true;
        out += '{';
        lcr::json::append_key(out, "exercise_id", first);
        lcr::json::append_string(out, exercise_id);
        if (rest.has()) {
            lcr::json::append_key(out, "rest", first);
            lcr::json::append(out, rest.value().seconds);
        }
        if (set_order.has()) {
            lcr::json::append_key(out, "set_order", first);
            writer::write_string_list(out, set_order.value());
        }
        out += '}';
        return true;
    }

    bool operator==(const ExerciseUpdate&) const = default;
};

// ===============================================
// exercise_delete
// ===============================================
struct ExerciseDelete {
    static constexpr OperationType type = OperationType::ExerciseDelete;

    std::string exercise_id;

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        out += "{\"exercise_id\":";
        lcr::json::append_string(out, exercise_id);
        out += '}';
        return true;
    }

    bool operator==(const ExerciseDelete&) const = default;
};

} // namespace schema
} // namespace protocol
} // namespace repsync::core
