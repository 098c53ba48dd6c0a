#pragma once

#include <string>
#include <vector>

#include "repsync/core/protocol/schema/exercise.hpp"
#include "repsync/core/protocol/parser/helpers.hpp"
#include "repsync/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace repsync::core::protocol::parser {

struct exercise_add {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ExerciseAdd& out) {
        // exercise object (required)
        simdjson::dom::element exercise;
        auto r = helper::parse_object_required(root, "exercise", exercise);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'exercise' missing or invalid in exercise_add -> ignore message.");
            return r;
        }
        r = adapter::parse_exercise(exercise, out.exercise);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Invalid exercise in exercise_add (" << to_string(r) << ") -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

struct exercise_update {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ExerciseUpdate& out) {
        // exercise_id (required)
        auto r = adapter::parse_id_required(root, "exercise_id", out.exercise_id);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'exercise_id' missing or invalid in exercise_update -> ignore message.");
            return r;
        }

        // rest (optional, seconds)
        out.rest.reset();
        lcr::optional<std::int64_t> rest;
        r = helper::parse_int64_optional(root, "rest", rest);
        if (r != Result::Parsed || (rest.has() && rest.value() < 0)) {
            RS_DEBUG("[PARSER] Field 'rest' invalid in exercise_update -> ignore message.");
            return r != Result::Parsed ? r : Result::InvalidValue;
        }
        if (rest.has()) {
            out.rest = session::Duration{rest.value()};
        }

        // set_order (optional)
        out.set_order.reset();
        std::vector<std::string> order;
        bool present = false;
        r = helper::parse_string_list_optional(root, "set_order", order, present);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'set_order' invalid in exercise_update -> ignore message.");
            return r;
        }
        if (present) {
            out.set_order = std::move(order);
        }
        return Result::Parsed;
    }
};

struct exercise_delete {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ExerciseDelete& out) {
        auto r = adapter::parse_id_required(root, "exercise_id", out.exercise_id);
        if (r != Result::Parsed) {
            RS_DEBUG("[PARSER] Field 'exercise_id' missing or invalid in exercise_delete -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace repsync::core::protocol::parser
