#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "repsync/core/session/enums.hpp"
#include "repsync/core/session/model.hpp"
#include "repsync/core/protocol/parser/result.hpp"
#include "repsync/core/protocol/parser/helpers.hpp"
#include "repsync/core/timestamp.hpp"

#include "simdjson.h"

/*
================================================================================
Session Parsing Adapters (Domain-Level Converters)
================================================================================

Domain-aware adapters that convert validated JSON primitives into strongly
typed session model objects (metrics, sets, exercises, state, participants,
session documents).

Adapters sit between:
  • Low-level JSON helpers (helper::parse_*), and
  • Payload parsers responsible for logging and dispatch

Responsibilities:
  • Convert primitive JSON fields into domain types (enums, Timestamp…)
  • Enforce semantic constraints (non-empty ids, known enum values)
  • Reject invalid or unknown domain values with Result::InvalidValue
  • Reject structural mismatches with Result::InvalidSchema

Design principles:
  • Adapters do NOT perform logging
  • Adapters do NOT inspect envelope-level structure
  • A failed adapter leaves its output in an unspecified state

Separation of concerns:
  - helper::*   → JSON mechanics and type extraction
  - adapter::*  → Domain semantics and validation
  - parser::*   → Message orchestration, logging, and control flow

================================================================================
*/


namespace repsync::core::protocol::parser::adapter {

// ------------------------------------------------------------
// Identifiers
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_id_required(const simdjson::dom::element& obj, const char* key, std::string& out) {
    std::string_view sv;
    auto r = helper::parse_string_required(obj, key, sv);
    if (r != Result::Parsed) {
        return r;
    }
    if (sv.empty()) {
        return Result::InvalidValue;
    }
    out.assign(sv);
    return Result::Parsed;
}


// ------------------------------------------------------------
// Timestamps (ISO-8601, several accepted shapes)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_timestamp_required(const simdjson::dom::element& obj, const char* key, Timestamp& out) noexcept {
    std::string_view sv;
    auto r = helper::parse_string_required(obj, key, sv);
    if (r != Result::Parsed) {
        return r;
    }
    return parse_iso8601(sv, out) ? Result::Parsed : Result::InvalidValue;
}

[[nodiscard]]
inline Result parse_timestamp_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<Timestamp>& out) {
    out.reset();
    lcr::optional<std::string> raw;
    auto r = helper::parse_string_optional(obj, key, raw);
    if (r != Result::Parsed || !raw.has()) {
        return r;
    }
    Timestamp ts{};
    if (!parse_iso8601(raw.value(), ts)) {
        return Result::InvalidValue;
    }
    out = ts;
    return Result::Parsed;
}


// ------------------------------------------------------------
// Enums
// ------------------------------------------------------------
template <typename Enum, Enum (*Convert)(std::string_view) noexcept>
[[nodiscard]]
inline Result parse_enum_required_(const simdjson::dom::element& obj, const char* key, Enum& out) noexcept {
    std::string_view sv;
    auto r = helper::parse_string_required(obj, key, sv);
    if (r != Result::Parsed) {
        return r;
    }
    out = Convert(sv);
    // Present but unknown value
    if (out == Enum::Unknown) {
        return Result::InvalidValue;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_session_status_required(const simdjson::dom::element& obj, const char* key, session::SessionStatus& out) noexcept {
    return parse_enum_required_<session::SessionStatus, session::to_session_status_enum>(obj, key, out);
}

[[nodiscard]]
inline Result parse_exercise_type_required(const simdjson::dom::element& obj, const char* key, session::ExerciseType& out) noexcept {
    return parse_enum_required_<session::ExerciseType, session::to_exercise_type_enum>(obj, key, out);
}

[[nodiscard]]
inline Result parse_item_type_required(const simdjson::dom::element& obj, const char* key, session::ItemType& out) noexcept {
    return parse_enum_required_<session::ItemType, session::to_item_type_enum>(obj, key, out);
}

[[nodiscard]]
inline Result parse_set_type_required(const simdjson::dom::element& obj, const char* key, session::SetType& out) noexcept {
    return parse_enum_required_<session::SetType, session::to_set_type_enum>(obj, key, out);
}

[[nodiscard]]
inline Result parse_weight_unit_required(const simdjson::dom::element& obj, const char* key, session::WeightUnit& out) noexcept {
    return parse_enum_required_<session::WeightUnit, session::to_weight_unit_enum>(obj, key, out);
}

[[nodiscard]]
inline Result parse_distance_unit_required(const simdjson::dom::element& obj, const char* key, session::DistanceUnit& out) noexcept {
    return parse_enum_required_<session::DistanceUnit, session::to_distance_unit_enum>(obj, key, out);
}


// ------------------------------------------------------------
// Metrics
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_metrics(const simdjson::dom::element& obj, session::Metrics& out) {
    out = session::Metrics{};
    if (helper::require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }

    auto r = helper::parse_int64_optional(obj, "reps", out.reps);
    if (r != Result::Parsed) {
        return r;
    }
    if (out.reps.has() && out.reps.value() < 0) {
        return Result::InvalidValue;
    }

    simdjson::dom::element sub;
    bool present = false;

    // weight: { value, unit }
    r = helper::parse_object_optional(obj, "weight", sub, present);
    if (r != Result::Parsed) {
        return r;
    }
    if (present) {
        session::Weight w;
        r = helper::parse_double_required(sub, "value", w.value);
        if (r != Result::Parsed) {
            return r;
        }
        r = parse_weight_unit_required(sub, "unit", w.unit);
        if (r != Result::Parsed) {
            return r;
        }
        out.weight = w;
    }

    // distance: { value, unit }
    r = helper::parse_object_optional(obj, "distance", sub, present);
    if (r != Result::Parsed) {
        return r;
    }
    if (present) {
        session::Distance d;
        r = helper::parse_double_required(sub, "value", d.value);
        if (r != Result::Parsed) {
            return r;
        }
        r = parse_distance_unit_required(sub, "unit", d.unit);
        if (r != Result::Parsed) {
            return r;
        }
        out.distance = d;
    }

    // duration: { value } (seconds)
    r = helper::parse_object_optional(obj, "duration", sub, present);
    if (r != Result::Parsed) {
        return r;
    }
    if (present) {
        session::Duration d;
        r = helper::parse_int64_required(sub, "value", d.seconds);
        if (r != Result::Parsed) {
            return r;
        }
        if (d.seconds < 0) {
            return Result::InvalidValue;
        }
        out.duration = d;
    }

    return Result::Parsed;
}


// ------------------------------------------------------------
// Exercise set
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_set(const simdjson::dom::element& obj, session::ExerciseSet& out) {
    auto r = parse_id_required(obj, "id", out.id);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_int64_required(obj, "order", out.order);
    if (r != Result::Parsed) {
        return r;
    }
    r = parse_set_type_required(obj, "type", out.type);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_bool_required(obj, "complete", out.complete);
    if (r != Result::Parsed) {
        return r;
    }
    simdjson::dom::element metrics;
    bool present = false;
    r = helper::parse_object_optional(obj, "metrics", metrics, present);
    if (r != Result::Parsed) {
        return r;
    }
    if (present) {
        return parse_metrics(metrics, out.metrics);
    }
    out.metrics = session::Metrics{};
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_set_list(const simdjson::dom::array& arr, std::vector<session::ExerciseSet>& out) {
    out.clear();
    for (auto v : arr) {
        session::ExerciseSet s;
        auto r = parse_set(v, s);
        if (r != Result::Parsed) {
            return r;
        }
        out.push_back(std::move(s));
    }
    return Result::Parsed;
}


// ------------------------------------------------------------
// Exercise meta
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_meta(const simdjson::dom::element& obj, session::ExerciseMeta& out) {
    auto r = parse_id_required(obj, "internal_id", out.internal_id);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_string_required(obj, "name", out.name);
    if (r != Result::Parsed) {
        return r;
    }
    return parse_exercise_type_required(obj, "type", out.type);
}

[[nodiscard]]
inline Result parse_meta_list(const simdjson::dom::array& arr, std::vector<session::ExerciseMeta>& out) {
    out.clear();
    for (auto v : arr) {
        session::ExerciseMeta m;
        auto r = parse_meta(v, m);
        if (r != Result::Parsed) {
            return r;
        }
        out.push_back(std::move(m));
    }
    return Result::Parsed;
}


// ------------------------------------------------------------
// Exercise (state item)
// ------------------------------------------------------------
//
// `order`, `participants` and `sets` are optional so that the same adapter
// serves both full state items and the lighter exercise_add payload.
// Absent values are left as default (order 0, empty lists).
//
[[nodiscard]]
inline Result parse_exercise(const simdjson::dom::element& obj, session::Exercise& out) {
    out = session::Exercise{};
    auto r = parse_id_required(obj, "id", out.id);
    if (r != Result::Parsed) {
        return r;
    }
    r = parse_item_type_required(obj, "type", out.type);
    if (r != Result::Parsed) {
        return r;
    }

    lcr::optional<std::int64_t> order;
    r = helper::parse_int64_optional(obj, "order", order);
    if (r != Result::Parsed) {
        return r;
    }
    out.order = order.value_or(0);

    lcr::optional<std::int64_t> rest;
    r = helper::parse_int64_optional(obj, "rest", rest);
    if (r != Result::Parsed) {
        return r;
    }
    if (rest.has()) {
        if (rest.value() < 0) {
            return Result::InvalidValue;
        }
        out.rest = session::Duration{rest.value()};
    }

    bool present = false;
    r = helper::parse_string_list_optional(obj, "participants", out.participants, present);
    if (r != Result::Parsed) {
        return r;
    }

    simdjson::dom::array arr;
    r = helper::parse_array_required(obj, "meta", arr);
    if (r != Result::Parsed) {
        return r;
    }
    r = parse_meta_list(arr, out.meta);
    if (r != Result::Parsed) {
        return r;
    }

    r = helper::parse_array_optional(obj, "sets", arr, present);
    if (r != Result::Parsed) {
        return r;
    }
    if (present) {
        return parse_set_list(arr, out.sets);
    }
    return Result::Parsed;
}


// ------------------------------------------------------------
// Session state
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_state(const simdjson::dom::element& obj, session::SessionState& out) {
    out = session::SessionState{};
    auto r = helper::parse_string_required(obj, "session_id", out.session_id);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_string_required(obj, "account_id", out.account_id);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_int64_required(obj, "version", out.version);
    if (r != Result::Parsed) {
        return r;
    }
    if (out.version < 0) {
        return Result::InvalidValue;
    }
    simdjson::dom::array arr;
    r = helper::parse_array_required(obj, "items", arr);
    if (r != Result::Parsed) {
        return r;
    }
    for (auto v : arr) {
        session::Exercise e;
        r = parse_exercise(v, e);
        if (r != Result::Parsed) {
            return r;
        }
        out.items.push_back(std::move(e));
    }
    return Result::Parsed;
}


// ------------------------------------------------------------
// Participants / invitations / session document
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_cursor(const simdjson::dom::element& obj, session::Cursor& out) {
    auto r = helper::parse_string_required(obj, "exercise_id", out.exercise_id);
    if (r != Result::Parsed) {
        return r;
    }
    return helper::parse_string_required(obj, "exercise_set_id", out.exercise_set_id);
}

[[nodiscard]]
inline Result parse_participant(const simdjson::dom::element& obj, session::Participant& out) {
    out = session::Participant{};
    auto r = parse_id_required(obj, "id", out.id);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_string_required(obj, "color", out.color);
    if (r != Result::Parsed) {
        return r;
    }
    simdjson::dom::element sub;
    bool present = false;
    r = helper::parse_object_optional(obj, "cursor", sub, present);
    if (r != Result::Parsed) {
        return r;
    }
    if (present) {
        session::Cursor c;
        r = parse_cursor(sub, c);
        if (r != Result::Parsed) {
            return r;
        }
        out.cursor = std::move(c);
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_invitation(const simdjson::dom::element& obj, session::Invitation& out) {
    out = session::Invitation{};
    auto r = helper::parse_string_required(obj, "invited_by", out.invited_by);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_string_required(obj, "invited", out.invited);
    if (r != Result::Parsed) {
        return r;
    }
    return parse_timestamp_optional(obj, "expires", out.expires);
}

[[nodiscard]]
inline Result parse_document(const simdjson::dom::element& obj, session::SessionDocument& out) {
    out = session::SessionDocument{};
    auto r = parse_id_required(obj, "id", out.id);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_string_optional(obj, "name", out.name);
    if (r != Result::Parsed) {
        return r;
    }
    r = parse_session_status_required(obj, "status", out.status);
    if (r != Result::Parsed) {
        return r;
    }
    r = helper::parse_string_required(obj, "owner_id", out.owner_id);
    if (r != Result::Parsed) {
        return r;
    }
    r = parse_timestamp_required(obj, "created_at", out.created_at);
    if (r != Result::Parsed) {
        return r;
    }
    r = parse_timestamp_required(obj, "updated_at", out.updated_at);
    if (r != Result::Parsed) {
        return r;
    }

    simdjson::dom::array arr;
    r = helper::parse_array_required(obj, "participants", arr);
    if (r != Result::Parsed) {
        return r;
    }
    for (auto v : arr) {
        session::Participant p;
        r = parse_participant(v, p);
        if (r != Result::Parsed) {
            return r;
        }
        out.participants.push_back(std::move(p));
    }

    r = helper::parse_array_required(obj, "invitations", arr);
    if (r != Result::Parsed) {
        return r;
    }
    for (auto v : arr) {
        session::Invitation i;
        r = parse_invitation(v, i);
        if (r != Result::Parsed) {
            return r;
        }
        out.invitations.push_back(std::move(i));
    }
    return Result::Parsed;
}

} // namespace repsync::core::protocol::parser::adapter
