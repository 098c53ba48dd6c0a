#pragma once

#include <string>
#include <vector>

#include "repsync/core/session/model.hpp"
#include "repsync/core/timestamp.hpp"
#include "lcr/json.hpp"


namespace repsync::core::protocol::writer {

// ============================================================================
// Model → JSON writers
//
// Each writer appends one JSON value to `out` using the wire field names.
// Writers return false when a value cannot be represented (non-finite
// numbers); `out` is then left partially written and must be discarded.
// ============================================================================

inline void write_string_list(std::string& out, const std::vector<std::string>& list) {
    out += '[';
    for (std::size_t i = 0; i < list.size(); ++i) {
        if (i) out += ',';
        lcr::json::append_string(out, list[i]);
    }
    out += ']';
}

[[nodiscard]]
inline bool write_metrics(std::string& out, const session::Metrics& m) {
    bool first = true;
    out += '{';
    if (m.reps.has()) {
        lcr::json::append_key(out, "reps", first);
        lcr::json::append(out, m.reps.value());
    }
    if (m.weight.has()) {
        lcr::json::append_key(out, "weight", first);
        out += "{\"value\":";
        if (!lcr::json::append(out, m.weight.value().value)) {
            return false;
        }
        out += ",\"unit\":";
        lcr::json::append_string(out, session::to_string(m.weight.value().unit));
        out += '}';
    }
    if (m.duration.has()) {
        lcr::json::append_key(out, "duration", first);
        out += "{\"value\":";
        lcr::json::append(out, m.duration.value().seconds);
        out += '}';
    }
    if (m.distance.has()) {
        lcr::json::append_key(out, "distance", first);
        out += "{\"value\":";
        if (!lcr::json::append(out, m.distance.value().value)) {
            return false;
        }
        out += ",\"unit\":";
        lcr::json::append_string(out, session::to_string(m.distance.value().unit));
        out += '}';
    }
    out += '}';
    return true;
}

[[nodiscard]]
inline bool write_set(std::string& out, const session::ExerciseSet& s) {
    out += "{\"id\":";
    lcr::json::append_string(out, s.id);
    out += ",\"order\":";
    lcr::json::append(out, s.order);
    out += ",\"metrics\":";
    if (!write_metrics(out, s.metrics)) {
        return false;
    }
    out += ",\"type\":";
    lcr::json::append_string(out, session::to_string(s.type));
    out += ",\"complete\":";
    lcr::json::append_bool(out, s.complete);
    out += '}';
    return true;
}

inline void write_meta(std::string& out, const session::ExerciseMeta& m) {
    out += "{\"internal_id\":";
    lcr::json::append_string(out, m.internal_id);
    out += ",\"name\":";
    lcr::json::append_string(out, m.name);
    out += ",\"type\":";
    lcr::json::append_string(out, session::to_string(m.type));
    out += '}';
}

// Full state item. With `with_sets == false` the `order` and `sets` fields
// are omitted (exercise_add shape: the receiver assigns the order).
[[nodiscard]]
inline bool write_exercise(std::string& out, const session::Exercise& e, bool with_sets = true) {
    out += "{\"id\":";
    lcr::json::append_string(out, e.id);
    if (with_sets) {
        out += ",\"order\":";
        lcr::json::append(out, e.order);
    }
    out += ",\"participants\":";
    write_string_list(out, e.participants);
    out += ",\"type\":";
    lcr::json::append_string(out, session::to_string(e.type));
    if (e.rest.has()) {
        out += ",\"rest\":";
        lcr::json::append(out, e.rest.value().seconds);
    }
    out += ",\"meta\":[";
    for (std::size_t i = 0; i < e.meta.size(); ++i) {
        if (i) out += ',';
        write_meta(out, e.meta[i]);
    }
    out += ']';
    if (with_sets) {
        out += ",\"sets\":[";
        for (std::size_t i = 0; i < e.sets.size(); ++i) {
            if (i) out += ',';
            if (!write_set(out, e.sets[i])) {
                return false;
            }
        }
        out += ']';
    }
    out += '}';
    return true;
}

[[nodiscard]]
inline bool write_state(std::string& out, const session::SessionState& st) {
    out += "{\"session_id\":";
    lcr::json::append_string(out, st.session_id);
    out += ",\"account_id\":";
    lcr::json::append_string(out, st.account_id);
    out += ",\"version\":";
    lcr::json::append(out, st.version);
    out += ",\"items\":[";
    for (std::size_t i = 0; i < st.items.size(); ++i) {
        if (i) out += ',';
        if (!write_exercise(out, st.items[i])) {
            return false;
        }
    }
    out += "]}";
    return true;
}

inline void write_cursor(std::string& out, const session::Cursor& c) {
    out += "{\"exercise_id\":";
    lcr::json::append_string(out, c.exercise_id);
    out += ",\"exercise_set_id\":";
    lcr::json::append_string(out, c.exercise_set_id);
    out += '}';
}

inline void write_participant(std::string& out, const session::Participant& p) {
    out += "{\"id\":";
    lcr::json::append_string(out, p.id);
    out += ",\"color\":";
    lcr::json::append_string(out, p.color);
    if (p.cursor.has()) {
        out += ",\"cursor\":";
        write_cursor(out, p.cursor.value());
    }
    out += '}';
}

inline void write_invitation(std::string& out, const session::Invitation& inv) {
    out += "{\"invited_by\":";
    lcr::json::append_string(out, inv.invited_by);
    out += ",\"invited\":";
    lcr::json::append_string(out, inv.invited);
    if (inv.expires.has()) {
        out += ",\"expires\":";
        lcr::json::append_string(out, core::to_string(inv.expires.value()));
    }
    out += '}';
}

inline void write_document(std::string& out, const session::SessionDocument& d) {
    bool first = true;
    out += '{';
    lcr::json::append_key(out, "id", first);
    lcr::json::append_string(out, d.id);
    if (d.name.has()) {
        lcr::json::append_key(out, "name", first);
        lcr::json::append_string(out, d.name.value());
    }
    lcr::json::append_key(out, "status", first);
    lcr::json::append_string(out, session::to_string(d.status));
    lcr::json::append_key(out, "owner_id", first);
    lcr::json::append_string(out, d.owner_id);
    lcr::json::append_key(out, "created_at", first);
    lcr::json::append_string(out, core::to_string(d.created_at));
    lcr::json::append_key(out, "updated_at", first);
    lcr::json::append_string(out, core::to_string(d.updated_at));
    lcr::json::append_key(out, "participants", first);
    out += '[';
    for (std::size_t i = 0; i < d.participants.size(); ++i) {
        if (i) out += ',';
        write_participant(out, d.participants[i]);
    }
    out += ']';
    lcr::json::append_key(out, "invitations", first);
    out += '[';
    for (std::size_t i = 0; i < d.invitations.size(); ++i) {
        if (i) out += ',';
        write_invitation(out, d.invitations[i]);
    }
    out += ']';
    out += '}';
}

} // namespace repsync::core::protocol::writer
