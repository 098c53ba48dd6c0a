#include "repsync/core/session/store.hpp"

#include <algorithm>
#include <utility>

#include "repsync/core/session/colors.hpp"
#include "repsync/core/timestamp.hpp"
#include "lcr/log/logger.hpp"


namespace repsync::core::session {

// -----------------------------------------------------------------------------
// Write helpers
// -----------------------------------------------------------------------------
template <class Fn>
bool Store::mutate_state_(const char* op, Fn&& fn) {
    {
        std::lock_guard<std::mutex> write(write_mutex_);
        StatePtr current = state();
        if (!current) {
            RS_DEBUG("[STORE] " << op << "(): no active session -> ignored");
            return false;
        }
        auto next = std::make_shared<SessionState>(*current);
        if (!fn(*next)) {
            RS_DEBUG("[STORE] " << op << "(): nothing to apply -> ignored");
            return false;
        }
        ++next->version;
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        state_ = std::move(next);
    }
    publish_();
    return true;
}

template <class Fn>
bool Store::mutate_document_(const char* op, Fn&& fn) {
    {
        std::lock_guard<std::mutex> write(write_mutex_);
        DocumentPtr current_doc = document();
        if (!current_doc) {
            RS_DEBUG("[STORE] " << op << "(): no active session -> ignored");
            return false;
        }
        auto next_doc = std::make_shared<SessionDocument>(*current_doc);
        if (!fn(*next_doc)) {
            RS_DEBUG("[STORE] " << op << "(): nothing to apply -> ignored");
            return false;
        }
        StatePtr current_state = state();
        std::shared_ptr<SessionState> next_state;
        if (current_state) {
            next_state = std::make_shared<SessionState>(*current_state);
            ++next_state->version;
        }
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        document_ = std::move(next_doc);
        if (next_state) {
            state_ = std::move(next_state);
        }
    }
    publish_();
    return true;
}

// -----------------------------------------------------------------------------
// Snapshots
// -----------------------------------------------------------------------------
Store::StatePtr Store::state() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return state_;
}

Store::DocumentPtr Store::document() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return document_;
}

bool Store::active() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return state_ != nullptr;
}

std::int64_t Store::version() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return state_ ? state_->version : 0;
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------
void Store::load(SessionDocument document, SessionState state) {
    RS_INFO("[STORE] Session " << document.id << " loaded (version " << state.version
            << ", " << state.items.size() << " items, " << document.participants.size() << " participants)");
    replace_(std::make_shared<const SessionDocument>(std::move(document)),
             std::make_shared<const SessionState>(std::move(state)), true);
}

void Store::begin_offline(std::string session_id, std::string account_id) {
    SessionDocument document;
    document.id = session_id;
    document.owner_id = account_id;
    document.status = SessionStatus::Draft;
    document.created_at = now();
    document.updated_at = document.created_at;

    SessionState state;
    state.session_id = std::move(session_id);
    state.account_id = std::move(account_id);

    RS_INFO("[STORE] Session " << document.id << " started offline");
    replace_(std::make_shared<const SessionDocument>(std::move(document)),
             std::make_shared<const SessionState>(std::move(state)), true);
}

void Store::reset() {
    RS_INFO("[STORE] Session cleared");
    replace_(nullptr, nullptr, true);
}

// -----------------------------------------------------------------------------
// Full replacement
// -----------------------------------------------------------------------------
void Store::apply_sync(SessionState state) {
    RS_INFO("[STORE] Session sync received (version " << state.version << ", " << state.items.size() << " items)");
    replace_(nullptr, std::make_shared<const SessionState>(std::move(state)), false);
}

void Store::apply_sync_response(SessionDocument document, SessionState state) {
    RS_INFO("[STORE] Full sync: " << document.participants.size() << " participants, "
            << state.items.size() << " items, version " << state.version);
    replace_(std::make_shared<const SessionDocument>(std::move(document)),
             std::make_shared<const SessionState>(std::move(state)), true);
}

// -----------------------------------------------------------------------------
// Document events
// -----------------------------------------------------------------------------
bool Store::apply_participant_join(const std::string& account_id) {
    return mutate_document_("participant_join", [&](SessionDocument& doc) {
        if (doc.find_participant(account_id)) {
            return false; // duplicate join
        }
        doc.participants.push_back(Participant{account_id, participant_color(account_id), {}});
        RS_INFO("[STORE] Participant " << account_id << " joined session " << doc.id);
        return true;
    });
}

bool Store::apply_participant_leave(std::string_view account_id) {
    return mutate_document_("participant_leave", [&](SessionDocument& doc) {
        auto it = std::find_if(doc.participants.begin(), doc.participants.end(),
                               [&](const Participant& p) { return p.id == account_id; });
        if (it == doc.participants.end()) {
            return false;
        }
        doc.participants.erase(it);
        RS_INFO("[STORE] Participant " << account_id << " left session " << doc.id);
        return true;
    });
}

bool Store::apply_session_update(const lcr::optional<std::string>& name, const lcr::optional<SessionStatus>& status) {
    return mutate_document_("session_update", [&](SessionDocument& doc) {
        if (!name.has() && !status.has()) {
            return false;
        }
        if (name.has()) {
            doc.name = name.value();
        }
        if (status.has()) {
            doc.status = status.value();
        }
        doc.updated_at = now();
        return true;
    });
}

bool Store::apply_cursor(std::string_view account_id, const Cursor& cursor) {
    return mutate_document_("cursor_move", [&](SessionDocument& doc) {
        Participant* p = doc.find_participant(account_id);
        if (!p) {
            return false;
        }
        p->cursor = cursor;
        return true;
    });
}

// -----------------------------------------------------------------------------
// Exercise events
// -----------------------------------------------------------------------------
bool Store::apply_exercise_add(Exercise exercise) {
    return add_exercise(std::move(exercise));
}

bool Store::apply_exercise_update(std::string_view exercise_id,
                                  const lcr::optional<Duration>& rest,
                                  const lcr::optional<std::vector<std::string>>& set_order) {
    return mutate_state_("exercise_update", [&](SessionState& state) {
        Exercise* e = state.find_exercise(exercise_id);
        if (!e || (!rest.has() && !set_order.has())) {
            return false;
        }
        if (rest.has()) {
            e->rest = rest.value();
        }
        if (set_order.has()) {
            // Listed sets first, in the given order; unlisted sets keep their
            // relative position after them
            std::vector<ExerciseSet> ordered;
            ordered.reserve(e->sets.size());
            for (const auto& id : set_order.value()) {
                auto it = std::find_if(e->sets.begin(), e->sets.end(), [&](const ExerciseSet& s) { return s.id == id; });
                if (it != e->sets.end()) {
                    ordered.push_back(std::move(*it));
                    e->sets.erase(it);
                }
            }
            for (auto& s : e->sets) {
                ordered.push_back(std::move(s));
            }
            e->sets = std::move(ordered);
            std::int64_t order = 0;
            for (auto& s : e->sets) {
                s.order = ++order;
            }
        }
        return true;
    });
}

bool Store::apply_exercise_delete(std::string_view exercise_id) {
    return mutate_state_("exercise_delete", [&](SessionState& state) {
        auto it = std::find_if(state.items.begin(), state.items.end(),
                               [&](const Exercise& e) { return e.id == exercise_id; });
        if (it == state.items.end()) {
            return false;
        }
        state.items.erase(it);
        return true;
    });
}

// -----------------------------------------------------------------------------
// Set events
// -----------------------------------------------------------------------------
bool Store::apply_set_add(std::string_view exercise_id, ExerciseSet set) {
    return mutate_state_("set_add", [&](SessionState& state) {
        Exercise* e = state.find_exercise(exercise_id);
        if (!e || e->find_set(set.id)) {
            return false;
        }
        if (set.order <= 0) {
            set.order = static_cast<std::int64_t>(e->sets.size()) + 1;
        }
        e->sets.push_back(std::move(set));
        return true;
    });
}

bool Store::apply_set_update(std::string_view exercise_id, const ExerciseSet& set) {
    return mutate_state_("set_update", [&](SessionState& state) {
        Exercise* e = state.find_exercise(exercise_id);
        ExerciseSet* s = e ? e->find_set(set.id) : nullptr;
        if (!s || *s == set) {
            return false;
        }
        *s = set;
        return true;
    });
}

bool Store::apply_set_delete(std::string_view exercise_id, std::string_view set_id) {
    return mutate_state_("set_delete", [&](SessionState& state) {
        Exercise* e = state.find_exercise(exercise_id);
        if (!e) {
            return false;
        }
        auto it = std::find_if(e->sets.begin(), e->sets.end(), [&](const ExerciseSet& s) { return s.id == set_id; });
        if (it == e->sets.end()) {
            return false;
        }
        e->sets.erase(it);
        return true;
    });
}

bool Store::apply_set_complete(std::string_view exercise_id, std::string_view set_id, bool complete) {
    return mutate_state_("set_complete", [&](SessionState& state) {
        Exercise* e = state.find_exercise(exercise_id);
        ExerciseSet* s = e ? e->find_set(set_id) : nullptr;
        if (!s || s->complete == complete) {
            return false;
        }
        s->complete = complete;
        return true;
    });
}

// -----------------------------------------------------------------------------
// Local mutations
// -----------------------------------------------------------------------------
bool Store::toggle_set_complete(std::string_view exercise_id, std::string_view set_id) {
    return mutate_state_("toggle_set_complete", [&](SessionState& state) {
        Exercise* e = state.find_exercise(exercise_id);
        ExerciseSet* s = e ? e->find_set(set_id) : nullptr;
        if (!s) {
            return false;
        }
        s->complete = !s->complete;
        return true;
    });
}

bool Store::reorder_set(std::string_view exercise_id, std::string_view from_set_id, std::string_view to_set_id) {
    if (from_set_id == to_set_id) {
        return false;
    }
    return mutate_state_("reorder_set", [&](SessionState& state) {
        Exercise* e = state.find_exercise(exercise_id);
        if (!e) {
            return false;
        }
        auto from = std::find_if(e->sets.begin(), e->sets.end(), [&](const ExerciseSet& s) { return s.id == from_set_id; });
        auto to   = std::find_if(e->sets.begin(), e->sets.end(), [&](const ExerciseSet& s) { return s.id == to_set_id; });
        if (from == e->sets.end() || to == e->sets.end()) {
            return false;
        }
        std::iter_swap(from, to);
        return true;
    });
}

bool Store::renumber_sets(std::string_view exercise_id) {
    return mutate_state_("renumber_sets", [&](SessionState& state) {
        Exercise* e = state.find_exercise(exercise_id);
        if (!e) {
            return false;
        }
        std::int64_t order = 0;
        for (auto& s : e->sets) {
            s.order = ++order;
        }
        return true;
    });
}

bool Store::update_metrics(std::string_view exercise_id, std::string_view set_id, const Metrics& metrics) {
    return mutate_state_("update_metrics", [&](SessionState& state) {
        Exercise* e = state.find_exercise(exercise_id);
        ExerciseSet* s = e ? e->find_set(set_id) : nullptr;
        if (!s) {
            return false;
        }
        s->metrics = metrics;
        return true;
    });
}

bool Store::add_exercise(Exercise exercise) {
    return mutate_state_("add_exercise", [&](SessionState& state) {
        exercise.order = static_cast<std::int64_t>(state.items.size()) + 1;
        RS_DEBUG("[STORE] Exercise " << exercise.id << " added at order " << exercise.order);
        state.items.push_back(std::move(exercise));
        return true;
    });
}

// -----------------------------------------------------------------------------
// Publication
// -----------------------------------------------------------------------------
void Store::replace_(DocumentPtr document, StatePtr state, bool replace_document) {
    {
        std::lock_guard<std::mutex> write(write_mutex_);
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        if (replace_document) {
            document_ = std::move(document);
        }
        state_ = std::move(state);
    }
    publish_();
}

void Store::publish_() {
    for (;;) {
        StatePtr s;
        DocumentPtr d;
        {
            std::lock_guard<std::mutex> lock(snapshot_mutex_);
            s = state_;
            d = document_;
        }
        state_stream_.set(s);
        document_stream_.set(d);

        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        if (state_ == s && document_ == d) {
            return;
        }
    }
}

} // namespace repsync::core::session
