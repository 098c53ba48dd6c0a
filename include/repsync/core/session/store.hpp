#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "repsync/core/observable.hpp"
#include "repsync/core/session/enums.hpp"
#include "repsync/core/session/model.hpp"
#include "lcr/optional.hpp"


namespace repsync::core::session {

/*
===============================================================================
 session::Store
===============================================================================

Single authoritative copy of the live SessionDocument and SessionState.

Reads
  • state() / document() return immutable snapshots (shared_ptr<const T>).
    A snapshot never changes after publication; writers build a new one.
  • Both are null while no session is active.

Writes
  • Serialized by one write mutex, applied in call order.
  • Three sources, all applied the same way:
      1) full sync       -> replaces the state wholesale (last sync wins)
      2) server events   -> touch only the addressed sub-entity
      3) local mutations -> optimistic, applied immediately
  • Every effective event or local mutation increments state.version.
    A no-op (unknown id, duplicate join, ...) leaves the version untouched
    and returns false.

Notifications
  • observe_state() / observe_document() are published after the write
    mutex is released, never from inside it.
  • Publication always re-reads the latest snapshot, so concurrent writers
    cannot leave an older snapshot as the last published value.
===============================================================================
*/
class Store {
public:
    using StatePtr    = std::shared_ptr<const SessionState>;
    using DocumentPtr = std::shared_ptr<const SessionDocument>;

    Store() = default;

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // -------------------------------------------------------------------------
    // Snapshots
    // -------------------------------------------------------------------------
    [[nodiscard]] StatePtr state() const;
    [[nodiscard]] DocumentPtr document() const;
    [[nodiscard]] bool active() const;

    // 0 when no session is active
    [[nodiscard]] std::int64_t version() const;

    [[nodiscard]] inline Observable<StatePtr>& observe_state() noexcept { return state_stream_; }
    [[nodiscard]] inline Observable<DocumentPtr>& observe_document() noexcept { return document_stream_; }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Session created or joined through the server
    void load(SessionDocument document, SessionState state);

    // Session created while offline: empty document, version 0
    void begin_offline(std::string session_id, std::string account_id);

    // Leave / end / sign-out
    void reset();

    // -------------------------------------------------------------------------
    // Server: full replacement
    // -------------------------------------------------------------------------
    void apply_sync(SessionState state);
    void apply_sync_response(SessionDocument document, SessionState state);

    // -------------------------------------------------------------------------
    // Server: discrete events (return true if effective)
    // -------------------------------------------------------------------------
    bool apply_participant_join(const std::string& account_id);
    bool apply_participant_leave(std::string_view account_id);
    bool apply_session_update(const lcr::optional<std::string>& name, const lcr::optional<SessionStatus>& status);
    bool apply_cursor(std::string_view account_id, const Cursor& cursor);

    bool apply_exercise_add(Exercise exercise);
    bool apply_exercise_update(std::string_view exercise_id,
                               const lcr::optional<Duration>& rest,
                               const lcr::optional<std::vector<std::string>>& set_order);
    bool apply_exercise_delete(std::string_view exercise_id);

    bool apply_set_add(std::string_view exercise_id, ExerciseSet set);
    bool apply_set_update(std::string_view exercise_id, const ExerciseSet& set);
    bool apply_set_delete(std::string_view exercise_id, std::string_view set_id);
    bool apply_set_complete(std::string_view exercise_id, std::string_view set_id, bool complete);

    // -------------------------------------------------------------------------
    // Local optimistic mutations (return true if effective)
    // -------------------------------------------------------------------------
    bool toggle_set_complete(std::string_view exercise_id, std::string_view set_id);

    // The two sets exchange positions. `order` fields are left as they are.
    bool reorder_set(std::string_view exercise_id, std::string_view from_set_id, std::string_view to_set_id);

    // order = 1..N by current position
    bool renumber_sets(std::string_view exercise_id);

    bool update_metrics(std::string_view exercise_id, std::string_view set_id, const Metrics& metrics);

    // Appends with order = item count + 1. Ids are not deduplicated.
    bool add_exercise(Exercise exercise);

private:
    template <class Fn>
    bool mutate_state_(const char* op, Fn&& fn);

    template <class Fn>
    bool mutate_document_(const char* op, Fn&& fn);

    void replace_(DocumentPtr document, StatePtr state, bool replace_document);
    void publish_();

private:
    mutable std::mutex write_mutex_;

    // Guards the snapshot pointers only (readers never wait on a writer)
    mutable std::mutex snapshot_mutex_;
    StatePtr state_;
    DocumentPtr document_;

    Observable<StatePtr> state_stream_;
    Observable<DocumentPtr> document_stream_;
};

} // namespace repsync::core::session
