#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <algorithm>

#include "repsync/core/session/enums.hpp"
#include "repsync/core/timestamp.hpp"
#include "lcr/optional.hpp"


namespace repsync::core::session {

// ============================================================================
// METRICS
// ============================================================================

struct Weight {
    double value{0.0};
    WeightUnit unit{WeightUnit::Kg};

    [[nodiscard]] inline double to_kg() const noexcept {
        return unit == WeightUnit::Lb ? value * 0.453592 : value;
    }

    bool operator==(const Weight&) const = default;
};

struct Distance {
    double value{0.0};
    DistanceUnit unit{DistanceUnit::M};

    [[nodiscard]] inline double to_meters() const noexcept {
        switch (unit) {
            case DistanceUnit::Km: return value * 1000.0;
            case DistanceUnit::Mi: return value * 1609.34;
            case DistanceUnit::Yd: return value * 0.9144;
            default:               return value;
        }
    }

    bool operator==(const Distance&) const = default;
};

struct Duration {
    std::int64_t seconds{0};

    bool operator==(const Duration&) const = default;
};

// All fields are independently optional; applicability depends on the
// exercise type (see metrics_for()).
struct Metrics {
    lcr::optional<std::int64_t> reps{};
    lcr::optional<Weight> weight{};
    lcr::optional<Distance> distance{};
    lcr::optional<Duration> duration{};

    bool operator==(const Metrics&) const = default;
};


// ============================================================================
// SESSION STATE (the workout being performed)
// ============================================================================

struct ExerciseSet {
    std::string id;
    std::int64_t order{0};
    SetType type{SetType::Working};
    bool complete{false};
    Metrics metrics{};

    bool operator==(const ExerciseSet&) const = default;
};

struct ExerciseMeta {
    std::string internal_id;
    std::string name;
    ExerciseType type{ExerciseType::WeightReps};

    bool operator==(const ExerciseMeta&) const = default;
};

// One item of the session: a single exercise or a compound (superset) of
// several exercises sharing the same sets.
struct Exercise {
    std::string id;
    std::int64_t order{0};
    ItemType type{ItemType::Single};
    std::vector<std::string> participants{};
    lcr::optional<Duration> rest{};
    std::vector<ExerciseMeta> meta{};
    std::vector<ExerciseSet> sets{};

    [[nodiscard]] inline ExerciseSet* find_set(std::string_view set_id) noexcept {
        auto it = std::find_if(sets.begin(), sets.end(), [&](const ExerciseSet& s) { return s.id == set_id; });
        return it == sets.end() ? nullptr : &*it;
    }

    [[nodiscard]] inline const ExerciseSet* find_set(std::string_view set_id) const noexcept {
        return const_cast<Exercise*>(this)->find_set(set_id);
    }

    bool operator==(const Exercise&) const = default;
};

struct SessionState {
    std::string session_id;
    std::string account_id;
    std::int64_t version{0};
    std::vector<Exercise> items{};

    [[nodiscard]] inline Exercise* find_exercise(std::string_view exercise_id) noexcept {
        auto it = std::find_if(items.begin(), items.end(), [&](const Exercise& e) { return e.id == exercise_id; });
        return it == items.end() ? nullptr : &*it;
    }

    [[nodiscard]] inline const Exercise* find_exercise(std::string_view exercise_id) const noexcept {
        return const_cast<SessionState*>(this)->find_exercise(exercise_id);
    }

    bool operator==(const SessionState&) const = default;
};


// ============================================================================
// SESSION DOCUMENT (who is in the session)
// ============================================================================

// Where a participant is currently focused (presence UI)
struct Cursor {
    std::string exercise_id;
    std::string exercise_set_id;

    bool operator==(const Cursor&) const = default;
};

struct Participant {
    std::string id;
    std::string color;
    lcr::optional<Cursor> cursor{};

    bool operator==(const Participant&) const = default;
};

struct Invitation {
    std::string invited_by;
    std::string invited;
    lcr::optional<Timestamp> expires{};

    bool operator==(const Invitation&) const = default;
};

struct SessionDocument {
    std::string id;
    lcr::optional<std::string> name{};
    SessionStatus status{SessionStatus::Draft};
    std::string owner_id;
    Timestamp created_at{};
    Timestamp updated_at{};
    std::vector<Participant> participants{};
    std::vector<Invitation> invitations{};

    [[nodiscard]] inline Participant* find_participant(std::string_view account_id) noexcept {
        auto it = std::find_if(participants.begin(), participants.end(), [&](const Participant& p) { return p.id == account_id; });
        return it == participants.end() ? nullptr : &*it;
    }

    [[nodiscard]] inline const Participant* find_participant(std::string_view account_id) const noexcept {
        return const_cast<SessionDocument*>(this)->find_participant(account_id);
    }

    bool operator==(const SessionDocument&) const = default;
};

} // namespace repsync::core::session
