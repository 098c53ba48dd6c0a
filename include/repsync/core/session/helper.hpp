#pragma once

#include <vector>
#include <algorithm>

#include "repsync/core/session/model.hpp"


namespace repsync::core::session::helper {

// An exercise without sets counts as complete
[[nodiscard]]
inline bool is_complete(const Exercise& exercise) noexcept {
    return std::all_of(exercise.sets.begin(), exercise.sets.end(),
                       [](const ExerciseSet& s) { return s.complete; });
}

// First set (by `order`) not yet completed, or nullptr
[[nodiscard]]
inline const ExerciseSet* next_incomplete_set(const Exercise& exercise) noexcept {
    const ExerciseSet* best = nullptr;
    for (const auto& s : exercise.sets) {
        if (!s.complete && (!best || s.order < best->order)) {
            best = &s;
        }
    }
    return best;
}

// First exercise (by `order`) that still has an incomplete set, or nullptr
[[nodiscard]]
inline const Exercise* next_incomplete_exercise(const SessionState& state) noexcept {
    const Exercise* best = nullptr;
    for (const auto& e : state.items) {
        if (!is_complete(e) && (!best || e.order < best->order)) {
            best = &e;
        }
    }
    return best;
}

// Items sorted by their explicit order field (structural position ignored)
[[nodiscard]]
inline std::vector<const Exercise*> ordered_items(const SessionState& state) {
    std::vector<const Exercise*> out;
    out.reserve(state.items.size());
    for (const auto& e : state.items) {
        out.push_back(&e);
    }
    std::stable_sort(out.begin(), out.end(), [](const Exercise* a, const Exercise* b) { return a->order < b->order; });
    return out;
}

} // namespace repsync::core::session::helper
