#pragma once

#include <cstdint>
#include <string_view>


namespace repsync::core::session {

// ===============================================================
// SESSION STATUS
// ===============================================================
enum class SessionStatus : uint8_t {
    Draft,
    Active,
    Complete,
    Unknown
};

[[nodiscard]] inline constexpr std::string_view to_string(SessionStatus s) noexcept {
    switch (s) {
        case SessionStatus::Draft:    return "draft";
        case SessionStatus::Active:   return "active";
        case SessionStatus::Complete: return "complete";
        default:                      return "unknown";
    }
}

[[nodiscard]] inline constexpr SessionStatus to_session_status_enum(std::string_view s) noexcept {
    if (s == "draft")    return SessionStatus::Draft;
    if (s == "active")   return SessionStatus::Active;
    if (s == "complete") return SessionStatus::Complete;
    return SessionStatus::Unknown;
}


// ===============================================================
// EXERCISE TYPE (declares which metrics apply)
// ===============================================================
enum class ExerciseType : uint8_t {
    WeightReps,
    WeightTime,
    DistanceTime,
    Reps,
    Time,
    Distance,
    Unknown
};

[[nodiscard]] inline constexpr std::string_view to_string(ExerciseType t) noexcept {
    switch (t) {
        case ExerciseType::WeightReps:   return "weight_reps";
        case ExerciseType::WeightTime:   return "weight_time";
        case ExerciseType::DistanceTime: return "distance_time";
        case ExerciseType::Reps:         return "reps";
        case ExerciseType::Time:         return "time";
        case ExerciseType::Distance:     return "distance";
        default:                         return "unknown";
    }
}

[[nodiscard]] inline constexpr ExerciseType to_exercise_type_enum(std::string_view s) noexcept {
    switch (s.size()) {
        case 4: // reps, time
            if (s == "reps") return ExerciseType::Reps;
            if (s == "time") return ExerciseType::Time;
            break;
        case 8:
            if (s == "distance") return ExerciseType::Distance;
            break;
        case 11: // weight_reps, weight_time
            if (s == "weight_reps") return ExerciseType::WeightReps;
            if (s == "weight_time") return ExerciseType::WeightTime;
            break;
        case 13:
            if (s == "distance_time") return ExerciseType::DistanceTime;
            break;
    }
    return ExerciseType::Unknown;
}

// Which metric fields an exercise type uses
struct MetricMask {
    bool reps{false};
    bool weight{false};
    bool duration{false};
    bool distance{false};
};

[[nodiscard]] inline constexpr MetricMask metrics_for(ExerciseType t) noexcept {
    switch (t) {
        case ExerciseType::WeightReps:   return {true,  true,  false, false};
        case ExerciseType::WeightTime:   return {false, true,  true,  false};
        case ExerciseType::DistanceTime: return {false, false, true,  true };
        case ExerciseType::Reps:         return {true,  false, false, false};
        case ExerciseType::Time:         return {false, false, true,  false};
        case ExerciseType::Distance:     return {false, false, false, true };
        default:                         return {};
    }
}


// ===============================================================
// ITEM TYPE
// ===============================================================
enum class ItemType : uint8_t {
    Single,
    Compound,
    Unknown
};

[[nodiscard]] inline constexpr std::string_view to_string(ItemType t) noexcept {
    switch (t) {
        case ItemType::Single:   return "single";
        case ItemType::Compound: return "compound";
        default:                 return "unknown";
    }
}

[[nodiscard]] inline constexpr ItemType to_item_type_enum(std::string_view s) noexcept {
    if (s == "single")   return ItemType::Single;
    if (s == "compound") return ItemType::Compound;
    return ItemType::Unknown;
}


// ===============================================================
// SET TYPE
// ===============================================================
enum class SetType : uint8_t {
    Warmup,
    Working,
    Drop,
    Superset,
    Failure,
    Unknown
};

// Wire name of Superset is "super"
[[nodiscard]] inline constexpr std::string_view to_string(SetType t) noexcept {
    switch (t) {
        case SetType::Warmup:   return "warmup";
        case SetType::Working:  return "working";
        case SetType::Drop:     return "drop";
        case SetType::Superset: return "super";
        case SetType::Failure:  return "failure";
        default:                return "unknown";
    }
}

[[nodiscard]] inline constexpr SetType to_set_type_enum(std::string_view s) noexcept {
    if (s == "warmup")                     return SetType::Warmup;
    if (s == "working")                    return SetType::Working;
    if (s == "drop")                       return SetType::Drop;
    if (s == "super" || s == "superset")   return SetType::Superset;
    if (s == "failure")                    return SetType::Failure;
    return SetType::Unknown;
}


// ===============================================================
// UNITS
// ===============================================================
enum class WeightUnit : uint8_t {
    Kg,
    Lb,
    Unknown
};

[[nodiscard]] inline constexpr std::string_view to_string(WeightUnit u) noexcept {
    switch (u) {
        case WeightUnit::Kg: return "kg";
        case WeightUnit::Lb: return "lb";
        default:             return "unknown";
    }
}

[[nodiscard]] inline constexpr WeightUnit to_weight_unit_enum(std::string_view s) noexcept {
    if (s == "kg") return WeightUnit::Kg;
    if (s == "lb") return WeightUnit::Lb;
    return WeightUnit::Unknown;
}

enum class DistanceUnit : uint8_t {
    M,
    Km,
    Mi,
    Yd,
    Unknown
};

[[nodiscard]] inline constexpr std::string_view to_string(DistanceUnit u) noexcept {
    switch (u) {
        case DistanceUnit::M:  return "m";
        case DistanceUnit::Km: return "km";
        case DistanceUnit::Mi: return "mi";
        case DistanceUnit::Yd: return "yd";
        default:               return "unknown";
    }
}

[[nodiscard]] inline constexpr DistanceUnit to_distance_unit_enum(std::string_view s) noexcept {
    if (s == "m")  return DistanceUnit::M;
    if (s == "km") return DistanceUnit::Km;
    if (s == "mi") return DistanceUnit::Mi;
    if (s == "yd") return DistanceUnit::Yd;
    return DistanceUnit::Unknown;
}

} // namespace repsync::core::session
