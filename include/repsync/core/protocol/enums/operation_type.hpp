#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>


namespace repsync::core::protocol {

// ===============================================================
// OPERATION TYPE ENUM (envelope "type" field)
// ===============================================================
enum class OperationType : uint8_t {
    SessionJoin,
    SessionLeave,
    SessionUpdate,
    SessionSync,
    ExerciseAdd,
    ExerciseUpdate,
    ExerciseDelete,
    SetAdd,
    SetUpdate,
    SetDelete,
    SetComplete,
    CursorMove,
    SyncRequest,
    SyncResponse,
    Unknown
};

inline constexpr std::size_t OPERATION_TYPE_COUNT = static_cast<std::size_t>(OperationType::Unknown);

// ===============================================================
// 1) Standard conversion: enum → string
// ===============================================================
[[nodiscard]] inline constexpr std::string_view to_string(OperationType t) noexcept {
    switch (t) {
        case OperationType::SessionJoin:    return "session_join";
        case OperationType::SessionLeave:   return "session_leave";
        case OperationType::SessionUpdate:  return "session_update";
        case OperationType::SessionSync:    return "session_sync";
        case OperationType::ExerciseAdd:    return "exercise_add";
        case OperationType::ExerciseUpdate: return "exercise_update";
        case OperationType::ExerciseDelete: return "exercise_delete";
        case OperationType::SetAdd:         return "set_add";
        case OperationType::SetUpdate:      return "set_update";
        case OperationType::SetDelete:      return "set_delete";
        case OperationType::SetComplete:    return "set_complete";
        case OperationType::CursorMove:     return "cursor_move";
        case OperationType::SyncRequest:    return "sync_request";
        case OperationType::SyncResponse:   return "sync_response";
        default:                            return "unknown";
    }
}

// ===============================================================
// 2) Standard conversion: string → enum
//    Dispatch on the prefix before '_' then compare the full name.
// ===============================================================
[[nodiscard]] inline constexpr OperationType to_operation_type_enum(std::string_view s) noexcept {
    if (s.size() < 6) {
        return OperationType::Unknown;
    }
    switch (s[0]) {
        case 's':
            if (s[1] == 'e' && s[2] == 's') { // session_*
                if (s == "session_join")   return OperationType::SessionJoin;
                if (s == "session_leave")  return OperationType::SessionLeave;
                if (s == "session_update") return OperationType::SessionUpdate;
                if (s == "session_sync")   return OperationType::SessionSync;
            }
            else if (s[1] == 'e' && s[2] == 't') { // set_*
                if (s == "set_add")        return OperationType::SetAdd;
                if (s == "set_update")     return OperationType::SetUpdate;
                if (s == "set_delete")     return OperationType::SetDelete;
                if (s == "set_complete")   return OperationType::SetComplete;
            }
            else if (s[1] == 'y') { // sync_*
                if (s == "sync_request")   return OperationType::SyncRequest;
                if (s == "sync_response")  return OperationType::SyncResponse;
            }
            break;
        case 'e':
            if (s == "exercise_add")       return OperationType::ExerciseAdd;
            if (s == "exercise_update")    return OperationType::ExerciseUpdate;
            if (s == "exercise_delete")    return OperationType::ExerciseDelete;
            break;
        case 'c':
            if (s == "cursor_move")        return OperationType::CursorMove;
            break;
    }
    return OperationType::Unknown;
}


// ===============================================================
// TYPE MASK (multi-type subscriptions)
// ===============================================================
class TypeMask {
public:
    constexpr TypeMask() noexcept = default;
    constexpr TypeMask(OperationType t) noexcept : bits_(bit_(t)) {}

    [[nodiscard]] static constexpr TypeMask all() noexcept {
        TypeMask m;
        m.bits_ = (1u << OPERATION_TYPE_COUNT) - 1u;
        return m;
    }

    [[nodiscard]] constexpr bool contains(OperationType t) const noexcept {
        return (bits_ & bit_(t)) != 0;
    }

    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }

    constexpr TypeMask& operator|=(TypeMask other) noexcept {
        bits_ |= other.bits_;
        return *this;
    }

    [[nodiscard]] friend constexpr TypeMask operator|(TypeMask a, TypeMask b) noexcept {
        a |= b;
        return a;
    }

    [[nodiscard]] friend constexpr bool operator==(TypeMask a, TypeMask b) noexcept { return a.bits_ == b.bits_; }

private:
    static constexpr std::uint32_t bit_(OperationType t) noexcept {
        return t == OperationType::Unknown ? 0u : (1u << static_cast<std::uint32_t>(t));
    }

    std::uint32_t bits_{0};
};

[[nodiscard]] inline constexpr TypeMask operator|(OperationType a, OperationType b) noexcept {
    return TypeMask{a} | TypeMask{b};
}

} // namespace repsync::core::protocol
