#pragma once

#include <array>
#include <string>
#include <string_view>

#include <xxhash.h>


namespace repsync::core::session {

inline constexpr std::array<std::string_view, 8> PARTICIPANT_PALETTE = {
    "#FF6B6B", "#4ECDC4", "#45B7D1", "#96CEB4",
    "#FFEAA7", "#DDA0DD", "#FF9FF3", "#54A0FF"
};

// Stable across devices and restarts: every client derives the same
// color for the same participant id.
[[nodiscard]]
inline std::string participant_color(std::string_view account_id) {
    constexpr XXH64_hash_t seed = 0;
    const XXH64_hash_t h = XXH64(account_id.data(), account_id.size(), seed);
    return std::string(PARTICIPANT_PALETTE[h % PARTICIPANT_PALETTE.size()]);
}

} // namespace repsync::core::session
