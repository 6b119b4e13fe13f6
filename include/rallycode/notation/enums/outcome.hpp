#pragma once

#include <cstdint>
#include <string_view>


namespace rallycode::notation {

// ===============================================================
// SHOT OUTCOME ENUM
// ===============================================================
enum class ShotOutcome : uint8_t {
    InPlay,
    Winner,         // *
    ForcedError,    // #
    UnforcedError,  // @
    Invalid
};

[[nodiscard]] inline constexpr std::string_view to_string(ShotOutcome o) noexcept {
    switch (o) {
        case ShotOutcome::InPlay:        return "in_play";
        case ShotOutcome::Winner:        return "winner";
        case ShotOutcome::ForcedError:   return "forced_error";
        case ShotOutcome::UnforcedError: return "unforced_error";
        default:                         return "invalid";
    }
}

[[nodiscard]] inline constexpr ShotOutcome to_shot_outcome(char c) noexcept {
    switch (c) {
        case '*': return ShotOutcome::Winner;
        case '#': return ShotOutcome::ForcedError;
        case '@': return ShotOutcome::UnforcedError;
        default:  return ShotOutcome::Invalid;
    }
}

[[nodiscard]] inline constexpr char to_char(ShotOutcome o) noexcept {
    switch (o) {
        case ShotOutcome::Winner:        return '*';
        case ShotOutcome::ForcedError:   return '#';
        case ShotOutcome::UnforcedError: return '@';
        default:                         return '?';
    }
}

[[nodiscard]] inline constexpr bool is_terminal(ShotOutcome o) noexcept {
    return o == ShotOutcome::Winner || o == ShotOutcome::ForcedError || o == ShotOutcome::UnforcedError;
}

[[nodiscard]] inline constexpr bool is_error(ShotOutcome o) noexcept {
    return o == ShotOutcome::ForcedError || o == ShotOutcome::UnforcedError;
}


// ===============================================================
// SERVE OUTCOME ENUM
// ===============================================================
enum class ServeOutcome : uint8_t {
    Fault,
    Ace,            // *
    Unreturnable,   // #
    InPlay,         // return follows
    Invalid
};

[[nodiscard]] inline constexpr std::string_view to_string(ServeOutcome o) noexcept {
    switch (o) {
        case ServeOutcome::Fault:        return "fault";
        case ServeOutcome::Ace:          return "ace";
        case ServeOutcome::Unreturnable: return "unreturnable";
        case ServeOutcome::InPlay:       return "in_play";
        default:                         return "invalid";
    }
}

// Only the point-ending serve markers have a notation character.
[[nodiscard]] inline constexpr ServeOutcome to_serve_outcome(char c) noexcept {
    switch (c) {
        case '*': return ServeOutcome::Ace;
        case '#': return ServeOutcome::Unreturnable;
        default:  return ServeOutcome::Invalid;
    }
}

[[nodiscard]] inline constexpr char to_char(ServeOutcome o) noexcept {
    switch (o) {
        case ServeOutcome::Ace:          return '*';
        case ServeOutcome::Unreturnable: return '#';
        default:                         return '?';
    }
}


// ===============================================================
// SERVE ATTEMPT ENUM
// ===============================================================
enum class ServeAttempt : uint8_t {
    First,
    Second
};

[[nodiscard]] inline constexpr std::string_view to_string(ServeAttempt a) noexcept {
    switch (a) {
        case ServeAttempt::First:  return "first";
        case ServeAttempt::Second: return "second";
    }
    return "unknown";
}

} // namespace rallycode::notation
