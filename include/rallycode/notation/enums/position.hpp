#pragma once

#include <cstdint>
#include <string_view>


namespace rallycode::notation {

// ===============================================================
// COURT POSITION ENUM
// ===============================================================
// Where the hitting player stood, when the charter recorded it.
enum class Position : uint8_t {
    None,
    Approach,   // +
    Net,        // -
    Baseline,   // =
    Invalid
};

[[nodiscard]] inline constexpr std::string_view to_string(Position p) noexcept {
    switch (p) {
        case Position::None:     return "none";
        case Position::Approach: return "approach";
        case Position::Net:      return "net";
        case Position::Baseline: return "baseline";
        default:                 return "invalid";
    }
}

[[nodiscard]] inline constexpr Position to_position(char c) noexcept {
    switch (c) {
        case '+': return Position::Approach;
        case '-': return Position::Net;
        case '=': return Position::Baseline;
        default:  return Position::Invalid;
    }
}

[[nodiscard]] inline constexpr char to_char(Position p) noexcept {
    switch (p) {
        case Position::Approach: return '+';
        case Position::Net:      return '-';
        case Position::Baseline: return '=';
        default:                 return '?';
    }
}

// Shot specials
inline constexpr char NET_CORD    = ';';
inline constexpr char STOP_VOLLEY = '^';

// Serve-only markers
inline constexpr char LET              = 'c';
inline constexpr char SERVE_AND_VOLLEY = '+';

} // namespace rallycode::notation
