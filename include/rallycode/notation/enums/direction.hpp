#pragma once

#include <cstdint>
#include <string_view>


namespace rallycode::notation {

// ===============================================================
// SERVE DIRECTION ENUM
// ===============================================================
enum class ServeDirection : uint8_t {
    Unknown,    // 0
    Wide,       // 4
    Body,       // 5
    T,          // 6
    Invalid
};

[[nodiscard]] inline constexpr std::string_view to_string(ServeDirection d) noexcept {
    switch (d) {
        case ServeDirection::Unknown: return "unknown";
        case ServeDirection::Wide:    return "wide";
        case ServeDirection::Body:    return "body";
        case ServeDirection::T:       return "t";
        default:                      return "invalid";
    }
}

[[nodiscard]] inline constexpr ServeDirection to_serve_direction(char c) noexcept {
    switch (c) {
        case '0': return ServeDirection::Unknown;
        case '4': return ServeDirection::Wide;
        case '5': return ServeDirection::Body;
        case '6': return ServeDirection::T;
        default:  return ServeDirection::Invalid;
    }
}

[[nodiscard]] inline constexpr char to_char(ServeDirection d) noexcept {
    switch (d) {
        case ServeDirection::Unknown: return '0';
        case ServeDirection::Wide:    return '4';
        case ServeDirection::Body:    return '5';
        case ServeDirection::T:       return '6';
        default:                      return '?';
    }
}


// ===============================================================
// SHOT DIRECTION ENUM
// ===============================================================
// Directions are given from the point of view of a right-handed receiver.
// A missing digit and '0' both decode to Unknown.
enum class ShotDirection : uint8_t {
    Unknown,    // 0 (or absent)
    Forehand,   // 1
    Middle,     // 2
    Backhand,   // 3
    Invalid
};

[[nodiscard]] inline constexpr std::string_view to_string(ShotDirection d) noexcept {
    switch (d) {
        case ShotDirection::Unknown:  return "unknown";
        case ShotDirection::Forehand: return "forehand_side";
        case ShotDirection::Middle:   return "middle";
        case ShotDirection::Backhand: return "backhand_side";
        default:                      return "invalid";
    }
}

[[nodiscard]] inline constexpr ShotDirection to_shot_direction(char c) noexcept {
    switch (c) {
        case '0': return ShotDirection::Unknown;
        case '1': return ShotDirection::Forehand;
        case '2': return ShotDirection::Middle;
        case '3': return ShotDirection::Backhand;
        default:  return ShotDirection::Invalid;
    }
}

[[nodiscard]] inline constexpr char to_char(ShotDirection d) noexcept {
    switch (d) {
        case ShotDirection::Unknown:  return '0';
        case ShotDirection::Forehand: return '1';
        case ShotDirection::Middle:   return '2';
        case ShotDirection::Backhand: return '3';
        default:                      return '?';
    }
}

} // namespace rallycode::notation
