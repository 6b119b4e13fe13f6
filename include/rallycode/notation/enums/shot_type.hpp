#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>


namespace rallycode::notation {

// ===============================================================
// SHOT TYPE ENUM
// ===============================================================
// One letter per stroke. Every rally token starts with one of these.
enum class ShotType : uint8_t {
    Forehand,               // f
    Backhand,               // b
    ForehandSlice,          // r
    BackhandSlice,          // s
    ForehandVolley,         // v
    BackhandVolley,         // z
    Overhead,               // o
    BackhandOverhead,       // p
    ForehandDropShot,       // u
    BackhandDropShot,       // y
    ForehandLob,            // l
    BackhandLob,            // m
    ForehandHalfVolley,     // h
    BackhandHalfVolley,     // i
    ForehandSwingingVolley, // j
    BackhandSwingingVolley, // k
    Trick,                  // t
    Unclassified,           // q
    Invalid
};

inline constexpr std::size_t SHOT_TYPE_COUNT = static_cast<std::size_t>(ShotType::Invalid);

// ===============================================================
// 1) Standard conversion: enum → string
// ===============================================================
[[nodiscard]] inline constexpr std::string_view to_string(ShotType t) noexcept {
    switch (t) {
        case ShotType::Forehand:               return "forehand";
        case ShotType::Backhand:               return "backhand";
        case ShotType::ForehandSlice:          return "forehand_slice";
        case ShotType::BackhandSlice:          return "backhand_slice";
        case ShotType::ForehandVolley:         return "forehand_volley";
        case ShotType::BackhandVolley:         return "backhand_volley";
        case ShotType::Overhead:               return "overhead";
        case ShotType::BackhandOverhead:       return "backhand_overhead";
        case ShotType::ForehandDropShot:       return "forehand_drop_shot";
        case ShotType::BackhandDropShot:       return "backhand_drop_shot";
        case ShotType::ForehandLob:            return "forehand_lob";
        case ShotType::BackhandLob:            return "backhand_lob";
        case ShotType::ForehandHalfVolley:     return "forehand_half_volley";
        case ShotType::BackhandHalfVolley:     return "backhand_half_volley";
        case ShotType::ForehandSwingingVolley: return "forehand_swinging_volley";
        case ShotType::BackhandSwingingVolley: return "backhand_swinging_volley";
        case ShotType::Trick:                  return "trick";
        case ShotType::Unclassified:           return "unclassified";
        default:                               return "invalid";
    }
}

// ===============================================================
// 2) Notation conversion: char → enum
// ===============================================================
[[nodiscard]] inline constexpr ShotType to_shot_type(char c) noexcept {
    switch (c) {
        case 'f': return ShotType::Forehand;
        case 'b': return ShotType::Backhand;
        case 'r': return ShotType::ForehandSlice;
        case 's': return ShotType::BackhandSlice;
        case 'v': return ShotType::ForehandVolley;
        case 'z': return ShotType::BackhandVolley;
        case 'o': return ShotType::Overhead;
        case 'p': return ShotType::BackhandOverhead;
        case 'u': return ShotType::ForehandDropShot;
        case 'y': return ShotType::BackhandDropShot;
        case 'l': return ShotType::ForehandLob;
        case 'm': return ShotType::BackhandLob;
        case 'h': return ShotType::ForehandHalfVolley;
        case 'i': return ShotType::BackhandHalfVolley;
        case 'j': return ShotType::ForehandSwingingVolley;
        case 'k': return ShotType::BackhandSwingingVolley;
        case 't': return ShotType::Trick;
        case 'q': return ShotType::Unclassified;
        default:  return ShotType::Invalid;
    }
}

// ===============================================================
// 3) Notation conversion: enum → char
// ===============================================================
[[nodiscard]] inline constexpr char to_char(ShotType t) noexcept {
    switch (t) {
        case ShotType::Forehand:               return 'f';
        case ShotType::Backhand:               return 'b';
        case ShotType::ForehandSlice:          return 'r';
        case ShotType::BackhandSlice:          return 's';
        case ShotType::ForehandVolley:         return 'v';
        case ShotType::BackhandVolley:         return 'z';
        case ShotType::Overhead:               return 'o';
        case ShotType::BackhandOverhead:       return 'p';
        case ShotType::ForehandDropShot:       return 'u';
        case ShotType::BackhandDropShot:       return 'y';
        case ShotType::ForehandLob:            return 'l';
        case ShotType::BackhandLob:            return 'm';
        case ShotType::ForehandHalfVolley:     return 'h';
        case ShotType::BackhandHalfVolley:     return 'i';
        case ShotType::ForehandSwingingVolley: return 'j';
        case ShotType::BackhandSwingingVolley: return 'k';
        case ShotType::Trick:                  return 't';
        case ShotType::Unclassified:           return 'q';
        default:                               return '?';
    }
}

[[nodiscard]] inline constexpr bool is_shot_type(char c) noexcept {
    return to_shot_type(c) != ShotType::Invalid;
}

} // namespace rallycode::notation
