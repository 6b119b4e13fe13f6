#pragma once

#include <cstdint>
#include <string_view>


namespace rallycode::notation {

// ===============================================================
// DEPTH ENUM (return depth)
// ===============================================================
enum class Depth : uint8_t {
    None,               // not recorded
    ServiceBoxes,       // 7
    BehindServiceLine,  // 8
    NearBaseline,       // 9
    Invalid
};

[[nodiscard]] inline constexpr std::string_view to_string(Depth d) noexcept {
    switch (d) {
        case Depth::None:              return "none";
        case Depth::ServiceBoxes:      return "service_boxes";
        case Depth::BehindServiceLine: return "behind_service_line";
        case Depth::NearBaseline:      return "near_baseline";
        default:                       return "invalid";
    }
}

[[nodiscard]] inline constexpr Depth to_depth(char c) noexcept {
    switch (c) {
        case '7': return Depth::ServiceBoxes;
        case '8': return Depth::BehindServiceLine;
        case '9': return Depth::NearBaseline;
        default:  return Depth::Invalid;
    }
}

[[nodiscard]] inline constexpr char to_char(Depth d) noexcept {
    switch (d) {
        case Depth::ServiceBoxes:      return '7';
        case Depth::BehindServiceLine: return '8';
        case Depth::NearBaseline:      return '9';
        default:                       return '?';
    }
}

} // namespace rallycode::notation
