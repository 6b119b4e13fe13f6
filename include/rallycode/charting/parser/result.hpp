#pragma once

#include <cstdint>
#include <string_view>


namespace rallycode::charting::parser {

// ===============================================
// ROW PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Parsed         = 0,     // Parsed successfully
    InvalidJson    = 1,     // Structural failure
    InvalidSchema  = 2,     // Missing required field, type mismatch, etc.
    InvalidValue   = 3      // Field present but semantically invalid
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Parsed:        return "Parsed";
        case Result::InvalidJson:   return "InvalidJson";
        case Result::InvalidSchema: return "InvalidSchema";
        case Result::InvalidValue:  return "InvalidValue";
        default:                    return "unknown";
    }
}

} // namespace rallycode::charting::parser
