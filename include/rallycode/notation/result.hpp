#pragma once

#include <cstdint>
#include <string_view>


namespace rallycode::notation {

// ===============================================
// DECODER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Parsed               = 0,   // Decoded successfully
    UnknownCode          = 1,   // Character or token outside the vocabulary
    MalformedSequence    = 2,   // Known tokens in an invalid arrangement
    MissingRequiredServe = 3    // A serve the point requires was not recorded
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Parsed:               return "Parsed";
        case Result::UnknownCode:          return "UnknownCode";
        case Result::MalformedSequence:    return "MalformedSequence";
        case Result::MissingRequiredServe: return "MissingRequiredServe";
        default:                           return "unknown";
    }
}

} // namespace rallycode::notation
