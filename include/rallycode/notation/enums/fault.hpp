#pragma once

#include <cstdint>
#include <string_view>


namespace rallycode::notation {

// ===============================================================
// FAULT KIND ENUM (serves)
// ===============================================================
enum class FaultKind : uint8_t {
    None,
    Net,            // n
    Wide,           // w
    Deep,           // d
    WideAndDeep,    // x
    FootFault,      // g
    Shank,          // !
    Unknown,        // e
    TimeViolation,  // V
    Invalid
};

[[nodiscard]] inline constexpr std::string_view to_string(FaultKind f) noexcept {
    switch (f) {
        case FaultKind::None:          return "none";
        case FaultKind::Net:           return "net";
        case FaultKind::Wide:          return "wide";
        case FaultKind::Deep:          return "deep";
        case FaultKind::WideAndDeep:   return "wide_and_deep";
        case FaultKind::FootFault:     return "foot_fault";
        case FaultKind::Shank:         return "shank";
        case FaultKind::Unknown:       return "unknown";
        case FaultKind::TimeViolation: return "time_violation";
        default:                       return "invalid";
    }
}

[[nodiscard]] inline constexpr FaultKind to_fault_kind(char c) noexcept {
    switch (c) {
        case 'n': return FaultKind::Net;
        case 'w': return FaultKind::Wide;
        case 'd': return FaultKind::Deep;
        case 'x': return FaultKind::WideAndDeep;
        case 'g': return FaultKind::FootFault;
        case '!': return FaultKind::Shank;
        case 'e': return FaultKind::Unknown;
        case 'V': return FaultKind::TimeViolation;
        default:  return FaultKind::Invalid;
    }
}

[[nodiscard]] inline constexpr char to_char(FaultKind f) noexcept {
    switch (f) {
        case FaultKind::Net:           return 'n';
        case FaultKind::Wide:          return 'w';
        case FaultKind::Deep:          return 'd';
        case FaultKind::WideAndDeep:   return 'x';
        case FaultKind::FootFault:     return 'g';
        case FaultKind::Shank:         return '!';
        case FaultKind::Unknown:       return 'e';
        case FaultKind::TimeViolation: return 'V';
        default:                       return '?';
    }
}

[[nodiscard]] inline constexpr bool is_fault_letter(char c) noexcept {
    return to_fault_kind(c) != FaultKind::Invalid;
}


// ===============================================================
// ERROR KIND ENUM (rally shots)
// ===============================================================
// Same letters as serve faults, minus the serve-only kinds.
enum class ErrorKind : uint8_t {
    None,
    Net,            // n
    Wide,           // w
    Deep,           // d
    WideAndDeep,    // x
    Shank,          // !
    Unknown,        // e
    Invalid
};

[[nodiscard]] inline constexpr std::string_view to_string(ErrorKind e) noexcept {
    switch (e) {
        case ErrorKind::None:        return "none";
        case ErrorKind::Net:         return "net";
        case ErrorKind::Wide:        return "wide";
        case ErrorKind::Deep:        return "deep";
        case ErrorKind::WideAndDeep: return "wide_and_deep";
        case ErrorKind::Shank:       return "shank";
        case ErrorKind::Unknown:     return "unknown";
        default:                     return "invalid";
    }
}

[[nodiscard]] inline constexpr ErrorKind to_error_kind(char c) noexcept {
    switch (c) {
        case 'n': return ErrorKind::Net;
        case 'w': return ErrorKind::Wide;
        case 'd': return ErrorKind::Deep;
        case 'x': return ErrorKind::WideAndDeep;
        case '!': return ErrorKind::Shank;
        case 'e': return ErrorKind::Unknown;
        default:  return ErrorKind::Invalid;
    }
}

[[nodiscard]] inline constexpr char to_char(ErrorKind e) noexcept {
    switch (e) {
        case ErrorKind::Net:         return 'n';
        case ErrorKind::Wide:        return 'w';
        case ErrorKind::Deep:        return 'd';
        case ErrorKind::WideAndDeep: return 'x';
        case ErrorKind::Shank:       return '!';
        case ErrorKind::Unknown:     return 'e';
        default:                     return '?';
    }
}

} // namespace rallycode::notation
