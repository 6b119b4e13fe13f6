#pragma once

#include <cstdint>
#include <string_view>

#include "rallycode/notation/enums/fault.hpp"


namespace rallycode::notation {

// ===============================================================
// SINGLE-CHARACTER CODE ENUM
// ===============================================================
// A one-character first code is either a whole-point shortcut or a
// fault letter recorded without a serve direction. The two meanings
// are told apart here, before any serve decoding takes place.
enum class SingleCode : uint8_t {
    NotCodedServerWon,      // S
    NotCodedReturnerWon,    // R
    ServerLostOutright,     // P
    ServerWonOutright,      // Q
    BareFault,              // any fault letter
    Invalid
};

[[nodiscard]] inline constexpr std::string_view to_string(SingleCode s) noexcept {
    switch (s) {
        case SingleCode::NotCodedServerWon:   return "not_coded_server_won";
        case SingleCode::NotCodedReturnerWon: return "not_coded_returner_won";
        case SingleCode::ServerLostOutright:  return "server_lost_outright";
        case SingleCode::ServerWonOutright:   return "server_won_outright";
        case SingleCode::BareFault:           return "bare_fault";
        default:                              return "invalid";
    }
}

// Shortcuts take precedence over fault letters.
[[nodiscard]] inline constexpr SingleCode to_single_code(char c) noexcept {
    switch (c) {
        case 'S': return SingleCode::NotCodedServerWon;
        case 'R': return SingleCode::NotCodedReturnerWon;
        case 'P': return SingleCode::ServerLostOutright;
        case 'Q': return SingleCode::ServerWonOutright;
        default:
            return is_fault_letter(c) ? SingleCode::BareFault : SingleCode::Invalid;
    }
}

[[nodiscard]] inline constexpr bool is_shortcut(SingleCode s) noexcept {
    return s == SingleCode::NotCodedServerWon || s == SingleCode::NotCodedReturnerWon ||
           s == SingleCode::ServerLostOutright || s == SingleCode::ServerWonOutright;
}

} // namespace rallycode::notation
