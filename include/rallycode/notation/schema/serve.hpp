#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <sstream>

#include "rallycode/notation/enums.hpp"


namespace rallycode::notation::schema {

/*
===============================================================================
Serve
===============================================================================

One serve attempt. The same type models first and second serves; `attempt`
tells them apart and consumers branch on the capability predicates:

  was_fault()    the serve did not land in (fault != None)
  had_rally()    the serve was returned and further shots follow
  ended_point()  the serve itself decided the point (ace, unreturnable,
                 or a second-serve fault)

Examples:
  "6*"     ace down the T
  "4n"     fault into the net, wide placement
  "n"      fault into the net, placement not recorded
  "c5+"    let, then a body serve followed by serve-and-volley
===============================================================================
*/

struct Serve {
    std::string server;
    ServeAttempt attempt{ServeAttempt::First};
    std::string raw_code;                               // Kept for diagnostics
    std::uint8_t lets{0};
    ServeDirection direction{ServeDirection::Unknown};
    bool serve_and_volley{false};
    FaultKind fault{FaultKind::None};
    ServeOutcome outcome{ServeOutcome::Invalid};

    [[nodiscard]] bool is_first() const noexcept { return attempt == ServeAttempt::First; }

    [[nodiscard]] bool was_fault() const noexcept { return fault != FaultKind::None; }

    [[nodiscard]] bool had_rally() const noexcept { return outcome == ServeOutcome::InPlay; }

    [[nodiscard]] bool ended_point() const noexcept {
        return outcome == ServeOutcome::Ace ||
               outcome == ServeOutcome::Unreturnable ||
               (was_fault() && attempt == ServeAttempt::Second);
    }

    [[nodiscard]] bool is_double_fault() const noexcept {
        return was_fault() && attempt == ServeAttempt::Second;
    }

    // raw_code is diagnostic only and takes no part in equality
    bool operator==(const Serve& o) const noexcept {
        return server == o.server &&
               attempt == o.attempt &&
               lets == o.lets &&
               direction == o.direction &&
               serve_and_volley == o.serve_and_volley &&
               fault == o.fault &&
               outcome == o.outcome;
    }

    // ------------------------------------------------------------
    // Debug / diagnostic dump
    // ------------------------------------------------------------
    inline void dump(std::ostream& os) const {
        os << "[SERVE] { "
           << "server=" << server << ", "
           << "attempt=" << to_string(attempt) << ", "
           << "code=" << raw_code << ", "
           << "direction=" << to_string(direction);
        if (lets > 0) {
            os << ", lets=" << static_cast<unsigned>(lets);
        }
        if (serve_and_volley) {
            os << ", serve_and_volley";
        }
        if (was_fault()) {
            os << ", fault=" << to_string(fault);
        }
        os << ", outcome=" << to_string(outcome) << " }";
    }

#ifndef NDEBUG
    // NOTE: Allocates. Intended for debugging/logging only.
    [[nodiscard]]
    inline std::string str() const {
        std::ostringstream oss;
        dump(oss);
        return oss.str();
    }
#endif
};

inline std::ostream& operator<<(std::ostream& os, const Serve& s) {
    s.dump(os);
    return os;
}

} // namespace rallycode::notation::schema
