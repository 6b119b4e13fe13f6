#pragma once

#include <string>
#include <ostream>
#include <sstream>

#include "rallycode/notation/enums.hpp"


namespace rallycode::notation::schema {

/*
===============================================================================
Shot
===============================================================================

One hit inside a rally. Decoded from a single rally token: a shot-type letter
followed by optional modifiers, e.g. "f+28" (forehand approach to the middle,
landing behind the service line) or "b3n@" (backhand, unforced error into
the net).

Only the last shot of a rally may carry a terminal outcome. Every earlier
shot is InPlay.
===============================================================================
*/

struct Shot {
    std::string player;                                 // Player who hit the shot
    ShotType type{ShotType::Invalid};
    ShotDirection direction{ShotDirection::Unknown};
    Depth depth{Depth::None};
    Position position{Position::None};
    bool net_cord{false};
    bool stop_volley{false};
    ErrorKind error{ErrorKind::None};
    ShotOutcome outcome{ShotOutcome::InPlay};

    [[nodiscard]] bool is_terminal() const noexcept {
        return notation::is_terminal(outcome);
    }

    bool operator==(const Shot&) const = default;

    // ------------------------------------------------------------
    // Debug / diagnostic dump
    // ------------------------------------------------------------
    inline void dump(std::ostream& os) const {
        os << "[SHOT] { "
           << "player=" << player << ", "
           << "type=" << to_string(type) << ", "
           << "direction=" << to_string(direction);
        if (depth != Depth::None) {
            os << ", depth=" << to_string(depth);
        }
        if (position != Position::None) {
            os << ", position=" << to_string(position);
        }
        if (net_cord) {
            os << ", net_cord";
        }
        if (stop_volley) {
            os << ", stop_volley";
        }
        if (error != ErrorKind::None) {
            os << ", error=" << to_string(error);
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

inline std::ostream& operator<<(std::ostream& os, const Shot& s) {
    s.dump(os);
    return os;
}

} // namespace rallycode::notation::schema
