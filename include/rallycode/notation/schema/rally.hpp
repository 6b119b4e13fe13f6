#pragma once

#include <vector>
#include <cstddef>
#include <ostream>

#include "rallycode/notation/schema/shot.hpp"


namespace rallycode::notation::schema {

// -----------------------------------------------------------------------------
// Rally: the shots exchanged after the serve was returned, in the order they
// were hit. Never empty once decoded. Shot 0 is the return of serve.
// -----------------------------------------------------------------------------
struct Rally {
    std::vector<Shot> shots;

    [[nodiscard]] std::size_t size() const noexcept { return shots.size(); }
    [[nodiscard]] bool empty() const noexcept { return shots.empty(); }

    [[nodiscard]] const Shot& last() const { return shots.back(); }

    bool operator==(const Rally&) const = default;

    inline void dump(std::ostream& os) const {
        os << "[RALLY] { shots=" << shots.size() << " }";
        for (const auto& s : shots) {
            os << "\n  " << s;
        }
    }
};

inline std::ostream& operator<<(std::ostream& os, const Rally& r) {
    r.dump(os);
    return os;
}

} // namespace rallycode::notation::schema
