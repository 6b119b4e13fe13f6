#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <sstream>


namespace rallycode::charting {

/*
===============================================================================
Charted Point Row
===============================================================================

One point as supplied by the tabular layer: the two players, who won, and the
two charting columns (first serve code, second serve code).

Example JSON row:
{
  "match_id": "20230709-M-Wimbledon-R16-A-B",
  "point": 17,
  "server": "A",
  "returner": "B",
  "server_won": true,
  "first": "4n",
  "second": "5b28f1*"
}

`match_id`, `point` and `second` are optional.
===============================================================================
*/

struct PointRow {
    std::string match_id;
    std::uint64_t point{0};
    std::string server;
    std::string returner;
    bool server_won{false};
    std::string first;
    std::string second;

    inline void dump(std::ostream& os) const {
        os << "[ROW] { ";
        if (!match_id.empty()) {
            os << "match_id=" << match_id << ", point=" << point << ", ";
        }
        os << "server=" << server << ", "
           << "returner=" << returner << ", "
           << "server_won=" << (server_won ? "true" : "false") << ", "
           << "first=" << first << ", "
           << "second=" << second
           << " }";
    }

#ifndef NDEBUG
    [[nodiscard]]
    inline std::string str() const {
        std::ostringstream oss;
        dump(oss);
        return oss.str();
    }
#endif
};

inline std::ostream& operator<<(std::ostream& os, const PointRow& r) {
    r.dump(os);
    return os;
}

} // namespace rallycode::charting
