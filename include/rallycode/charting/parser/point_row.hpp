#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include <simdjson.h>

#include "rallycode/charting/point_row.hpp"
#include "rallycode/charting/parser/helpers.hpp"
#include "lcr/log/logger.hpp"


namespace rallycode::charting::parser {

class point_row {
public:
    // Parse one charted point row
    //
    // Expected shape:
    // {
    //   "match_id": "...",     (optional)
    //   "point": 17,           (optional)
    //   "server": "A",
    //   "returner": "B",
    //   "server_won": true,
    //   "first": "4n",
    //   "second": "5b28f1*"    (optional)
    // }
    //
    // `out` is only written on success.
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, PointRow& out) noexcept {
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            RC_DEBUG("[PARSER] Row is not an object -> drop row.");
            return r;
        }

        PointRow row;

        // match_id (optional)
        bool present = false;
        std::string_view sv;
        r = helper::parse_string_optional(root, "match_id", sv, present);
        if (r != Result::Parsed) {
            RC_DEBUG("[PARSER] Field 'match_id' has the wrong type -> drop row.");
            return r;
        }
        row.match_id.assign(sv);

        // point (optional)
        r = helper::parse_uint64_optional(root, "point", row.point, present);
        if (r != Result::Parsed) {
            RC_DEBUG("[PARSER] Field 'point' has the wrong type -> drop row.");
            return r;
        }

        // server (required)
        r = helper::parse_string_required(root, "server", sv);
        if (r != Result::Parsed) {
            RC_DEBUG("[PARSER] Field 'server' missing or invalid -> drop row.");
            return r;
        }
        if (sv.empty()) {
            RC_DEBUG("[PARSER] Field 'server' is empty -> drop row.");
            return Result::InvalidValue;
        }
        row.server.assign(sv);

        // returner (required)
        r = helper::parse_string_required(root, "returner", sv);
        if (r != Result::Parsed) {
            RC_DEBUG("[PARSER] Field 'returner' missing or invalid -> drop row.");
            return r;
        }
        if (sv.empty() || sv == row.server) {
            RC_DEBUG("[PARSER] Field 'returner' is empty or equals the server -> drop row.");
            return Result::InvalidValue;
        }
        row.returner.assign(sv);

        // server_won (required)
        r = helper::parse_bool_required(root, "server_won", row.server_won);
        if (r != Result::Parsed) {
            RC_DEBUG("[PARSER] Field 'server_won' missing or invalid -> drop row.");
            return r;
        }

        // first (required; an empty string is left to the notation decoder)
        r = helper::parse_string_required(root, "first", sv);
        if (r != Result::Parsed) {
            RC_DEBUG("[PARSER] Field 'first' missing or invalid -> drop row.");
            return r;
        }
        row.first.assign(sv);

        // second (optional)
        r = helper::parse_string_optional(root, "second", sv, present);
        if (r != Result::Parsed) {
            RC_DEBUG("[PARSER] Field 'second' has the wrong type -> drop row.");
            return r;
        }
        row.second.assign(sv);

        out = std::move(row);
        return Result::Parsed;
    }
};

} // namespace rallycode::charting::parser
