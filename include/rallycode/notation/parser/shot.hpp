#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include "rallycode/notation/schema/shot.hpp"
#include "rallycode/notation/parser/helpers.hpp"
#include "rallycode/notation/result.hpp"
#include "rallycode/notation/error.hpp"


namespace rallycode::notation::parser {

// -----------------------------------------------------------------------------
// Single rally token
// -----------------------------------------------------------------------------
//
// A token is one shot-type letter followed by any number of modifiers, up to
// the next shot-type letter. Modifiers may come in any order but each axis
// (direction, depth, position, error, outcome) may only appear once.
//
// `pos` must point at the token start and is left one past its end on
// success. `out` is only written on success.
// -----------------------------------------------------------------------------
class shot {
public:
    [[nodiscard]]
    static inline Result parse(std::string_view code, std::size_t& pos, std::string_view player,
                               schema::Shot& out, Error& err, std::string_view full_code) {
        const std::size_t start = pos;
        std::size_t i = pos;

        schema::Shot s;
        s.type = to_shot_type(code[i]);
        if (s.type == ShotType::Invalid) {
            return err.set(Result::UnknownCode, helper::tail(code, i), full_code, "unrecognised shot type");
        }
        ++i;

        bool has_direction = false;
        bool has_depth = false;
        bool has_position = false;
        bool has_error = false;
        bool has_outcome = false;

        auto duplicate = [&](const char* what) {
            return err.set(Result::MalformedSequence, code.substr(start, i - start + 1), full_code, what);
        };

        for (; i < code.size() && !is_shot_type(code[i]); ++i) {
            const char c = code[i];

            if (const auto d = to_shot_direction(c); d != ShotDirection::Invalid) {
                if (has_direction) return duplicate("shot carries two directions");
                s.direction = d;
                has_direction = true;
            }
            else if (const auto dp = to_depth(c); dp != Depth::Invalid) {
                if (has_depth) return duplicate("shot carries two depths");
                s.depth = dp;
                has_depth = true;
            }
            else if (const auto p = to_position(c); p != Position::Invalid) {
                if (has_position) return duplicate("shot carries two court positions");
                s.position = p;
                has_position = true;
            }
            else if (c == NET_CORD) {
                if (s.net_cord) return duplicate("shot carries two net-cord markers");
                s.net_cord = true;
            }
            else if (c == STOP_VOLLEY) {
                if (s.stop_volley) return duplicate("shot carries two stop-volley markers");
                s.stop_volley = true;
            }
            else if (const auto e = to_error_kind(c); e != ErrorKind::Invalid) {
                if (has_error) return duplicate("shot carries two error kinds");
                s.error = e;
                has_error = true;
            }
            else if (const auto o = to_shot_outcome(c); o != ShotOutcome::Invalid) {
                if (has_outcome) return duplicate("shot carries two outcomes");
                s.outcome = o;
                has_outcome = true;
            }
            else {
                return err.set(Result::UnknownCode, helper::tail(code, i), full_code, "unrecognised shot modifier");
            }
        }

        const std::string_view token = code.substr(start, i - start);
        if (has_error && !is_error(s.outcome)) {
            return err.set(Result::MalformedSequence, token, full_code, "error kind without a forced or unforced error outcome");
        }

        s.player.assign(player);
        out = std::move(s);
        pos = i;
        return Result::Parsed;
    }
};

} // namespace rallycode::notation::parser
