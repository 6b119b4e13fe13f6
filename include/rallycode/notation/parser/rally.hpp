#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include "rallycode/notation/schema/rally.hpp"
#include "rallycode/notation/parser/shot.hpp"
#include "rallycode/notation/parser/helpers.hpp"
#include "rallycode/config/decoder.hpp"
#include "lcr/log/logger.hpp"


namespace rallycode::notation::parser {

class rally {
public:
    // Decode everything after the serve into shots.
    //
    // Expected shape:
    //   <token><token>...   e.g. "f28b3f1*"
    //
    // Shots alternate players starting with the returner. Only the last
    // token may carry a terminal outcome. The whole string is consumed or
    // the call fails; `out` is only written on success. `full_code` is the
    // complete serve code the rally was taken from, reported on failure.
    [[nodiscard]]
    static inline Result parse(std::string_view code, std::string_view server, std::string_view returner,
                               schema::Rally& out, Error& err, std::string_view full_code = {}) {
        if (full_code.empty()) {
            full_code = code;
        }

        if (code.empty()) {
            RC_DEBUG("[PARSER] Empty rally in code '" << full_code << "' -> reject point.");
            return err.set(Result::MalformedSequence, code, full_code, "rally is empty");
        }

        schema::Rally r;
        r.shots.reserve(config::decoder::RALLY_RESERVE);

        std::size_t pos = 0;
        std::size_t last_start = 0;
        while (pos < code.size()) {
            // A terminal outcome must close the rally
            if (!r.shots.empty() && r.shots.back().is_terminal()) {
                RC_DEBUG("[PARSER] Shots after a terminal outcome in '" << full_code << "' -> reject point.");
                return err.set(Result::MalformedSequence, code.substr(last_start), full_code,
                               "terminal outcome before the end of the rally");
            }

            const std::string_view player = (r.shots.size() % 2 == 0) ? returner : server;
            last_start = pos;

            schema::Shot s;
            auto res = shot::parse(code, pos, player, s, err, full_code);
            if (res != Result::Parsed) {
                RC_DEBUG("[PARSER] Shot #" << r.shots.size() << " invalid in '" << full_code << "': " << err.reason << " -> reject point.");
                return res;
            }
            r.shots.push_back(std::move(s));
        }

        out = std::move(r);
        return Result::Parsed;
    }
};

} // namespace rallycode::notation::parser
