#pragma once

#include <string>
#include <optional>
#include <string_view>
#include <utility>

#include "rallycode/notation/schema/shot_sequence.hpp"
#include "rallycode/notation/enums/shortcut.hpp"
#include "rallycode/notation/parser/helpers.hpp"
#include "rallycode/notation/parser/serve.hpp"
#include "rallycode/notation/parser/rally.hpp"
#include "rallycode/config/decoder.hpp"
#include "lcr/log/logger.hpp"


namespace rallycode::notation::parser {

/*
================================================================================
Point Decoder
================================================================================

Turns the pair of codes charted for one point into a ShotSequence.

Decoding order:
  1) Strip whitespace from both codes; the second code is only read
     (and length-checked) after a first-serve fault
  2) One-character first code → tagged dispatch (see SingleCode):
       S / R        not coded
       P / Q        server lost / won outright
       fault letter prefixed with the unknown direction '0'
       anything else is UnknownCode
  3) First serve
  4) First serve faulted → second serve from `second_code`
     First serve in      → `second_code` must be empty
  5) Terminating serve returned in play → rally from its remainder

A ShotSequence is produced in one pass or not at all: `out` is only written
when Result::Parsed is returned.
================================================================================
*/

class shot_sequence {
public:
    [[nodiscard]]
    static inline Result parse(std::string_view server, std::string_view returner, bool server_won,
                               std::string_view first_code, std::string_view second_code,
                               schema::ShotSequence& out, Error& err) {
        std::string_view first = helper::trim(first_code);
        const std::string_view second = helper::trim(second_code);

        if (first.empty()) {
            RC_DEBUG("[PARSER] No first serve code for point " << server << " vs " << returner << " -> reject point.");
            return err.set(Result::MissingRequiredServe, first, first_code, "no first serve code recorded");
        }
        if (first.size() > config::decoder::MAX_CODE_LENGTH) {
            RC_DEBUG("[PARSER] First serve code exceeds " << config::decoder::MAX_CODE_LENGTH << " characters -> reject point.");
            return err.set(Result::MalformedSequence, first, first_code, "first serve code exceeds the maximum length");
        }

        // Single-character first codes
        std::string normalized;
        if (first.size() == 1) {
            switch (to_single_code(first.front())) {
                case SingleCode::NotCodedServerWon:
                case SingleCode::NotCodedReturnerWon:
                    out = schema::ShotSequence::not_coded_point(server, returner, server_won);
                    return Result::Parsed;
                case SingleCode::ServerLostOutright:
                    out = schema::ShotSequence::lost_outright_point(server, returner, server_won);
                    return Result::Parsed;
                case SingleCode::ServerWonOutright:
                    out = schema::ShotSequence::won_outright_point(server, returner, server_won);
                    return Result::Parsed;
                case SingleCode::BareFault:
                    normalized.reserve(2);
                    normalized.push_back(to_char(ServeDirection::Unknown));
                    normalized.push_back(first.front());
                    first = normalized;
                    break;
                default:
                    RC_DEBUG("[PARSER] Unknown single-character code '" << first << "' -> reject point.");
                    return err.set(Result::UnknownCode, first, first_code, "unknown single-character code");
            }
        }

        schema::ShotSequence seq;
        seq.server.assign(server);
        seq.returner.assign(returner);
        seq.server_won = server_won;
        seq.shape = schema::PointShape::Coded;

        // First serve
        schema::Serve first_serve;
        std::string_view remainder;
        auto r = serve::parse(first, server, ServeAttempt::First, first_serve, remainder, err);
        if (r != Result::Parsed) {
            return r;
        }

        std::string_view rally_code = remainder;
        std::string_view rally_source = first;
        bool rally_follows = first_serve.had_rally();

        if (first_serve.was_fault()) {
            if (second.empty()) {
                RC_DEBUG("[PARSER] First serve '" << first << "' faulted but no second serve recorded -> reject point.");
                return err.set(Result::MissingRequiredServe, first, first_code,
                               "first serve faulted but no second serve was recorded");
            }
            if (second.size() > config::decoder::MAX_CODE_LENGTH) {
                RC_DEBUG("[PARSER] Second serve code exceeds " << config::decoder::MAX_CODE_LENGTH << " characters -> reject point.");
                return err.set(Result::MalformedSequence, second, second_code,
                               "second serve code exceeds the maximum length");
            }

            schema::Serve second_serve;
            r = serve::parse(second, server, ServeAttempt::Second, second_serve, remainder, err);
            if (r != Result::Parsed) {
                return r;
            }
            rally_code = remainder;
            rally_source = second;
            rally_follows = second_serve.had_rally();
            seq.second_serve = std::move(second_serve);
        }
        else if (!second.empty()) {
            RC_DEBUG("[PARSER] Second serve '" << second << "' recorded after a good first serve -> reject point.");
            return err.set(Result::MalformedSequence, second, second_code,
                           "second serve recorded although the first serve was in");
        }

        seq.first_serve = std::move(first_serve);

        if (rally_follows) {
            schema::Rally rally_out;
            r = rally::parse(rally_code, server, returner, rally_out, err, rally_source);
            if (r != Result::Parsed) {
                return r;
            }
            seq.rally = std::move(rally_out);
        }

        out = std::move(seq);
        return Result::Parsed;
    }
};

} // namespace rallycode::notation::parser
