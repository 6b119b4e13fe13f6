#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <utility>

#include "rallycode/notation/schema/serve.hpp"
#include "rallycode/notation/parser/helpers.hpp"
#include "rallycode/notation/result.hpp"
#include "rallycode/notation/error.hpp"
#include "lcr/log/logger.hpp"


namespace rallycode::notation::parser {

class serve {
public:
    // Decode one serve attempt.
    //
    // Expected shape:
    //   c*  <direction> [+] ( <fault> | * | # | <rally...> )
    //
    //   "6*"      ace down the T
    //   "4n"      wide serve, net fault
    //   "5+f2b1*" body serve, serve-and-volley, rally "f2b1*"
    //   "n"       net fault, direction not recorded
    //
    // On success `remainder` holds the rally characters (empty unless the
    // serve was returned in play). `out` is only written on success.
    [[nodiscard]]
    static inline Result parse(std::string_view code, std::string_view server, ServeAttempt attempt,
                               schema::Serve& out, std::string_view& remainder, Error& err) {
        if (code.empty()) {
            RC_DEBUG("[PARSER] Empty " << to_string(attempt) << " serve code -> reject point.");
            return err.set(Result::MissingRequiredServe, code, code, "serve code is empty");
        }

        schema::Serve s;
        s.server.assign(server);
        s.attempt = attempt;
        s.raw_code.assign(code);

        std::size_t pos = 0;

        // Lets
        while (pos < code.size() && code[pos] == LET) {
            if (s.lets == std::numeric_limits<std::uint8_t>::max()) {
                return err.set(Result::MalformedSequence, code, code, "too many lets");
            }
            ++s.lets;
            ++pos;
        }
        if (pos == code.size()) {
            RC_DEBUG("[PARSER] Serve code '" << code << "' holds only lets -> reject point.");
            return err.set(Result::MalformedSequence, code, code, "serve code holds only lets");
        }

        // Direction (or a bare fault letter standing in for an unknown one)
        const auto dir = to_serve_direction(code[pos]);
        if (dir != ServeDirection::Invalid) {
            s.direction = dir;
            ++pos;
        }
        else if (is_fault_letter(code[pos])) {
            RC_DEBUG("[PARSER] Serve code '" << code << "' has no direction -> fault with unknown direction.");
            s.direction = ServeDirection::Unknown;
        }
        else {
            RC_DEBUG("[PARSER] Unknown serve direction in '" << code << "' -> reject point.");
            return err.set(Result::UnknownCode, helper::tail(code, pos), code, "expected a serve direction or fault letter");
        }

        if (pos < code.size() && code[pos] == SERVE_AND_VOLLEY) {
            s.serve_and_volley = true;
            ++pos;
        }

        if (pos == code.size()) {
            RC_DEBUG("[PARSER] Serve '" << code << "' in play without a return -> reject point.");
            return err.set(Result::MalformedSequence, code, code, "serve in play without a recorded return");
        }

        const char c = code[pos];
        if (const auto f = to_fault_kind(c); f != FaultKind::Invalid) {
            s.fault = f;
            s.outcome = ServeOutcome::Fault;
            ++pos;
        }
        else if (const auto o = to_serve_outcome(c); o != ServeOutcome::Invalid) {
            s.outcome = o;
            ++pos;
        }
        else {
            s.outcome = ServeOutcome::InPlay;
        }

        // Faults, aces and unreturnable serves end the attempt
        if (s.outcome != ServeOutcome::InPlay && pos != code.size()) {
            RC_DEBUG("[PARSER] Trailing characters after " << to_string(s.outcome) << " in '" << code << "' -> reject point.");
            return err.set(Result::MalformedSequence, code.substr(pos), code,
                           "characters after a serve that ended the attempt");
        }

        remainder = helper::tail(code, pos);
        out = std::move(s);
        return Result::Parsed;
    }
};

} // namespace rallycode::notation::parser
