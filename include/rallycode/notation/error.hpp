#pragma once

#include <string>
#include <string_view>
#include <ostream>

#include "rallycode/notation/result.hpp"


namespace rallycode::notation {

/*
===============================================================================
Decoder Error Record
===============================================================================

Filled by the notation parsers whenever they return anything other than
Result::Parsed. The record keeps enough context to locate the problem in the
source corpus without re-running the decoder:

  code       Failure class (mirrors the returned Result)
  offending  The character, token or substring that could not be decoded
  raw        The complete code the failing decoder was given
  reason     Human-readable explanation

An Error is only meaningful after a failed parse; on success it is left
untouched.
===============================================================================
*/

struct Error {
    Result code{Result::Parsed};
    std::string offending;
    std::string raw;
    std::string reason;

    // Records the failure and returns its code so parsers can write
    // `return err.set(...)`.
    Result set(Result r, std::string_view bad, std::string_view full, std::string_view why) {
        code = r;
        offending.assign(bad);
        raw.assign(full);
        reason.assign(why);
        return r;
    }

    void clear() noexcept {
        code = Result::Parsed;
        offending.clear();
        raw.clear();
        reason.clear();
    }

    inline void dump(std::ostream& os) const {
        os << "[" << to_string(code) << "] " << reason
           << " (offending='" << offending << "', code='" << raw << "')";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Error& e) {
    e.dump(os);
    return os;
}

} // namespace rallycode::notation
