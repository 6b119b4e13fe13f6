#pragma once

#include <string>

#include "rallycode/notation/schema/shot.hpp"
#include "rallycode/notation/schema/rally.hpp"
#include "rallycode/notation/schema/serve.hpp"
#include "rallycode/notation/schema/shot_sequence.hpp"


namespace rallycode::notation {

// -----------------------------------------------------------------------------
// Canonical re-encoding
// -----------------------------------------------------------------------------
// Decoding the output of encode() yields a value equal to the input. The
// text itself may differ from the charted original (modifier order, a '0'
// for an unrecorded direction, a dropped '0' shot direction).
// -----------------------------------------------------------------------------

[[nodiscard]] std::string encode(const schema::Shot& shot);
[[nodiscard]] std::string encode(const schema::Rally& rally);

// Serve only; the rally that followed it is not included.
[[nodiscard]] std::string encode(const schema::Serve& serve);

struct PointCodes {
    std::string first;
    std::string second;
};

// Both charting columns for a point.
[[nodiscard]] PointCodes encode(const schema::ShotSequence& seq);

} // namespace rallycode::notation
