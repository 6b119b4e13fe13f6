#pragma once

// Notation vocabulary
#include "rallycode/notation/enums.hpp"
#include "rallycode/notation/result.hpp"
#include "rallycode/notation/error.hpp"

// Decoded point model
#include "rallycode/notation/schema/shot.hpp"
#include "rallycode/notation/schema/rally.hpp"
#include "rallycode/notation/schema/serve.hpp"
#include "rallycode/notation/schema/shot_sequence.hpp"

// Decoders
#include "rallycode/notation/parser/rally.hpp"
#include "rallycode/notation/parser/serve.hpp"
#include "rallycode/notation/parser/shot_sequence.hpp"
#include "rallycode/notation/encode.hpp"

// Charted corpora
#include "rallycode/charting/point_row.hpp"
#include "rallycode/charting/parser/point_row.hpp"
#include "rallycode/charting/batch.hpp"
#include "rallycode/stats/summary.hpp"
