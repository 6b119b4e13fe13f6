#pragma once

#include <cstddef>


namespace rallycode::config::decoder {

/*
===============================================================================
Decoder Limits
===============================================================================

All limits are compile-time constants. Charted points are short (a long
rally is a few dozen tokens), so anything past MAX_CODE_LENGTH is treated as
corrupt input rather than decoded.
===============================================================================
*/

// -----------------------------------------------------------------------------
// Notation codes
// -----------------------------------------------------------------------------
inline constexpr static std::size_t MAX_CODE_LENGTH = 512;

// Expected shots per rally (reservation hint only)
inline constexpr static std::size_t RALLY_RESERVE = 16;

// -----------------------------------------------------------------------------
// Batch decoding
// -----------------------------------------------------------------------------
inline constexpr static unsigned DEFAULT_WORKERS = 1;
inline constexpr static unsigned MAX_WORKERS = 64;

// Rows per worker below which parallel decoding is not worth a thread
inline constexpr static std::size_t MIN_ROWS_PER_WORKER = 256;

// -----------------------------------------------------------------------------
// JSON input
// -----------------------------------------------------------------------------
inline constexpr static std::size_t PARSER_BUFFER_INITIAL_SIZE = 64 * 1024; // 64 KB

// -----------------------------------------------------------------------------
// Statistics
// -----------------------------------------------------------------------------
// Rallies of this length or longer share the last histogram bucket
inline constexpr static std::size_t RALLY_HISTOGRAM_BUCKETS = 21;

} // namespace rallycode::config::decoder
