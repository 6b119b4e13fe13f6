#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <ostream>
#include <string_view>
#include <vector>

#include <simdjson.h>

#include "rallycode/charting/point_row.hpp"
#include "rallycode/charting/parser/result.hpp"
#include "rallycode/notation/schema/shot_sequence.hpp"
#include "rallycode/notation/error.hpp"
#include "rallycode/config/decoder.hpp"
#include "lcr/metrics/counter.hpp"


namespace rallycode::charting {

/*
===============================================================================
Batch Decoder
===============================================================================

Decodes whole corpora of charted points. A point that fails to decode is
dropped, logged at warn level and counted; it never aborts the batch.

With more than one worker the rows are split into contiguous chunks and each
chunk is decoded on its own thread. A worker that cannot be started, or that
throws, never takes the process down: the row it was on is dropped and
counted as a worker error, and the rest of its chunk is decoded on the
calling thread.

Workers share nothing mutable: each one writes only its own output slots and
failure list, and the results are merged on the calling thread in row order
once every worker has joined. The output is therefore identical whatever the
worker count.

A BatchDecoder is not itself thread-safe; use one instance per calling
thread.
===============================================================================
*/

struct DecodedPoint {
    std::size_t row;                                // Index in the input
    notation::schema::ShotSequence sequence;
};

struct BatchStats {
    lcr::metrics::counter64 rows;                   // Rows seen
    lcr::metrics::counter64 decoded;                // Points produced
    lcr::metrics::counter64 dropped;                // Rows skipped for any reason
    lcr::metrics::counter64 invalid_rows;           // JSON row rejected before decoding
    lcr::metrics::counter64 unknown_code;
    lcr::metrics::counter64 malformed_sequence;
    lcr::metrics::counter64 missing_required_serve;
    lcr::metrics::counter64 worker_errors;          // Rows lost to an exception in a worker

    void record(notation::Result r) noexcept;
    void reset() noexcept;
    void dump(std::ostream& os) const;
};

std::ostream& operator<<(std::ostream& os, const BatchStats& s);

class BatchDecoder {
public:
    explicit BatchDecoder(unsigned workers = config::decoder::DEFAULT_WORKERS);

    BatchDecoder(const BatchDecoder&) = delete;
    BatchDecoder& operator=(const BatchDecoder&) = delete;

    // Decoded points in input order; `row` is the index in `rows`.
    [[nodiscard]]
    std::vector<DecodedPoint> decode(const std::vector<PointRow>& rows);

    // Accepts either a JSON array of rows or an object holding them under
    // "points". Rows that do not match the row schema are dropped like
    // undecodable points; `row` is the index in the JSON array. Returns a
    // failure only when the document itself is unusable.
    [[nodiscard]]
    parser::Result decode_json(std::string_view json, std::vector<DecodedPoint>& out);

    [[nodiscard]] const BatchStats& stats() const noexcept { return stats_; }
    [[nodiscard]] unsigned workers() const noexcept { return workers_; }

    void reset_stats() noexcept { stats_.reset(); }

private:
    struct Failure {
        std::size_t index;                          // Index in the rows vector
        notation::Error error;
    };

    struct Aborted {
        std::size_t index;                          // Row a worker was decoding when it threw
        std::string what;
    };

    [[nodiscard]] static std::string describe_(const std::exception_ptr& ep);

    std::vector<DecodedPoint> run_(const std::vector<PointRow>& rows, const std::vector<std::size_t>* row_ids);

    [[nodiscard]] unsigned effective_workers_(std::size_t rows) const noexcept;

    unsigned workers_;
    BatchStats stats_;
    simdjson::dom::parser parser_;
};

} // namespace rallycode::charting
