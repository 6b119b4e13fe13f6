#include "rallycode/charting/batch.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <optional>
#include <utility>

#include "rallycode/charting/parser/point_row.hpp"
#include "rallycode/notation/parser/shot_sequence.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/system/worker_group.hpp"


namespace rallycode::charting {

using notation::schema::ShotSequence;

// ---------------------------------
// BatchStats
// ---------------------------------

void BatchStats::record(notation::Result r) noexcept {
    switch (r) {
        case notation::Result::Parsed:
            decoded.inc();
            return;
        case notation::Result::UnknownCode:
            unknown_code.inc();
            break;
        case notation::Result::MalformedSequence:
            malformed_sequence.inc();
            break;
        case notation::Result::MissingRequiredServe:
            missing_required_serve.inc();
            break;
    }
    dropped.inc();
}

void BatchStats::reset() noexcept {
    rows.reset();
    decoded.reset();
    dropped.reset();
    invalid_rows.reset();
    unknown_code.reset();
    malformed_sequence.reset();
    missing_required_serve.reset();
    worker_errors.reset();
}

void BatchStats::dump(std::ostream& os) const {
    os << "[BATCH] { "
       << "rows=" << rows << ", "
       << "decoded=" << decoded << ", "
       << "dropped=" << dropped << ", "
       << "invalid_rows=" << invalid_rows << ", "
       << "unknown_code=" << unknown_code << ", "
       << "malformed_sequence=" << malformed_sequence << ", "
       << "missing_required_serve=" << missing_required_serve << ", "
       << "worker_errors=" << worker_errors
       << " }";
}

std::ostream& operator<<(std::ostream& os, const BatchStats& s) {
    s.dump(os);
    return os;
}

// ---------------------------------
// BatchDecoder
// ---------------------------------

BatchDecoder::BatchDecoder(unsigned workers)
    : workers_(std::clamp(workers, 1u, config::decoder::MAX_WORKERS))
{
    // The parser grows on demand; pre-sizing only saves the first reallocations
    if (parser_.allocate(config::decoder::PARSER_BUFFER_INITIAL_SIZE) != simdjson::SUCCESS) {
        RC_WARN("[BATCH] Could not pre-allocate " << config::decoder::PARSER_BUFFER_INITIAL_SIZE << " bytes for the JSON parser.");
    }
}

std::string BatchDecoder::describe_(const std::exception_ptr& ep) {
    try {
        std::rethrow_exception(ep);
    }
    catch (const std::exception& e) {
        return e.what();
    }
    catch (...) {
        return "non-standard exception";
    }
}

unsigned BatchDecoder::effective_workers_(std::size_t rows) const noexcept {
    const std::size_t useful = std::max<std::size_t>(1, rows / config::decoder::MIN_ROWS_PER_WORKER);
    return static_cast<unsigned>(std::min<std::size_t>(workers_, useful));
}

std::vector<DecodedPoint> BatchDecoder::decode(const std::vector<PointRow>& rows) {
    return run_(rows, nullptr);
}

parser::Result BatchDecoder::decode_json(std::string_view json, std::vector<DecodedPoint>& out) {
    simdjson::dom::element root;
    auto error = parser_.parse(json.data(), json.size()).get(root);
    if (error) {
        RC_WARN("[BATCH] JSON parse error: " << error);
        return parser::Result::InvalidJson;
    }

    simdjson::dom::array points;
    if (root.get(points) != simdjson::SUCCESS && root["points"].get(points) != simdjson::SUCCESS) {
        RC_WARN("[BATCH] Document is neither an array of rows nor an object with a 'points' array.");
        return parser::Result::InvalidSchema;
    }

    std::vector<PointRow> rows;
    std::vector<std::size_t> row_ids;
    rows.reserve(points.size());
    row_ids.reserve(points.size());

    std::size_t index = 0;
    for (const simdjson::dom::element item : points) {
        PointRow row;
        auto r = parser::point_row::parse(item, row);
        if (r != parser::Result::Parsed) {
            stats_.rows.inc();
            stats_.invalid_rows.inc();
            stats_.dropped.inc();
            RC_WARN("[BATCH] Row " << index << " rejected (" << parser::to_string(r) << ") -> drop row.");
        }
        else {
            rows.push_back(std::move(row));
            row_ids.push_back(index);
        }
        ++index;
    }

    out = run_(rows, &row_ids);
    return parser::Result::Parsed;
}

std::vector<DecodedPoint> BatchDecoder::run_(const std::vector<PointRow>& rows, const std::vector<std::size_t>* row_ids) {
    const std::size_t n = rows.size();
    const unsigned workers = effective_workers_(n);

    std::vector<std::optional<ShotSequence>> slots(n);
    std::vector<std::vector<Failure>> failures(workers);

    // `next` tracks progress so an interrupted range can be resumed
    auto decode_range = [&rows, &slots](std::size_t begin, std::size_t end, std::vector<Failure>& failed, std::size_t& next) {
        for (std::size_t i = begin; i < end; ++i) {
            const PointRow& row = rows[i];
            ShotSequence seq;
            notation::Error err;
            auto r = notation::parser::shot_sequence::parse(row.server, row.returner, row.server_won,
                                                           row.first, row.second, seq, err);
            if (r == notation::Result::Parsed) {
                slots[i] = std::move(seq);
            }
            else {
                failed.push_back(Failure{i, std::move(err)});
            }
            next = i + 1;
        }
    };

    std::vector<std::size_t> next(workers, 0);
    std::vector<Aborted> aborted;

    if (workers <= 1) {
        decode_range(0, n, failures[0], next[0]);
    }
    else {
        const std::size_t chunk = (n + workers - 1) / workers;
        auto chunk_begin = [n, chunk](unsigned w) { return std::min(n, w * chunk); };
        auto chunk_end = [n, chunk](unsigned w) { return std::min(n, w * chunk + chunk); };

        {
            lcr::system::worker_group group(workers);
            for (unsigned w = 0; w < workers; ++w) {
                const std::size_t begin = chunk_begin(w);
                const std::size_t end = chunk_end(w);
                next[w] = begin;
                const bool started = group.spawn([&decode_range, &failures, &next, w, begin, end] {
                    lcr::log::Logger::set_thread_tag("w" + std::to_string(w));
                    decode_range(begin, end, failures[w], next[w]);
                });
                if (!started) {
                    RC_WARN("[BATCH] Could not start worker " << w << " -> decoding its rows on the calling thread.");
                    for (unsigned rest = w; rest < workers; ++rest) {
                        next[rest] = chunk_begin(rest);
                    }
                    break;
                }
            }
            group.join();

            // The row a worker was on when it threw is dropped; the rest of
            // its range is resumed below
            for (unsigned w = 0; w < group.size(); ++w) {
                if (const auto ep = group.error(w); ep && next[w] < chunk_end(w)) {
                    aborted.push_back(Aborted{next[w], describe_(ep)});
                    ++next[w];
                }
            }
        }

        for (unsigned w = 0; w < workers; ++w) {
            if (next[w] < chunk_end(w)) {
                decode_range(next[w], chunk_end(w), failures[w], next[w]);
            }
        }
        RC_DEBUG("[BATCH] " << n << " rows decoded on " << workers << " workers.");
    }

    // Merge on the calling thread, in row order
    auto row_id = [row_ids](std::size_t i) { return row_ids ? (*row_ids)[i] : i; };

    for (const auto& failed : failures) {
        for (const auto& f : failed) {
            const PointRow& row = rows[f.index];
            if (row.match_id.empty()) {
                RC_WARN("[BATCH] Row " << row_id(f.index) << " dropped: " << f.error);
            }
            else {
                RC_WARN("[BATCH] Row " << row_id(f.index) << " (" << row.match_id << " #" << row.point << ") dropped: " << f.error);
            }
            stats_.record(f.error.code);
        }
    }

    for (const auto& a : aborted) {
        RC_WARN("[BATCH] Row " << row_id(a.index) << " dropped: worker failed (" << a.what << ")");
        stats_.worker_errors.inc();
        stats_.dropped.inc();
    }

    std::vector<DecodedPoint> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        stats_.rows.inc();
        if (slots[i]) {
            stats_.record(notation::Result::Parsed);
            out.push_back(DecodedPoint{row_id(i), std::move(*slots[i])});
        }
    }

    RC_INFO("[BATCH] " << stats_);
    return out;
}

} // namespace rallycode::charting
