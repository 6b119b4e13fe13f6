#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>

#include "rallycode/notation/schema/shot_sequence.hpp"
#include "rallycode/notation/enums/shot_type.hpp"
#include "rallycode/config/decoder.hpp"
#include "lcr/metrics/counter.hpp"


namespace rallycode::stats {

/*
===============================================================================
Chart Summary
===============================================================================

Shot-level counts over any number of decoded points, read exclusively through
the public ShotSequence / Serve predicates.

Serve counts refer to coded points only. `rally_lengths[n]` counts rallies of
exactly n shots (serve excluded); the last bucket also collects everything
longer.

Single-threaded. To summarise in parallel give every thread its own Summary
and merge_from() them afterwards.
===============================================================================
*/

class Summary {
public:
    using Histogram = std::array<lcr::metrics::counter64, config::decoder::RALLY_HISTOGRAM_BUCKETS>;
    using ShotTypeCounts = std::array<lcr::metrics::counter64, notation::SHOT_TYPE_COUNT>;

    Summary() = default;
    Summary(const Summary&) = delete;
    Summary& operator=(const Summary&) = delete;

    void add(const notation::schema::ShotSequence& seq) noexcept;
    void merge_from(const Summary& other) noexcept;
    void reset() noexcept;

    // Points
    [[nodiscard]] std::uint64_t points() const noexcept { return points_.load(); }
    [[nodiscard]] std::uint64_t not_coded() const noexcept { return not_coded_.load(); }
    [[nodiscard]] std::uint64_t outright() const noexcept { return outright_.load(); }
    [[nodiscard]] std::uint64_t server_won() const noexcept { return server_won_.load(); }

    // Serves
    [[nodiscard]] std::uint64_t first_serves() const noexcept { return first_serves_.load(); }
    [[nodiscard]] std::uint64_t first_serves_in() const noexcept { return first_serves_in_.load(); }
    [[nodiscard]] std::uint64_t second_serves() const noexcept { return second_serves_.load(); }
    [[nodiscard]] std::uint64_t aces() const noexcept { return aces_.load(); }
    [[nodiscard]] std::uint64_t unreturnable() const noexcept { return unreturnable_.load(); }
    [[nodiscard]] std::uint64_t double_faults() const noexcept { return double_faults_.load(); }
    [[nodiscard]] std::uint64_t lets() const noexcept { return lets_.load(); }

    // Rallies
    [[nodiscard]] std::uint64_t rallies() const noexcept { return rallies_.load(); }
    [[nodiscard]] std::uint64_t rally_shots() const noexcept { return rally_shots_.load(); }
    [[nodiscard]] std::uint64_t longest_rally() const noexcept { return longest_rally_.load(); }
    [[nodiscard]] std::uint64_t winners() const noexcept { return winners_.load(); }
    [[nodiscard]] std::uint64_t forced_errors() const noexcept { return forced_errors_.load(); }
    [[nodiscard]] std::uint64_t unforced_errors() const noexcept { return unforced_errors_.load(); }

    [[nodiscard]] double mean_rally_length() const noexcept;

    [[nodiscard]] std::uint64_t rallies_of_length(std::size_t shots) const noexcept;
    [[nodiscard]] std::uint64_t shots_of_type(notation::ShotType t) const noexcept;

    void dump(std::ostream& os) const;

private:
    lcr::metrics::counter64 points_;
    lcr::metrics::counter64 not_coded_;
    lcr::metrics::counter64 outright_;
    lcr::metrics::counter64 server_won_;

    lcr::metrics::counter64 first_serves_;
    lcr::metrics::counter64 first_serves_in_;
    lcr::metrics::counter64 second_serves_;
    lcr::metrics::counter64 aces_;
    lcr::metrics::counter64 unreturnable_;
    lcr::metrics::counter64 double_faults_;
    lcr::metrics::counter64 lets_;

    lcr::metrics::counter64 rallies_;
    lcr::metrics::counter64 rally_shots_;
    lcr::metrics::peak64 longest_rally_;
    lcr::metrics::counter64 winners_;
    lcr::metrics::counter64 forced_errors_;
    lcr::metrics::counter64 unforced_errors_;

    Histogram rally_lengths_{};
    ShotTypeCounts shot_types_{};
};

std::ostream& operator<<(std::ostream& os, const Summary& s);

} // namespace rallycode::stats
