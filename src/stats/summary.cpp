#include "rallycode/stats/summary.hpp"

#include <algorithm>
#include <initializer_list>
#include <iomanip>
#include <ostream>


namespace rallycode::stats {

using notation::schema::Serve;
using notation::schema::ShotSequence;
using notation::ShotOutcome;
using notation::ShotType;

namespace {

void count_serve(const Serve& s, lcr::metrics::counter64& aces, lcr::metrics::counter64& unreturnable,
                 lcr::metrics::counter64& lets) noexcept {
    lets.inc(s.lets);
    switch (s.outcome) {
        case notation::ServeOutcome::Ace:
            aces.inc();
            break;
        case notation::ServeOutcome::Unreturnable:
            unreturnable.inc();
            break;
        default:
            break;
    }
}

} // namespace

void Summary::add(const ShotSequence& seq) noexcept {
    points_.inc();
    if (seq.server_won) {
        server_won_.inc();
    }

    if (seq.not_coded()) {
        not_coded_.inc();
        return;
    }
    if (seq.server_lost_outright() || seq.server_won_outright()) {
        outright_.inc();
        return;
    }
    if (!seq.first_serve) {
        return;
    }

    const Serve& first = *seq.first_serve;
    first_serves_.inc();
    if (!first.was_fault()) {
        first_serves_in_.inc();
    }
    count_serve(first, aces_, unreturnable_, lets_);

    if (seq.second_serve) {
        const Serve& second = *seq.second_serve;
        second_serves_.inc();
        if (second.is_double_fault()) {
            double_faults_.inc();
        }
        count_serve(second, aces_, unreturnable_, lets_);
    }

    if (!seq.rally) {
        return;
    }

    const auto& shots = seq.rally->shots;
    rallies_.inc();
    rally_shots_.inc(shots.size());
    longest_rally_.observe(shots.size());
    rally_lengths_[std::min(shots.size(), rally_lengths_.size() - 1)].inc();

    for (const auto& shot : shots) {
        const auto idx = static_cast<std::size_t>(shot.type);
        if (idx < shot_types_.size()) {
            shot_types_[idx].inc();
        }
    }

    switch (seq.rally->last().outcome) {
        case ShotOutcome::Winner:        winners_.inc();         break;
        case ShotOutcome::ForcedError:   forced_errors_.inc();   break;
        case ShotOutcome::UnforcedError: unforced_errors_.inc(); break;
        default: break;
    }
}

void Summary::merge_from(const Summary& other) noexcept {
    points_.merge_from(other.points_);
    not_coded_.merge_from(other.not_coded_);
    outright_.merge_from(other.outright_);
    server_won_.merge_from(other.server_won_);
    first_serves_.merge_from(other.first_serves_);
    first_serves_in_.merge_from(other.first_serves_in_);
    second_serves_.merge_from(other.second_serves_);
    aces_.merge_from(other.aces_);
    unreturnable_.merge_from(other.unreturnable_);
    double_faults_.merge_from(other.double_faults_);
    lets_.merge_from(other.lets_);
    rallies_.merge_from(other.rallies_);
    rally_shots_.merge_from(other.rally_shots_);
    longest_rally_.merge_from(other.longest_rally_);
    winners_.merge_from(other.winners_);
    forced_errors_.merge_from(other.forced_errors_);
    unforced_errors_.merge_from(other.unforced_errors_);
    for (std::size_t i = 0; i < rally_lengths_.size(); ++i) {
        rally_lengths_[i].merge_from(other.rally_lengths_[i]);
    }
    for (std::size_t i = 0; i < shot_types_.size(); ++i) {
        shot_types_[i].merge_from(other.shot_types_[i]);
    }
}

void Summary::reset() noexcept {
    for (auto* c : {&points_, &not_coded_, &outright_, &server_won_,
                    &first_serves_, &first_serves_in_, &second_serves_, &aces_, &unreturnable_, &double_faults_, &lets_,
                    &rallies_, &rally_shots_, &winners_, &forced_errors_, &unforced_errors_}) {
        c->reset();
    }
    longest_rally_.reset();
    for (auto& c : rally_lengths_) {
        c.reset();
    }
    for (auto& c : shot_types_) {
        c.reset();
    }
}

double Summary::mean_rally_length() const noexcept {
    const auto n = rallies_.load();
    return n == 0 ? 0.0 : static_cast<double>(rally_shots_.load()) / static_cast<double>(n);
}

std::uint64_t Summary::rallies_of_length(std::size_t shots) const noexcept {
    return rally_lengths_[std::min(shots, rally_lengths_.size() - 1)].load();
}

std::uint64_t Summary::shots_of_type(ShotType t) const noexcept {
    const auto idx = static_cast<std::size_t>(t);
    return idx < shot_types_.size() ? shot_types_[idx].load() : 0;
}

void Summary::dump(std::ostream& os) const {
    os << "[SUMMARY]\n"
       << "  points           : " << points_ << " (not coded " << not_coded_ << ", outright " << outright_ << ")\n"
       << "  server won       : " << server_won_ << "\n"
       << "  first serves     : " << first_serves_ << " (in " << first_serves_in_ << ")\n"
       << "  second serves    : " << second_serves_ << " (double faults " << double_faults_ << ")\n"
       << "  aces             : " << aces_ << "\n"
       << "  unreturnable     : " << unreturnable_ << "\n"
       << "  lets             : " << lets_ << "\n"
       << "  rallies          : " << rallies_ << " (shots " << rally_shots_
       << ", mean " << std::fixed << std::setprecision(2) << mean_rally_length()
       << ", longest " << longest_rally_ << ")\n"
       << "  winners          : " << winners_ << "\n"
       << "  forced errors    : " << forced_errors_ << "\n"
       << "  unforced errors  : " << unforced_errors_ << "\n"
       << "  shot types       :";
    for (std::size_t i = 0; i < shot_types_.size(); ++i) {
        if (shot_types_[i].load() > 0) {
            os << ' ' << notation::to_string(static_cast<ShotType>(i)) << '=' << shot_types_[i];
        }
    }
    os << '\n';
}

std::ostream& operator<<(std::ostream& os, const Summary& s) {
    s.dump(os);
    return os;
}

} // namespace rallycode::stats
