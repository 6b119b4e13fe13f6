#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "common/test_check.hpp"
#include "rallycode/stats/summary.hpp"
#include "rallycode/notation/parser/shot_sequence.hpp"

using namespace rallycode;
using namespace rallycode::notation;

/*
================================================================================
Chart Summary: Unit Tests
================================================================================
*/

static schema::ShotSequence decode(bool server_won, std::string_view first, std::string_view second = {}) {
    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parser::shot_sequence::parse("A", "B", server_won, first, second, seq, err) == Result::Parsed);
    return seq;
}

static void add_sample(stats::Summary& s) {
    s.add(decode(true, "6*"));                      // ace
    s.add(decode(true, "4n", "5b28f1*"));           // second serve, 2-shot rally, winner
    s.add(decode(false, "6f37b3f2b1w@"));           // 4-shot rally, unforced error
    s.add(decode(false, "n", "4d"));                // double fault
    s.add(decode(true, "S"));                       // not coded
    s.add(decode(true, "c4#"));                     // let, unreturnable
    s.add(decode(true, "5+b2v-1#"));                // 2-shot rally, forced error
    s.add(decode(true, "Q"));                       // outright
}

void test_summary_counts() {
    std::cout << "[TEST] Summary (counts)..." << std::endl;

    stats::Summary s;
    add_sample(s);

    TEST_CHECK_EQ(s.points(), 8u);
    TEST_CHECK_EQ(s.not_coded(), 1u);
    TEST_CHECK_EQ(s.outright(), 1u);
    TEST_CHECK_EQ(s.server_won(), 6u);

    TEST_CHECK_EQ(s.first_serves(), 6u);
    TEST_CHECK_EQ(s.first_serves_in(), 4u);
    TEST_CHECK_EQ(s.second_serves(), 2u);
    TEST_CHECK_EQ(s.aces(), 1u);
    TEST_CHECK_EQ(s.unreturnable(), 1u);
    TEST_CHECK_EQ(s.double_faults(), 1u);
    TEST_CHECK_EQ(s.lets(), 1u);

    TEST_CHECK_EQ(s.rallies(), 3u);
    TEST_CHECK_EQ(s.rally_shots(), 8u);
    TEST_CHECK_EQ(s.longest_rally(), 4u);
    TEST_CHECK_EQ(s.winners(), 1u);
    TEST_CHECK_EQ(s.forced_errors(), 1u);
    TEST_CHECK_EQ(s.unforced_errors(), 1u);

    TEST_CHECK_EQ(s.rallies_of_length(2), 2u);
    TEST_CHECK_EQ(s.rallies_of_length(4), 1u);
    TEST_CHECK_EQ(s.rallies_of_length(3), 0u);

    TEST_CHECK_EQ(s.shots_of_type(ShotType::Backhand), 4u);
    TEST_CHECK_EQ(s.shots_of_type(ShotType::Forehand), 3u);
    TEST_CHECK_EQ(s.shots_of_type(ShotType::ForehandVolley), 1u);
    TEST_CHECK_EQ(s.shots_of_type(ShotType::Invalid), 0u);

    TEST_CHECK(s.mean_rally_length() > 2.66 && s.mean_rally_length() < 2.67);

    std::cout << "[TEST] OK\n";
}

void test_summary_long_rallies_share_last_bucket() {
    std::cout << "[TEST] Summary (long rallies in the last bucket)..." << std::endl;

    std::string code = "6";
    for (std::size_t i = 0; i < 15; ++i) {
        code += "f1b3";
    }
    code += "*";

    stats::Summary s;
    s.add(decode(true, code));
    TEST_CHECK_EQ(s.longest_rally(), 30u);
    TEST_CHECK_EQ(s.rallies_of_length(30), 1u);
    TEST_CHECK_EQ(s.rallies_of_length(config::decoder::RALLY_HISTOGRAM_BUCKETS - 1), 1u);

    std::cout << "[TEST] OK\n";
}

void test_summary_merge() {
    std::cout << "[TEST] Summary (merge equals sequential add)..." << std::endl;

    stats::Summary all;
    add_sample(all);
    add_sample(all);

    stats::Summary left;
    stats::Summary right;
    add_sample(left);
    add_sample(right);
    left.merge_from(right);

    TEST_CHECK_EQ(left.points(), all.points());
    TEST_CHECK_EQ(left.rallies(), all.rallies());
    TEST_CHECK_EQ(left.rally_shots(), all.rally_shots());
    TEST_CHECK_EQ(left.longest_rally(), all.longest_rally());
    TEST_CHECK_EQ(left.double_faults(), all.double_faults());
    TEST_CHECK_EQ(left.rallies_of_length(2), all.rallies_of_length(2));
    TEST_CHECK_EQ(left.shots_of_type(ShotType::Backhand), all.shots_of_type(ShotType::Backhand));

    std::ostringstream a;
    std::ostringstream b;
    a << left;
    b << all;
    TEST_CHECK_EQ(a.str(), b.str());

    std::cout << "[TEST] OK\n";
}

void test_summary_reset() {
    std::cout << "[TEST] Summary (reset)..." << std::endl;

    stats::Summary s;
    add_sample(s);
    s.reset();

    TEST_CHECK_EQ(s.points(), 0u);
    TEST_CHECK_EQ(s.longest_rally(), 0u);
    TEST_CHECK_EQ(s.rallies_of_length(2), 0u);
    TEST_CHECK_EQ(s.shots_of_type(ShotType::Forehand), 0u);
    TEST_CHECK_EQ(s.mean_rally_length(), 0.0);

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// MAIN
// ------------------------------------------------------------

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Error);

    test_summary_counts();
    test_summary_long_rallies_share_last_bucket();
    test_summary_merge();
    test_summary_reset();

    std::cout << "[TEST] ALL SUMMARY TESTS PASSED!\n";
    return 0;
}
