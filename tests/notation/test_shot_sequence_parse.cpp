#include <iostream>
#include <sstream>
#include <string>
#include <optional>
#include <initializer_list>
#include <string_view>

#include "common/test_check.hpp"
#include "rallycode/notation/parser/shot_sequence.hpp"

using namespace rallycode::notation;

/*
================================================================================
Point Decoder: Unit Tests
================================================================================

Covers:
  • Shortcut dispatch (S / R / P / Q) and the bare fault-letter leniency
  • First / second serve branching
  • Rally hand-off and player alternation
  • Failure classes and their diagnostics
  • assemble() invariant checks on hand-built points
================================================================================
*/

static Result parse(bool server_won, std::string_view first, std::string_view second,
                    schema::ShotSequence& out, Error& err) {
    return parser::shot_sequence::parse("A", "B", server_won, first, second, out, err);
}

static std::size_t count_lines(const std::string& s) {
    std::size_t n = 0;
    for (char c : s) {
        if (c == '\n') ++n;
    }
    return n;
}

// ------------------------------------------------------------
// SHORTCUTS
// ------------------------------------------------------------

void test_not_coded() {
    std::cout << "[TEST] Point (not coded)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, "S", "", seq, err) == Result::Parsed);
    TEST_CHECK(seq.not_coded());
    TEST_CHECK(seq.server_won);
    TEST_CHECK_EQ(seq.server, "A");
    TEST_CHECK_EQ(seq.returner, "B");
    TEST_CHECK(!seq.first_serve);
    TEST_CHECK(!seq.second_serve);
    TEST_CHECK(!seq.rally);
    TEST_CHECK(seq.terminating_serve() == nullptr);
    TEST_CHECK_EQ(seq.shot_count(), 0u);

    TEST_CHECK(parse(false, "R", "", seq, err) == Result::Parsed);
    TEST_CHECK(seq.not_coded());
    TEST_CHECK(!seq.server_won);

    std::cout << "[TEST] OK\n";
}

void test_outright_shortcuts() {
    std::cout << "[TEST] Point (outright shortcuts)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(false, "P", "", seq, err) == Result::Parsed);
    TEST_CHECK(seq.server_lost_outright());
    TEST_CHECK(!seq.first_serve);

    TEST_CHECK(parse(true, "Q", "", seq, err) == Result::Parsed);
    TEST_CHECK(seq.server_won_outright());
    TEST_CHECK(!seq.rally);
    TEST_CHECK(seq.invariants_hold());

    std::cout << "[TEST] OK\n";
}

void test_shortcut_ignores_second_code() {
    std::cout << "[TEST] Point (shortcut ignores the second code)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, "S", "4n", seq, err) == Result::Parsed);
    TEST_CHECK(seq.not_coded());
    TEST_CHECK(!seq.second_serve);

    std::cout << "[TEST] OK\n";
}

void test_whitespace_is_stripped() {
    std::cout << "[TEST] Point (surrounding whitespace)..." << std::endl;

    schema::ShotSequence a;
    schema::ShotSequence b;
    Error err;
    TEST_CHECK(parse(true, "  Q\t", "", a, err) == Result::Parsed);
    TEST_CHECK(a.server_won_outright());

    TEST_CHECK(parse(true, " 6f2* ", " ", a, err) == Result::Parsed);
    TEST_CHECK(parse(true, "6f2*", "", b, err) == Result::Parsed);
    TEST_CHECK(a == b);

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// SERVES
// ------------------------------------------------------------

void test_bare_fault_letter() {
    std::cout << "[TEST] Point (bare fault letter needs a second serve)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, "n", "4*", seq, err) == Result::Parsed);
    TEST_CHECK(seq.is_coded());
    TEST_CHECK(seq.first_serve);
    TEST_CHECK(seq.first_serve->fault == FaultKind::Net);
    TEST_CHECK(seq.first_serve->direction == ServeDirection::Unknown);
    TEST_CHECK(seq.first_serve->was_fault());
    TEST_CHECK(seq.second_serve);
    TEST_CHECK(seq.second_serve->outcome == ServeOutcome::Ace);
    TEST_CHECK(seq.terminating_serve() == &*seq.second_serve);
    TEST_CHECK(!seq.rally);

    TEST_CHECK(parse(true, "n", "", seq, err) == Result::MissingRequiredServe);

    std::cout << "[TEST] OK\n";
}

void test_ace() {
    std::cout << "[TEST] Point (ace)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, "6*", "", seq, err) == Result::Parsed);
    TEST_CHECK(seq.first_serve);
    TEST_CHECK(!seq.first_serve->had_rally());
    TEST_CHECK(seq.first_serve->ended_point());
    TEST_CHECK(!seq.second_serve);
    TEST_CHECK(!seq.rally);
    TEST_CHECK_EQ(seq.shot_count(), 1u);

    std::cout << "[TEST] OK\n";
}

void test_double_fault() {
    std::cout << "[TEST] Point (double fault)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(false, "4n", "5d", seq, err) == Result::Parsed);
    TEST_CHECK(seq.first_serve->is_first());
    TEST_CHECK(!seq.second_serve->is_first());
    TEST_CHECK(seq.second_serve->is_double_fault());
    TEST_CHECK(seq.terminating_serve()->ended_point());
    TEST_CHECK(!seq.rally);
    TEST_CHECK_EQ(seq.shot_count(), 2u);

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// RALLIES
// ------------------------------------------------------------

void test_first_serve_rally() {
    std::cout << "[TEST] Point (first serve in, three-shot rally)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, "6f2b3f1*", "", seq, err) == Result::Parsed);
    TEST_CHECK(seq.first_serve->had_rally());
    TEST_CHECK(!seq.second_serve);
    TEST_CHECK(seq.rally);
    TEST_CHECK_EQ(seq.rally->size(), 3u);
    TEST_CHECK_EQ(seq.rally->shots[0].player, "B");
    TEST_CHECK_EQ(seq.rally->shots[1].player, "A");
    TEST_CHECK_EQ(seq.rally->shots[2].player, "B");
    TEST_CHECK(seq.rally->last().outcome == ShotOutcome::Winner);
    TEST_CHECK_EQ(seq.shot_count(), 4u);
    TEST_CHECK(seq.invariants_hold());

    std::cout << "[TEST] OK\n";
}

void test_second_serve_rally() {
    std::cout << "[TEST] Point (second serve in, rally from second code)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(false, "6w", "c5+b2v1@", seq, err) == Result::Parsed);
    TEST_CHECK(seq.first_serve->fault == FaultKind::Wide);
    TEST_CHECK_EQ(static_cast<unsigned>(seq.second_serve->lets), 1u);
    TEST_CHECK(seq.second_serve->serve_and_volley);
    TEST_CHECK(seq.second_serve->had_rally());
    TEST_CHECK_EQ(seq.rally->size(), 2u);
    TEST_CHECK(seq.rally->last().type == ShotType::ForehandVolley);
    TEST_CHECK_EQ(seq.rally->last().player, "A");
    TEST_CHECK(seq.rally->last().outcome == ShotOutcome::UnforcedError);

    std::cout << "[TEST] OK\n";
}

void test_print_sequence() {
    std::cout << "[TEST] Point (print_sequence lists every shot)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(false, "6w", "4f2b3f1*", seq, err) == Result::Parsed);

    std::ostringstream oss;
    seq.print_sequence(oss);
    TEST_CHECK_EQ(count_lines(oss.str()), 5u);
    TEST_CHECK(oss.str().rfind("[SERVE]", 0) == 0);

    std::ostringstream dump;
    dump << seq;
    TEST_CHECK(dump.str().find("rally=3") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_parse_is_deterministic() {
    std::cout << "[TEST] Point (repeated decoding agrees)..." << std::endl;

    schema::ShotSequence a;
    schema::ShotSequence b;
    Error err;
    TEST_CHECK(parse(true, "4x", "c6f+18b2z-1*", a, err) == Result::Parsed);
    TEST_CHECK(parse(true, "4x", "c6f+18b2z-1*", b, err) == Result::Parsed);
    TEST_CHECK(a == b);

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// FAILURES
// ------------------------------------------------------------

void test_unknown_single_character() {
    std::cout << "[TEST] Point (unknown single character)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, "Z", "", seq, err) == Result::UnknownCode);
    TEST_CHECK(err.code == Result::UnknownCode);
    TEST_CHECK_EQ(err.offending, "Z");

    TEST_CHECK(parse(true, "7", "", seq, err) == Result::UnknownCode);
    TEST_CHECK_EQ(err.offending, "7");

    std::cout << "[TEST] OK\n";
}

void test_missing_first_serve() {
    std::cout << "[TEST] Point (no first serve)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, "", "", seq, err) == Result::MissingRequiredServe);
    TEST_CHECK(parse(true, "   ", "6*", seq, err) == Result::MissingRequiredServe);

    std::cout << "[TEST] OK\n";
}

void test_fault_without_second_serve() {
    std::cout << "[TEST] Point (faulted first serve, no second code)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, "4n", "", seq, err) == Result::MissingRequiredServe);
    TEST_CHECK_EQ(err.raw, "4n");

    std::cout << "[TEST] OK\n";
}

void test_second_code_after_good_serve() {
    std::cout << "[TEST] Point (second code after a good first serve)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, "6*", "4n", seq, err) == Result::MalformedSequence);
    TEST_CHECK_EQ(err.offending, "4n");

    std::cout << "[TEST] OK\n";
}

void test_bad_rally_reports_full_code() {
    std::cout << "[TEST] Point (rally failure names the serve code)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, "6f2Zb1", "", seq, err) == Result::UnknownCode);
    TEST_CHECK_EQ(err.offending, "Zb1");
    TEST_CHECK_EQ(err.raw, "6f2Zb1");

    TEST_CHECK(parse(true, "4d", "5f1*b2", seq, err) == Result::MalformedSequence);
    TEST_CHECK_EQ(err.raw, "5f1*b2");

    std::cout << "[TEST] OK\n";
}

void test_failure_leaves_output_untouched() {
    std::cout << "[TEST] Point (failure leaves output untouched)..." << std::endl;

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, "Q", "", seq, err) == Result::Parsed);
    const schema::ShotSequence before = seq;

    TEST_CHECK(parse(true, "6f1*b2", "", seq, err) == Result::MalformedSequence);
    TEST_CHECK(seq == before);

    std::cout << "[TEST] OK\n";
}

void test_code_too_long() {
    std::cout << "[TEST] Point (oversized code)..." << std::endl;

    std::string code = "6";
    while (code.size() <= rallycode::config::decoder::MAX_CODE_LENGTH) {
        code += "f1b2";
    }

    schema::ShotSequence seq;
    Error err;
    TEST_CHECK(parse(true, code, "", seq, err) == Result::MalformedSequence);
    TEST_CHECK_EQ(err.raw, code);

    std::cout << "[TEST] OK\n";
}

void test_oversized_second_code() {
    std::cout << "[TEST] Point (oversized second code)..." << std::endl;

    const std::string second(rallycode::config::decoder::MAX_CODE_LENGTH + 88, 'x');
    schema::ShotSequence seq;
    Error err;

    // Shortcuts never read the second code
    for (std::string_view shortcut : {"S", "R", "P", "Q"}) {
        TEST_CHECK(parse(true, shortcut, second, seq, err) == Result::Parsed);
        TEST_CHECK(!seq.is_coded());
        TEST_CHECK(!seq.second_serve);
    }
    TEST_CHECK(parse(true, "S", second, seq, err) == Result::Parsed);
    TEST_CHECK(seq.not_coded());

    // After a fault the second code is read, and the error names it
    err.clear();
    TEST_CHECK(parse(true, "4n", second, seq, err) == Result::MalformedSequence);
    TEST_CHECK_EQ(err.offending, second);
    TEST_CHECK_EQ(err.raw, second);
    TEST_CHECK(err.offending != "4n");

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// ASSEMBLE
// ------------------------------------------------------------

static schema::Serve make_serve(ServeAttempt attempt, FaultKind fault, ServeOutcome outcome) {
    schema::Serve s;
    s.server = "A";
    s.attempt = attempt;
    s.direction = ServeDirection::T;
    s.fault = fault;
    s.outcome = outcome;
    return s;
}

void test_assemble_valid() {
    std::cout << "[TEST] assemble (valid parts)..." << std::endl;

    schema::Shot ret;
    ret.player = "B";
    ret.type = ShotType::Backhand;
    ret.outcome = ShotOutcome::UnforcedError;

    schema::Rally rally;
    rally.shots.push_back(ret);

    schema::ShotSequence seq;
    Error err;
    const auto res = schema::ShotSequence::assemble(
        "A", "B", true,
        make_serve(ServeAttempt::First, FaultKind::None, ServeOutcome::InPlay),
        std::nullopt, rally, seq, err);
    TEST_CHECK(res == Result::Parsed);
    TEST_CHECK(seq.is_coded());
    TEST_CHECK_EQ(seq.shot_count(), 2u);

    // Matches what the decoder builds from the equivalent codes
    schema::ShotSequence decoded;
    TEST_CHECK(parse(true, "6b@", "", decoded, err) == Result::Parsed);
    TEST_CHECK(seq == decoded);

    std::cout << "[TEST] OK\n";
}

void test_assemble_rejects_broken_parts() {
    std::cout << "[TEST] assemble (invariant violations)..." << std::endl;

    schema::ShotSequence seq;
    Error err;

    // Fault without a second serve
    TEST_CHECK(schema::ShotSequence::assemble(
        "A", "B", false,
        make_serve(ServeAttempt::First, FaultKind::Net, ServeOutcome::Fault),
        std::nullopt, std::nullopt, seq, err) == Result::MissingRequiredServe);

    // Second serve after a good first serve
    TEST_CHECK(schema::ShotSequence::assemble(
        "A", "B", true,
        make_serve(ServeAttempt::First, FaultKind::None, ServeOutcome::Ace),
        make_serve(ServeAttempt::Second, FaultKind::None, ServeOutcome::Ace),
        std::nullopt, seq, err) == Result::MalformedSequence);

    // Rally after an ace
    schema::Rally rally;
    rally.shots.emplace_back();
    rally.shots.back().type = ShotType::Forehand;
    TEST_CHECK(schema::ShotSequence::assemble(
        "A", "B", true,
        make_serve(ServeAttempt::First, FaultKind::None, ServeOutcome::Ace),
        std::nullopt, rally, seq, err) == Result::MalformedSequence);

    // In-play serve without a rally
    TEST_CHECK(schema::ShotSequence::assemble(
        "A", "B", true,
        make_serve(ServeAttempt::First, FaultKind::None, ServeOutcome::InPlay),
        std::nullopt, std::nullopt, seq, err) == Result::MalformedSequence);

    // Winner in the middle of a rally
    schema::Rally broken;
    broken.shots.resize(2);
    broken.shots[0].type = ShotType::Forehand;
    broken.shots[0].outcome = ShotOutcome::Winner;
    broken.shots[1].type = ShotType::Backhand;
    TEST_CHECK(schema::ShotSequence::assemble(
        "A", "B", true,
        make_serve(ServeAttempt::First, FaultKind::None, ServeOutcome::InPlay),
        std::nullopt, broken, seq, err) == Result::MalformedSequence);

    // First serve tagged as a second attempt
    TEST_CHECK(schema::ShotSequence::assemble(
        "A", "B", true,
        make_serve(ServeAttempt::Second, FaultKind::None, ServeOutcome::Ace),
        std::nullopt, std::nullopt, seq, err) == Result::MalformedSequence);

    // Output untouched by every rejected assembly
    TEST_CHECK(seq == schema::ShotSequence{});

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// MAIN
// ------------------------------------------------------------

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Error);

    // shortcuts
    test_not_coded();
    test_outright_shortcuts();
    test_shortcut_ignores_second_code();
    test_whitespace_is_stripped();

    // serves
    test_bare_fault_letter();
    test_ace();
    test_double_fault();

    // rallies
    test_first_serve_rally();
    test_second_serve_rally();
    test_print_sequence();
    test_parse_is_deterministic();

    // failures
    test_unknown_single_character();
    test_missing_first_serve();
    test_fault_without_second_serve();
    test_second_code_after_good_serve();
    test_bad_rally_reports_full_code();
    test_failure_leaves_output_untouched();
    test_code_too_long();
    test_oversized_second_code();

    // assemble
    test_assemble_valid();
    test_assemble_rejects_broken_parts();

    std::cout << "[TEST] ALL POINT DECODER TESTS PASSED!\n";
    return 0;
}
