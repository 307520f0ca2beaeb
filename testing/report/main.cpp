// report_tests.cpp
// doctest checks for the console reports (single run, scenario lines, batch
// table, failure warnings) and for the mode dispatch that prints them.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstddef>
#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

#include "app/app.hpp"
#include "cli/cli.hpp"
#include "experiment/aggregator.hpp"
#include "experiment/trial.hpp"
#include "io/report.hpp"
#include "sim/diffusion.hpp"

namespace testutil {

inline experiment::TrialRecord record(std::size_t infl, std::size_t fi, std::size_t st, std::size_t fin) {
    experiment::TrialRecord r;
    r.influencer_count = infl;
    r.fraction_index   = fi;
    r.static_illusion  = st;
    r.final_illusion   = fin;
    return r;
}

inline std::vector<std::string> lines_of(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream is(s);
    for (std::string line; std::getline(is, line);) out.push_back(line);
    return out;
}

// Illusion series 3, 5, 1 after a converged run; two influencers.
inline experiment::ScenarioResult make_scenario() {
    experiment::ScenarioResult s;
    s.influencers.mean_degree = 2.5;
    s.influencers.threshold   = 5.0;
    s.influencers.nodes       = {0, 4};
    s.fraction                = 0.3;
    s.static_report.global    = sim::Label::Majority;
    s.static_report.nodes     = {1, 2, 3};
    s.diffusion.illusion_series = {3, 5, 1};
    s.diffusion.minority_series = {2, 3, 4};
    s.diffusion.halt            = sim::HaltReason::Converged;
    return s;
}

// Redirects std::cout for the lifetime of the object.
class CoutCapture {
public:
    CoutCapture() : old_(std::cout.rdbuf(buf_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_); }
    CoutCapture(const CoutCapture&) = delete;
    CoutCapture& operator=(const CoutCapture&) = delete;
    std::string str() const { return buf_.str(); }
private:
    std::ostringstream buf_;
    std::streambuf* old_;
};

} // namespace testutil

// -----------------------------------------------------------------------------
// Formatting helpers
// -----------------------------------------------------------------------------

TEST_CASE("label text and percent headers") {
    CHECK(io::label_text(sim::Label::Minority, false) == "Red");
    CHECK(io::label_text(sim::Label::Majority, false) == "Blue");
    const auto red = io::label_text(sim::Label::Minority, true);
    CHECK(red.find("\x1b[31m") == 0);
    CHECK(red.find("Red") != std::string::npos);
    CHECK(io::percent(0.1) == "10%");
    CHECK(io::percent(0.4) == "40%");
}

// -----------------------------------------------------------------------------
// Single and scenario reports
// -----------------------------------------------------------------------------

TEST_CASE("single-network report") {
    std::ostringstream os;
    io::print_single(os, testutil::make_scenario(), false);
    CHECK(os.str() ==
          "Average degree = 2.50, threshold = 5.00\n"
          "Number of influencers: 2\n"
          "Global majority: Blue, Illusioned nodes: 3\n"
          "Illusion series: 3 5 1\n"
          "Final number under illusion: 1 (3 rounds, converged)\n");
}

TEST_CASE("scenario report carries static, peak and final counts") {
    std::ostringstream os;
    io::print_scenario(os, testutil::make_scenario(), false);
    CHECK(os.str() ==
          "30% | infl=2 | global maj=Blue\n"
          "  static=3 | peak=5 | final=1 | rounds=3 (converged)\n");

    auto s = testutil::make_scenario();
    s.fraction.reset();
    s.diffusion.halt = sim::HaltReason::RoundCap;
    std::ostringstream os2;
    io::print_scenario(os2, s, false);
    CHECK(os2.str().rfind("infl | infl=2", 0) == 0);
    CHECK(os2.str().find("(round-cap)") != std::string::npos);
}

// -----------------------------------------------------------------------------
// Batch table
// -----------------------------------------------------------------------------

TEST_CASE("batch table: header, mean±sd cells and empty cells") {
    using testutil::record;
    const std::vector<double> fr{0.1, 0.3};
    const auto t = experiment::summarize({record(5, 0, 10, 4), record(5, 0, 20, 8), record(9, 1, 3, 3)}, fr);

    std::ostringstream os;
    io::print_table(os, t);
    const auto lines = testutil::lines_of(os.str());
    REQUIRE(lines.size() == 4);

    CHECK(lines[0].rfind("Infl | 10% stat", 0) == 0);
    CHECK(lines[0].find("| 10% fin") != std::string::npos);
    CHECK(lines[0].find("| 30% stat") != std::string::npos);
    CHECK(lines[0].find("| 30% fin") != std::string::npos);
    CHECK(lines[1] == std::string(lines[0].size(), '-'));

    // Group 5: 10% cell is 15.0±7.1 / 6.0±2.8, 30% cell is empty.
    CHECK(lines[2].rfind("   5 |", 0) == 0);
    CHECK(lines[2].find("15.0±7.1") != std::string::npos);
    CHECK(lines[2].find("6.0±2.8") != std::string::npos);
    CHECK(lines[2].find("|    -") != std::string::npos);

    // Group 9: only the 30% cell, single sample so sd is 0.
    CHECK(lines[3].rfind("   9 |    -", 0) == 0);
    CHECK(lines[3].find("3.0±0.0") != std::string::npos);
}

TEST_CASE("failures are reported as warnings") {
    std::ostringstream os;
    io::print_failures(os, {experiment::TrialFailure{4, "boom"}, experiment::TrialFailure{7, "bad"}});
    CHECK(os.str() == "WARN: trial 4 failed: boom\nWARN: trial 7 failed: bad\n");
}

// -----------------------------------------------------------------------------
// Mode dispatch
// -----------------------------------------------------------------------------

TEST_CASE("run_app prints the report for each mode") {
    cli::Options opt;
    opt.nodes     = 200;
    opt.attach    = 2;
    opt.trials    = 3;
    opt.fractions = {0.1, 0.3};
    opt.seed      = 5;

    SUBCASE("single") {
        opt.mode = cli::Mode::Single;
        testutil::CoutCapture cap;
        CHECK(app::run_app(opt) == 0);
        const auto out = cap.str();
        CHECK(out.find("Number of influencers:") != std::string::npos);
        CHECK(out.find("Illusion series:") != std::string::npos);
        CHECK(out.find("Final number under illusion:") != std::string::npos);
    }
    SUBCASE("scenario") {
        opt.mode = cli::Mode::Scenario;
        testutil::CoutCapture cap;
        CHECK(app::run_app(opt) == 0);
        const auto lines = testutil::lines_of(cap.str());
        REQUIRE(lines.size() == 4);
        CHECK(lines[0].rfind("10% | infl=", 0) == 0);
        CHECK(lines[1].rfind("  static=", 0) == 0);
        CHECK(lines[1].find(" | peak=") != std::string::npos);
        CHECK(lines[2].rfind("30% | infl=", 0) == 0);
    }
    SUBCASE("batch") {
        opt.mode = cli::Mode::Batch;
        testutil::CoutCapture cap;
        CHECK(app::run_app(opt) == 0);
        const auto lines = testutil::lines_of(cap.str());
        REQUIRE(lines.size() >= 3);
        CHECK(lines[0].rfind("Infl | 10% stat", 0) == 0);
    }
}
