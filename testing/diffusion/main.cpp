// diffusion_tests.cpp
// doctest checks for the threshold and majority-vote dynamics: synchronous
// updates, halting rules, monotonicity and cycle detection.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "core/errors.hpp"
#include "core/rng.hpp"
#include "graphs/adjacency_graph.hpp"
#include "graphs/barabasi_albert.hpp"
#include "graphs/influencers.hpp"
#include "sim/assign.hpp"
#include "sim/diffusion.hpp"
#include "sim/rules.hpp"

using sim::Label;
using sim::HaltReason;

namespace testutil {

inline graphs::AdjacencyGraph make_star(std::size_t k) {
    graphs::AdjacencyGraph g(k + 1);
    for (std::size_t i = 1; i <= k; ++i) g.add_edge(0, i);
    return g;
}

inline sim::Opinions make_opinions(std::size_t n, std::vector<std::size_t> minority) {
    sim::Opinions op(n);
    for (auto v : minority) op.set(v, Label::Minority);
    return op;
}

template <class Rule>
inline sim::Opinions step(const graphs::AdjacencyGraph& g, const sim::Opinions& op, const Rule& rule) {
    sim::Opinions next(op.size());
    for (std::size_t v = 0; v < op.size(); ++v) next.set(v, rule.next_label(g, op, v));
    return next;
}

inline sim::Opinions forced_labeling(const graphs::AdjacencyGraph& g, double f, std::uint64_t seed) {
    const auto infl = graphs::select_influencers(g);
    core::SplitMix64 rng(seed);
    return sim::assign_opinions(g, infl, f, rng).opinions;
}

} // namespace testutil

// -----------------------------------------------------------------------------
// Threshold adoption
// -----------------------------------------------------------------------------

TEST_CASE("threshold adoption on a star: leaves adopt, then the run converges") {
    const auto g  = testutil::make_star(4);
    const auto op = testutil::make_opinions(5, {0});
    const auto r  = sim::simulate(g, op, sim::ThresholdAdoption{});
    CHECK(r.illusion_series == std::vector<std::size_t>{4, 0});
    CHECK(r.minority_series == std::vector<std::size_t>{1, 5});
    CHECK(r.halt == HaltReason::Converged);
    CHECK(r.converged());
    CHECK(r.rounds() == 2);
    CHECK(r.final_opinions.count(Label::Minority) == 5);
    CHECK(r.final_illusion() == 0);
    CHECK(r.peak_illusion() == 4);
}

TEST_CASE("threshold comparison is strict") {
    const auto g  = testutil::make_star(4);
    const auto op = testutil::make_opinions(5, {0});
    // phi = 1: a leaf has 1 of 1 minority neighbours, 1 > 1 is false.
    const auto r = sim::simulate(g, op, sim::ThresholdAdoption{core::PqThreshold(1, 1)});
    CHECK(r.illusion_series == std::vector<std::size_t>{4});
    CHECK(r.halt == HaltReason::Converged);
    CHECK(r.final_opinions == op);

    // Center with 2 of 4 minority leaves at phi = 1/2 stays Majority.
    const auto op2 = testutil::make_opinions(5, {1, 2});
    const sim::ThresholdAdoption half{};
    CHECK(half.next_label(g, op2, 0) == Label::Majority);
    const auto op3 = testutil::make_opinions(5, {1, 2, 3});
    CHECK(half.next_label(g, op3, 0) == Label::Minority);
}

TEST_CASE("threshold adoption is monotone and ends within N rounds") {
    const auto g = graphs::barabasi_albert(400, 2, 21);
    for (double f : {0.1, 0.3, 0.4}) {
        for (std::uint64_t seed = 1; seed <= 3; ++seed) {
            CAPTURE(f); CAPTURE(seed);
            const auto op = testutil::forced_labeling(g, f, seed);
            sim::DiffusionOptions opt;
            opt.max_rounds = 10 * g.num_vertices();   // effectively uncapped
            const auto r = sim::simulate(g, op, sim::ThresholdAdoption{}, opt);
            CHECK(r.converged());
            CHECK(r.rounds() <= g.num_vertices());
            for (std::size_t i = 1; i < r.minority_series.size(); ++i) {
                CHECK(r.minority_series[i - 1] <= r.minority_series[i]);
            }
            for (std::size_t v = 0; v < g.num_vertices(); ++v) {
                if (op.is_minority(v)) CHECK(r.final_opinions.is_minority(v));
            }
        }
    }
}

// -----------------------------------------------------------------------------
// Majority vote
// -----------------------------------------------------------------------------

TEST_CASE("majority vote halts at the first unchanged round") {
    const auto g = graphs::barabasi_albert(600, 2, 4);
    const sim::MajorityVote rule{};
    for (std::uint64_t seed = 1; seed <= 5; ++seed) {
        CAPTURE(seed);
        const auto op = testutil::forced_labeling(g, 0.3, seed);
        sim::DiffusionOptions opt;
        opt.max_rounds = 200;
        const auto r = sim::simulate(g, op, rule, opt);

        // Replay: the first k with step(x_k) == x_k must be the last round.
        sim::Opinions x = op;
        std::size_t k = 0;
        while (k < opt.max_rounds) {
            auto next = testutil::step(g, x, rule);
            ++k;
            if (next == x) break;
            x = std::move(next);
        }
        if (r.converged()) {
            CHECK(r.rounds() == k);
            CHECK(testutil::step(g, r.final_opinions, rule) == r.final_opinions);
        } else {
            CHECK(r.rounds() == opt.max_rounds);
        }
    }
}

TEST_CASE("a fixed point stops after one round") {
    const auto g = testutil::make_star(4);
    const auto r = sim::simulate(g, sim::Opinions(5), sim::MajorityVote{});
    CHECK(r.rounds() == 1);
    CHECK(r.halt == HaltReason::Converged);
}

TEST_CASE("updates are synchronous") {
    // Two vertices with opposite labels swap every round.
    graphs::AdjacencyGraph g(2);
    g.add_edge(0, 1);
    const auto op = testutil::make_opinions(2, {0});
    sim::DiffusionOptions opt;
    opt.max_rounds = 1;
    const auto r = sim::simulate(g, op, sim::MajorityVote{}, opt);
    CHECK(r.halt == HaltReason::RoundCap);
    CHECK(r.final_opinions.get(0) == Label::Majority);
    CHECK(r.final_opinions.get(1) == Label::Minority);
}

TEST_CASE("oscillation runs to the cap unless cycle detection is on") {
    graphs::AdjacencyGraph g(2);
    g.add_edge(0, 1);
    const auto op = testutil::make_opinions(2, {0});

    sim::DiffusionOptions capped;
    capped.max_rounds = 10;
    const auto r = sim::simulate(g, op, sim::MajorityVote{}, capped);
    CHECK(r.halt == HaltReason::RoundCap);
    CHECK(r.rounds() == 10);

    sim::DiffusionOptions watched = capped;
    watched.cycle_window = 4;
    const auto c = sim::simulate(g, op, sim::MajorityVote{}, watched);
    CHECK(c.halt == HaltReason::Cycle);
    CHECK(c.rounds() == 2);
    CHECK(c.final_opinions == op);
}

TEST_CASE("ties and isolated vertices keep their label under majority vote") {
    graphs::AdjacencyGraph g(4);   // path 0-1-2, vertex 3 isolated
    g.add_edge(0, 1); g.add_edge(1, 2);
    const auto op = testutil::make_opinions(4, {0, 3});
    const sim::MajorityVote rule{};
    CHECK(rule.next_label(g, op, 1) == Label::Majority);   // tie: keep
    CHECK(rule.next_label(g, op, 3) == Label::Minority);   // isolated: keep
    CHECK(rule.next_label(g, op, 0) == Label::Majority);   // adopts neighbour

    const sim::ThresholdAdoption th{};
    CHECK(th.next_label(g, testutil::make_opinions(4, {0}), 3) == Label::Majority);
}

// -----------------------------------------------------------------------------
// Dispatch and preconditions
// -----------------------------------------------------------------------------

TEST_CASE("with_rule dispatches to the selected strategy") {
    const auto g  = testutil::make_star(4);
    const auto op = testutil::make_opinions(5, {0});
    auto run = [&](sim::RuleKind k) {
        return sim::with_rule(k, core::PqThreshold(1, 2), [&](const auto& rule) {
            return sim::simulate(g, op, rule);
        });
    };
    const auto t = run(sim::RuleKind::Threshold);
    CHECK(t.final_opinions.count(Label::Minority) == 5);
    // Majority vote: leaves adopt the center, the center adopts the leaves.
    const auto m = run(sim::RuleKind::MajorityVote);
    CHECK(m.illusion_series.front() == 4);
    CHECK(sim::parse_rule("threshold") == sim::RuleKind::Threshold);
    CHECK(sim::parse_rule("majority") == sim::RuleKind::MajorityVote);
    CHECK_FALSE(sim::parse_rule("voter").has_value());
}

TEST_CASE("simulate rejects a zero round cap and a short labeling") {
    const auto g = testutil::make_star(4);
    sim::DiffusionOptions opt;
    opt.max_rounds = 0;
    CHECK_THROWS_AS(sim::simulate(g, sim::Opinions(5), sim::MajorityVote{}, opt), core::precondition_error);
    CHECK_THROWS_AS(sim::simulate(g, sim::Opinions(3), sim::MajorityVote{}), core::precondition_error);
}

TEST_CASE("threshold comparison stays exact for a huge denominator") {
    // phi = 1 / (2^63 + 1): the cross products do not fit in 64 bits.
    const core::PqThreshold tiny(1, (std::uint64_t{1} << 63) + 1);
    REQUIRE(tiny.valid());
    CHECK(tiny.exceeded(2, 3));
    CHECK_FALSE(tiny.exceeded(0, 3));

    const core::PqThreshold near_one((std::uint64_t{1} << 63), (std::uint64_t{1} << 63) + 1);
    CHECK_FALSE(near_one.exceeded(2, 3));
    CHECK(near_one.exceeded(3, 3));

    graphs::AdjacencyGraph g(4);   // vertex 0 sees 1, 2 (Minority) and 3
    g.add_edge(0, 1); g.add_edge(0, 2); g.add_edge(0, 3);
    const auto op = testutil::make_opinions(4, {1, 2});
    CHECK(sim::ThresholdAdoption{tiny}.next_label(g, op, 0) == Label::Minority);
}

namespace testutil {

// Claims to be monotone but sends every vertex back to Majority.
struct RevertingRule {
    static constexpr bool monotone = true;
    template <class Graph>
    Label next_label(const Graph&, const sim::Opinions&, core::index_t) const { return Label::Majority; }
};

} // namespace testutil

TEST_CASE("a monotone rule that reverts a Minority vertex is rejected") {
    static_assert(sim::ThresholdAdoption::monotone);
    static_assert(!sim::MajorityVote::monotone);

    const auto g = testutil::make_star(4);
    CHECK_THROWS_AS(sim::simulate(g, testutil::make_opinions(5, {0}), testutil::RevertingRule{}),
                    std::logic_error);
    // Nothing to revert: the all-Majority labeling is a fixed point.
    const auto r = sim::simulate(g, sim::Opinions(5), testutil::RevertingRule{});
    CHECK(r.converged());
}
