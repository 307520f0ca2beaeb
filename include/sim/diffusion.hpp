// diffusion.hpp — synchronous opinion diffusion with illusion tracking
#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "sim/graph_concepts.hpp"
#include "sim/illusion.hpp"
#include "sim/opinions.hpp"
#include "sim/rules.hpp"

namespace sim {

enum class HaltReason {
    Converged,   // a round changed no label
    RoundCap,    // max_rounds updates applied
    Cycle        // labeling repeated with period >= 2 (cycle_window > 0 only)
};

inline constexpr std::string_view halt_name(HaltReason h) noexcept {
    switch (h) {
        case HaltReason::Converged: return "converged";
        case HaltReason::RoundCap:  return "round-cap";
        case HaltReason::Cycle:     return "cycle";
    }
    return "?";
}

struct DiffusionOptions {
    std::size_t max_rounds{core::defaults::max_rounds};   // >= 1
    std::size_t cycle_window{0};                          // 0 disables cycle detection
};

struct DiffusionResult {
    std::vector<std::size_t> illusion_series;   // one entry per round, taken before the update
    std::vector<std::size_t> minority_series;   // #Minority at the same instants
    Opinions final_opinions;
    HaltReason halt{HaltReason::RoundCap};

    [[nodiscard]] std::size_t rounds() const noexcept { return illusion_series.size(); }
    [[nodiscard]] bool converged() const noexcept { return halt == HaltReason::Converged; }
    [[nodiscard]] std::size_t final_illusion() const noexcept { return illusion_series.back(); }
    [[nodiscard]] std::size_t peak_illusion() const noexcept {
        return *std::max_element(illusion_series.begin(), illusion_series.end());
    }
};

// Run the diffusion from `initial`.
//
// Each round:
//   1) record illusion_count(current) and #Minority;
//   2) build `next` entirely from `current` (synchronous update);
//   3) stop if next == current (Converged), otherwise current := next.
// The loop also stops after max_rounds rounds (RoundCap) or, when
// cycle_window > 0, when `next` equals one of the last cycle_window labelings
// older than `current` (Cycle). On RoundCap/Cycle the final labeling is the
// last `next`, whose illusion count is not part of the series.
// A rule declaring `monotone` that moves a vertex back to Majority is a bug
// in the rule and raises std::logic_error.
template <NeighborGraph Graph, class Rule>
    requires DiffusionRule<Rule, Graph>
inline DiffusionResult simulate(const Graph& g,
                                const Opinions& initial,
                                const Rule& rule,
                                const DiffusionOptions& opt = {})
{
    const std::size_t n = g.num_vertices();
    CORE_REQUIRE(opt.max_rounds >= 1, "simulate: max_rounds must be >= 1");
    CORE_REQUIRE(initial.size() == n, "simulate: labeling does not cover the graph");

    DiffusionResult res;
    res.illusion_series.reserve(std::min<std::size_t>(opt.max_rounds, 64));
    res.minority_series.reserve(res.illusion_series.capacity());

    std::deque<std::pair<std::uint64_t, Opinions>> history; // oldest first
    Opinions current = initial;
    res.halt = HaltReason::RoundCap;

    for (std::size_t round = 0; round < opt.max_rounds; ++round) {
        res.illusion_series.push_back(illusion_count(g, current));
        res.minority_series.push_back(current.count(Label::Minority));

        Opinions next(n, Label::Majority);
        for (core::index_t v = 0; v < n; ++v) {
            const Label l = rule.next_label(g, current, v);
            if constexpr (Rule::monotone) {
                if (l == Label::Majority && current.is_minority(v))
                    throw std::logic_error("simulate: monotone rule reverted a Minority vertex");
            }
            next.set(v, l);
        }

        if (next == current) { res.halt = HaltReason::Converged; break; }

        if (opt.cycle_window > 0) {
            const std::uint64_t h = next.fingerprint();
            const bool repeat = std::any_of(history.begin(), history.end(), [&](const auto& e) {
                return e.first == h && e.second == next;
            });
            if (repeat) { current = std::move(next); res.halt = HaltReason::Cycle; break; }
            history.emplace_back(current.fingerprint(), current);
            if (history.size() > opt.cycle_window) history.pop_front();
        }
        current = std::move(next);
    }

    res.final_opinions = std::move(current);
    return res;
}

} // namespace sim
