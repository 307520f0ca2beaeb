// assign.hpp — initial opinion labelings (forced minority fraction)
#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/rng.hpp"
#include "graphs/influencers.hpp"
#include "sim/graph_concepts.hpp"
#include "sim/opinions.hpp"

namespace sim {

struct Assignment {
    Opinions opinions;
    std::size_t target{0};                     // round(fraction * N)
    std::vector<core::index_t> kept;           // influencers labeled Minority
    std::vector<core::index_t> extra;          // random fill, ascending ids
};

// Minority count for a fraction of n vertices. Fractions outside [0,1]
// (and NaN) are rejected.
inline std::size_t target_minority_count(double fraction, std::size_t n) {
    CORE_REQUIRE(fraction >= 0.0 && fraction <= 1.0,
                 "minority fraction must be in [0,1] (got " + std::to_string(fraction) + ")");
    return static_cast<std::size_t>(std::llround(fraction * static_cast<double>(n)));
}

// Influencers ranked by degree descending, vertex id ascending on ties.
template <NeighborGraph Graph>
inline std::vector<core::index_t> rank_by_degree(const Graph& g, std::vector<core::index_t> nodes) {
    std::stable_sort(nodes.begin(), nodes.end(), [&](core::index_t a, core::index_t b) {
        const auto da = g.degree(a), db = g.degree(b);
        return da != db ? da > db : a < b;
    });
    return nodes;
}

// Label exactly round(fraction * N) vertices Minority:
//   |infl| >  target: keep the `target` highest-degree influencers;
//   |infl| <  target: keep all influencers, fill the deficit uniformly
//                     without replacement from the non-influencers;
//   |infl| == target: the influencer set itself.
// Everything else is Majority. The fill never runs partially: if the
// non-influencer population is too small the call throws.
template <NeighborGraph Graph, class URBG>
inline Assignment assign_opinions(const Graph& g,
                                  const graphs::InfluencerSelection& infl,
                                  double fraction,
                                  URBG& rng)
{
    const std::size_t n = g.num_vertices();
    Assignment out;
    out.target   = target_minority_count(fraction, n);
    out.opinions = Opinions(n, Label::Majority);
    for (core::index_t v : infl.nodes) {
        CORE_REQUIRE(v < n, "assign_opinions: influencer id out of range");
    }

    if (infl.size() >= out.target) {
        out.kept = rank_by_degree(g, infl.nodes);
        out.kept.resize(out.target);
        std::sort(out.kept.begin(), out.kept.end());
    } else {
        out.kept = infl.nodes;
        std::vector<unsigned char> is_infl(n, 0);
        for (core::index_t v : infl.nodes) is_infl[v] = 1;
        std::vector<core::index_t> rest;
        rest.reserve(n - infl.size());
        for (core::index_t v = 0; v < n; ++v) if (!is_infl[v]) rest.push_back(v);

        const std::size_t deficit = out.target - infl.size();
        CORE_REQUIRE(deficit <= rest.size(),
                     "assign_opinions: fill of " + std::to_string(deficit) +
                     " exceeds non-influencer population " + std::to_string(rest.size()));
        for (std::size_t k : core::sample_without_replacement(rest.size(), deficit, rng)) {
            out.extra.push_back(rest[k]);
        }
        std::sort(out.extra.begin(), out.extra.end());
    }

    for (core::index_t v : out.kept)  out.opinions.set(v, Label::Minority);
    for (core::index_t v : out.extra) out.opinions.set(v, Label::Minority);
    return out;
}

// Minority = influencer set exactly (no target fraction).
template <NeighborGraph Graph>
inline Opinions assign_influencers_only(const Graph& g, const graphs::InfluencerSelection& infl) {
    Opinions op(g.num_vertices(), Label::Majority);
    for (core::index_t v : infl.nodes) {
        CORE_REQUIRE(v < g.num_vertices(), "assign_influencers_only: influencer id out of range");
        op.set(v, Label::Minority);
    }
    return op;
}

} // namespace sim
