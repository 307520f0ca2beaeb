#pragma once
/*
illusion.hpp — majority-illusion detection via on-demand neighbour scans

DEFINITIONS
- global majority: Minority iff #Minority > #Majority over all vertices;
  an exact global tie resolves to Majority (strict comparison).
- local majority of v: the strictly larger of (minority neighbours,
  majority neighbours). Undefined when v has no neighbours or the two
  counts are equal; such vertices are never in the illusion set.
- v is under illusion iff its local majority is defined and differs from
  the global majority.

COST
- One pass over all adjacency lists: O(N + E) per call, no per-vertex arrays.
  detect_illusion() materialises the set; illusion_count() only counts and is
  what the simulator calls every round.
*/

#include <cstddef>
#include <optional>
#include <vector>

#include "core/config.hpp"
#include "sim/graph_concepts.hpp"
#include "sim/opinions.hpp"

namespace sim {

struct NeighborCounts {
    std::size_t minority{0};
    std::size_t total{0};
    [[nodiscard]] std::size_t majority() const noexcept { return total - minority; }
};

template <NeighborGraph Graph>
inline NeighborCounts count_neighbors(const Graph& g, const Opinions& op, core::index_t v) {
    NeighborCounts c;
    g.for_each_neighbor(v, [&](core::index_t u) {
        ++c.total;
        c.minority += static_cast<std::size_t>(op.is_minority(u));
    });
    return c;
}

// nullopt for isolated vertices and exact ties
inline std::optional<Label> local_majority(const NeighborCounts& c) noexcept {
    if (c.total == 0 || 2 * c.minority == c.total) return std::nullopt;
    return (2 * c.minority > c.total) ? Label::Minority : Label::Majority;
}

inline Label global_majority(const Opinions& op) noexcept {
    return op.count(Label::Minority) > op.count(Label::Majority) ? Label::Minority : Label::Majority;
}

struct IllusionReport {
    Label global{Label::Majority};
    std::vector<core::index_t> nodes;   // ascending vertex ids

    [[nodiscard]] std::size_t size() const noexcept { return nodes.size(); }
};

template <NeighborGraph Graph>
inline IllusionReport detect_illusion(const Graph& g, const Opinions& op) {
    CORE_ASSERT_H(op.size() == g.num_vertices(), "detect_illusion: labeling size mismatch");
    IllusionReport r;
    r.global = global_majority(op);
    const std::size_t n = g.num_vertices();
    for (core::index_t v = 0; v < n; ++v) {
        const auto local = local_majority(count_neighbors(g, op, v));
        if (local && *local != r.global) r.nodes.push_back(v);
    }
    return r;
}

template <NeighborGraph Graph>
inline std::size_t illusion_count(const Graph& g, const Opinions& op) {
    CORE_ASSERT_H(op.size() == g.num_vertices(), "illusion_count: labeling size mismatch");
    const Label global = global_majority(op);
    const std::size_t n = g.num_vertices();
    std::size_t count = 0;
    for (core::index_t v = 0; v < n; ++v) {
        const auto local = local_majority(count_neighbors(g, op, v));
        count += static_cast<std::size_t>(local && *local != global);
    }
    return count;
}

} // namespace sim
