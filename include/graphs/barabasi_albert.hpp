// barabasi_albert.hpp — scale-free graphs by preferential attachment
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/rng.hpp"
#include "graphs/adjacency_graph.hpp"

namespace graphs {

// Build a Barabási–Albert graph on n vertices.
//
// Seed core: complete graph on vertices [0, m). Every later vertex v in [m, n)
// attaches to m distinct existing vertices drawn proportionally to their
// current degree. The draw uses the repeated-vertex list (each vertex appears
// once per incident edge endpoint), so a uniform index into it is a
// degree-weighted pick. The first attaching vertex sees exactly m candidates
// and takes all of them (the core has no edges when m == 1).
//
// Result: n vertices, m(m-1)/2 + (n-m)*m edges, min degree >= m.
// Throws core::precondition_error unless n > m >= 1.
inline AdjacencyGraph barabasi_albert(std::size_t n, std::size_t m, std::uint64_t seed) {
    CORE_REQUIRE(m >= 1, "barabasi_albert: attachment parameter m must be >= 1");
    CORE_REQUIRE(n > m, "barabasi_albert: need n > m (got n=" + std::to_string(n) +
                        ", m=" + std::to_string(m) + ")");

    AdjacencyGraph g(n);
    core::SplitMix64 rng(seed);

    std::vector<core::index_t> repeated;
    repeated.reserve(2 * (m * (m - 1) / 2 + (n - m) * m));

    for (core::index_t i = 0; i < m; ++i) {
        for (core::index_t j = i + 1; j < m; ++j) {
            g.add_edge(i, j);
            repeated.push_back(i);
            repeated.push_back(j);
        }
    }

    std::vector<core::index_t> targets;
    targets.reserve(m);
    std::vector<unsigned char> picked(n, 0);

    for (core::index_t v = m; v < n; ++v) {
        targets.clear();
        if (v == m) {
            for (core::index_t u = 0; u < m; ++u) targets.push_back(u);
        } else {
            // v > m: every existing vertex has degree >= 1 and there are
            // at least m+1 of them, so m distinct picks always exist.
            while (targets.size() < m) {
                const auto k = core::uniform_bounded(rng, static_cast<std::uint64_t>(repeated.size()));
                const core::index_t u = repeated[static_cast<std::size_t>(k)];
                if (picked[u]) continue;
                picked[u] = 1;
                targets.push_back(u);
            }
        }
        for (core::index_t u : targets) {
            g.add_edge(v, u);
            picked[u] = 0;
            repeated.push_back(u);
            repeated.push_back(v);
        }
    }
    return g;
}

} // namespace graphs
