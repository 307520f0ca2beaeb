// influencers.hpp — degree-threshold influencer selection
#pragma once
#include <cstddef>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"

namespace graphs {

struct InfluencerSelection {
    double mean_degree{0.0};
    double threshold{0.0};               // 2 * mean_degree
    std::vector<core::index_t> nodes;    // ascending vertex ids

    [[nodiscard]] std::size_t size() const noexcept { return nodes.size(); }
};

// Influencers are vertices whose degree is strictly greater than twice the
// mean degree. An empty graph has no mean degree and is rejected.
template <class Graph>
inline InfluencerSelection select_influencers(const Graph& g) {
    const std::size_t n = g.num_vertices();
    CORE_REQUIRE(n > 0, "select_influencers: graph has no vertices");

    std::size_t degree_sum = 0;
    for (core::index_t v = 0; v < n; ++v) degree_sum += g.degree(v);

    InfluencerSelection sel;
    sel.mean_degree = static_cast<double>(degree_sum) / static_cast<double>(n);
    sel.threshold   = 2.0 * sel.mean_degree;
    for (core::index_t v = 0; v < n; ++v) {
        if (static_cast<double>(g.degree(v)) > sel.threshold) sel.nodes.push_back(v);
    }
    return sel;
}

} // namespace graphs
