// adjacency_graph.hpp — undirected simple graph over vertices 0..N-1
#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"

namespace graphs {

// Adjacency lists with a fixed vertex set. Edges are only added (during
// generation); self-loops and duplicate edges are rejected by add_edge.
// Models sim::NeighborGraph (sim/graph_concepts.hpp).
class AdjacencyGraph {
public:
    using index_t = core::index_t;

    AdjacencyGraph() = default;
    explicit AdjacencyGraph(std::size_t n) : adj_(n) {}

    // ---- sizes ----
    [[nodiscard]] std::size_t num_vertices() const noexcept { return adj_.size(); }
    [[nodiscard]] std::size_t num_edges()    const noexcept { return num_edges_; }
    [[nodiscard]] std::size_t degree(index_t v) const noexcept { return adj_[v].size(); }

    // Sum of degrees / N. Undefined for an empty graph; callers check first.
    [[nodiscard]] double mean_degree() const noexcept {
        return 2.0 * static_cast<double>(num_edges_) / static_cast<double>(adj_.size());
    }

    // ---- neighbours ----
    template <class F>
    inline void for_each_neighbor(index_t v, F&& f) const {
        for (index_t u : adj_[v]) f(u);
    }
    [[nodiscard]] const std::vector<index_t>& neighbors(index_t v) const noexcept { return adj_[v]; }

    [[nodiscard]] bool has_edge(index_t u, index_t v) const noexcept {
        const auto& a = adj_[u].size() <= adj_[v].size() ? adj_[u] : adj_[v];
        const index_t other = adj_[u].size() <= adj_[v].size() ? v : u;
        return std::find(a.begin(), a.end(), other) != a.end();
    }

    // ---- mutation ----
    // Returns false (and leaves the graph unchanged) for a self-loop or an
    // existing edge. Throws on out-of-range endpoints.
    bool add_edge(index_t u, index_t v) {
        CORE_REQUIRE(u < adj_.size() && v < adj_.size(), "AdjacencyGraph::add_edge: vertex out of range");
        if (u == v || has_edge(u, v)) return false;
        adj_[u].push_back(v);
        adj_[v].push_back(u);
        ++num_edges_;
        return true;
    }

private:
    std::vector<std::vector<index_t>> adj_;
    std::size_t num_edges_{0};
};

} // namespace graphs
