// graph_concepts.hpp — minimal graph requirements for opinion dynamics
#pragma once

#include <concepts>
#include <cstddef>
#include "core/config.hpp"

namespace sim {

// A graph type G models NeighborGraph if it provides:
//   std::size_t num_vertices() const;
//   std::size_t degree(index_t v) const;
//   template<class F> void for_each_neighbor(index_t v, F&& f) const;
//     Calls f(u) for each neighbor u of v. No allocations; order irrelevant.
// Vertices are the dense range [0, num_vertices()).
template <class G>
concept NeighborGraph = requires(const G& cg, core::index_t v) {
    { cg.num_vertices() } -> std::convertible_to<std::size_t>;
    { cg.degree(v) } -> std::convertible_to<std::size_t>;
    cg.for_each_neighbor(v, [](core::index_t) {});
};

} // namespace sim
