// rules.hpp — per-vertex opinion update rules for synchronous diffusion
#pragma once

#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include "core/threshold.hpp"
#include "sim/graph_concepts.hpp"
#include "sim/illusion.hpp"
#include "sim/opinions.hpp"

namespace sim {

// A rule computes v's next label from the *current* snapshot only.
// `monotone` rules never move a vertex from Minority back to Majority.
template <class R, class G>
concept DiffusionRule = NeighborGraph<G> &&
    requires(const R& r, const G& g, const Opinions& op, core::index_t v) {
        { r.next_label(g, op, v) } -> std::same_as<Label>;
        { R::monotone } -> std::convertible_to<bool>;
    };

/**
 * @brief One-way threshold adoption: Majority adopts Minority iff
 *        minority_neighbors > phi * degree. Minority never reverts.
 */
struct ThresholdAdoption {
    static constexpr bool monotone = true;
    core::PqThreshold phi{1, 2};

    template <NeighborGraph Graph>
    inline Label next_label(const Graph& g, const Opinions& op, core::index_t v) const {
        if (op.is_minority(v)) return Label::Minority;
        const auto c = count_neighbors(g, op, v);
        return phi.exceeded(c.minority, c.total) ? Label::Minority : Label::Majority;
    }
};

/**
 * @brief Reversible majority vote: adopt the strict local majority; keep the
 *        current label on a tie or with no neighbours.
 */
struct MajorityVote {
    static constexpr bool monotone = false;

    template <NeighborGraph Graph>
    inline Label next_label(const Graph& g, const Opinions& op, core::index_t v) const {
        return local_majority(count_neighbors(g, op, v)).value_or(op.get(v));
    }
};

// ---- runtime selection ----

enum class RuleKind { Threshold, MajorityVote };

inline constexpr std::string_view rule_name(RuleKind k) noexcept {
    return k == RuleKind::Threshold ? "threshold" : "majority";
}

inline std::optional<RuleKind> parse_rule(std::string_view s) noexcept {
    if (s == "threshold") return RuleKind::Threshold;
    if (s == "majority")  return RuleKind::MajorityVote;
    return std::nullopt;
}

// Invoke f with the concrete rule for `kind`; phi only applies to Threshold.
template <class F>
inline decltype(auto) with_rule(RuleKind kind, core::PqThreshold phi, F&& f) {
    if (kind == RuleKind::Threshold) return f(ThresholdAdoption{phi});
    return f(MajorityVote{});
}

} // namespace sim
