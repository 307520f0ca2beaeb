// trial.hpp — one graph, its labelings and their diffusion runs
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "core/config.hpp"
#include "core/rng.hpp"
#include "core/threshold.hpp"
#include "graphs/adjacency_graph.hpp"
#include "graphs/barabasi_albert.hpp"
#include "graphs/influencers.hpp"
#include "sim/assign.hpp"
#include "sim/diffusion.hpp"
#include "sim/illusion.hpp"
#include "sim/rules.hpp"

namespace experiment {

struct GraphParams {
    std::size_t nodes{core::defaults::nodes};
    std::size_t attach{core::defaults::attach};
};

struct DynamicsParams {
    sim::RuleKind rule{sim::RuleKind::MajorityVote};
    core::PqThreshold phi{1, 2};
    sim::DiffusionOptions diffusion{};
};

// Scalar summary of one (graph, fraction) pair.
struct TrialRecord {
    std::size_t trial{0};
    std::size_t influencer_count{0};
    std::size_t fraction_index{0};
    double fraction{0.0};
    std::size_t static_illusion{0};
    std::size_t final_illusion{0};
    std::size_t peak_illusion{0};
    std::size_t rounds{0};
    sim::HaltReason halt{sim::HaltReason::RoundCap};
};

// Everything a presentation layer needs to draw one run.
struct ScenarioResult {
    graphs::AdjacencyGraph graph;
    graphs::InfluencerSelection influencers;
    std::optional<double> fraction;          // nullopt: minority = influencers
    sim::Assignment assignment;
    sim::IllusionReport static_report;
    sim::DiffusionResult diffusion;
};

inline sim::DiffusionResult run_dynamics(const graphs::AdjacencyGraph& g,
                                         const sim::Opinions& initial,
                                         const DynamicsParams& dyn) {
    return sim::with_rule(dyn.rule, dyn.phi, [&](const auto& rule) {
        return sim::simulate(g, initial, rule, dyn.diffusion);
    });
}

// Generate one graph from graph_seed, label it (forced fraction, or
// influencers only when fraction is empty), detect, diffuse.
template <class URBG>
inline ScenarioResult run_scenario(const GraphParams& gp,
                                   std::uint64_t graph_seed,
                                   std::optional<double> fraction,
                                   const DynamicsParams& dyn,
                                   URBG& rng)
{
    ScenarioResult s;
    s.graph       = graphs::barabasi_albert(gp.nodes, gp.attach, graph_seed);
    s.influencers = graphs::select_influencers(s.graph);
    s.fraction    = fraction;
    if (fraction) {
        s.assignment = sim::assign_opinions(s.graph, s.influencers, *fraction, rng);
    } else {
        s.assignment.opinions = sim::assign_influencers_only(s.graph, s.influencers);
        s.assignment.kept     = s.influencers.nodes;
        s.assignment.target   = s.influencers.size();
    }
    s.static_report = sim::detect_illusion(s.graph, s.assignment.opinions);
    s.diffusion     = run_dynamics(s.graph, s.assignment.opinions, dyn);
    return s;
}

// One batch trial: a single graph shared by every fraction. The graph and
// the random fill use independent streams derived from `seed`.
inline std::vector<TrialRecord> run_trial(std::size_t trial,
                                          std::uint64_t seed,
                                          const GraphParams& gp,
                                          const std::vector<double>& fractions,
                                          const DynamicsParams& dyn)
{
    const auto g    = graphs::barabasi_albert(gp.nodes, gp.attach, core::splitmix_hash(seed));
    const auto infl = graphs::select_influencers(g);
    core::SplitMix64 rng(seed);

    std::vector<TrialRecord> out;
    out.reserve(fractions.size());
    for (std::size_t fi = 0; fi < fractions.size(); ++fi) {
        const auto a = sim::assign_opinions(g, infl, fractions[fi], rng);
        const auto d = run_dynamics(g, a.opinions, dyn);
        TrialRecord r;
        r.trial            = trial;
        r.influencer_count = infl.size();
        r.fraction_index   = fi;
        r.fraction         = fractions[fi];
        r.static_illusion  = sim::illusion_count(g, a.opinions);
        r.final_illusion   = d.final_illusion();
        r.peak_illusion    = d.peak_illusion();
        r.rounds           = d.rounds();
        r.halt             = d.halt;
        out.push_back(r);
    }
    return out;
}

} // namespace experiment
