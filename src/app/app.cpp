// app.cpp — single network, per-fraction scenarios, or the grouped batch table

#include "app/app.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <optional>

#include "core/rng.hpp"
#include "experiment/aggregator.hpp"
#include "experiment/trial.hpp"
#include "io/progress.hpp"
#include "io/report.hpp"
#include "io/term_utils.hpp"
#include "sim/rules.hpp"

namespace app {

namespace {

experiment::GraphParams graph_params(const cli::Options& opt) {
    return experiment::GraphParams{ .nodes = opt.nodes, .attach = opt.attach };
}

experiment::DynamicsParams dynamics_params(const cli::Options& opt) {
    experiment::DynamicsParams d;
    d.rule = opt.effective_rule();
    d.phi  = opt.phi;
    d.diffusion.max_rounds   = opt.max_rounds;
    d.diffusion.cycle_window = opt.cycle_window;
    return d;
}

void banner(const cli::Options& opt) {
    std::cerr << "n=" << opt.nodes << " m=" << opt.attach
              << " rule=" << sim::rule_name(opt.effective_rule());
    if (opt.effective_rule() == sim::RuleKind::Threshold) std::cerr << " phi=" << opt.phi.value();
    std::cerr << " max_rounds=" << opt.max_rounds << " seed=" << opt.seed << "\n";
}

// Influencers alone hold the minority opinion on one network.
int run_single(const cli::Options& opt, bool color) {
    core::SplitMix64 rng(opt.seed);
    const auto s = experiment::run_scenario(graph_params(opt), opt.seed, std::nullopt, dynamics_params(opt), rng);
    io::print_single(std::cout, s, color);
    return 0;
}

// One fresh network per fraction, drawn from the master stream.
int run_scenarios(const cli::Options& opt, bool color) {
    core::SplitMix64 master(opt.seed);
    const auto gp  = graph_params(opt);
    const auto dyn = dynamics_params(opt);
    for (double f : opt.fractions) {
        const std::uint64_t graph_seed = master();
        const auto s = experiment::run_scenario(gp, graph_seed, f, dyn, master);
        io::print_scenario(std::cout, s, color);
    }
    return 0;
}

int run_batch(const cli::Options& opt) {
    experiment::BatchConfig cfg;
    cfg.trials    = opt.trials;
    cfg.graph     = graph_params(opt);
    cfg.fractions = opt.fractions;
    cfg.dynamics  = dynamics_params(opt);
    cfg.seed      = opt.seed;
    cfg.threads   = opt.threads;

    std::atomic<std::size_t> done{0};
    std::optional<io::ProgressManager> progress;
    if (opt.progress) { progress.emplace(done, cfg.trials); progress->start(); }

    const auto t0 = std::chrono::steady_clock::now();
    const auto res = experiment::run_batch(cfg, &done);
    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    if (progress) progress->stop();

    io::print_table(std::cout, res.table);
    io::print_failures(std::cerr, res.failures);
    std::fprintf(stderr, "DONE: trials=%zu records=%zu failures=%zu elapsed=%.2fs\n",
                 cfg.trials, res.records.size(), res.failures.size(), secs);
    return res.failures.empty() ? 0 : 1;
}

} // namespace

int run_app(const cli::Options& opt) {
    banner(opt);
    const bool color = io::is_tty(stdout);
    switch (opt.mode) {
        case cli::Mode::Single:   return run_single(opt, color);
        case cli::Mode::Scenario: return run_scenarios(opt, color);
        case cli::Mode::Batch:    return run_batch(opt);
    }
    return 2;
}

} // namespace app
