// aggregator.hpp — batch trials over TBB with per-trial failure isolation
#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "core/errors.hpp"
#include "core/rng.hpp"
#include "experiment/stats.hpp"
#include "experiment/trial.hpp"

namespace experiment {

// ---------- Config ----------
struct BatchConfig {
    std::size_t trials{core::defaults::trials};
    GraphParams graph{};
    std::vector<double> fractions{0.10, 0.30, 0.40};
    DynamicsParams dynamics{};
    std::uint64_t seed{core::defaults::seed};
    int threads{1};            // 0 -> tbb default
};

struct TrialFailure {
    std::size_t trial{0};
    std::string message;
};

// ---------- Grouped table ----------
struct Cell {
    Summary static_count;
    Summary final_count;
};

struct Row {
    std::size_t influencer_count{0};
    std::vector<std::optional<Cell>> cells;   // one per fraction; nullopt when no record
};

struct SummaryTable {
    std::vector<double> fractions;
    std::vector<Row> rows;                    // ascending influencer_count
};

struct BatchResult {
    std::vector<TrialRecord> records;         // trial order, then fraction order
    std::vector<TrialFailure> failures;
    SummaryTable table;
};

// Group records by influencer count; within each group and fraction compute
// mean and sample sd of the static and final illusion counts.
inline SummaryTable summarize(const std::vector<TrialRecord>& records,
                              const std::vector<double>& fractions)
{
    struct Acc { RunningStats st, fin; };
    std::map<std::size_t, std::vector<Acc>> groups;
    for (const auto& r : records) {
        CORE_REQUIRE(r.fraction_index < fractions.size(), "summarize: fraction index out of range");
        auto& accs = groups[r.influencer_count];
        if (accs.empty()) accs.resize(fractions.size());
        accs[r.fraction_index].st.add(static_cast<double>(r.static_illusion));
        accs[r.fraction_index].fin.add(static_cast<double>(r.final_illusion));
    }

    SummaryTable t;
    t.fractions = fractions;
    t.rows.reserve(groups.size());
    for (const auto& [ic, accs] : groups) {
        Row row;
        row.influencer_count = ic;
        row.cells.resize(fractions.size());
        for (std::size_t f = 0; f < fractions.size(); ++f) {
            if (accs[f].st.n == 0) continue;
            row.cells[f] = Cell{accs[f].st.summary(), accs[f].fin.summary()};
        }
        t.rows.push_back(std::move(row));
    }
    return t;
}

inline void validate(const BatchConfig& cfg) {
    CORE_REQUIRE(cfg.trials >= 1, "run_batch: trial count must be >= 1");
    CORE_REQUIRE(!cfg.fractions.empty(), "run_batch: fraction list is empty");
    for (double f : cfg.fractions) {
        CORE_REQUIRE(f >= 0.0 && f <= 1.0, "run_batch: fraction " + std::to_string(f) + " outside [0,1]");
    }
    CORE_REQUIRE(cfg.graph.attach >= 1 && cfg.graph.nodes > cfg.graph.attach,
                 "run_batch: need nodes > attach >= 1");
    CORE_REQUIRE(cfg.dynamics.diffusion.max_rounds >= 1, "run_batch: max_rounds must be >= 1");
    CORE_REQUIRE(cfg.dynamics.phi.valid(), "run_batch: phi must be a fraction in [0,1]");
}

// Run cfg.trials independent trials through `trial_fn(j, seed_j)`.
// Per-trial seeds are derived from cfg.seed up front and every trial writes
// its own slot, so the result does not depend on cfg.threads. A trial that
// throws is reported in `failures` and contributes no records. `done`
// (optional) counts finished trials.
template <class TrialFn>
inline BatchResult run_trials(const BatchConfig& cfg, TrialFn&& trial_fn,
                              std::atomic<std::size_t>* done = nullptr)
{
    validate(cfg);

    const int NT = (cfg.threads > 0) ? cfg.threads : tbb::this_task_arena::max_concurrency();
    tbb::global_control limit(tbb::global_control::max_allowed_parallelism, static_cast<std::size_t>(NT));

    core::SplitMix64 master(cfg.seed);
    const auto seeds = core::seed_jobs(cfg.trials, master);

    struct Slot {
        std::vector<TrialRecord> records;
        std::optional<std::string> error;
    };
    std::vector<Slot> slots(cfg.trials);

    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, cfg.trials),
        [&](const tbb::blocked_range<std::size_t>& r) {
            for (std::size_t j = r.begin(); j != r.end(); ++j) {
                try {
                    slots[j].records = trial_fn(j, seeds[j]);
                } catch (const std::exception& e) {
                    slots[j].records.clear();
                    slots[j].error = e.what();
                }
                if (done) done->fetch_add(1, std::memory_order_relaxed);
            }
        });

    BatchResult out;
    out.records.reserve(cfg.trials * cfg.fractions.size());
    for (std::size_t j = 0; j < slots.size(); ++j) {
        if (slots[j].error) { out.failures.push_back(TrialFailure{j, *slots[j].error}); continue; }
        out.records.insert(out.records.end(), slots[j].records.begin(), slots[j].records.end());
    }
    out.table = summarize(out.records, cfg.fractions);
    return out;
}

inline BatchResult run_batch(const BatchConfig& cfg, std::atomic<std::size_t>* done = nullptr) {
    return run_trials(cfg, [&](std::size_t j, std::uint64_t seed) {
        return run_trial(j, seed, cfg.graph, cfg.fractions, cfg.dynamics);
    }, done);
}

} // namespace experiment
