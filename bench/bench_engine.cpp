/**
 * @file  bench/bench_engine.cpp
 * @brief Google Benchmark suite for the medsim evaluation and simulation paths.
 *
 * Benchmarks
 * ----------
 *   BM_Utility_Score           : one party, three dimensions
 *   BM_Engine_Evaluate         : full evaluate_proposal for two parties
 *   BM_Simulate_Steps          : AgentSimulator over N steps
 *   BM_MonteCarlo_Explore      : concurrent runs over N seeds
 *
 * Build (CMake):
 *   cmake -DMEDSIM_BENCH=ON ..
 *   cmake --build build --target bench_engine
 *   ./build/bench_engine --benchmark_format=json
 *
 * Throughput units: items/second (steps or evaluations).
 */

#include "benchmark/benchmark.h"

#include "medsim/engine.hpp"
#include "medsim/monte_carlo.hpp"
#include "medsim/utility.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

using namespace medsim;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static IssueSpace make_space() {
    return IssueSpace("bench", {
        Dimension::continuous("standoff_nm", 0.0, 10.0, "nm"),
        Dimension::continuous("escorts", 0.0, 5.0),
        Dimension::continuous("notice_hours", 0.0, 48.0, "h"),
        Dimension::boolean("hotline"),
        Dimension::boolean("cues"),
    });
}

static std::vector<PartyProfile> make_parties() {
    PartyProfile a;
    a.party_id = "PartyA";
    a.interests["standoff_nm"]  = Interest{.weight = 0.4, .ideal = 5.0,  .minimum_acceptable = 2.0};
    a.interests["escorts"]      = Interest{.weight = 0.3, .ideal = 2.0,  .minimum_acceptable = 1.0};
    a.interests["notice_hours"] = Interest{.weight = 0.3, .ideal = 12.0, .minimum_acceptable = 48.0};
    a.batna_utility  = 0.30;
    a.risk_tolerance = 0.50;

    PartyProfile b;
    b.party_id = "PartyB";
    b.interests["standoff_nm"]  = Interest{.weight = 0.5, .ideal = 2.0,  .minimum_acceptable = 4.0};
    b.interests["escorts"]      = Interest{.weight = 0.2, .ideal = 0.0,  .minimum_acceptable = 1.0};
    b.interests["notice_hours"] = Interest{.weight = 0.3, .ideal = 72.0, .minimum_acceptable = 24.0};
    b.batna_utility  = 0.40;
    b.risk_tolerance = 0.30;
    return {a, b};
}

static Proposal make_proposal() {
    Proposal p;
    p.id = "draft";
    p.values["standoff_nm"]  = 3.0;
    p.values["escorts"]      = 1.0;
    p.values["notice_hours"] = 24.0;
    p.values["hotline"]      = true;
    p.values["cues"]         = true;
    return p;
}

// ── Bargaining ─────────────────────────────────────────────────────────────────

static void BM_Utility_Score(benchmark::State& state) {
    const auto space    = make_space();
    const auto parties  = make_parties();
    const auto proposal = make_proposal();
    const bargaining::UtilityEngine engine;
    for (auto _ : state) {
        auto u = engine.score(proposal, parties[0], space);
        benchmark::DoNotOptimize(u.score);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Utility_Score)->Unit(benchmark::kMicrosecond);

static void BM_Engine_Evaluate(benchmark::State& state) {
    core::Engine engine;
    engine.register_issue_space(make_space());
    const auto parties  = make_parties();
    const auto proposal = make_proposal();
    for (auto _ : state) {
        auto eval = engine.evaluate_proposal("bench", proposal, parties);
        benchmark::DoNotOptimize(eval.overall_probability);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Engine_Evaluate)->Unit(benchmark::kMicrosecond);

// ── Simulation ─────────────────────────────────────────────────────────────────

static void BM_Simulate_Steps(benchmark::State& state) {
    const auto steps    = static_cast<std::size_t>(state.range(0));
    const auto space    = make_space();
    const auto parties  = make_parties();
    const auto proposal = make_proposal();
    const sim::AgentSimulator simulator;
    std::uint64_t seed = 1;
    for (auto _ : state) {
        auto run = simulator.run(proposal, space, parties, steps, seed++);
        benchmark::DoNotOptimize(run.incident_log.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(steps));
}
BENCHMARK(BM_Simulate_Steps)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMillisecond);

static void BM_MonteCarlo_Explore(benchmark::State& state) {
    const auto runs = static_cast<std::size_t>(state.range(0));
    core::Engine engine;
    engine.register_issue_space(make_space());
    const auto parties  = make_parties();
    const auto proposal = make_proposal();
    const auto seeds    = analysis::MonteCarloExplorer::seed_sequence(1, runs);
    const analysis::MonteCarloExplorer explorer(engine);
    for (auto _ : state) {
        auto report = explorer.explore("bench", proposal, parties, 300, seeds);
        benchmark::DoNotOptimize(report.mean_incidents);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(runs));
}
BENCHMARK(BM_MonteCarlo_Explore)->RangeMultiplier(2)->Range(4, 64)->Unit(benchmark::kMillisecond)->UseRealTime();
