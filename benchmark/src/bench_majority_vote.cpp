/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the MAJVOTE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_majority_vote.cpp
 * @brief Micro-benchmarks for the majority vote, input generation and result storage.
 *
 * The vote is measured on shuffled inputs with and without a majority element;
 * the per-iteration operation counters are exported as benchmark counters so
 * that the linear growth can be read next to the timings.
 */

#include <benchmark/benchmark.h>
#include <majvote/majvote.h>
#include <cstdint>
#include <string>

using namespace majvote;

// ============================================================================
// Setup helpers
// ============================================================================

namespace {

Sequence makeInput(int64_t size, bool majority, uint64_t seed) {
    Sequence seq = TestDataGenerator::generate(size, majority);
    TestDataGenerator::DefaultEngine rng(seed);
    TestDataGenerator::shuffle(seq, rng);
    return seq;
}

} // namespace

// ============================================================================
// findMajority
// ============================================================================

static void BM_FindMajority_WithMajority(benchmark::State& state) {
    const int64_t size = state.range(0);
    const Sequence seq = makeInput(size, true, 1);

    uint64_t comparisons = 0;
    uint64_t accesses = 0;
    for (auto _ : state) {
        auto result = MajorityVote<Value>::findMajority(seq);
        benchmark::DoNotOptimize(result);
        comparisons = result.metrics().comparisons();
        accesses = result.metrics().accesses();
    }
    state.SetItemsProcessed(state.iterations() * size);
    state.counters["comparisons"] = static_cast<double>(comparisons);
    state.counters["accesses"] = static_cast<double>(accesses);
}
BENCHMARK(BM_FindMajority_WithMajority)
    ->Arg(100)->Arg(1000)->Arg(10000)->Arg(100000)->Arg(1000000);

static void BM_FindMajority_WithoutMajority(benchmark::State& state) {
    const int64_t size = state.range(0);
    const Sequence seq = makeInput(size, false, 1);

    uint64_t comparisons = 0;
    uint64_t accesses = 0;
    for (auto _ : state) {
        auto result = MajorityVote<Value>::findMajority(seq);
        benchmark::DoNotOptimize(result);
        comparisons = result.metrics().comparisons();
        accesses = result.metrics().accesses();
    }
    state.SetItemsProcessed(state.iterations() * size);
    state.counters["comparisons"] = static_cast<double>(comparisons);
    state.counters["accesses"] = static_cast<double>(accesses);
}
BENCHMARK(BM_FindMajority_WithoutMajority)
    ->Arg(100)->Arg(1000)->Arg(10000)->Arg(100000)->Arg(1000000);

// Baseline: plain int vector, no absent elements
static void BM_FindMajority_PlainInt(benchmark::State& state) {
    const int64_t size = state.range(0);
    MajorityVote<int>::SequenceType seq;
    seq.reserve(static_cast<size_t>(size));
    for (const auto& e : makeInput(size, true, 2)) {
        seq.emplace_back(*e);
    }

    for (auto _ : state) {
        auto result = MajorityVote<int>::findMajority(seq);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * size);
}
BENCHMARK(BM_FindMajority_PlainInt)
    ->Arg(1000)->Arg(100000);

static void BM_Validate(benchmark::State& state) {
    const int64_t size = state.range(0);
    const Sequence seq = makeInput(size, true, 3);

    for (auto _ : state) {
        auto err = MajorityVote<Value>::validate(seq);
        benchmark::DoNotOptimize(err);
    }
    state.SetItemsProcessed(state.iterations() * size);
}
BENCHMARK(BM_Validate)
    ->Arg(1000)->Arg(100000);

// ============================================================================
// Input generation
// ============================================================================

static void BM_Generate(benchmark::State& state) {
    const int64_t size = state.range(0);
    for (auto _ : state) {
        Sequence seq = TestDataGenerator::generate(size, true);
        benchmark::DoNotOptimize(seq.data());
    }
    state.SetItemsProcessed(state.iterations() * size);
}
BENCHMARK(BM_Generate)
    ->Arg(1000)->Arg(100000);

static void BM_Shuffle(benchmark::State& state) {
    const int64_t size = state.range(0);
    Sequence seq = TestDataGenerator::generate(size, true);
    TestDataGenerator::DefaultEngine rng(4);

    for (auto _ : state) {
        TestDataGenerator::shuffle(seq, rng);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * size);
}
BENCHMARK(BM_Shuffle)
    ->Arg(1000)->Arg(100000);

// ============================================================================
// Result storage
// ============================================================================

// All threads append to one shared key
static void BM_Store_Record(benchmark::State& state) {
    static ResultStore store;
    if (state.thread_index() == 0) {
        store.clear();
    }
    const PerformanceSample sample(ALGORITHM_NAME, 1000, 12345, 1500, 2002, 1, true);

    for (auto _ : state) {
        store.record(sample);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Store_Record)->Threads(1)->Threads(4);

static void BM_Store_ExportCsv(benchmark::State& state) {
    ResultStore store;
    BenchmarkRunner runner(store, 5);
    runner.runTrials(100, true, static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        std::string csv = store.exportCsv();
        benchmark::DoNotOptimize(csv.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Store_ExportCsv)
    ->Arg(100)->Arg(10000);

BENCHMARK_MAIN();
