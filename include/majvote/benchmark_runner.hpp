/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the MAJVOTE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file benchmark_runner.hpp
 * @brief BenchmarkRunner implementations.
 */

#include "benchmark_runner.h"
#include "generator.hpp"
#include "majority_vote.hpp"
#include "performance_summary.hpp"
#include "result_store.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <optional>
#include <random>
#include <thread>

namespace majvote {

    namespace detail {
        inline VoteResult<Value> defaultVote(const Sequence& sequence) {
            return MajorityVote<Value>::findMajority(sequence);
        }
    } // namespace detail

    inline BenchmarkRunner::BenchmarkRunner(ResultStore& store)
        : store_(store)
        , rng_(std::random_device{}())
        , vote_(detail::defaultVote)
    {}

    inline BenchmarkRunner::BenchmarkRunner(ResultStore& store, uint64_t seed)
        : store_(store)
        , rng_(seed)
        , vote_(detail::defaultVote)
    {}

    inline BenchmarkRunner::BenchmarkRunner(ResultStore& store, uint64_t seed, VoteFunction vote)
        : store_(store)
        , rng_(seed)
        , vote_(vote ? std::move(vote) : VoteFunction(detail::defaultVote))
    {}

    // ── Trials ──────────────────────────────────────────────────────────

    inline std::vector<PerformanceSample> BenchmarkRunner::runTrials(int64_t size, bool wantMajority, size_t runCount) {
        return runTrials(store_, rng_, vote_, algorithm_name_, size, wantMajority, runCount);
    }

    inline std::vector<PerformanceSample> BenchmarkRunner::runTrials(ResultStore& store, Engine& rng, const VoteFunction& vote,
                                                                     const std::string& algorithmName,
                                                                     int64_t size, bool wantMajority, size_t runCount) {
        std::vector<PerformanceSample> samples;
        samples.reserve(runCount);

        for (size_t run = 0; run < runCount; ++run) {
            Sequence sequence = TestDataGenerator::generate(size, wantMajority);
            TestDataGenerator::shuffle(sequence, rng);

            auto result = vote(sequence);
            if (result.hasError()) {
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << "BenchmarkRunner: dropped trial " << run << " (size " << size
                              << "): " << result.errorMessage() << std::endl;
                }
                continue;
            }
            samples.push_back(PerformanceSample::fromMetrics(algorithmName, size, result.metrics(), result.hasMajority()));
        }

        if (!samples.empty()) {
            store.recordAll(ResultKey{algorithmName, size, wantMajority}, samples);
        }
        return samples;
    }

    // ── Summaries ───────────────────────────────────────────────────────

    inline void BenchmarkRunner::upsert(SummaryTable& table, int64_t size, PerformanceSummary summary) {
        auto it = std::find_if(table.begin(), table.end(),
                               [size](const auto& entry) { return entry.first == size; });
        if (it != table.end()) {
            it->second = std::move(summary);
        } else {
            table.emplace_back(size, std::move(summary));
        }
    }

    inline SummaryTable BenchmarkRunner::runMatrix(const std::vector<int64_t>& sizes, bool wantMajority, size_t runCount) {
        SummaryTable table;
        for (int64_t size : sizes) {
            auto samples = runTrials(size, wantMajority, runCount);
            if (samples.empty()) {
                continue;
            }
            upsert(table, size, PerformanceSummary(algorithm_name_, size, std::move(samples)));
        }
        return table;
    }

    inline ComparisonTable BenchmarkRunner::compareMajorityVsNone(const std::vector<int64_t>& sizes, size_t runCount) {
        ComparisonTable comparison;
        comparison.emplace(WITH_MAJORITY_KEY, runMatrix(sizes, true, runCount));
        comparison.emplace(WITHOUT_MAJORITY_KEY, runMatrix(sizes, false, runCount));
        return comparison;
    }

    inline SummaryTable BenchmarkRunner::runMatrixParallel(const std::vector<int64_t>& sizes, bool wantMajority,
                                                           size_t runCount, size_t workers) {
        if (workers == 0) {
            workers = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers = std::min(workers, sizes.size());
        if (workers <= 1) {
            return runMatrix(sizes, wantMajority, runCount);
        }

        // One engine per size index, seeded up front so work distribution does not matter
        std::vector<uint64_t> seeds(sizes.size());
        for (auto& seed : seeds) {
            seed = rng_();
        }

        std::vector<std::vector<PerformanceSample>> perSize(sizes.size());
        std::vector<std::exception_ptr> errors(workers);
        std::atomic<size_t> next{0};

        auto work = [&](size_t worker) {
            try {
                for (size_t i = next.fetch_add(1); i < sizes.size(); i = next.fetch_add(1)) {
                    Engine rng(seeds[i]);
                    perSize[i] = runTrials(store_, rng, vote_, algorithm_name_, sizes[i], wantMajority, runCount);
                }
            } catch (...) {
                errors[worker] = std::current_exception();   // re-thrown on the calling thread
            }
        };

        {
            WorkerThreads threads;
            try {
                for (size_t w = 0; w < workers; ++w) {
                    threads.spawn(work, w);
                }
            } catch (...) {
                next.store(sizes.size());   // started workers pick up no further sizes
                throw;                      // ~WorkerThreads joins them first
            }
            threads.join();
        }
        for (auto& err : errors) {
            if (err) {
                std::rethrow_exception(err);
            }
        }

        SummaryTable table;
        for (size_t i = 0; i < sizes.size(); ++i) {
            if (perSize[i].empty()) {
                continue;
            }
            upsert(table, sizes[i], PerformanceSummary(algorithm_name_, sizes[i], std::move(perSize[i])));
        }
        return table;
    }

} // namespace majvote
