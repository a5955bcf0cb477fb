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
 * @file benchmark_runner.h
 * @brief BenchmarkRunner — repeated trials of the majority vote and their summaries.
 *
 * One trial = generate -> shuffle -> MajorityVote::findMajority(). Successful
 * trials become PerformanceSamples; failed trials are dropped without retry,
 * so a result shorter than runCount means some trials errored.
 * All samples of one runTrials() call are appended to the ResultStore in a
 * single append under (algorithm, size, wantMajority), whatever the vote
 * reported for the individual trials.
 *
 * The vote itself can be replaced through a VoteFunction; the default is
 * MajorityVote<Value>::findMajority. runMatrixParallel() calls it from
 * several threads at once.
 *
 * Summary tables keep the order of the requested sizes. Sizes without any
 * successful sample are left out; a repeated size keeps its first position
 * and the summary of its last run.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "definitions.h"
#include "generator.h"
#include "performance_sample.h"
#include "performance_summary.h"
#include "result_store.h"
#include "vote_result.h"

namespace majvote {

    using SummaryTable    = std::vector<std::pair<int64_t, PerformanceSummary>>;
    using ComparisonTable = std::map<std::string, SummaryTable>;

    /// Owns a set of worker threads and joins every one still running when it goes out of scope.
    class WorkerThreads {
        std::vector<std::thread> threads_;

    public:
        WorkerThreads() = default;
        WorkerThreads(const WorkerThreads&) = delete;
        WorkerThreads& operator=(const WorkerThreads&) = delete;
        ~WorkerThreads() { join(); }

        template<typename Fn, typename... Args>
        void spawn(Fn&& fn, Args&&... args) {
            threads_.emplace_back(std::forward<Fn>(fn), std::forward<Args>(args)...);
        }

        void join() {
            for (auto& t : threads_) {
                if (t.joinable()) {
                    t.join();
                }
            }
        }

        size_t size() const { return threads_.size(); }
    };

    class BenchmarkRunner {
    public:
        using Engine        = TestDataGenerator::DefaultEngine;
        using VoteFunction  = std::function<VoteResult<Value>(const Sequence&)>;

    private:
        ResultStore&    store_;
        Engine          rng_;
        VoteFunction    vote_;
        std::string     algorithm_name_ = ALGORITHM_NAME;

        static std::vector<PerformanceSample> runTrials(ResultStore& store, Engine& rng, const VoteFunction& vote,
                                                        const std::string& algorithmName,
                                                        int64_t size, bool wantMajority, size_t runCount);
        static void                     upsert(SummaryTable& table, int64_t size, PerformanceSummary summary);

    public:
        explicit BenchmarkRunner(ResultStore& store);
        BenchmarkRunner(ResultStore& store, uint64_t seed);
        BenchmarkRunner(ResultStore& store, uint64_t seed, VoteFunction vote);

        ResultStore&                    store()                         { return store_; }
        const std::string&              algorithmName() const           { return algorithm_name_; }

        std::vector<PerformanceSample>  runTrials(int64_t size, bool wantMajority, size_t runCount);
        SummaryTable                    runMatrix(const std::vector<int64_t>& sizes, bool wantMajority, size_t runCount);
        ComparisonTable                 compareMajorityVsNone(const std::vector<int64_t>& sizes, size_t runCount);

        /// runMatrix() with independent sizes spread over @p workers threads (0 = hardware concurrency).
        SummaryTable                    runMatrixParallel(const std::vector<int64_t>& sizes, bool wantMajority,
                                                          size_t runCount, size_t workers);
    };

} // namespace majvote
