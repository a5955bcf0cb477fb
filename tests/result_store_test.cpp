/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the MAJVOTE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file result_store_test.cpp
 * @brief Tests for ResultStore recording, queries, exports and concurrent appends
 *
 * Tests cover:
 * - Keyed recording and query ordering
 * - Summaries over both majority flags
 * - Exact CSV and report text for fixed samples
 * - Concurrent appends from several threads (no lost samples)
 */

#include <gtest/gtest.h>
#include <majvote/majvote.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using majvote::PerformanceSample;
using majvote::ResultKey;
using majvote::ResultStore;

class ResultStoreTest : public ::testing::Test {
protected:
    ResultStore store_;

    static PerformanceSample sample(const std::string& name, int64_t size, int64_t nanos,
                                    bool majority, int64_t timestampMs = 1700000000000) {
        return PerformanceSample(name, size, nanos, static_cast<uint64_t>(size), static_cast<uint64_t>(2 * size + 2), 1,
                                 majority, PerformanceSample::TimePoint{std::chrono::milliseconds(timestampMs)});
    }
};

TEST_F(ResultStoreTest, StartsEmpty) {
    EXPECT_TRUE(store_.empty());
    EXPECT_EQ(store_.sampleCount(), 0u);
    EXPECT_TRUE(store_.keys().empty());
    EXPECT_TRUE(store_.snapshot().empty());
    EXPECT_FALSE(store_.summarize("A", 10).has_value());
}

TEST_F(ResultStoreTest, RecordAndQuery) {
    store_.record(sample("B", 10, 1'000'000, true));
    store_.record(sample("A", 20, 2'000'000, true));
    store_.record(sample("A", 10, 3'000'000, false));
    store_.record(sample("A", 10, 4'000'000, true));
    store_.record(sample("A", 10, 5'000'000, true));

    EXPECT_EQ(store_.sampleCount(), 5u);
    EXPECT_FALSE(store_.empty());

    auto keys = store_.keys();
    ASSERT_EQ(keys.size(), 4u);
    EXPECT_EQ(keys[0], (ResultKey{"A", 10, false}));
    EXPECT_EQ(keys[1], (ResultKey{"A", 10, true}));
    EXPECT_EQ(keys[2], (ResultKey{"A", 20, true}));
    EXPECT_EQ(keys[3], (ResultKey{"B", 10, true}));

    auto a = store_.query("A");
    ASSERT_EQ(a.size(), 4u);
    EXPECT_EQ(a[0].elapsedNanos(), 3'000'000);     // (A,10,false)
    EXPECT_EQ(a[1].elapsedNanos(), 4'000'000);     // (A,10,true), insertion order
    EXPECT_EQ(a[2].elapsedNanos(), 5'000'000);
    EXPECT_EQ(a[3].elapsedNanos(), 2'000'000);     // (A,20,true)

    EXPECT_EQ(store_.query(ResultKey{"A", 10, true}).size(), 2u);
    EXPECT_TRUE(store_.query(ResultKey{"A", 30, true}).empty());
    EXPECT_TRUE(store_.query("C").empty());
}

TEST_F(ResultStoreTest, RecordAllGroupsByKey) {
    std::vector<PerformanceSample> batch = {
        sample("A", 10, 1, true),
        sample("A", 10, 2, true),
        sample("A", 20, 3, true),
        sample("A", 10, 4, true),
    };
    store_.recordAll(batch);

    auto bucket = store_.query(ResultKey{"A", 10, true});
    ASSERT_EQ(bucket.size(), 3u);
    EXPECT_EQ(bucket[0].elapsedNanos(), 1);
    EXPECT_EQ(bucket[1].elapsedNanos(), 2);
    EXPECT_EQ(bucket[2].elapsedNanos(), 4);
    EXPECT_EQ(store_.sampleCount(), 4u);

    store_.recordAll({});
    EXPECT_EQ(store_.sampleCount(), 4u);
}

TEST_F(ResultStoreTest, RecordAllUnderExplicitKey) {
    store_.recordAll(ResultKey{"A", 10, false}, {sample("A", 10, 1, true), sample("A", 10, 2, false)});

    EXPECT_EQ(store_.query(ResultKey{"A", 10, false}).size(), 2u);
    EXPECT_TRUE(store_.query(ResultKey{"A", 10, true}).empty());

    // the CSV keeps the flag reported by each sample
    const std::string csv = store_.exportCsv();
    EXPECT_NE(csv.find("A,10,0.000001,10,22,1,true,"), std::string::npos) << csv;
    EXPECT_NE(csv.find("A,10,0.000002,10,22,1,false,"), std::string::npos) << csv;
}

TEST_F(ResultStoreTest, SummarizeMergesMajorityFlags) {
    store_.record(sample("A", 10, 1'000'000, true));
    store_.record(sample("A", 10, 3'000'000, false));
    store_.record(sample("A", 20, 9'000'000, true));

    auto summary = store_.summarize("A", 10);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->runCount(), 2u);
    EXPECT_DOUBLE_EQ(summary->avgTimeMs(), 2.0);
    EXPECT_DOUBLE_EQ(summary->minTimeMs(), 1.0);
    EXPECT_DOUBLE_EQ(summary->maxTimeMs(), 3.0);

    EXPECT_FALSE(store_.summarize("A", 30).has_value());
    EXPECT_FALSE(store_.summarize("B", 10).has_value());
}

TEST_F(ResultStoreTest, ClearRemovesEverything) {
    store_.record(sample("A", 10, 1, true));
    store_.record(sample("B", 10, 1, true));
    store_.clear();

    EXPECT_TRUE(store_.empty());
    EXPECT_TRUE(store_.keys().empty());
    EXPECT_EQ(store_.exportCsv(), std::string(majvote::CSV_HEADER) + "\n");

    store_.record(sample("A", 10, 1, true));
    EXPECT_EQ(store_.sampleCount(), 1u);
}

// ── Export ──────────────────────────────────────────────────────────

TEST_F(ResultStoreTest, ExportCsvEmpty) {
    EXPECT_EQ(store_.exportCsv(),
              "Algorithm,InputSize,ExecutionTimeMs,Comparisons,ArrayAccesses,MemoryAllocations,HasMajority,Timestamp\n");
}

TEST_F(ResultStoreTest, ExportCsvRows) {
    store_.record(PerformanceSample("Algo", 100, 1'234'567, 150, 202, 1, true,
                                    PerformanceSample::TimePoint{std::chrono::milliseconds(1700000000123)}));
    store_.record(PerformanceSample("Algo", 10, 500, 9, 21, 1, false,
                                    PerformanceSample::TimePoint{std::chrono::milliseconds(1700000000456)}));

    const std::string expected =
        "Algorithm,InputSize,ExecutionTimeMs,Comparisons,ArrayAccesses,MemoryAllocations,HasMajority,Timestamp\n"
        "Algo,10,0.000500,9,21,1,false,1700000000456\n"
        "Algo,100,1.234567,150,202,1,true,1700000000123\n";
    EXPECT_EQ(store_.exportCsv(), expected);

    // exports do not consume the store
    EXPECT_EQ(store_.exportCsv(), expected);
    EXPECT_EQ(store_.sampleCount(), 2u);
}

TEST_F(ResultStoreTest, ExportCsvQuotesAlgorithmName) {
    store_.record(sample("Vote, \"fast\"", 1, 1000, true, 0));
    const std::string csv = store_.exportCsv();
    EXPECT_NE(csv.find("\n\"Vote, \"\"fast\"\"\",1,0.001000,1,4,1,true,0\n"), std::string::npos) << csv;
}

TEST_F(ResultStoreTest, ExportReportEmpty) {
    EXPECT_EQ(store_.exportReport(), "=== Performance Analysis Report ===\n\n");
}

TEST_F(ResultStoreTest, ExportReport) {
    store_.record(sample("A", 100, 2'000'000, true));
    store_.record(sample("A", 10, 1'000'000, true));
    store_.record(sample("A", 10, 3'000'000, false));
    store_.record(sample("B", 5, 1'000'000, true));

    const auto a10  = store_.summarize("A", 10);
    const auto a100 = store_.summarize("A", 100);
    const auto b5   = store_.summarize("B", 5);
    ASSERT_TRUE(a10 && a100 && b5);

    const std::string expected =
        "=== Performance Analysis Report ===\n\n"
        "Algorithm: A\n"
        "Total runs: 3\n"
        "  Input size 10: " + a10->toString() + "\n"
        "  Input size 100: " + a100->toString() + "\n"
        "\n"
        "Algorithm: B\n"
        "Total runs: 1\n"
        "  Input size 5: " + b5->toString() + "\n"
        "\n";
    EXPECT_EQ(store_.exportReport(), expected);
}

// ── Concurrency ─────────────────────────────────────────────────────

TEST_F(ResultStoreTest, ConcurrentAppendsLoseNothing) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                // half the threads share one key, the others spread over new keys
                const int64_t size = (t % 2 == 0) ? 100 : 1000 + (i % 7);
                store_.record(sample("A", size, i, true));
                if (i % 50 == 0) {
                    (void)store_.exportCsv();
                    (void)store_.sampleCount();
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(store_.sampleCount(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(store_.query(ResultKey{"A", 100, true}).size(), static_cast<size_t>(kThreads / 2 * kPerThread));
    EXPECT_EQ(store_.keys().size(), 8u);
}

TEST_F(ResultStoreTest, ConcurrentBatchesStayContiguous) {
    constexpr int kThreads = 4;
    constexpr int kBatch = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t]() {
            std::vector<PerformanceSample> batch;
            for (int i = 0; i < kBatch; ++i) {
                batch.push_back(sample("A", 10, t, true));
            }
            store_.recordAll(batch);
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    auto bucket = store_.query(ResultKey{"A", 10, true});
    ASSERT_EQ(bucket.size(), static_cast<size_t>(kThreads * kBatch));
    for (size_t start = 0; start < bucket.size(); start += kBatch) {
        for (size_t i = start; i < start + kBatch; ++i) {
            EXPECT_EQ(bucket[i].elapsedNanos(), bucket[start].elapsedNanos()) << "i=" << i;
        }
    }
}
