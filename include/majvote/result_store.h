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
 * @file result_store.h
 * @brief ResultStore — thread-safe, append-only store of benchmark samples.
 *
 * Samples are grouped under ResultKey (algorithm, input size, majority flag).
 * record() derives the key from the sample; a batch can also be filed under
 * an explicit key, e.g. the requested majority configuration of a run.
 * The key map is guarded by a shared mutex, each bucket by its own mutex:
 *   - appends to the same key are serialized and never lose samples
 *   - appends to different keys only share the (shared) map lock
 *   - creating a new key or clear() takes the map lock exclusively
 *
 * Iteration order of all queries and exports is the key order
 * (algorithm, size ascending, false < true), then insertion order.
 */

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

#include "performance_sample.h"
#include "performance_summary.h"

namespace majvote {

    struct ResultKey {
        std::string algorithm;
        int64_t     input_size      = 0;
        bool        has_majority    = false;

        static ResultKey of(const PerformanceSample& sample) {
            return {sample.algorithmName(), sample.inputSize(), sample.hasMajority()};
        }

        auto operator<=>(const ResultKey& other) const = default;
    };

    class ResultStore {
        struct Bucket {
            std::mutex                      mutex;
            std::vector<PerformanceSample>  samples;
        };

        mutable std::shared_mutex                       map_mutex_;
        std::map<ResultKey, std::unique_ptr<Bucket>>    buckets_;

        void                            append(const ResultKey& key, std::span<const PerformanceSample> samples);

    public:
        ResultStore() = default;
        ResultStore(const ResultStore&) = delete;
        ResultStore& operator=(const ResultStore&) = delete;

        void                            record(const PerformanceSample& sample);
        void                            recordAll(const std::vector<PerformanceSample>& samples);
        void                            recordAll(const ResultKey& key, const std::vector<PerformanceSample>& samples);

        std::vector<PerformanceSample>  query(const std::string& algorithmName) const;
        std::vector<PerformanceSample>  query(const ResultKey& key) const;
        std::optional<PerformanceSummary> summarize(const std::string& algorithmName, int64_t inputSize) const;
        std::vector<PerformanceSample>  snapshot() const;
        std::vector<ResultKey>          keys() const;

        size_t                          sampleCount() const;
        bool                            empty() const                   { return sampleCount() == 0; }
        void                            clear();

        std::string                     exportCsv() const;
        std::string                     exportReport() const;
    };

} // namespace majvote
