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
 * @file result_store.hpp
 * @brief ResultStore implementations.
 */

#include "result_store.h"
#include "csv_format.h"
#include "definitions.h"
#include "performance_summary.hpp"
#include <iostream>
#include <sstream>
#include <utility>

namespace majvote {

    // ── Recording ───────────────────────────────────────────────────────

    inline void ResultStore::append(const ResultKey& key, std::span<const PerformanceSample> samples) {
        if (samples.empty()) {
            return;
        }
        {
            std::shared_lock mapLock(map_mutex_);
            auto it = buckets_.find(key);
            if (it != buckets_.end()) {
                std::lock_guard bucketLock(it->second->mutex);
                it->second->samples.insert(it->second->samples.end(), samples.begin(), samples.end());
                return;
            }
        }

        // New key: exclusive map lock, no reader can hold a bucket mutex meanwhile
        std::unique_lock mapLock(map_mutex_);
        auto& bucket = buckets_[key];
        if (!bucket) {
            bucket = std::make_unique<Bucket>();
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << "ResultStore: new key " << key.algorithm << "/" << key.input_size
                          << "/" << (key.has_majority ? "true" : "false") << std::endl;
            }
        }
        bucket->samples.insert(bucket->samples.end(), samples.begin(), samples.end());
    }

    inline void ResultStore::record(const PerformanceSample& sample) {
        append(ResultKey::of(sample), std::span<const PerformanceSample>(&sample, 1));
    }

    /// Consecutive samples with the same key are appended as one unit.
    inline void ResultStore::recordAll(const std::vector<PerformanceSample>& samples) {
        size_t begin = 0;
        while (begin < samples.size()) {
            const ResultKey key = ResultKey::of(samples[begin]);
            size_t end = begin + 1;
            while (end < samples.size() && ResultKey::of(samples[end]) == key) {
                ++end;
            }
            append(key, std::span<const PerformanceSample>(samples.data() + begin, end - begin));
            begin = end;
        }
    }

    /// The whole batch is appended under @p key as one unit.
    inline void ResultStore::recordAll(const ResultKey& key, const std::vector<PerformanceSample>& samples) {
        append(key, std::span<const PerformanceSample>(samples.data(), samples.size()));
    }

    inline void ResultStore::clear() {
        std::unique_lock mapLock(map_mutex_);
        buckets_.clear();
    }

    // ── Queries ─────────────────────────────────────────────────────────

    inline std::vector<PerformanceSample> ResultStore::query(const std::string& algorithmName) const {
        std::vector<PerformanceSample> result;
        std::shared_lock mapLock(map_mutex_);
        for (const auto& [key, bucket] : buckets_) {
            if (key.algorithm != algorithmName) {
                continue;
            }
            std::lock_guard bucketLock(bucket->mutex);
            result.insert(result.end(), bucket->samples.begin(), bucket->samples.end());
        }
        return result;
    }

    inline std::vector<PerformanceSample> ResultStore::query(const ResultKey& key) const {
        std::shared_lock mapLock(map_mutex_);
        auto it = buckets_.find(key);
        if (it == buckets_.end()) {
            return {};
        }
        std::lock_guard bucketLock(it->second->mutex);
        return it->second->samples;
    }

    /// Summary over both majority flags of (algorithm, size); nullopt without samples.
    inline std::optional<PerformanceSummary> ResultStore::summarize(const std::string& algorithmName, int64_t inputSize) const {
        std::vector<PerformanceSample> matching;
        for (auto& sample : query(algorithmName)) {
            if (sample.inputSize() == inputSize) {
                matching.push_back(std::move(sample));
            }
        }
        if (matching.empty()) {
            return std::nullopt;
        }
        return PerformanceSummary(algorithmName, inputSize, std::move(matching));
    }

    inline std::vector<PerformanceSample> ResultStore::snapshot() const {
        std::vector<PerformanceSample> result;
        std::shared_lock mapLock(map_mutex_);
        for (const auto& [key, bucket] : buckets_) {
            std::lock_guard bucketLock(bucket->mutex);
            result.insert(result.end(), bucket->samples.begin(), bucket->samples.end());
        }
        return result;
    }

    inline std::vector<ResultKey> ResultStore::keys() const {
        std::vector<ResultKey> result;
        std::shared_lock mapLock(map_mutex_);
        result.reserve(buckets_.size());
        for (const auto& [key, bucket] : buckets_) {
            result.push_back(key);
        }
        return result;
    }

    inline size_t ResultStore::sampleCount() const {
        size_t count = 0;
        std::shared_lock mapLock(map_mutex_);
        for (const auto& [key, bucket] : buckets_) {
            std::lock_guard bucketLock(bucket->mutex);
            count += bucket->samples.size();
        }
        return count;
    }

    // ── Export ──────────────────────────────────────────────────────────

    inline std::string ResultStore::exportCsv() const {
        CsvRowBuffer buf;
        buf.appendLine(CSV_HEADER);
        for (const auto& s : snapshot()) {
            buf.appendString(s.algorithmName());
            buf.appendInteger(s.inputSize());
            buf.appendFixed(s.elapsedMs(), CSV_TIME_PRECISION);
            buf.appendInteger(s.comparisons());
            buf.appendInteger(s.accesses());
            buf.appendInteger(s.allocations());
            buf.appendBool(s.hasMajority());
            buf.appendInteger(s.timestampMs());
            buf.endRow();
        }
        return buf.str();
    }

    inline std::string ResultStore::exportReport() const {
        // algorithm -> size -> samples (both majority flags)
        std::map<std::string, std::map<int64_t, std::vector<PerformanceSample>>> grouped;
        std::map<std::string, size_t> totals;
        for (auto& s : snapshot()) {
            ++totals[s.algorithmName()];
            grouped[s.algorithmName()][s.inputSize()].push_back(std::move(s));
        }

        std::ostringstream oss;
        oss << "=== Performance Analysis Report ===\n\n";
        for (auto& [algorithm, sizes] : grouped) {
            oss << "Algorithm: " << algorithm << "\n";
            oss << "Total runs: " << totals[algorithm] << "\n";
            for (auto& [size, samples] : sizes) {
                PerformanceSummary summary(algorithm, size, std::move(samples));
                oss << "  Input size " << size << ": " << summary << "\n";
            }
            oss << "\n";
        }
        return oss.str();
    }

} // namespace majvote
