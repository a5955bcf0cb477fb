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
 * @file performance_sample.h
 * @brief PerformanceSample — immutable record of one benchmark trial.
 */

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include "metrics.h"

namespace majvote {

    class PerformanceSample {
    public:
        using SystemClock = std::chrono::system_clock;
        using TimePoint   = SystemClock::time_point;

    private:
        std::string     algorithm_name_;
        int64_t         input_size_     = 0;
        int64_t         elapsed_nanos_  = 0;
        uint64_t        comparisons_    = 0;
        uint64_t        accesses_       = 0;
        uint64_t        allocations_    = 0;
        bool            has_majority_   = false;
        TimePoint       created_at_{};

    public:
        PerformanceSample(std::string algorithmName, int64_t inputSize, int64_t elapsedNanos,
                          uint64_t comparisons, uint64_t accesses, uint64_t allocations,
                          bool hasMajority, TimePoint createdAt = SystemClock::now())
            : algorithm_name_(std::move(algorithmName))
            , input_size_(inputSize)
            , elapsed_nanos_(elapsedNanos)
            , comparisons_(comparisons)
            , accesses_(accesses)
            , allocations_(allocations)
            , has_majority_(hasMajority)
            , created_at_(createdAt)
        {}

        /// Build a sample from the metrics of a finished vote.
        static PerformanceSample fromMetrics(std::string algorithmName, int64_t inputSize,
                                             const Metrics& metrics, bool hasMajority) {
            return PerformanceSample(std::move(algorithmName), inputSize, metrics.elapsedNanos(),
                                     metrics.comparisons(), metrics.accesses(), metrics.allocations(),
                                     hasMajority);
        }

        const std::string&  algorithmName() const   { return algorithm_name_; }
        int64_t             inputSize() const       { return input_size_; }
        int64_t             elapsedNanos() const    { return elapsed_nanos_; }
        double              elapsedMs() const       { return static_cast<double>(elapsed_nanos_) / 1'000'000.0; }
        uint64_t            comparisons() const     { return comparisons_; }
        uint64_t            accesses() const        { return accesses_; }
        uint64_t            allocations() const     { return allocations_; }
        bool                hasMajority() const     { return has_majority_; }
        TimePoint           createdAt() const       { return created_at_; }

        /// Creation time as milliseconds since the Unix epoch (CSV Timestamp column).
        int64_t timestampMs() const {
            return std::chrono::duration_cast<std::chrono::milliseconds>(created_at_.time_since_epoch()).count();
        }

        std::string toString() const {
            std::ostringstream oss;
            oss << "PerformanceResult{size=" << input_size_
                << ", time=" << std::fixed << std::setprecision(3) << elapsedMs() << " ms"
                << ", comparisons=" << comparisons_
                << ", accesses=" << accesses_
                << ", allocations=" << allocations_
                << ", hasMajority=" << (has_majority_ ? "true" : "false")
                << ", algorithm='" << algorithm_name_ << "'}";
            return oss.str();
        }
    };

    inline std::ostream& operator<<(std::ostream& os, const PerformanceSample& sample) {
        return os << sample.toString();
    }

} // namespace majvote
