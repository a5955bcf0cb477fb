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
 * @file performance_summary.h
 * @brief PerformanceSummary — read-only statistics over a batch of samples.
 *
 * All samples must share algorithm name and input size, and the batch must
 * not be empty; otherwise construction throws std::invalid_argument.
 * Times are in milliseconds; the standard deviation is the population one.
 *
 * Rendering (toString / operator<<):
 *   NAME: size=N, runs=K, avgTime=A±S ms, min=X ms, max=Y ms,
 *   avgComparisons=C, avgAccesses=R, avgAllocations=M
 */

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "performance_sample.h"

namespace majvote {

    class PerformanceSummary {
        std::string                     algorithm_name_;
        int64_t                         input_size_         = 0;
        std::vector<PerformanceSample>  samples_;

        double                          avg_time_ms_        = 0.0;
        double                          min_time_ms_        = 0.0;
        double                          max_time_ms_        = 0.0;
        double                          stddev_time_ms_     = 0.0;
        double                          avg_comparisons_    = 0.0;
        double                          avg_accesses_       = 0.0;
        double                          avg_allocations_    = 0.0;

        void                            compute();

    public:
        PerformanceSummary(std::string algorithmName, int64_t inputSize, std::vector<PerformanceSample> samples);

        const std::string&              algorithmName() const       { return algorithm_name_; }
        int64_t                         inputSize() const           { return input_size_; }
        size_t                          runCount() const            { return samples_.size(); }
        const std::vector<PerformanceSample>& samples() const       { return samples_; }

        double                          avgTimeMs() const           { return avg_time_ms_; }
        double                          minTimeMs() const           { return min_time_ms_; }
        double                          maxTimeMs() const           { return max_time_ms_; }
        double                          stddevTimeMs() const        { return stddev_time_ms_; }
        double                          avgComparisons() const      { return avg_comparisons_; }
        double                          avgAccesses() const         { return avg_accesses_; }
        double                          avgAllocations() const      { return avg_allocations_; }

        std::string                     toString() const;
    };

} // namespace majvote
