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
 * @file performance_summary.hpp
 * @brief PerformanceSummary implementations.
 */

#include "performance_summary.h"
#include "definitions.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace majvote {

    inline PerformanceSummary::PerformanceSummary(std::string algorithmName, int64_t inputSize,
                                                  std::vector<PerformanceSample> samples)
        : algorithm_name_(std::move(algorithmName))
        , input_size_(inputSize)
        , samples_(std::move(samples))
    {
        if (samples_.empty()) {
            throw std::invalid_argument("PerformanceSummary requires at least one sample ("
                                        + algorithm_name_ + ", size " + std::to_string(input_size_) + ")");
        }
        for (const auto& s : samples_) {
            if (s.inputSize() != input_size_ || s.algorithmName() != algorithm_name_) {
                throw std::invalid_argument("PerformanceSummary: sample '" + s.algorithmName()
                                            + "' size " + std::to_string(s.inputSize())
                                            + " does not belong to '" + algorithm_name_
                                            + "' size " + std::to_string(input_size_));
            }
        }
        compute();
    }

    inline void PerformanceSummary::compute() {
        const double n = static_cast<double>(samples_.size());

        double sumTime = 0.0;
        double sumComparisons = 0.0;
        double sumAccesses = 0.0;
        double sumAllocations = 0.0;
        min_time_ms_ = samples_.front().elapsedMs();
        max_time_ms_ = min_time_ms_;

        for (const auto& s : samples_) {
            const double t = s.elapsedMs();
            sumTime += t;
            min_time_ms_ = std::min(min_time_ms_, t);
            max_time_ms_ = std::max(max_time_ms_, t);
            sumComparisons += static_cast<double>(s.comparisons());
            sumAccesses    += static_cast<double>(s.accesses());
            sumAllocations += static_cast<double>(s.allocations());
        }

        avg_time_ms_     = sumTime / n;
        avg_comparisons_ = sumComparisons / n;
        avg_accesses_    = sumAccesses / n;
        avg_allocations_ = sumAllocations / n;

        double sqDiff = 0.0;
        for (const auto& s : samples_) {
            const double d = s.elapsedMs() - avg_time_ms_;
            sqDiff += d * d;
        }
        stddev_time_ms_ = std::sqrt(sqDiff / n);
    }

    inline std::string PerformanceSummary::toString() const {
        std::ostringstream oss;
        oss << algorithm_name_ << ": size=" << input_size_ << ", runs=" << runCount()
            << std::fixed << std::setprecision(SUMMARY_TIME_PRECISION)
            << ", avgTime=" << avg_time_ms_ << "\xc2\xb1" << stddev_time_ms_ << " ms"   // UTF-8 ±
            << ", min=" << min_time_ms_ << " ms"
            << ", max=" << max_time_ms_ << " ms"
            << std::setprecision(SUMMARY_COUNT_PRECISION)
            << ", avgComparisons=" << avg_comparisons_
            << ", avgAccesses=" << avg_accesses_
            << ", avgAllocations=" << avg_allocations_;
        return oss.str();
    }

    inline std::ostream& operator<<(std::ostream& os, const PerformanceSummary& summary) {
        return os << summary.toString();
    }

} // namespace majvote
