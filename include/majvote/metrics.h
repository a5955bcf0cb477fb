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
 * @file metrics.h
 * @brief Metrics — operation counters and wall-clock timer for one algorithm invocation.
 *
 * A Metrics object is owned by exactly one call of MajorityVote::findMajority()
 * and moved into its VoteResult afterwards. Counters start at zero and only
 * grow until reset() is called.
 */

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

namespace majvote {

    class Metrics {
    public:
        using Clock     = std::chrono::steady_clock;
        using TimePoint = Clock::time_point;

    private:
        uint64_t    comparisons_  = 0;
        uint64_t    accesses_     = 0;
        uint64_t    allocations_  = 0;
        TimePoint   start_{};
        TimePoint   end_{};
        bool        started_      = false;
        bool        stopped_      = false;

    public:
        void        incrementComparisons()              { ++comparisons_; }
        void        incrementAccesses()                 { ++accesses_; }
        void        incrementAllocations()              { ++allocations_; }

        void        startTimer()                        { start_ = Clock::now(); started_ = true; stopped_ = false; }
        void        stopTimer()                         { end_ = Clock::now(); stopped_ = true; }

        uint64_t    comparisons() const                 { return comparisons_; }
        uint64_t    accesses() const                    { return accesses_; }
        uint64_t    allocations() const                 { return allocations_; }
        bool        isTimed() const                     { return started_ && stopped_; }

        /// Elapsed time between startTimer() and stopTimer(), 0 while the timer has not completed.
        int64_t elapsedNanos() const {
            if (!isTimed()) {
                return 0;
            }
            return std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_).count();
        }

        double elapsedMs() const {
            return static_cast<double>(elapsedNanos()) / 1'000'000.0;
        }

        void reset() {
            comparisons_ = 0;
            accesses_    = 0;
            allocations_ = 0;
            start_       = TimePoint{};
            end_         = TimePoint{};
            started_     = false;
            stopped_     = false;
        }

        std::string toString() const {
            std::ostringstream oss;
            oss << "Metrics{comparisons=" << comparisons_
                << ", arrayAccesses=" << accesses_
                << ", memoryAllocations=" << allocations_
                << ", executionTime=" << std::fixed << std::setprecision(3) << elapsedMs() << " ms}";
            return oss.str();
        }
    };

    inline std::ostream& operator<<(std::ostream& os, const Metrics& metrics) {
        return os << metrics.toString();
    }

} // namespace majvote
