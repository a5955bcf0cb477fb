/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the MAJVOTE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the MAJVOTE library */
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace majvote {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

    // Diagnostic output to std::cerr (CMake option MAJVOTE_DEBUG_OUTPUTS)
#ifdef MAJVOTE_DEBUG_OUTPUTS
    constexpr bool DEBUG_OUTPUTS = true;
#else
    constexpr bool DEBUG_OUTPUTS = false;
#endif

    // Element model: integer values, each position may be absent (null)
    using Value    = int32_t;
    using Element  = std::optional<Value>;
    using Sequence = std::vector<Element>;

    // Algorithm identification (used as store key and in CSV/report output)
    inline constexpr const char* ALGORITHM_NAME = "BoyerMooreMajorityVote";

    // Test data generation
    constexpr Value MAJORITY_SENTINEL   = 1;   // value filling the majority positions
    constexpr Value FIRST_FILLER_VALUE  = 2;   // first of the distinct non-majority values

    // Text output
    inline constexpr const char* CSV_HEADER =
        "Algorithm,InputSize,ExecutionTimeMs,Comparisons,ArrayAccesses,MemoryAllocations,HasMajority,Timestamp";
    constexpr int CSV_TIME_PRECISION     = 6;  // ExecutionTimeMs decimals
    constexpr int SUMMARY_TIME_PRECISION = 3;  // ms values in summaries
    constexpr int SUMMARY_COUNT_PRECISION= 1;  // averaged counters in summaries

    // Keys of compareMajorityVsNone()
    inline constexpr const char* WITH_MAJORITY_KEY    = "with_majority";
    inline constexpr const char* WITHOUT_MAJORITY_KEY = "without_majority";

    // Tool defaults
    inline constexpr std::array<int64_t, 4> QUICK_BENCHMARK_SIZES = {100, 1000, 10000, 100000};
    constexpr size_t QUICK_BENCHMARK_RUNS = 10;
    inline constexpr std::array<int64_t, 3> DEMO_BENCHMARK_SIZES  = {1000, 10000, 100000};
    constexpr size_t DEMO_BENCHMARK_RUNS  = 5;

} // namespace majvote
