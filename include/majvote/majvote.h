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
 * @file majvote.h
 * @brief MAJVOTE Library - Main Header with Declarations
 *
 * A C++20 header-only library around an instrumented Boyer-Moore majority
 * vote, with a benchmarking harness and text/CSV export of the results.
 *
 * This header includes all MAJVOTE component declarations:
 * - Metrics / VoteResult: per-invocation counters and outcome
 * - MajorityVote: the two-pass vote with validation
 * - TestDataGenerator: synthetic sequences and Fisher-Yates shuffle
 * - PerformanceSample / PerformanceSummary: trial records and statistics
 * - ResultStore: thread-safe keyed sample storage with CSV/report export
 * - ResultExporter: writing exports to files
 * - BenchmarkRunner: repeated trials over sizes and configurations
 */

// Core definitions first
#include "definitions.h"

// Component declarations
#include "metrics.h"
#include "vote_result.h"
#include "majority_vote.h"
#include "generator.h"
#include "performance_sample.h"
#include "performance_summary.h"
#include "csv_format.h"
#include "result_store.h"
#include "result_exporter.h"
#include "benchmark_runner.h"

// Include implementations
#include "majority_vote.hpp"
#include "generator.hpp"
#include "performance_summary.hpp"
#include "result_store.hpp"
#include "result_exporter.hpp"
#include "benchmark_runner.hpp"
