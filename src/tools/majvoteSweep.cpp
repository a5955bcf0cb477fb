/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the MAJVOTE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file majvoteSweep.cpp
 * @brief CLI tool to run a non-interactive majority-vote size sweep
 *
 * Runs N trials per input size, prints one summary line per size and
 * optionally writes the raw samples (CSV) and the grouped report to files.
 *
 * Default: quick benchmark sizes (100 .. 100000), 10 runs, with majority.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <majvote/majvote.h>
#include "cli_common.h"

// ── Configuration ───────────────────────────────────────────────────

struct Config {
    std::vector<int64_t>    sizes;
    size_t                  runs            = majvote::QUICK_BENCHMARK_RUNS;
    bool                    majority        = true;
    bool                    compare         = false;    // run with and without majority
    size_t                  jobs            = 1;        // worker threads for independent sizes
    std::optional<uint64_t> seed;

    std::string             output_file;                // CSV
    std::string             report_file;

    // Flags
    bool                    overwrite       = false;
    bool                    verbose         = false;
    bool                    help            = false;
};

// ── Usage ───────────────────────────────────────────────────────────

static void printUsage(const char* prog) {
    std::cout
        << "Usage: " << prog
        << " [OPTIONS]\n\n"

        << "Run repeated majority-vote trials over a list of input sizes.\n\n"

        << "Sweep:\n"
        << "  -s, --sizes LIST         Comma-separated sizes (default: 100,1000,10000,100000)\n"
        << "  --range MIN:MAX:STEP     Sizes from MIN to MAX in steps of STEP\n"
        << "  -r, --runs N             Trials per size (default: 10)\n"
        << "  --no-majority            Generate inputs without a majority element\n"
        << "  --compare                Run with and without majority element\n"
        << "  -j, --jobs N             Worker threads for independent sizes (default: 1, 0 = all cores)\n"
        << "  --seed N                 Seed the shuffle engine for reproducible inputs\n\n"

        << "Output:\n"
        << "  -o, --output FILE        Write all samples as CSV\n"
        << "  --report FILE            Write the grouped text report\n"
        << "  -f, --overwrite          Overwrite output files if they exist\n\n"

        << "General:\n"
        << "  -v, --verbose            Verbose progress output\n"
        << "  -h, --help               Show this help message\n\n"

        << "Examples:\n"
        << "  " << prog << "\n"
        << "  " << prog << " -s 1000,5000 -r 50 -o results.csv\n"
        << "  " << prog << " --range 1000:10000:1000 --no-majority --report report.txt\n"
        << "  " << prog << " --compare -j 4 --seed 42\n";
}

// ── Argument parsing ────────────────────────────────────────────────

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            cfg.help = true;
            return cfg;
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "-f" || arg == "--overwrite") {
            cfg.overwrite = true;
        } else if (arg == "--no-majority") {
            cfg.majority = false;
        } else if (arg == "--compare") {
            cfg.compare = true;
        } else if ((arg == "-s" || arg == "--sizes") && i + 1 < argc) {
            cfg.sizes = majvote_cli::parseSizeList(argv[++i]);
        } else if (arg == "--range" && i + 1 < argc) {
            cfg.sizes = majvote_cli::parseRange(argv[++i]);
        } else if ((arg == "-r" || arg == "--runs") && i + 1 < argc) {
            cfg.runs = majvote_cli::parseCount(argv[++i], "run count");
            if (cfg.runs == 0) {
                throw std::runtime_error("Run count must be positive.");
            }
        } else if ((arg == "-j" || arg == "--jobs") && i + 1 < argc) {
            cfg.jobs = majvote_cli::parseCount(argv[++i], "job count");
        } else if (arg == "--seed" && i + 1 < argc) {
            cfg.seed = majvote_cli::parseInteger<uint64_t>(argv[++i], "seed");
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            cfg.output_file = argv[++i];
        } else if (arg == "--report" && i + 1 < argc) {
            cfg.report_file = argv[++i];
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (cfg.sizes.empty()) {
        cfg.sizes.assign(majvote::QUICK_BENCHMARK_SIZES.begin(), majvote::QUICK_BENCHMARK_SIZES.end());
    }
    return cfg;
}

// ── Main ────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.help) {
            printUsage(argv[0]);
            return 0;
        }

        // ── Validate output paths ───────────────────────────────────
        for (const auto& path : {cfg.output_file, cfg.report_file}) {
            if (!path.empty() && !cfg.overwrite && std::filesystem::exists(path)) {
                std::cerr << "Error: Output file already exists: " << path
                          << "\n       Use -f / --overwrite to replace.\n";
                return 1;
            }
        }

        majvote::ResultStore store;
        majvote::BenchmarkRunner runner = cfg.seed ? majvote::BenchmarkRunner(store, *cfg.seed)
                                                   : majvote::BenchmarkRunner(store);

        if (cfg.verbose) {
            std::cerr << "Sizes:   " << majvote_cli::formatSizes(cfg.sizes) << "\n";
            std::cerr << "Runs:    " << cfg.runs << " per size\n";
            std::cerr << "Inputs:  " << (cfg.compare ? "with and without majority"
                                                     : (cfg.majority ? "with majority" : "without majority")) << "\n";
            std::cerr << "Jobs:    " << cfg.jobs << "\n";
        }

        // ── Sweep ───────────────────────────────────────────────────
        auto start_time = std::chrono::steady_clock::now();

        auto sweep = [&](bool majority) {
            return majvote_cli::runSweep(runner, cfg.sizes, majority, cfg.runs, cfg.jobs,
                                         cfg.verbose ? &std::cerr : nullptr);
        };

        if (cfg.compare) {
            std::cout << "\n" << majvote::WITH_MAJORITY_KEY << ":\n";
            majvote_cli::printSummaryTable(sweep(true), std::cout, "  ");
            std::cout << "\n" << majvote::WITHOUT_MAJORITY_KEY << ":\n";
            majvote_cli::printSummaryTable(sweep(false), std::cout, "  ");
        } else {
            majvote_cli::printSummaryTable(sweep(cfg.majority), std::cout);
        }

        auto end_time = std::chrono::steady_clock::now();
        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               end_time - start_time).count();

        // ── Export ──────────────────────────────────────────────────
        majvote::ResultExporter exporter;
        if (!cfg.output_file.empty() && !exporter.writeCsv(store, cfg.output_file, cfg.overwrite)) {
            std::cerr << exporter.getErrorMsg() << "\n";
            return 1;
        }
        if (!cfg.report_file.empty() && !exporter.writeReport(store, cfg.report_file, cfg.overwrite)) {
            std::cerr << exporter.getErrorMsg() << "\n";
            return 1;
        }

        // ── Summary ─────────────────────────────────────────────────
        std::cerr << "\n=== majvoteSweep Summary ===\n"
                  << "  Sizes:        " << cfg.sizes.size() << "\n"
                  << "  Samples:      " << store.sampleCount() << "\n"
                  << "  Wall time:    " << duration_ms << " ms\n";
        if (!cfg.output_file.empty()) {
            std::cerr << "  CSV:          " << cfg.output_file << "\n";
        }
        if (!cfg.report_file.empty()) {
            std::cerr << "  Report:       " << cfg.report_file << "\n";
        }

        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
