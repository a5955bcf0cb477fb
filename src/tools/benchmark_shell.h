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
 * @file benchmark_shell.h
 * @brief BenchmarkShell — menu-driven console front end for the benchmark harness.
 *
 * Menu (choices 0-9):
 *   1 single test        2 quick benchmark     3 comprehensive benchmark
 *   4 comparison test    5 interactive test    6 display results
 *   7 export results     8 memory statistics   9 stress test
 *   0 exit
 *
 * Input/output streams are injected so the shell can be driven by scripts.
 * Malformed input is reported and the loop continues; end of input exits.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <majvote/majvote.h>
#include "cli_common.h"

namespace majvote_cli {

class BenchmarkShell {
    majvote::ResultStore        store_;
    majvote::BenchmarkRunner    runner_;
    std::istream&               in_;
    std::ostream&               out_;

    using Clock = std::chrono::steady_clock;

    static int64_t elapsedMs(Clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    }

    /// Prompt and read one line. Throws on end of input so the menu loop can stop.
    std::string ask(const std::string& prompt) {
        out_ << prompt << std::flush;
        std::string line;
        if (!std::getline(in_, line)) {
            throw EndOfInput();
        }
        return trim(line);
    }

    struct EndOfInput {};

public:
    explicit BenchmarkShell(std::istream& in = std::cin, std::ostream& out = std::cout)
        : runner_(store_)
        , in_(in)
        , out_(out)
    {}

    BenchmarkShell(std::istream& in, std::ostream& out, uint64_t seed)
        : runner_(store_, seed)
        , in_(in)
        , out_(out)
    {}

    majvote::ResultStore&       store()         { return store_; }
    majvote::BenchmarkRunner&   runner()        { return runner_; }

    // ── Main loop ───────────────────────────────────────────────────

    void run() {
        out_ << "=== Boyer-Moore Majority Vote Algorithm Benchmark Runner ===\n\n";

        try {
            while (true) {
                displayMenu();
                std::string choice = ask("Enter your choice: ");

                if (choice == "0") {
                    out_ << "Goodbye!\n";
                    return;
                }

                try {
                    if      (choice == "1") runSingleTest();
                    else if (choice == "2") runQuickBenchmark();
                    else if (choice == "3") runComprehensiveBenchmark();
                    else if (choice == "4") runComparisonTest();
                    else if (choice == "5") runInteractiveTest();
                    else if (choice == "6") displayResults();
                    else if (choice == "7") exportResults();
                    else if (choice == "8") displayMemoryStats();
                    else if (choice == "9") runStressTest();
                    else out_ << "Invalid choice. Please try again.\n";
                } catch (const std::exception& ex) {
                    out_ << "Error: " << ex.what() << "\n";
                    out_ << "Please try again.\n";
                }

                ask("\nPress Enter to continue...");
            }
        } catch (const EndOfInput&) {
            out_ << "\n";
        }
    }

    void displayMenu() {
        out_ << "\n=== Main Menu ===\n"
             << "1. Run Single Test\n"
             << "2. Quick Benchmark\n"
             << "3. Comprehensive Benchmark\n"
             << "4. Comparison Test (Majority vs No Majority)\n"
             << "5. Interactive Test\n"
             << "6. Display Results\n"
             << "7. Export Results\n"
             << "8. Memory Statistics\n"
             << "9. Stress Test\n"
             << "0. Exit\n";
    }

    // ── Menu actions ────────────────────────────────────────────────

    void runSingleTest() {
        out_ << "\n=== Single Test ===\n";
        int64_t size = parseInteger<int64_t>(ask("Enter array size: "), "array size");
        bool majority = isYes(ask("Should array have majority element? (y/n): "));
        size_t runs = parseCount(ask("Number of runs: "), "number of runs");

        out_ << "\nRunning test...\n";
        auto start = Clock::now();
        auto samples = runner_.runTrials(size, majority, runs);
        out_ << "Test completed in " << elapsedMs(start) << " ms\n";
        out_ << "Results for " << samples.size() << " runs:\n";

        if (!samples.empty()) {
            out_ << majvote::PerformanceSummary(runner_.algorithmName(), size, std::move(samples)) << "\n";
        }
    }

    void runQuickBenchmark() {
        out_ << "\n=== Quick Benchmark ===\n";
        std::vector<int64_t> sizes(majvote::QUICK_BENCHMARK_SIZES.begin(), majvote::QUICK_BENCHMARK_SIZES.end());
        const size_t runs = majvote::QUICK_BENCHMARK_RUNS;

        out_ << "Running quick benchmark with sizes: " << formatSizes(sizes) << "\n";
        out_ << "Runs per size: " << runs << "\n\n";

        auto start = Clock::now();
        auto table = runner_.runMatrix(sizes, true, runs);
        out_ << "Benchmark completed in " << elapsedMs(start) << " ms\n";
        out_ << "\nResults:\n";
        printSummaryTable(table, out_);
    }

    void runComprehensiveBenchmark() {
        out_ << "\n=== Comprehensive Benchmark ===\n";
        int64_t minSize = parseInteger<int64_t>(ask("Enter minimum size: "), "minimum size");
        int64_t maxSize = parseInteger<int64_t>(ask("Enter maximum size: "), "maximum size");
        int64_t step    = parseInteger<int64_t>(ask("Enter step size: "), "step size");
        size_t runs     = parseCount(ask("Runs per size: "), "runs per size");
        bool majority   = isYes(ask("Should arrays have majority elements? (y/n): "));

        auto sizes = rangeSizes(minSize, maxSize, step);

        out_ << "Running comprehensive benchmark...\n";
        out_ << "Sizes: " << formatSizes(sizes) << "\n";
        out_ << "Runs per size: " << runs << "\n\n";

        auto start = Clock::now();
        auto table = runner_.runMatrix(sizes, majority, runs);
        out_ << "Benchmark completed in " << elapsedMs(start) << " ms\n";
        out_ << "\nResults:\n";
        printSummaryTable(table, out_);
    }

    void runComparisonTest() {
        out_ << "\n=== Comparison Test ===\n";
        auto sizes = parseSizeList(ask("Enter array sizes (comma-separated): "));
        size_t runs = parseCount(ask("Runs per configuration: "), "runs per configuration");

        out_ << "Running comparison test...\n";
        out_ << "Sizes: " << formatSizes(sizes) << "\n";
        out_ << "Runs per configuration: " << runs << "\n\n";

        auto start = Clock::now();
        auto comparison = runner_.compareMajorityVsNone(sizes, runs);
        out_ << "Comparison completed in " << elapsedMs(start) << " ms\n";
        out_ << "\nResults:\n";

        for (const auto& [label, table] : comparison) {
            out_ << "\n" << label << ":\n";
            printSummaryTable(table, out_, "  ");
        }
    }

    /// validate → find_majority on user-typed arrays until "quit".
    void runInteractiveTest() {
        out_ << "\n=== Interactive Test ===\n";
        while (true) {
            std::string input = ask("Enter array elements (comma-separated, or 'quit' to exit): ");
            if (toLower(input) == "quit") {
                break;
            }

            majvote::Sequence seq;
            try {
                seq = parseElements(input);
            } catch (const std::runtime_error&) {
                out_ << "Invalid input. Please enter comma-separated integers.\n";
                continue;
            }

            out_ << "Array: " << formatSequence(seq) << "\n";
            if (auto err = majvote::MajorityVote<majvote::Value>::validate(seq)) {
                out_ << "Warning: " << err->message << "\n";
            }

            auto result = majvote::MajorityVote<majvote::Value>::findMajority(seq);
            if (result.hasError()) {
                out_ << "Error: " << result.errorMessage() << "\n";
            } else {
                out_ << "Result: " << result << "\n";
            }
        }
    }

    void displayResults() {
        out_ << "\n=== Stored Results ===\n";
        if (store_.empty()) {
            out_ << "No results stored.\n";
            return;
        }
        out_ << store_.exportReport() << "\n";
    }

    void exportResults() {
        out_ << "\n=== Export Results ===\n";
        std::string name = ask("Enter filename (without extension): ");
        if (name.empty()) {
            auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            name = "benchmark_results_" + std::to_string(now);
        }

        const std::filesystem::path csvPath    = name + ".csv";
        const std::filesystem::path reportPath = name + ".txt";

        bool overwrite = false;
        if (std::filesystem::exists(csvPath) || std::filesystem::exists(reportPath)) {
            overwrite = isYes(ask("Files exist. Overwrite? (y/n): "));
        }

        majvote::ResultExporter exporter;
        if (!exporter.writeCsv(store_, csvPath, overwrite)) {
            out_ << "Error exporting results: " << exporter.getErrorMsg() << "\n";
            return;
        }
        if (!exporter.writeReport(store_, reportPath, overwrite)) {
            out_ << "Error exporting results: " << exporter.getErrorMsg() << "\n";
            return;
        }
        out_ << "Results exported to " << csvPath.string() << " and " << reportPath.string()
             << " (" << store_.sampleCount() << " samples)\n";
    }

    void displayMemoryStats() {
        out_ << "\n=== Memory Statistics ===\n";
        out_ << memoryUsageStats() << "\n";
    }

    void runStressTest() {
        out_ << "\n=== Stress Test ===\n";
        int64_t maxSize = parseInteger<int64_t>(ask("Enter maximum array size for stress test: "), "maximum array size");
        size_t runs = parseCount(ask("Number of test runs: "), "number of test runs");

        std::vector<int64_t> sizes = {maxSize / 10, maxSize / 5, maxSize / 2, maxSize};
        out_ << "Running stress test with sizes: " << formatSizes(sizes) << "\n";
        out_ << "Runs per size: " << runs << "\n\n";

        auto start = Clock::now();
        for (int64_t size : sizes) {
            out_ << "Testing size " << size << "...\n";
            auto samples = runner_.runTrials(size, true, runs);
            if (!samples.empty()) {
                out_ << majvote::PerformanceSummary(runner_.algorithmName(), size, std::move(samples)) << "\n";
            }
        }
        out_ << "Stress test completed in " << elapsedMs(start) << " ms\n";
    }

    /// Fixed example arrays followed by a short benchmark.
    void runDemo() {
        out_ << "=== Running Demo ===\n";

        const majvote::Sequence basic = {1, 1, 2, 1, 3, 1, 4};
        out_ << "\n1. Basic Functionality Test:\n";
        out_ << "Array: " << formatSequence(basic) << "\n";
        out_ << "Result: " << majvote::MajorityVote<majvote::Value>::findMajority(basic) << "\n";

        const majvote::Sequence none = {1, 2, 3, 4, 5};
        out_ << "\n2. No Majority Test:\n";
        out_ << "Array: " << formatSequence(none) << "\n";
        out_ << "Result: " << majvote::MajorityVote<majvote::Value>::findMajority(none) << "\n";

        out_ << "\n3. Performance Test:\n";
        for (int64_t size : majvote::DEMO_BENCHMARK_SIZES) {
            auto samples = runner_.runTrials(size, true, majvote::DEMO_BENCHMARK_RUNS);
            if (!samples.empty()) {
                out_ << majvote::PerformanceSummary(runner_.algorithmName(), size, std::move(samples)) << "\n";
            }
        }
    }
};

} // namespace majvote_cli
