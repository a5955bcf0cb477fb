/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the MAJVOTE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file majvote.cpp
 * @brief Entry point: demo, interactive benchmark shell, basic checks, quick benchmark
 *
 * Usage: majvote [demo|cli|test|benchmark|help]
 * Without a command a small chooser menu is shown.
 */

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <stdexcept>
#include <majvote/majvote.h>
#include "benchmark_shell.h"
#include "cli_common.h"

using Vote = majvote::MajorityVote<majvote::Value>;

// ── Commands ────────────────────────────────────────────────────────

static void printUsage(const char* prog) {
    std::cout
        << "\n=== Help ===\n"
        << "Usage: " << prog << " [command]\n\n"

        << "Commands:\n"
        << "  demo       - Run algorithm demonstration\n"
        << "  cli        - Start interactive CLI interface\n"
        << "  test       - Run basic tests\n"
        << "  benchmark  - Run quick benchmark\n"
        << "  help       - Display this help message\n\n"

        << "If no command is provided, an interactive menu will be displayed.\n\n"

        << "Examples:\n"
        << "  " << prog << " demo\n"
        << "  " << prog << " cli\n"
        << "  " << prog << " test\n";
}

static void showExample(const std::string& title, const majvote::Sequence& seq) {
    std::cout << "\n" << title << "\n";
    std::cout << "Input: " << majvote_cli::formatSequence(seq) << "\n";
    std::cout << "Result: " << Vote::findMajority(seq) << "\n";
}

static void runDemo() {
    std::cout << "\n=== Algorithm Demonstration ===\n";
    showExample("1. Array with majority element:",    {1, 1, 2, 1, 3, 1, 4});
    showExample("2. Array without majority element:", {1, 2, 3, 4, 5});
    showExample("3. Array with negative numbers:",    {-1, -1, -1, 2, 3});
    showExample("4. Edge case - single element:",     {42});
    showExample("5. Edge case - empty array:",        {});
}

static void runCli() {
    std::cout << "\n=== Starting CLI Interface ===\n";
    majvote_cli::BenchmarkShell shell;
    shell.run();
}

static void runBasicTests() {
    std::cout << "\n=== Running Basic Tests ===\n";

    auto describe = [](const std::optional<majvote::VoteError>& err) -> std::string {
        return err ? err->message : "null";
    };

    std::cout << "\n1. Input Validation Tests:\n";
    const majvote::Sequence empty;
    const majvote::Sequence valid = {1, 2, 3};
    std::cout << "Null input: "  << describe(Vote::validate(nullptr)) << "\n";
    std::cout << "Empty input: " << describe(Vote::validate(empty)) << "\n";
    std::cout << "Valid input: " << describe(Vote::validate(valid)) << "\n";

    std::cout << "\n2. Array Generation Tests:\n";
    std::cout << "Array with majority (size 10): "
              << majvote_cli::formatSequence(majvote::TestDataGenerator::generate(10, true)) << "\n";
    std::cout << "Array without majority (size 10): "
              << majvote_cli::formatSequence(majvote::TestDataGenerator::generate(10, false)) << "\n";

    std::cout << "\n3. Performance Tests:\n";
    for (int64_t size : {100, 1000, 10000}) {
        auto seq = majvote::TestDataGenerator::generate(size, true);
        auto result = Vote::findMajority(seq);
        const auto& m = result.metrics();
        std::cout << "Size " << size << ": " << m.comparisons() << " comparisons, "
                  << m.accesses() << " accesses, "
                  << std::fixed << std::setprecision(3) << m.elapsedMs() << " ms\n";
    }
}

static void runQuickBenchmark() {
    std::cout << "\n=== Quick Benchmark ===\n";
    majvote_cli::BenchmarkShell shell;
    shell.runDemo();
}

static void runChooser() {
    std::cout << "Choose an option:\n"
              << "1. Run Demo\n"
              << "2. Start CLI Interface\n"
              << "3. Run Basic Tests\n"
              << "4. Run Quick Benchmark\n"
              << "5. Exit\n"
              << "Enter your choice (1-5): " << std::flush;

    std::string line;
    if (!std::getline(std::cin, line)) {
        return;
    }

    int choice = 0;
    try {
        choice = majvote_cli::parseInteger<int>(line, "choice");
    } catch (const std::runtime_error&) {
        std::cout << "Invalid input. Please run the program again.\n";
        return;
    }

    switch (choice) {
        case 1: runDemo(); break;
        case 2: runCli(); break;
        case 3: runBasicTests(); break;
        case 4: runQuickBenchmark(); break;
        case 5: std::cout << "Goodbye!\n"; break;
        default: std::cout << "Invalid choice. Please run the program again.\n"; break;
    }
}

// ── Main ────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    try {
        std::cout << "=== Boyer-Moore Majority Vote Algorithm Implementation ===\n"
                  << "majvote " << majvote::getVersion() << "\n\n";

        if (argc < 2) {
            runChooser();
            return 0;
        }

        const std::string command = majvote_cli::toLower(argv[1]);
        if (command == "demo") {
            runDemo();
        } else if (command == "cli") {
            runCli();
        } else if (command == "test") {
            runBasicTests();
        } else if (command == "benchmark") {
            runQuickBenchmark();
        } else if (command == "help" || command == "-h" || command == "--help") {
            printUsage(argv[0]);
        } else {
            std::cout << "Unknown command: " << command << "\n";
            printUsage(argv[0]);
            return 1;
        }
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
