#include <iostream>
#include <iomanip>
#include "majvote/majvote.h"

/**
 * MAJVOTE Library Example
 *
 * This example walks through the three layers of the library: a single
 * instrumented vote, a repeated benchmark over several input sizes, and
 * exporting the collected samples as CSV and as a text report.
 */

void singleVote() {
    std::cout << "=== Single Vote ===\n\n";

    // Step 1: Build an input sequence; std::nullopt marks an absent element
    majvote::Sequence votes = {3, 3, 4, 2, 3, 3, 3, 1};

    // Step 2: Optional validation before running the vote
    if (auto err = majvote::MajorityVote<majvote::Value>::validate(votes)) {
        std::cerr << "Invalid input: " << err->message << "\n";
        return;
    }

    // Step 3: Run the vote and inspect the result and its counters
    auto result = majvote::MajorityVote<majvote::Value>::findMajority(votes);
    if (result.hasError()) {
        std::cerr << "Vote failed: " << result.errorMessage() << "\n";
        return;
    }
    std::cout << result << "\n";
    if (result.hasMajority()) {
        std::cout << "Majority element: " << *result.candidate() << "\n";
    }
    std::cout << "Comparisons: " << result.metrics().comparisons()
              << ", accesses: " << result.metrics().accesses() << "\n\n";
}

void sizeSweep(majvote::ResultStore& store) {
    std::cout << "=== Size Sweep ===\n\n";

    // A fixed seed makes the shuffled inputs (and therefore the counters) reproducible
    majvote::BenchmarkRunner runner(store, 2026);

    auto table = runner.runMatrix({1000, 10000, 100000}, true, 5);
    for (const auto& [size, summary] : table) {
        std::cout << std::setw(7) << size << "  " << summary << "\n";
    }

    auto comparison = runner.compareMajorityVsNone({10000}, 5);
    for (const auto& [label, rows] : comparison) {
        std::cout << label << ": avg accesses "
                  << std::fixed << std::setprecision(1) << rows.front().second.avgAccesses() << "\n";
    }
    std::cout << "\n";
}

void exportResults(const majvote::ResultStore& store) {
    std::cout << "=== Export ===\n\n";

    majvote::ResultExporter exporter;
    if (!exporter.writeCsv(store, "example_results.csv", true)) {
        std::cerr << "CSV export failed: " << exporter.getErrorMsg() << "\n";
        return;
    }
    if (!exporter.writeReport(store, "example_report.txt", true)) {
        std::cerr << "Report export failed: " << exporter.getErrorMsg() << "\n";
        return;
    }
    std::cout << "Wrote " << store.sampleCount() << " samples to example_results.csv and example_report.txt\n";
}

int main() {
    std::cout << "MAJVOTE Library Example (version " << majvote::getVersion() << ")\n\n";

    singleVote();

    majvote::ResultStore store;
    sizeSweep(store);
    exportResults(store);

    return 0;
}
