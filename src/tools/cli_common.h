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
 * @file cli_common.h
 * @brief Shared utilities for MAJVOTE CLI tools
 *
 * Provides standardised helpers used across all CLI tools:
 *   - trim() / isYes()          — console answer handling
 *   - parseInteger()            — checked string → integer, throws on junk
 *   - parseSizeList()           — "100, 1000,10000" → sizes
 *   - rangeSizes() / parseRange() — MIN:MAX:STEP → sizes
 *   - parseElements()           — "1, 2, null, 4" → Sequence
 *   - formatSequence() / formatSizes() — bracketed lists for output
 *   - formatBytes()             — byte count → "1.23 MB" / "456 KB" / "789 bytes"
 *   - memoryUsageStats()        — process memory line from /proc/self/status
 *   - printSummaryTable()       — one summary per line to any ostream
 *   - runSweep()                — size matrix, sequential or on worker threads
 *
 * Tools opt-in to specific helpers via ordinary #include.
 */

#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <majvote/majvote.h>

namespace majvote_cli {

// ── String helpers ─────────────────────────────────────────────────

inline std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

inline std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

/// "y", "yes", "Y ..." → true
inline bool isYes(const std::string& answer) {
    std::string a = toLower(trim(answer));
    return !a.empty() && a.front() == 'y';
}

inline std::vector<std::string> split(std::string_view s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        parts.push_back(trim(s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start)));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return parts;
}

// ── Number parsing ─────────────────────────────────────────────────

/// Parse a whole string as integer. Throws std::runtime_error naming @p what on failure.
template<typename T = int64_t>
T parseInteger(const std::string& text, const std::string& what) {
    const std::string s = trim(text);
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
        if (ec == std::errc::result_out_of_range) {
            throw std::runtime_error("Value out of range for " + what + ": '" + s + "'");
        }
        throw std::runtime_error("Invalid " + what + ": '" + s + "'");
    }
    return value;
}

/// Parse a non-negative count (runs, sizes).
inline size_t parseCount(const std::string& text, const std::string& what) {
    int64_t v = parseInteger<int64_t>(text, what);
    if (v < 0) {
        throw std::runtime_error(what + " must be non-negative.");
    }
    return static_cast<size_t>(v);
}

/// "100, 1000,10000" → {100, 1000, 10000}
inline std::vector<int64_t> parseSizeList(const std::string& text) {
    std::vector<int64_t> sizes;
    for (const auto& token : split(text, ',')) {
        sizes.push_back(parseInteger<int64_t>(token, "size"));
    }
    return sizes;
}

/// Every size in [minSize, maxSize] reachable from minSize in steps of @p step.
inline std::vector<int64_t> rangeSizes(int64_t minSize, int64_t maxSize, int64_t step) {
    if (step <= 0) {
        throw std::runtime_error("Step size must be positive.");
    }
    if (minSize > maxSize) {
        throw std::runtime_error("Minimum size must not exceed maximum size.");
    }
    std::vector<int64_t> sizes;
    for (int64_t s = minSize; ; s += step) {
        sizes.push_back(s);
        if (maxSize - s < step) {
            break;
        }
    }
    return sizes;
}

/// "MIN:MAX:STEP" → rangeSizes(MIN, MAX, STEP)
inline std::vector<int64_t> parseRange(const std::string& text) {
    auto parts = split(text, ':');
    if (parts.size() != 3) {
        throw std::runtime_error("Invalid range '" + text + "'. Expected MIN:MAX:STEP.");
    }
    return rangeSizes(parseInteger<int64_t>(parts[0], "minimum size"),
                      parseInteger<int64_t>(parts[1], "maximum size"),
                      parseInteger<int64_t>(parts[2], "step size"));
}

/// "1, 2, null, 4" → {1, 2, absent, 4}. Throws on anything else.
inline majvote::Sequence parseElements(const std::string& text) {
    majvote::Sequence seq;
    for (const auto& token : split(text, ',')) {
        if (toLower(token) == "null") {
            seq.emplace_back(std::nullopt);
        } else {
            seq.emplace_back(parseInteger<majvote::Value>(token, "element"));
        }
    }
    return seq;
}

// ── Formatting ─────────────────────────────────────────────────────

inline std::string formatSequence(const majvote::Sequence& seq) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < seq.size(); ++i) {
        if (i > 0) oss << ", ";
        if (seq[i]) {
            oss << *seq[i];
        } else {
            oss << "null";
        }
    }
    oss << "]";
    return oss.str();
}

inline std::string formatSizes(const std::vector<int64_t>& sizes) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < sizes.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << sizes[i];
    }
    oss << "]";
    return oss.str();
}

/// Format a byte count as human-readable string.
inline std::string formatBytes(uintmax_t bytes) {
    std::ostringstream oss;
    if (bytes >= 1024 * 1024) {
        oss << std::fixed << std::setprecision(2)
            << (static_cast<double>(bytes) / (1024.0 * 1024.0)) << " MB";
    } else if (bytes >= 1024) {
        oss << std::fixed << std::setprecision(2)
            << (static_cast<double>(bytes) / 1024.0) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

// ── Process memory ─────────────────────────────────────────────────

/// "Memory Usage: Resident=…, Peak resident=…, Virtual=…" (Linux /proc), or a notice elsewhere.
inline std::string memoryUsageStats() {
    std::ifstream status("/proc/self/status");
    if (!status) {
        return "Memory Usage: not available on this platform";
    }

    uintmax_t rssKb = 0, hwmKb = 0, vmKb = 0;
    std::string line;
    while (std::getline(status, line)) {
        auto value = [&line]() -> uintmax_t {
            std::istringstream iss(line.substr(line.find(':') + 1));
            uintmax_t kb = 0;
            iss >> kb;
            return kb;
        };
        if (line.rfind("VmRSS:", 0) == 0)       rssKb = value();
        else if (line.rfind("VmHWM:", 0) == 0)  hwmKb = value();
        else if (line.rfind("VmSize:", 0) == 0) vmKb  = value();
    }

    return "Memory Usage: Resident=" + formatBytes(rssKb * 1024)
         + ", Peak resident=" + formatBytes(hwmKb * 1024)
         + ", Virtual=" + formatBytes(vmKb * 1024);
}

// ── Summary output ─────────────────────────────────────────────────

inline void printSummaryTable(const majvote::SummaryTable& table,
                              std::ostream& os = std::cout,
                              const std::string& indent = "") {
    for (const auto& [size, summary] : table) {
        os << indent << summary << "\n";
    }
}

/// One summary per distinct size in either mode; @p jobs != 1 spreads sizes over worker threads.
inline majvote::SummaryTable runSweep(majvote::BenchmarkRunner& runner, const std::vector<int64_t>& sizes,
                                      bool majority, size_t runs, size_t jobs,
                                      std::ostream* progress = nullptr) {
    if (progress != nullptr) {
        *progress << "  Sizes " << formatSizes(sizes) << (majority ? " with" : " without")
                  << " majority...\n";
    }
    if (jobs != 1) {
        return runner.runMatrixParallel(sizes, majority, runs, jobs);
    }
    return runner.runMatrix(sizes, majority, runs);
}

} // namespace majvote_cli
