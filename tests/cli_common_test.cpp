/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the MAJVOTE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file cli_common_test.cpp
 * @brief Tests for the console parsing and formatting helpers of the CLI tools
 */

#include <gtest/gtest.h>
#include "cli_common.h"
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace majvote_cli;

TEST(CliCommonTest, TrimAndCase) {
    EXPECT_EQ(trim("  abc \t\n"), "abc");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(toLower("QuIt"), "quit");
}

TEST(CliCommonTest, IsYes) {
    EXPECT_TRUE(isYes("y"));
    EXPECT_TRUE(isYes(" Yes "));
    EXPECT_FALSE(isYes("n"));
    EXPECT_FALSE(isYes(""));
}

TEST(CliCommonTest, ParseInteger) {
    EXPECT_EQ(parseInteger<int64_t>(" 1000 ", "size"), 1000);
    EXPECT_EQ(parseInteger<int>("-7", "value"), -7);
    EXPECT_THROW(parseInteger<int64_t>("", "size"), std::runtime_error);
    EXPECT_THROW(parseInteger<int64_t>("12abc", "size"), std::runtime_error);
    EXPECT_THROW(parseInteger<int32_t>("99999999999", "element"), std::runtime_error);

    try {
        parseInteger<int64_t>("abc", "array size");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& ex) {
        EXPECT_EQ(std::string(ex.what()), "Invalid array size: 'abc'");
    }
}

TEST(CliCommonTest, ParseCount) {
    EXPECT_EQ(parseCount("5", "runs"), 5u);
    EXPECT_EQ(parseCount("0", "runs"), 0u);
    EXPECT_THROW(parseCount("-1", "runs"), std::runtime_error);
}

TEST(CliCommonTest, ParseSizeList) {
    EXPECT_EQ(parseSizeList("100, 1000,10000"), (std::vector<int64_t>{100, 1000, 10000}));
    EXPECT_EQ(parseSizeList("42"), (std::vector<int64_t>{42}));
    EXPECT_THROW(parseSizeList("100,,200"), std::runtime_error);
    EXPECT_THROW(parseSizeList("a,b"), std::runtime_error);
}

TEST(CliCommonTest, Ranges) {
    EXPECT_EQ(rangeSizes(1000, 5000, 1000), (std::vector<int64_t>{1000, 2000, 3000, 4000, 5000}));
    EXPECT_EQ(rangeSizes(10, 25, 10), (std::vector<int64_t>{10, 20}));
    EXPECT_EQ(rangeSizes(7, 7, 3), (std::vector<int64_t>{7}));
    EXPECT_THROW(rangeSizes(10, 5, 1), std::runtime_error);
    EXPECT_THROW(rangeSizes(1, 10, 0), std::runtime_error);

    // stepping past the top of the int64 range stops at the last reachable size
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    EXPECT_EQ(parseRange("9223372036854775800:9223372036854775807:5"),
              (std::vector<int64_t>{kMax - 7, kMax - 2}));
    EXPECT_EQ(rangeSizes(kMax - 1, kMax, kMax), (std::vector<int64_t>{kMax - 1}));
    EXPECT_THROW(parseRange("300:100:100"), std::runtime_error);

    EXPECT_EQ(parseRange("100:300:100"), (std::vector<int64_t>{100, 200, 300}));
    EXPECT_THROW(parseRange("100:300"), std::runtime_error);
    EXPECT_THROW(parseRange("100:300:-5"), std::runtime_error);
}

TEST(CliCommonTest, ParseElements) {
    auto seq = parseElements("1, 2, null, -4");
    const majvote::Sequence expected = {1, 2, std::nullopt, -4};
    EXPECT_EQ(seq, expected);

    EXPECT_THROW(parseElements("1, x"), std::runtime_error);
    EXPECT_THROW(parseElements(""), std::runtime_error);
}

TEST(CliCommonTest, Formatting) {
    EXPECT_EQ(formatSequence({1, std::nullopt, 3}), "[1, null, 3]");
    EXPECT_EQ(formatSequence({}), "[]");
    EXPECT_EQ(formatSizes({100, 1000}), "[100, 1000]");
    EXPECT_EQ(formatBytes(512), "512 bytes");
    EXPECT_EQ(formatBytes(1536), "1.50 KB");
    EXPECT_EQ(formatBytes(3 * 1024 * 1024), "3.00 MB");
}

TEST(CliCommonTest, MemoryUsageStats) {
    EXPECT_EQ(memoryUsageStats().rfind("Memory Usage: ", 0), 0u);
}

TEST(CliCommonTest, PrintSummaryTable) {
    majvote::ResultStore store;
    majvote::BenchmarkRunner runner(store, 1);
    auto table = runner.runMatrix({10, 20}, true, 2);

    std::ostringstream oss;
    printSummaryTable(table, oss, "  ");
    const std::string expected = "  " + table[0].second.toString() + "\n"
                               + "  " + table[1].second.toString() + "\n";
    EXPECT_EQ(oss.str(), expected);
}

TEST(CliCommonTest, SweepMergesRepeatedSizes) {
    const std::vector<int64_t> sizes = {100, 200, 100};

    for (size_t jobs : {size_t{1}, size_t{2}}) {
        majvote::ResultStore store;
        majvote::BenchmarkRunner runner(store, 3);
        std::ostringstream progress;

        auto table = runSweep(runner, sizes, true, 2, jobs, &progress);
        ASSERT_EQ(table.size(), 2u) << "jobs=" << jobs;
        EXPECT_EQ(table[0].first, 100) << "jobs=" << jobs;
        EXPECT_EQ(table[1].first, 200) << "jobs=" << jobs;
        EXPECT_EQ(table[0].second.runCount(), 2u) << "jobs=" << jobs;
        EXPECT_EQ(store.sampleCount(), 6u) << "jobs=" << jobs;
        EXPECT_EQ(progress.str(), "  Sizes [100, 200, 100] with majority...\n");
    }
}
