/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the MAJVOTE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file result_exporter_test.cpp
 * @brief Tests for ResultExporter file output and error reporting
 *
 * Tests cover:
 * - CSV and report files match the in-memory exports
 * - Parent directory creation
 * - Overwrite protection
 * - Error signaling via return value and getErrorMsg()
 */

#include <gtest/gtest.h>
#include <majvote/majvote.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

class ResultExporterTest : public ::testing::Test {
protected:
    fs::path test_dir_;
    majvote::ResultStore store_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = fs::temp_directory_path() / (std::string("majvote_exporter_") + info->name());
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        const majvote::PerformanceSample::TimePoint ts{std::chrono::milliseconds(1700000000000)};
        store_.record(majvote::PerformanceSample("Algo", 10, 1'000'000, 12, 24, 1, true, ts));
        store_.record(majvote::PerformanceSample("Algo", 10, 2'000'000, 14, 26, 1, true, ts));
    }

    void TearDown() override {
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }
};

TEST_F(ResultExporterTest, WritesCsv) {
    majvote::ResultExporter exporter;
    const fs::path path = test_dir_ / "results.csv";

    ASSERT_TRUE(exporter.writeCsv(store_, path)) << exporter.getErrorMsg();
    EXPECT_TRUE(exporter.getErrorMsg().empty());
    EXPECT_EQ(exporter.lastPath(), fs::absolute(path));
    EXPECT_EQ(readFile(path), store_.exportCsv());
}

TEST_F(ResultExporterTest, WritesReport) {
    majvote::ResultExporter exporter;
    const fs::path path = test_dir_ / "report.txt";

    ASSERT_TRUE(exporter.writeReport(store_, path)) << exporter.getErrorMsg();
    EXPECT_EQ(readFile(path), store_.exportReport());
}

TEST_F(ResultExporterTest, CreatesParentDirectories) {
    majvote::ResultExporter exporter;
    const fs::path path = test_dir_ / "nested" / "deeper" / "results.csv";

    ASSERT_TRUE(exporter.writeCsv(store_, path)) << exporter.getErrorMsg();
    EXPECT_TRUE(fs::exists(path));
}

TEST_F(ResultExporterTest, RefusesToOverwriteByDefault) {
    majvote::ResultExporter exporter;
    const fs::path path = test_dir_ / "results.csv";
    {
        std::ofstream existing(path);
        existing << "keep me";
    }

    EXPECT_FALSE(exporter.writeCsv(store_, path));
    EXPECT_NE(exporter.getErrorMsg().find("already exists"), std::string::npos)
        << "Got: " << exporter.getErrorMsg();
    EXPECT_EQ(readFile(path), "keep me");

    ASSERT_TRUE(exporter.writeCsv(store_, path, true)) << exporter.getErrorMsg();
    EXPECT_TRUE(exporter.getErrorMsg().empty());
    EXPECT_EQ(readFile(path), store_.exportCsv());
}

TEST_F(ResultExporterTest, ReportsUnwritablePath) {
    majvote::ResultExporter exporter;
    const fs::path blocker = test_dir_ / "not_a_directory";
    {
        std::ofstream file(blocker);
        file << "x";
    }

    EXPECT_FALSE(exporter.writeCsv(store_, blocker / "results.csv"));
    EXPECT_FALSE(exporter.getErrorMsg().empty());
}

TEST_F(ResultExporterTest, EmptyStoreWritesHeaderOnly) {
    majvote::ResultStore empty;
    majvote::ResultExporter exporter;
    const fs::path path = test_dir_ / "empty.csv";

    ASSERT_TRUE(exporter.writeCsv(empty, path)) << exporter.getErrorMsg();
    EXPECT_EQ(readFile(path), std::string(majvote::CSV_HEADER) + "\n");
}
