/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the MAJVOTE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file generator_test.cpp
 * @brief Tests for TestDataGenerator::generate() and TestDataGenerator::shuffle()
 */

#include <gtest/gtest.h>
#include <majvote/majvote.h>
#include <algorithm>
#include <map>
#include <random>

using majvote::Sequence;
using majvote::TestDataGenerator;

namespace {

std::map<majvote::Value, size_t> histogram(const Sequence& seq) {
    std::map<majvote::Value, size_t> counts;
    for (const auto& e : seq) {
        EXPECT_TRUE(e.has_value());
        if (e) {
            ++counts[*e];
        }
    }
    return counts;
}

} // namespace

TEST(GeneratorTest, NonPositiveSizeYieldsEmpty) {
    EXPECT_TRUE(TestDataGenerator::generate(0, true).empty());
    EXPECT_TRUE(TestDataGenerator::generate(0, false).empty());
    EXPECT_TRUE(TestDataGenerator::generate(-5, true).empty());
}

TEST(GeneratorTest, WithMajorityLayout) {
    auto seq = TestDataGenerator::generate(10, true);
    ASSERT_EQ(seq.size(), 10u);

    for (size_t i = 0; i < 6; ++i) {
        EXPECT_EQ(seq[i], majvote::Element{majvote::MAJORITY_SENTINEL}) << "i=" << i;
    }
    // remaining positions are distinct fillers
    EXPECT_EQ(seq[6], majvote::Element{2});
    EXPECT_EQ(seq[7], majvote::Element{3});
    EXPECT_EQ(seq[8], majvote::Element{4});
    EXPECT_EQ(seq[9], majvote::Element{5});
}

TEST(GeneratorTest, WithMajorityCounts) {
    for (int64_t n : {2, 3, 7, 100, 1001}) {
        auto counts = histogram(TestDataGenerator::generate(n, true));
        EXPECT_EQ(counts[majvote::MAJORITY_SENTINEL], static_cast<size_t>(n / 2 + 1)) << "n=" << n;
        for (const auto& [value, count] : counts) {
            if (value != majvote::MAJORITY_SENTINEL) {
                EXPECT_EQ(count, 1u) << "n=" << n << " value=" << value;
            }
        }
    }
}

TEST(GeneratorTest, WithoutMajorityLayout) {
    auto seq = TestDataGenerator::generate(10, false);
    const Sequence expected = {0, 1, 2, 3, 4, 5, 0, 1, 2, 3};
    EXPECT_EQ(seq, expected);
}

TEST(GeneratorTest, WithoutMajorityNoValueExceedsHalf) {
    for (int64_t n : {2, 4, 10, 100, 1001}) {
        for (const auto& [value, count] : histogram(TestDataGenerator::generate(n, false))) {
            EXPECT_LE(count, static_cast<size_t>(n / 2)) << "n=" << n << " value=" << value;
        }
    }
}

TEST(GeneratorTest, SingleElement) {
    EXPECT_EQ(TestDataGenerator::generate(1, true), Sequence{majvote::MAJORITY_SENTINEL});
    EXPECT_EQ(TestDataGenerator::generate(1, false), Sequence{0});
}

TEST(GeneratorTest, ShufflePreservesElements) {
    auto original = TestDataGenerator::generate(1000, true);
    auto shuffled = original;
    TestDataGenerator::shuffle(shuffled);

    ASSERT_EQ(shuffled.size(), original.size());
    std::sort(original.begin(), original.end());
    std::sort(shuffled.begin(), shuffled.end());
    EXPECT_EQ(shuffled, original);
}

TEST(GeneratorTest, ShuffleIsDeterministicForSeededEngine) {
    auto a = TestDataGenerator::generate(500, true);
    auto b = a;

    TestDataGenerator::DefaultEngine rngA(12345);
    TestDataGenerator::DefaultEngine rngB(12345);
    TestDataGenerator::shuffle(a, rngA);
    TestDataGenerator::shuffle(b, rngB);
    EXPECT_EQ(a, b);

    // 500 elements left in place by a permutation is practically impossible
    EXPECT_NE(a, TestDataGenerator::generate(500, true));
}

TEST(GeneratorTest, ShuffleAcceptsAnyElementType) {
    std::vector<int> values = {5, 4, 3, 2, 1};
    std::mt19937 rng(7);
    TestDataGenerator::shuffle(values, rng);

    std::sort(values.begin(), values.end());
    EXPECT_EQ(values, (std::vector<int>{1, 2, 3, 4, 5}));
}

TEST(GeneratorTest, ShuffleTrivialInputsAreNoOps) {
    Sequence* absent = nullptr;
    EXPECT_NO_THROW(TestDataGenerator::shuffle(absent));

    Sequence empty;
    TestDataGenerator::shuffle(empty);
    EXPECT_TRUE(empty.empty());

    Sequence single = {42};
    TestDataGenerator::shuffle(single);
    EXPECT_EQ(single, Sequence{42});
}
