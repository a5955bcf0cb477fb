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
 * @file generator.hpp
 * @brief TestDataGenerator implementations.
 */

#include "generator.h"
#include <utility>

namespace majvote {

    inline Sequence TestDataGenerator::generate(int64_t size, bool wantMajority) {
        if (size <= 0) {
            return {};
        }

        const size_t n = static_cast<size_t>(size);
        const size_t majorityCount = n / 2 + 1;
        Sequence sequence(n);

        if (wantMajority && n > 1) {
            for (size_t i = 0; i < majorityCount; ++i) {
                sequence[i] = MAJORITY_SENTINEL;
            }
            for (size_t i = majorityCount; i < n; ++i) {
                sequence[i] = static_cast<Value>(i - majorityCount) + FIRST_FILLER_VALUE;
            }
        } else {
            for (size_t i = 0; i < n; ++i) {
                sequence[i] = static_cast<Value>(i % majorityCount);
            }
        }
        return sequence;
    }

    template<typename E, std::uniform_random_bit_generator URBG>
    void TestDataGenerator::shuffle(std::vector<E>* sequence, URBG& rng) {
        if (sequence == nullptr || sequence->size() <= 1) {
            return;
        }
        for (size_t i = sequence->size() - 1; i > 0; --i) {
            std::uniform_int_distribution<size_t> pick(0, i);
            size_t j = pick(rng);
            using std::swap;
            swap((*sequence)[i], (*sequence)[j]);
        }
    }

    inline TestDataGenerator::DefaultEngine& TestDataGenerator::defaultEngine() {
        thread_local DefaultEngine engine{std::random_device{}()};
        return engine;
    }

} // namespace majvote
