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
 * @file generator.h
 * @brief TestDataGenerator — synthetic input sequences for the majority vote.
 *
 * generate(n, true)  : first floor(n/2)+1 positions hold MAJORITY_SENTINEL,
 *                      the rest hold distinct values starting at FIRST_FILLER_VALUE.
 * generate(n, false) : position i holds i mod (floor(n/2)+1).
 *                      Note: n == 1 yields {0}, which the engine still
 *                      reports as a (single-element) majority.
 *
 * shuffle() is an in-place Fisher-Yates permutation. The random source can be
 * injected for reproducible runs; the default uses a per-thread engine.
 */

#include <cstdint>
#include <random>
#include <vector>

#include "definitions.h"

namespace majvote {

    class TestDataGenerator {
    public:
        using DefaultEngine = std::mt19937_64;

        TestDataGenerator() = delete;

        static Sequence generate(int64_t size, bool wantMajority);

        template<typename E, std::uniform_random_bit_generator URBG>
        static void     shuffle(std::vector<E>* sequence, URBG& rng);

        template<typename E, std::uniform_random_bit_generator URBG>
        static void     shuffle(std::vector<E>& sequence, URBG& rng)   { shuffle(&sequence, rng); }

        template<typename E>
        static void     shuffle(std::vector<E>* sequence)               { shuffle(sequence, defaultEngine()); }

        template<typename E>
        static void     shuffle(std::vector<E>& sequence)               { shuffle(&sequence, defaultEngine()); }

        /// Per-thread engine seeded from std::random_device.
        static DefaultEngine& defaultEngine();
    };

} // namespace majvote
