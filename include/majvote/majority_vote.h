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
 * @file majority_vote.h
 * @brief MajorityVote — instrumented Boyer-Moore majority vote.
 *
 * Two linear passes over a sequence of (possibly absent) elements:
 *   1. candidate selection (pair-cancelling vote)
 *   2. verification with early exit once floor(n/2)+1 occurrences are seen
 *
 * Every element read charges one access, every equality test one
 * comparison. The result object itself is charged as one allocation.
 *
 * Usage:
 *     majvote::Sequence seq = {1, 1, 2, 1, 3, 1, 4};
 *     auto result = majvote::MajorityVote<majvote::Value>::findMajority(seq);
 *     if (!result.hasError() && result.hasMajority()) {
 *         std::cout << *result.candidate() << "\n";   // 1
 *     }
 */

#include <concepts>
#include <cstddef>
#include <optional>
#include <vector>

#include "definitions.h"
#include "metrics.h"
#include "vote_result.h"

namespace majvote {

    template<typename T>
    concept VoteValue = std::equality_comparable<T> && std::copyable<T>;

    template<VoteValue T>
    class MajorityVote {
    public:
        using ValueType     = T;
        using ElementType   = std::optional<T>;
        using SequenceType  = std::vector<ElementType>;
        using ResultType    = VoteResult<T>;

        MajorityVote() = delete;

        /// Find the majority element of @p sequence; never throws.
        static ResultType               findMajority(const SequenceType& sequence);

        /// Overload accepting an absent sequence (nullptr) -> NullInput error result.
        static ResultType               findMajority(const SequenceType* sequence);

        /// Check a sequence for absence, emptiness and absent elements.
        static std::optional<VoteError> validate(const SequenceType* sequence);
        static std::optional<VoteError> validate(const SequenceType& sequence) { return validate(&sequence); }

    private:
        static ElementType              selectCandidate(const SequenceType& sequence, Metrics& metrics);
        static bool                     verifyCandidate(const SequenceType& sequence, const ElementType& candidate, Metrics& metrics);
    };

} // namespace majvote
