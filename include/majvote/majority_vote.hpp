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
 * @file majority_vote.hpp
 * @brief MajorityVote template implementations.
 */

#include "majority_vote.h"
#include <exception>
#include <iostream>
#include <utility>

namespace majvote {

    // ── Public entry points ─────────────────────────────────────────────

    template<VoteValue T>
    typename MajorityVote<T>::ResultType MajorityVote<T>::findMajority(const SequenceType& sequence) {
        return findMajority(&sequence);
    }

    template<VoteValue T>
    typename MajorityVote<T>::ResultType MajorityVote<T>::findMajority(const SequenceType* sequence) {
        Metrics metrics;
        metrics.startTimer();
        metrics.incrementAllocations();     // the result/metrics object

        try {
            if (sequence == nullptr) {
                metrics.stopTimer();
                return ResultType::failure(VoteError::nullInput(), std::move(metrics));
            }
            metrics.incrementAccesses();    // presence check

            const size_t n = sequence->size();
            if (n == 0) {
                metrics.stopTimer();
                return ResultType::success(std::nullopt, false, std::move(metrics));
            }
            metrics.incrementAccesses();    // length check

            if (n == 1) {
                metrics.incrementAccesses();    // element read
                const ElementType& only = (*sequence)[0];
                metrics.stopTimer();
                // a lone absent element has no value to be the majority of
                return ResultType::success(only, only.has_value(), std::move(metrics));
            }

            ElementType candidate = selectCandidate(*sequence, metrics);
            bool isMajority = verifyCandidate(*sequence, candidate, metrics);

            metrics.stopTimer();
            return ResultType::success(std::move(candidate), isMajority, std::move(metrics));

        } catch (const std::exception& ex) {
            metrics.stopTimer();
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << "MajorityVote: " << ex.what() << std::endl;
            }
            return ResultType::failure(VoteError::unexpectedFault(ex.what()), std::move(metrics));
        } catch (...) {
            metrics.stopTimer();
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << "MajorityVote: unknown error" << std::endl;
            }
            return ResultType::failure(VoteError::unexpectedFault("unknown error"), std::move(metrics));
        }
    }

    template<VoteValue T>
    std::optional<VoteError> MajorityVote<T>::validate(const SequenceType* sequence) {
        if (sequence == nullptr) {
            return VoteError::nullInput();
        }
        if (sequence->empty()) {
            return VoteError::emptyInput();
        }
        for (size_t i = 0; i < sequence->size(); ++i) {
            if (!(*sequence)[i].has_value()) {
                return VoteError::nullElement(i);
            }
        }
        return std::nullopt;
    }

    // ── Phases ──────────────────────────────────────────────────────────

    /// Pass 1: pair-cancelling vote. Fresh assignments are not charged as comparisons.
    template<VoteValue T>
    typename MajorityVote<T>::ElementType MajorityVote<T>::selectCandidate(const SequenceType& sequence, Metrics& metrics) {
        ElementType candidate;
        size_t count = 0;

        for (const ElementType& element : sequence) {
            metrics.incrementAccesses();
            if (count == 0) {
                candidate = element;
                count = 1;
            } else {
                metrics.incrementComparisons();
                if (candidate == element) {
                    ++count;
                } else {
                    --count;
                }
            }
        }
        return candidate;
    }

    /// Pass 2: count occurrences of the candidate, stop at floor(n/2)+1.
    template<VoteValue T>
    bool MajorityVote<T>::verifyCandidate(const SequenceType& sequence, const ElementType& candidate, Metrics& metrics) {
        if (!candidate.has_value()) {
            return false;
        }

        const size_t threshold = sequence.size() / 2 + 1;
        size_t count = 0;

        for (const ElementType& element : sequence) {
            metrics.incrementAccesses();
            metrics.incrementComparisons();
            if (candidate == element) {
                ++count;
                if (count >= threshold) {
                    return true;
                }
            }
        }
        return count > sequence.size() / 2;
    }

} // namespace majvote
