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
 * @file vote_result.h
 * @brief VoteError and VoteResult — structured outcome of a majority vote.
 *
 * Errors never leave the engine as exceptions; they are carried as data:
 *   - NullInput        the whole sequence is absent
 *   - EmptyInput       the sequence has no elements   (validate() only)
 *   - NullElement      an element is absent at index   (validate() only)
 *   - UnexpectedFault  an exception escaped an element comparison
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include "metrics.h"

namespace majvote {

    enum class ErrorKind : uint8_t {
        NullInput,
        EmptyInput,
        NullElement,
        UnexpectedFault
    };

    inline std::string errorKindToString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::NullInput:       return "NullInput";
            case ErrorKind::EmptyInput:      return "EmptyInput";
            case ErrorKind::NullElement:     return "NullElement";
            case ErrorKind::UnexpectedFault: return "UnexpectedFault";
            default:                         return "Unknown";
        }
    }

    struct VoteError {
        ErrorKind   kind    = ErrorKind::UnexpectedFault;
        std::string message;
        size_t      index   = 0;    // only meaningful for NullElement

        static VoteError nullInput() {
            return {ErrorKind::NullInput, "Input array cannot be null", 0};
        }
        static VoteError emptyInput() {
            return {ErrorKind::EmptyInput, "Input array is empty", 0};
        }
        static VoteError nullElement(size_t index) {
            return {ErrorKind::NullElement, "Array contains null element at index " + std::to_string(index), index};
        }
        static VoteError unexpectedFault(const std::string& what) {
            return {ErrorKind::UnexpectedFault, "Unexpected error: " + what, 0};
        }

        bool operator==(const VoteError& other) const = default;
    };

    /**
     * @brief Outcome of one MajorityVote::findMajority() call.
     *
     * Either carries a (candidate, hasMajority) pair or an error. An error
     * result has no candidate and hasMajority() == false. Metrics are always
     * present, also on error paths.
     */
    template<typename T>
    class VoteResult {
        std::optional<T>            candidate_;
        bool                        has_majority_ = false;
        Metrics                     metrics_;
        std::optional<VoteError>    error_;

        VoteResult() = default;

    public:
        using ValueType = T;

        static VoteResult success(std::optional<T> candidate, bool hasMajority, Metrics metrics) {
            VoteResult result;
            result.candidate_    = std::move(candidate);
            result.has_majority_ = hasMajority;
            result.metrics_      = std::move(metrics);
            return result;
        }

        static VoteResult failure(VoteError error, Metrics metrics) {
            VoteResult result;
            result.metrics_ = std::move(metrics);
            result.error_   = std::move(error);
            return result;
        }

        const std::optional<T>&         candidate() const       { return candidate_; }
        bool                            hasMajority() const     { return has_majority_; }
        const Metrics&                  metrics() const         { return metrics_; }
        const std::optional<VoteError>& error() const           { return error_; }
        bool                            hasError() const        { return error_.has_value(); }
        std::string                     errorMessage() const    { return error_ ? error_->message : std::string(); }

        std::string toString() const {
            std::ostringstream oss;
            if (error_) {
                oss << "Result{error='" << error_->message << "', " << metrics_ << "}";
                return oss.str();
            }
            oss << "Result{majorityElement=";
            if (candidate_) {
                oss << *candidate_;
            } else {
                oss << "null";
            }
            oss << ", hasMajority=" << (has_majority_ ? "true" : "false")
                << ", " << metrics_ << "}";
            return oss.str();
        }
    };

    template<typename T>
    std::ostream& operator<<(std::ostream& os, const VoteResult<T>& result) {
        return os << result.toString();
    }

} // namespace majvote
