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
 * @file csv_format.h
 * @brief CsvRowBuffer — locale-independent CSV text assembly.
 *
 * Fields are appended via std::to_chars() into a reusable char buffer; a
 * delimiter is inserted automatically between fields of the same row.
 * Strings are quoted (RFC 4180) only when they contain the delimiter, a
 * quote or a line break, so plain identifiers are written verbatim.
 *
 * Usage:
 *     majvote::CsvRowBuffer buf;
 *     buf.appendString("BoyerMooreMajorityVote");
 *     buf.appendInteger(1000);
 *     buf.appendFixed(0.0123, 6);
 *     buf.appendBool(true);
 *     buf.endRow();
 *     std::string text = buf.str();   // "BoyerMooreMajorityVote,1000,0.012300,true\n"
 */

#include <charconv>
#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace majvote {

    class CsvRowBuffer {
        std::vector<char>   buf_;                   // accumulated text
        char                delimiter_  = ',';
        bool                row_open_   = false;    // at least one field in current row

        void separate() {
            if (row_open_) {
                buf_.push_back(delimiter_);
            }
            row_open_ = true;
        }

    public:
        explicit CsvRowBuffer(char delimiter = ',')
            : delimiter_(delimiter)
        {
            buf_.reserve(4096);
        }

        char                delimiter() const       { return delimiter_; }
        size_t              size() const            { return buf_.size(); }
        std::string         str() const             { return std::string(buf_.data(), buf_.size()); }

        void clear() {
            buf_.clear();
            row_open_ = false;
        }

        template<std::integral T>
        void appendInteger(T value) {
            separate();
            constexpr size_t kMaxDigits = 32;
            size_t oldSize = buf_.size();
            buf_.resize(oldSize + kMaxDigits);
            auto [ptr, ec] = std::to_chars(buf_.data() + oldSize,
                                           buf_.data() + oldSize + kMaxDigits, value);
            buf_.resize(static_cast<size_t>(ptr - buf_.data()));
        }

        /// Fixed-point notation with exactly @p precision decimals.
        void appendFixed(double value, int precision) {
            separate();
            constexpr size_t kMaxDigits = 64;
            size_t oldSize = buf_.size();
            buf_.resize(oldSize + kMaxDigits);
            auto [ptr, ec] = std::to_chars(buf_.data() + oldSize,
                                           buf_.data() + oldSize + kMaxDigits,
                                           value, std::chars_format::fixed, precision);
            if (ec != std::errc{}) {
                // out of buffer space: only for absurd magnitudes, fall back to shortest form
                auto res = std::to_chars(buf_.data() + oldSize,
                                         buf_.data() + oldSize + kMaxDigits, value);
                ptr = res.ptr;
            }
            buf_.resize(static_cast<size_t>(ptr - buf_.data()));
        }

        void appendBool(bool value) {
            separate();
            if (value) {
                buf_.insert(buf_.end(), {'t','r','u','e'});
            } else {
                buf_.insert(buf_.end(), {'f','a','l','s','e'});
            }
        }

        void appendString(std::string_view value) {
            separate();
            const bool needsQuotes = value.find_first_of(std::string{delimiter_} + "\"\r\n") != std::string_view::npos;
            if (!needsQuotes) {
                buf_.insert(buf_.end(), value.begin(), value.end());
                return;
            }
            buf_.push_back('"');
            for (char c : value) {
                if (c == '"') buf_.push_back('"'); // escape quotes by doubling
                buf_.push_back(c);
            }
            buf_.push_back('"');
        }

        /// Append a pre-formatted line (e.g. a header) as its own row.
        void appendLine(std::string_view line) {
            if (row_open_) {
                endRow();
            }
            buf_.insert(buf_.end(), line.begin(), line.end());
            buf_.push_back('\n');
        }

        void endRow() {
            buf_.push_back('\n');
            row_open_ = false;
        }
    };

} // namespace majvote
