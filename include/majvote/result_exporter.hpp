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
 * @file result_exporter.hpp
 * @brief ResultExporter implementations.
 */

#include "result_exporter.h"
#include "definitions.h"
#include "result_store.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace majvote {

    inline bool ResultExporter::writeCsv(const ResultStore& store, const FilePath& filepath, bool overwrite) {
        return writeText(filepath, store.exportCsv(), overwrite);
    }

    inline bool ResultExporter::writeReport(const ResultStore& store, const FilePath& filepath, bool overwrite) {
        return writeText(filepath, store.exportReport(), overwrite);
    }

    inline bool ResultExporter::writeText(const FilePath& filepath, const std::string& text, bool overwrite) {
        err_msg_.clear();

        try {
            FilePath absolutePath = std::filesystem::absolute(filepath);

            // Create parent directory if needed
            FilePath parentDir = absolutePath.parent_path();
            if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
                std::error_code ec;
                if (!std::filesystem::create_directories(parentDir, ec)) {
                    err_msg_ = "Error: Cannot create directory: " + parentDir.string() +
                              " (Error: " + ec.message() + ")";
                    throw std::runtime_error(err_msg_);
                }
            }

            if (std::filesystem::exists(absolutePath) && !overwrite) {
                err_msg_ = "Warning: File already exists: " + absolutePath.string() +
                          ". Use overwrite=true to replace it.";
                throw std::runtime_error(err_msg_);
            }

            std::ofstream stream(absolutePath, std::ios::out | std::ios::trunc);
            if (!stream.good()) {
                err_msg_ = "Error: Cannot open file for writing: " + absolutePath.string();
                throw std::runtime_error(err_msg_);
            }

            stream.write(text.data(), static_cast<std::streamsize>(text.size()));
            stream.flush();
            if (!stream.good()) {
                err_msg_ = "Error: Write failed: " + absolutePath.string();
                throw std::runtime_error(err_msg_);
            }

            last_path_ = absolutePath;
            return true;

        } catch (const std::filesystem::filesystem_error& ex) {
            if (err_msg_.empty()) {
                err_msg_ = std::string("Filesystem error: ") + ex.what();
            }
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return false;
        } catch (const std::exception& ex) {
            if (err_msg_.empty()) {
                err_msg_ = std::string("Error writing file: ") + ex.what();
            }
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return false;
        }
    }

} // namespace majvote
