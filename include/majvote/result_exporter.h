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
 * @file result_exporter.h
 * @brief ResultExporter — write ResultStore exports (CSV, text report) to files.
 *
 * Design:
 *   - Missing parent directories are created
 *   - Existing files are only replaced with overwrite=true
 *   - Failures return false; getErrorMsg() holds the reason (no exceptions escape)
 *
 * Usage:
 *     majvote::ResultExporter exporter;
 *     if (!exporter.writeCsv(store, "results/run.csv", true)) {
 *         std::cerr << exporter.getErrorMsg() << "\n";
 *     }
 */

#include <filesystem>
#include <string>

#include "result_store.h"

namespace majvote {

    class ResultExporter {
    public:
        using FilePath = std::filesystem::path;

    private:
        std::string     err_msg_;           // last error message description
        FilePath        last_path_;         // absolute path of the last successful write

        bool            writeText(const FilePath& filepath, const std::string& text, bool overwrite);

    public:
        const std::string&  getErrorMsg() const         { return err_msg_; }
        const FilePath&     lastPath() const            { return last_path_; }

        bool                writeCsv(const ResultStore& store, const FilePath& filepath, bool overwrite = false);
        bool                writeReport(const ResultStore& store, const FilePath& filepath, bool overwrite = false);
    };

} // namespace majvote
