/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_UTILITY_HPP
#define GBFLAT_UTILITY_HPP

// standard
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace logging {
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // suppress info messages (warnings and errors are always shown)
    void set_quiet(bool quiet);
}

namespace text {
    // strip leading/trailing whitespace (space, tab, CR, LF)
    std::string trim(const std::string& str);

    // split on runs of whitespace, no empty tokens
    std::vector<std::string> split_whitespace(const std::string& str);

    std::string to_lower(const std::string& str);

    /**
     * Read a whole file into memory. Gzipped files (magic 0x1f 0x8b) are
     * decompressed transparently.
     * @throws std::runtime_error if the file cannot be opened or read
     */
    std::string read_file(const std::filesystem::path& filepath);
}

#endif //GBFLAT_UTILITY_HPP
