/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "utility.hpp"

// standard
#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <zlib.h>

namespace logging {
    // ANSI color codes
    const std::string RESET = "\033[0m";
    const std::string YELLOW = "\033[33m";
    const std::string RED = "\033[31m";

    static bool quiet_mode = false;

    // Internal helper to get timestamp
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t current_time = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&current_time), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    void info(const std::string& message) {
        if (quiet_mode) return;
        std::cout << "[GBFLAT] " << get_timestamp() << " - " << message << std::endl;
    }

    void warning(const std::string& message) {
        std::cout << YELLOW << "[GBFLAT] " << get_timestamp() << " - WARNING: " << message << RESET << std::endl;
    }

    void error(const std::string& message) {
        std::cerr << RED << "[GBFLAT] " << get_timestamp() << " - ERROR: " << message << RESET << std::endl;
    }

    void set_quiet(bool quiet) {
        quiet_mode = quiet;
    }
}

namespace text {
    std::string trim(const std::string& str) {
        size_t start = str.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return "";
        }
        size_t end = str.find_last_not_of(" \t\r\n");
        return str.substr(start, end - start + 1);
    }

    std::vector<std::string> split_whitespace(const std::string& str) {
        std::vector<std::string> tokens;
        std::istringstream iss(str);
        std::string token;
        while (iss >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
            [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    static bool is_gzipped(const std::filesystem::path& filepath) {
        std::ifstream file(filepath, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Failed to open file: " + filepath.string());
        }
        unsigned char magic[2] = {0, 0};
        file.read(reinterpret_cast<char*>(magic), sizeof(magic));
        return file.gcount() == 2 && magic[0] == 0x1f && magic[1] == 0x8b;
    }

    static std::string read_gzipped(const std::filesystem::path& filepath) {
        gzFile gzfile = gzopen(filepath.string().c_str(), "rb");
        if (!gzfile) {
            throw std::runtime_error("Failed to open gzipped file: " + filepath.string());
        }

        std::string content;
        char buffer[16384];
        int bytes_read = 0;
        while ((bytes_read = gzread(gzfile, buffer, sizeof(buffer))) > 0) {
            content.append(buffer, static_cast<size_t>(bytes_read));
        }

        int errnum = Z_OK;
        std::string message = bytes_read < 0 ? gzerror(gzfile, &errnum) : "";
        gzclose(gzfile);

        if (bytes_read < 0) {
            throw std::runtime_error("Failed to decompress " + filepath.string() + ": " + message);
        }
        return content;
    }

    std::string read_file(const std::filesystem::path& filepath) {
        if (is_gzipped(filepath)) {
            return read_gzipped(filepath);
        }

        std::ifstream file(filepath, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file: " + filepath.string());
        }
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }
}
