/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "filetype_detector.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <zlib.h>

#include "utility.hpp"

namespace {
    // the content check looks at the first KiB, the line check at 20 lines
    constexpr size_t CONTENT_HEAD_BYTES = 1024;
    constexpr size_t LINE_SCAN_BYTES = 64 * 1024;
    constexpr size_t LINE_SCAN_LINES = 20;

    std::vector<std::string> head_lines(const std::string& head, size_t max_lines) {
        std::vector<std::string> lines;
        std::istringstream iss(head);
        std::string line;
        while (lines.size() < max_lines && std::getline(iss, line)) {
            lines.push_back(line);
        }
        return lines;
    }
}

std::string to_string(filetype ftype) {
    switch (ftype) {
        case filetype::GENBANK: return "GenBank";
        case filetype::FASTA:   return "FASTA";
        default:                return "UNKNOWN";
    }
}

std::tuple<filetype, bool> filetype_detector::detect_filetype(
    const std::filesystem::path& filepath) {

    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + filepath.string());
    }

    // Read first bytes to check the gzip magic number
    char magic[2] = {0, 0};
    file.read(magic, sizeof(magic));
    std::streamsize bytes_read = file.gcount();
    file.close();

    // magic bytes: 0x1f 0x8b
    bool is_gzipped = bytes_read == 2 &&
                      static_cast<unsigned char>(magic[0]) == 0x1f &&
                      static_cast<unsigned char>(magic[1]) == 0x8b;

    std::string head = read_head(filepath, is_gzipped, LINE_SCAN_BYTES);
    return std::make_tuple(detect_text(head), is_gzipped);
}

filetype filetype_detector::detect_text(const std::string& head) {
    std::string content = head.substr(0, CONTENT_HEAD_BYTES);

    // GenBank: LOCUS plus one of the header sections
    if (content.find("LOCUS") != std::string::npos &&
        (content.find("DEFINITION") != std::string::npos ||
         content.find("ACCESSION") != std::string::npos ||
         content.find("VERSION") != std::string::npos)) {
        return filetype::GENBANK;
    }

    // FASTA: a '>' header line plus at least one non-header line
    bool has_header = false;
    bool has_body = false;
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        std::string trimmed = text::trim(line);
        if (trimmed.empty()) {
            continue;
        }
        if (trimmed[0] == '>') {
            has_header = true;
        } else {
            has_body = true;
        }
    }
    if (has_header && has_body) {
        return filetype::FASTA;
    }

    // Fall back to the leading lines
    auto lines = head_lines(head, LINE_SCAN_LINES);
    for (const auto& line : lines) {
        if (text::trim(line).starts_with('>')) {
            return filetype::FASTA;
        }
    }
    for (const auto& line : lines) {
        if (text::trim(line).starts_with("LOCUS")) {
            return filetype::GENBANK;
        }
    }

    return filetype::UNKNOWN;
}

std::string filetype_detector::read_head(const std::filesystem::path& filepath,
                                         bool gzipped, size_t max_bytes) {
    std::vector<char> buffer(max_bytes);

    if (!gzipped) {
        std::ifstream file(filepath, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Failed to open file: " + filepath.string());
        }
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        return std::string(buffer.data(), static_cast<size_t>(file.gcount()));
    }

    // Open gzipped file and read the decompressed header
    gzFile gzfile = gzopen(filepath.string().c_str(), "rb");
    if (!gzfile) {
        throw std::runtime_error("Failed to open gzipped file: " + filepath.string());
    }
    int bytes_read = gzread(gzfile, buffer.data(), static_cast<unsigned>(buffer.size()));
    gzclose(gzfile);

    if (bytes_read < 0) {
        throw std::runtime_error("Failed to decompress file: " + filepath.string());
    }
    return std::string(buffer.data(), static_cast<size_t>(bytes_read));
}
