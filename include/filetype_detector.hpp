/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_FILETYPE_DETECTOR_HPP
#define GBFLAT_FILETYPE_DETECTOR_HPP

// standard
#include <filesystem>
#include <string>
#include <tuple>

enum class filetype {
    GENBANK, FASTA, UNKNOWN
};

std::string to_string(filetype ftype);

class filetype_detector {
public:
    /**
     * Classify a file from its first lines. Gzipped files are inspected
     * after decompression.
     * @return detected type and whether the file is gzipped
     * @throws std::runtime_error if the file cannot be opened
     */
    std::tuple<filetype, bool> detect_filetype(const std::filesystem::path& filepath);

    // classify text already in memory
    filetype detect_text(const std::string& head);

private:
    std::string read_head(const std::filesystem::path& filepath, bool gzipped, size_t max_bytes);
};

#endif //GBFLAT_FILETYPE_DETECTOR_HPP
