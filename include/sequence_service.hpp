/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_SEQUENCE_SERVICE_HPP
#define GBFLAT_SEQUENCE_SERVICE_HPP

// standard
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// class
#include "file_entries.hpp"
#include "filetype_detector.hpp"

using sequence_record = std::variant<genbank_record, fasta_entry>;

enum class output_format {
    JSON, FASTA
};

std::string to_string(output_format format);

/**
 * Entry point for reading and writing sequence files: picks the parser for
 * an input file and the writer for a record.
 */
class sequence_service {
public:
    /**
     * Map a user supplied format name ("genbank", "fasta", any case).
     * @throws unsupported_format_error for any other name
     */
    static filetype parse_format_hint(const std::string& hint);

    /**
     * @throws unsupported_format_error for names other than "json"/"fasta"
     */
    static output_format parse_output_format(const std::string& name);

    /**
     * Parse all records of a file. Without a hint the format is detected
     * from the file content.
     * @throws unsupported_format_error if the format cannot be determined
     * @throws genbank_parse_error on a fatal GenBank grammar error
     */
    std::vector<sequence_record> parse_file(const std::filesystem::path& filepath,
                                            std::optional<filetype> hint = std::nullopt) const;

    /**
     * Write one record to filepath, creating parent directories. GenBank
     * records can only be written as JSON.
     * @throws unsupported_record_error for a GenBank record with FASTA output
     * @throws std::runtime_error if the file cannot be created
     */
    std::filesystem::path save_record(const sequence_record& record,
                                      const std::filesystem::path& filepath,
                                      output_format format) const;

    // file extension used for the format ("json" / "fa")
    static std::string extension(output_format format);
};

#endif //GBFLAT_SEQUENCE_SERVICE_HPP
