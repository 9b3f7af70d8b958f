/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_FASTA_READER_HPP
#define GBFLAT_FASTA_READER_HPP

// standard
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

// class
#include "file_reader.hpp"
#include "file_entries.hpp"

class fasta_reader : public file_reader<fasta_entry> {
public:
    explicit fasta_reader(const std::filesystem::path& filepath);

    // Read next entry
    bool read_next(fasta_entry& entry) override;

    // Check if more entries available
    bool has_next() const override { return !eof_reached; }

    size_t records_read() const override { return records; }

    // Parse FASTA text held in memory
    static std::vector<fasta_entry> parse_text(const std::string& content);

private:
    struct in_memory {};
    fasta_reader(in_memory, std::string content);

    std::istringstream input;
    size_t records;
    bool eof_reached;

    // record being collected, valid once a '>' line with an identifier was seen
    std::string pending_header;
    std::string pending_description;
    std::string pending_sequence;

    // take the pending record, leaving the reader without one
    fasta_entry take_pending();
    void start_record(const std::string& header_line);
};

#endif //GBFLAT_FASTA_READER_HPP
