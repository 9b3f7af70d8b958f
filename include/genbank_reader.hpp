/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_GENBANK_READER_HPP
#define GBFLAT_GENBANK_READER_HPP

// standard
#include <filesystem>
#include <string>
#include <vector>

// class
#include "file_entries.hpp"
#include "file_reader.hpp"
#include "record_accumulator.hpp"
#include "section_parsers.hpp"

namespace genbank {

/**
 * Split file content into one chunk per record. Records end at a line that
 * is exactly "//"; chunks containing only whitespace are dropped.
 */
std::vector<std::string> split_records(const std::string& content);

// split a chunk into lines, removing a trailing '\r' from each
std::vector<std::string> split_lines(const std::string& chunk);

/**
 * Routes the lines of one record to the section parsers.
 *
 * Lines that start with a section keyword go to the first parser (in
 * priority order) that accepts them, which then becomes the active parser.
 * Every other line is offered to the active parser only and dropped if it
 * declines.
 */
class section_dispatcher {
public:
    section_dispatcher();

    // parse one record chunk with a fresh accumulator
    genbank_record parse_record(const std::string& chunk) const;

    /**
     * Dispatch a single line. `active` is the parser that took the last
     * section keyword line (nullptr before the first one).
     */
    void dispatch(const std::string& line, record_accumulator& acc,
                  const section_parser*& active) const;

private:
    parser_list parsers;

    static bool is_section_start(const std::string& line);
};

} // namespace genbank

/**
 * Reads GenBank flat files. The whole file is loaded up front and split
 * into records; read_next() parses one record per call.
 */
class genbank_reader : public file_reader<genbank_record> {
public:
    explicit genbank_reader(const std::filesystem::path& filepath);

    // Read next record
    // @throws genbank_parse_error if the record has a non-numeric LOCUS length
    bool read_next(genbank_record& entry) override;

    bool has_next() const override { return next_chunk < chunks.size(); }

    size_t records_read() const override { return next_chunk; }

    // Parse GenBank text held in memory
    static std::vector<genbank_record> parse_text(const std::string& content);

private:
    explicit genbank_reader(std::vector<std::string> chunks, std::string origin);

    std::vector<std::string> chunks;
    size_t next_chunk;
    std::string origin;     // file name for error messages
    genbank::section_dispatcher dispatcher;
};

#endif //GBFLAT_GENBANK_READER_HPP
