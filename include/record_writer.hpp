/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_RECORD_WRITER_HPP
#define GBFLAT_RECORD_WRITER_HPP

#include <cstddef>
#include <ostream>

#include "file_entries.hpp"

namespace record_writer {

    constexpr size_t FASTA_LINE_WIDTH = 60;

    /**
     * Write a GenBank record as a JSON object (2-space indentation,
     * non-ASCII characters escaped as \uXXXX). Keys follow the field order
     * of genbank_record; qualifiers are written as arrays of fragments.
     * @throws std::runtime_error if a field is not valid UTF-8
     */
    void write_genbank_json(const genbank_record& record, std::ostream& out);

    // {"header": ..., "description": ..., "sequence": ...}
    void write_fasta_json(const fasta_entry& entry, std::ostream& out);

    // ">header description" followed by the sequence folded to line_width columns
    void write_fasta(const fasta_entry& entry, std::ostream& out,
                     size_t line_width = FASTA_LINE_WIDTH);
}

#endif //GBFLAT_RECORD_WRITER_HPP
