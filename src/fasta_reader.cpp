/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "fasta_reader.hpp"

#include "utility.hpp"

fasta_reader::fasta_reader(const std::filesystem::path& filepath)
    : fasta_reader(in_memory{}, text::read_file(filepath)) {}

fasta_reader::fasta_reader(in_memory, std::string content)
    : input(std::move(content)), records(0), eof_reached(false) {}

bool fasta_reader::read_next(fasta_entry& entry) {
    std::string line;

    while (std::getline(input, line)) {
        line = text::trim(line);
        if (line.empty()) {
            continue;
        }

        if (line[0] == '>') {
            bool finished = !pending_header.empty();
            fasta_entry previous = finished ? take_pending() : fasta_entry();
            start_record(line);

            if (finished) {
                entry = std::move(previous);
                records++;
                return true;
            }
        } else {
            // sequence line, any wrap width
            pending_sequence += line;
        }
    }

    eof_reached = true;
    if (!pending_header.empty()) {
        entry = take_pending();
        records++;
        return true;
    }
    return false;
}

fasta_entry fasta_reader::take_pending() {
    fasta_entry entry(std::move(pending_header), std::move(pending_description),
                      std::move(pending_sequence));
    pending_header.clear();
    pending_description.clear();
    pending_sequence.clear();
    return entry;
}

// ">id free text" -> identifier up to the first space, rest is the description;
// a '>' without identifier opens a record that is never emitted
void fasta_reader::start_record(const std::string& header_line) {
    std::string header = header_line.substr(1);
    size_t space = header.find(' ');

    if (space == std::string::npos) {
        pending_header = header;
        pending_description.clear();
    } else {
        pending_header = header.substr(0, space);
        pending_description = header.substr(space + 1);
    }
    pending_sequence.clear();
}

std::vector<fasta_entry> fasta_reader::parse_text(const std::string& content) {
    fasta_reader reader(in_memory{}, content);
    return reader.read_all();
}
