/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/summary.hpp"

#include <iostream>
#include <string>

#include "utility.hpp"

namespace subcall {

cxxopts::Options summary::parse_args(int argc, char** argv) {
    cxxopts::Options options("gbflat summary",
        "Print a short overview of every record");

    add_common_options(options);

    return options;
}

void summary::validate(const cxxopts::ParseResult& args) {
    validate_input(args);
}

void summary::execute(const cxxopts::ParseResult& args) {
    // stdout carries the report, keep info lines out of it
    logging::set_quiet(true);

    std::string input_path = args["input"].as<std::string>();
    auto records = service.parse_file(input_path, format_hint(args));

    for (size_t i = 0; i < records.size(); ++i) {
        write_summary(records[i], i, std::cout);
    }
}

void summary::write_summary(const sequence_record& record, size_t index, std::ostream& out) {
    out << "Record " << index + 1 << "\n";

    if (const auto* genbank = std::get_if<genbank_record>(&record)) {
        out << "Locus: " << genbank->locus << "\n";
        out << "Definition: " << genbank->definition << "\n";
        out << "Features: " << genbank->features.size() << "\n";
        out << "Sequence length: " << genbank->sequence.size() << " bp\n";
    } else {
        const auto& fasta = std::get<fasta_entry>(record);
        out << "Header: " << fasta.header << "\n";
        out << "Description: " << fasta.description << "\n";
        out << "Sequence length: " << fasta.sequence.size() << " bp\n";
    }

    out << std::string(50, '-') << std::endl;
}

} // namespace subcall
