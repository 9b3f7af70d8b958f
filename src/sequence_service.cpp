/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "sequence_service.hpp"

// standard
#include <fstream>
#include <stdexcept>
#include <utility>

// class
#include "errors.hpp"
#include "fasta_reader.hpp"
#include "genbank_reader.hpp"
#include "record_writer.hpp"
#include "utility.hpp"

std::string to_string(output_format format) {
    switch (format) {
        case output_format::JSON:  return "JSON";
        case output_format::FASTA: return "FASTA";
    }
    return "UNKNOWN";
}

filetype sequence_service::parse_format_hint(const std::string& hint) {
    std::string name = text::to_lower(text::trim(hint));
    if (name == "genbank") {
        return filetype::GENBANK;
    }
    if (name == "fasta") {
        return filetype::FASTA;
    }
    throw unsupported_format_error(hint);
}

output_format sequence_service::parse_output_format(const std::string& name) {
    std::string lower = text::to_lower(text::trim(name));
    if (lower == "json") {
        return output_format::JSON;
    }
    if (lower == "fasta") {
        return output_format::FASTA;
    }
    throw unsupported_format_error(name);
}

std::string sequence_service::extension(output_format format) {
    return format == output_format::FASTA ? "fa" : "json";
}

std::vector<sequence_record> sequence_service::parse_file(const std::filesystem::path& filepath,
                                                          std::optional<filetype> hint) const {
    filetype ftype;
    if (hint) {
        ftype = *hint;
    } else {
        filetype_detector detector;
        auto [detected, gzipped] = detector.detect_filetype(filepath);
        ftype = detected;
        logging::info("Detected file type: " + to_string(ftype) + (gzipped ? " (gzipped)" : ""));
    }

    std::vector<sequence_record> records;
    switch (ftype) {
        case filetype::GENBANK: {
            genbank_reader reader(filepath);
            for (auto& record : reader.read_all()) {
                records.emplace_back(std::move(record));
            }
            break;
        }
        case filetype::FASTA: {
            fasta_reader reader(filepath);
            for (auto& entry : reader.read_all()) {
                records.emplace_back(std::move(entry));
            }
            break;
        }
        default:
            throw unsupported_format_error(filepath.string());
    }

    logging::info("Parsed " + std::to_string(records.size()) + " record(s) from " + filepath.string());
    return records;
}

std::filesystem::path sequence_service::save_record(const sequence_record& record,
                                                    const std::filesystem::path& filepath,
                                                    output_format format) const {
    if (std::holds_alternative<genbank_record>(record) && format != output_format::JSON) {
        throw unsupported_record_error("GenBank", to_string(format));
    }

    if (filepath.has_parent_path()) {
        std::filesystem::create_directories(filepath.parent_path());
    }

    std::ofstream out(filepath);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot create output file: " + filepath.string());
    }

    if (const auto* genbank = std::get_if<genbank_record>(&record)) {
        record_writer::write_genbank_json(*genbank, out);
    } else {
        const auto& fasta = std::get<fasta_entry>(record);
        if (format == output_format::FASTA) {
            record_writer::write_fasta(fasta, out);
        } else {
            record_writer::write_fasta_json(fasta, out);
        }
    }

    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + filepath.string());
    }
    return filepath;
}
