/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "genbank_reader.hpp"

// standard
#include <sstream>

// class
#include "errors.hpp"
#include "utility.hpp"

namespace genbank {

std::vector<std::string> split_records(const std::string& content) {
    std::vector<std::string> chunks;
    std::string current;

    auto push_chunk = [&chunks](std::string& chunk) {
        if (!text::trim(chunk).empty()) {
            chunks.push_back(std::move(chunk));
        }
        chunk.clear();
    };

    size_t pos = 0;
    while (pos < content.size()) {
        size_t eol = content.find('\n', pos);
        size_t next = (eol == std::string::npos) ? content.size() : eol + 1;

        std::string_view line(content.data() + pos, next - pos);
        std::string_view bare = line;
        while (!bare.empty() && (bare.back() == '\n' || bare.back() == '\r')) {
            bare.remove_suffix(1);
        }

        if (bare == record_terminator) {
            push_chunk(current);
        } else {
            current.append(line);
        }
        pos = next;
    }
    push_chunk(current);

    return chunks;
}

std::vector<std::string> split_lines(const std::string& chunk) {
    std::vector<std::string> lines;
    std::istringstream iss(chunk);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

section_dispatcher::section_dispatcher()
    : parsers(make_section_parsers()) {}

bool section_dispatcher::is_section_start(const std::string& line) {
    for (auto section : dispatch_sections) {
        if (starts_with(line, section)) {
            return true;
        }
    }
    return false;
}

void section_dispatcher::dispatch(const std::string& line, record_accumulator& acc,
                                  const section_parser*& active) const {
    if (text::trim(line).empty()) {
        return;
    }

    if (is_section_start(line)) {
        for (const auto& parser : parsers) {
            if (parser->can_consume(line, acc)) {
                active = parser.get();
                parser->consume(line, acc);
                return;
            }
        }
        return;
    }

    // continuation line; anything the active section declines is dropped
    if (active && active->can_consume(line, acc)) {
        active->consume(line, acc);
    }
}

genbank_record section_dispatcher::parse_record(const std::string& chunk) const {
    record_accumulator acc;
    const section_parser* active = nullptr;

    for (const auto& line : split_lines(chunk)) {
        dispatch(line, acc, active);
    }

    return acc.finalize();
}

} // namespace genbank

genbank_reader::genbank_reader(const std::filesystem::path& filepath)
    : genbank_reader(genbank::split_records(text::read_file(filepath)), filepath.string()) {}

genbank_reader::genbank_reader(std::vector<std::string> chunks, std::string origin)
    : chunks(std::move(chunks)), next_chunk(0), origin(std::move(origin)) {}

bool genbank_reader::read_next(genbank_record& entry) {
    if (!has_next()) {
        return false;
    }

    size_t index = next_chunk++;
    try {
        entry = dispatcher.parse_record(chunks[index]);
    } catch (const genbank_parse_error& e) {
        throw genbank_parse_error(origin + ", record " + std::to_string(index + 1) + ": " + e.what());
    }
    return true;
}

std::vector<genbank_record> genbank_reader::parse_text(const std::string& content) {
    genbank_reader reader(genbank::split_records(content), "<memory>");
    return reader.read_all();
}
