/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "section_parsers.hpp"

// standard
#include <algorithm>
#include <initializer_list>
#include <sstream>
#include <stdexcept>

// class
#include "errors.hpp"
#include "utility.hpp"

namespace genbank {

namespace {

    // remainder of the line after a (possibly indented) label, trimmed
    std::string value_after(const std::string& line, std::string_view label) {
        return text::trim(line.substr(std::min(label.size(), line.size())));
    }

    std::string value_after(const std::string& line, section_type section) {
        return value_after(line, keyword(section));
    }

    bool starts_any(const std::string& line, std::initializer_list<section_type> sections) {
        for (auto section : sections) {
            if (starts_with(line, section)) {
                return true;
            }
        }
        return false;
    }

    bool in_section(const record_accumulator& acc, section_type section) {
        return acc.current_section && *acc.current_section == section;
    }

    // "  AUTHORS", "   PUBMED", ...
    std::string label(std::string_view indentation, const char* name) {
        return std::string(indentation) + name;
    }

    const std::string ORGANISM = label(indent::section, "ORGANISM");
    const std::string AUTHORS = label(indent::section, "AUTHORS");
    const std::string TITLE = label(indent::section, "TITLE");
    const std::string JOURNAL = label(indent::section, "JOURNAL");
    const std::string PUBMED = label(indent::pubmed, "PUBMED");

    void set_text(std::string& field, std::string value) { field = std::move(value); }
    void set_text(std::optional<std::string>& field, std::string value) { field = std::move(value); }

    void append_text(std::string& field, const std::string& value) { field += " " + value; }
    void append_text(std::optional<std::string>& field, const std::string& value) {
        field = field.value_or("") + " " + value;
    }

    std::string strip_trailing_quote(std::string value) {
        if (!value.empty() && value.back() == '"') {
            value.pop_back();
        }
        return value;
    }

} // namespace

// LOCUS       NG_009073  128315 bp    DNA     linear   PRI 03-OCT-2024
bool locus_parser::can_consume(const std::string& line, const record_accumulator&) const {
    return starts_with(line, section_type::LOCUS);
}

void locus_parser::consume(const std::string& line, record_accumulator& acc) const {
    acc.current_section = section_type::LOCUS;

    auto tokens = text::split_whitespace(value_after(line, section_type::LOCUS));
    if (tokens.size() < 7) {
        return;
    }

    int64_t size = 0;
    try {
        size_t pos = 0;
        size = std::stoll(tokens[1], &pos);
        if (pos != tokens[1].size()) {
            throw std::invalid_argument(tokens[1]);
        }
    } catch (const std::invalid_argument&) {
        throw genbank_parse_error("Invalid sequence length in LOCUS line: '" + tokens[1] + "'");
    } catch (const std::out_of_range&) {
        throw genbank_parse_error("Sequence length out of range in LOCUS line: '" + tokens[1] + "'");
    }

    // tokens 2 and 4 are the unit ("bp") and the topology
    acc.record.locus = tokens[0];
    acc.record.size = size;
    acc.record.molecule_type = tokens[3];
    acc.record.genbank_division = tokens[5];
    acc.record.modification_date = tokens[6];
}

template<typename Field>
bool text_section_parser<Field>::can_consume(const std::string& line,
                                             const record_accumulator& acc) const {
    return starts_with(line, section_) || (in_section(acc, section_) && line.starts_with(' '));
}

template<typename Field>
void text_section_parser<Field>::consume(const std::string& line, record_accumulator& acc) const {
    if (starts_with(line, section_)) {
        acc.current_section = section_;
        set_text(acc.record.*field_, value_after(line, section_));
    } else {
        append_text(acc.record.*field_, text::trim(line));
    }
}

template class text_section_parser<std::string>;
template class text_section_parser<std::optional<std::string>>;

bool version_parser::can_consume(const std::string& line, const record_accumulator&) const {
    return starts_with(line, section_type::VERSION);
}

void version_parser::consume(const std::string& line, record_accumulator& acc) const {
    acc.current_section = section_type::VERSION;
    acc.record.version = value_after(line, section_type::VERSION);
}

bool keywords_parser::can_consume(const std::string& line, const record_accumulator&) const {
    return starts_with(line, section_type::KEYWORDS);
}

void keywords_parser::consume(const std::string& line, record_accumulator& acc) const {
    acc.current_section = section_type::KEYWORDS;

    std::string keyword_text = value_after(line, section_type::KEYWORDS);
    keyword_text.erase(keyword_text.find_last_not_of('.') + 1);

    std::vector<std::string> keywords;
    std::istringstream iss(keyword_text);
    std::string token;
    while (std::getline(iss, token, ';')) {
        token = text::trim(token);
        if (!token.empty()) {
            keywords.push_back(std::move(token));
        }
    }

    // a bare "KEYWORDS    ." keeps whatever an earlier KEYWORDS line set
    if (!keywords.empty()) {
        acc.record.keywords = std::move(keywords);
    }
}

bool source_parser::can_consume(const std::string& line, const record_accumulator& acc) const {
    if (starts_with(line, section_type::SOURCE) || line.starts_with(ORGANISM)) {
        return true;
    }
    if (!in_section(acc, section_type::SOURCE)) {
        return false;
    }
    if (line.starts_with(indent::taxonomy)) {
        return true;
    }
    return !starts_any(line, {section_type::REFERENCE, section_type::COMMENT,
                              section_type::PRIMARY, section_type::FEATURES,
                              section_type::ORIGIN, section_type::BASE,
                              section_type::CONTIG});
}

void source_parser::consume(const std::string& line, record_accumulator& acc) const {
    if (starts_with(line, section_type::SOURCE)) {
        acc.current_section = section_type::SOURCE;
        acc.record.source = value_after(line, section_type::SOURCE);
    } else if (line.starts_with(ORGANISM)) {
        acc.record.organism = value_after(line, ORGANISM);
    } else if (in_section(acc, section_type::SOURCE) && line.starts_with(indent::taxonomy)) {
        std::string lineage = text::trim(line);
        if (acc.record.taxonomy.empty()) {
            acc.record.taxonomy = std::move(lineage);
        } else {
            acc.record.taxonomy += " " + lineage;
        }
    }
}

bool reference_parser::can_consume(const std::string& line, const record_accumulator& acc) const {
    if (starts_with(line, section_type::REFERENCE)) {
        return true;
    }
    return in_section(acc, section_type::REFERENCE)
        && !starts_any(line, {section_type::FEATURES, section_type::ORIGIN,
                              section_type::BASE, section_type::CONTIG,
                              section_type::COMMENT, section_type::PRIMARY});
}

void reference_parser::consume(const std::string& line, record_accumulator& acc) const {
    if (starts_with(line, section_type::REFERENCE)) {
        acc.current_section = section_type::REFERENCE;
        acc.flush_reference();
        acc.current_reference.emplace();
        acc.current_reference->citation = value_after(line, section_type::REFERENCE);
        return;
    }

    if (!in_section(acc, section_type::REFERENCE) || !acc.current_reference) {
        return;
    }

    auto& reference = *acc.current_reference;
    if (line.starts_with(AUTHORS)) {
        reference.authors = value_after(line, AUTHORS);
    } else if (line.starts_with(TITLE)) {
        reference.title = value_after(line, TITLE);
    } else if (line.starts_with(JOURNAL)) {
        reference.journal = value_after(line, JOURNAL);
    } else if (line.starts_with(PUBMED)) {
        reference.pubmed = value_after(line, PUBMED);
    }
}

bool features_parser::can_consume(const std::string& line, const record_accumulator& acc) const {
    if (starts_with(line, section_type::FEATURES)) {
        return true;
    }
    return acc.in_features
        && !starts_any(line, {section_type::ORIGIN, section_type::BASE, section_type::CONTIG});
}

void features_parser::consume(const std::string& line, record_accumulator& acc) const {
    if (starts_with(line, section_type::FEATURES)) {
        acc.current_section = section_type::FEATURES;
        acc.in_features = true;
        return;
    }

    if (line.starts_with(indent::feature) && !line.starts_with(indent::qualifier)) {
        feature_line(line, acc);
    } else if (line.starts_with(indent::qualifier) && acc.current_feature) {
        qualifier_line(line, acc);
    }
}

//      gene            complement(join(1..200,300..400))
void features_parser::feature_line(const std::string& line, record_accumulator& acc) {
    acc.flush_feature();

    std::string body = value_after(line, indent::feature);
    size_t split = body.find_first_of(" \t");
    if (split == std::string::npos) {
        return;
    }
    size_t location_start = body.find_first_not_of(" \t", split);

    acc.current_feature.emplace(body.substr(0, split), body.substr(location_start));
}

//                      /gene="ABCA4"
void features_parser::qualifier_line(const std::string& line, record_accumulator& acc) {
    std::string body = value_after(line, indent::qualifier);
    auto& qualifiers = acc.current_feature->qualifiers;

    if (!body.starts_with('/')) {
        // continuation of a wrapped value; an opening quote on an earlier
        // line is not tracked, so only a closing quote is removed
        qualifiers.append_to_last(strip_trailing_quote(std::move(body)));
        return;
    }

    size_t eq_pos = body.find('=');
    if (eq_pos == std::string::npos) {
        qualifiers.assign(body.substr(1), "");
        return;
    }

    std::string key = body.substr(1, eq_pos - 1);
    std::string value = body.substr(eq_pos + 1);
    if (value.starts_with('"')) {
        value = strip_trailing_quote(value.substr(1));
    }
    qualifiers.assign(key, std::move(value));
}

bool origin_parser::can_consume(const std::string& line, const record_accumulator& acc) const {
    return starts_with(line, section_type::ORIGIN) || in_section(acc, section_type::ORIGIN);
}

//         1 ggacacagcg ttagacccca agttcttggc ...
void origin_parser::consume(const std::string& line, record_accumulator& acc) const {
    if (starts_with(line, section_type::ORIGIN)) {
        acc.current_section = section_type::ORIGIN;
        acc.in_sequence = true;
        acc.in_features = false;
        return;
    }

    if (!acc.in_sequence || line.starts_with(record_terminator)) {
        return;
    }

    auto tokens = text::split_whitespace(line);
    if (tokens.size() < 2) {
        return;
    }

    std::string fragment;
    for (size_t i = 1; i < tokens.size(); ++i) {
        fragment += tokens[i];
    }
    acc.sequence_fragments.push_back(std::move(fragment));
}

parser_list make_section_parsers() {
    parser_list parsers;
    parsers.push_back(std::make_unique<locus_parser>());
    parsers.push_back(std::make_unique<text_section_parser<std::string>>(
        section_type::DEFINITION, &genbank_record::definition));
    parsers.push_back(std::make_unique<text_section_parser<std::string>>(
        section_type::ACCESSION, &genbank_record::accession));
    parsers.push_back(std::make_unique<version_parser>());
    parsers.push_back(std::make_unique<keywords_parser>());
    parsers.push_back(std::make_unique<source_parser>());
    parsers.push_back(std::make_unique<reference_parser>());
    parsers.push_back(std::make_unique<text_section_parser<std::optional<std::string>>>(
        section_type::COMMENT, &genbank_record::comment));
    parsers.push_back(std::make_unique<text_section_parser<std::optional<std::string>>>(
        section_type::PRIMARY, &genbank_record::primary));
    parsers.push_back(std::make_unique<features_parser>());
    parsers.push_back(std::make_unique<origin_parser>());
    return parsers;
}

} // namespace genbank
