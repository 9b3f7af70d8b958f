/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_SECTION_PARSERS_HPP
#define GBFLAT_SECTION_PARSERS_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "genbank_constants.hpp"
#include "record_accumulator.hpp"

namespace genbank {

/**
 * Abstract base class for the parser of one GenBank section.
 *
 * Parsers hold no state of their own; everything they need to remember
 * between lines lives in the record_accumulator of the current parse run.
 */
class section_parser {
public:
    virtual ~section_parser() = default;

    /**
     * Whether this parser takes the line, either as the start of its
     * section or as a continuation of it.
     */
    virtual bool can_consume(const std::string& line, const record_accumulator& acc) const = 0;

    /**
     * Apply the line to the accumulator.
     * @throws genbank_parse_error on fatal grammar errors (LOCUS size)
     */
    virtual void consume(const std::string& line, record_accumulator& acc) const = 0;

    virtual section_type section() const = 0;
};

class locus_parser : public section_parser {
public:
    bool can_consume(const std::string& line, const record_accumulator& acc) const override;
    void consume(const std::string& line, record_accumulator& acc) const override;
    section_type section() const override { return section_type::LOCUS; }
};

/**
 * Free-text sections wrapped over several lines (DEFINITION, ACCESSION,
 * COMMENT, PRIMARY). Every continuation line is trimmed and appended
 * after a single space.
 */
template<typename Field>
class text_section_parser : public section_parser {
public:
    text_section_parser(section_type section, Field genbank_record::* field)
        : section_{section}, field_{field} {}

    bool can_consume(const std::string& line, const record_accumulator& acc) const override;
    void consume(const std::string& line, record_accumulator& acc) const override;
    section_type section() const override { return section_; }

private:
    section_type section_;
    Field genbank_record::* field_;
};

class version_parser : public section_parser {
public:
    bool can_consume(const std::string& line, const record_accumulator& acc) const override;
    void consume(const std::string& line, record_accumulator& acc) const override;
    section_type section() const override { return section_type::VERSION; }
};

class keywords_parser : public section_parser {
public:
    bool can_consume(const std::string& line, const record_accumulator& acc) const override;
    void consume(const std::string& line, record_accumulator& acc) const override;
    section_type section() const override { return section_type::KEYWORDS; }
};

/**
 * SOURCE block including the ORGANISM line and the taxonomy lineage.
 * Lines inside the block that are none of the three are accepted and
 * ignored.
 */
class source_parser : public section_parser {
public:
    bool can_consume(const std::string& line, const record_accumulator& acc) const override;
    void consume(const std::string& line, record_accumulator& acc) const override;
    section_type section() const override { return section_type::SOURCE; }
};

/**
 * REFERENCE blocks. Only the first line of AUTHORS, TITLE, JOURNAL and
 * PUBMED is kept; wrapped lines are accepted and dropped.
 */
class reference_parser : public section_parser {
public:
    bool can_consume(const std::string& line, const record_accumulator& acc) const override;
    void consume(const std::string& line, record_accumulator& acc) const override;
    section_type section() const override { return section_type::REFERENCE; }
};

/**
 * FEATURES table. Feature lines are indented by 5 columns, qualifier lines
 * by 21; a qualifier line that does not start with '/' continues the value
 * of the qualifier inserted last.
 */
class features_parser : public section_parser {
public:
    bool can_consume(const std::string& line, const record_accumulator& acc) const override;
    void consume(const std::string& line, record_accumulator& acc) const override;
    section_type section() const override { return section_type::FEATURES; }

private:
    static void feature_line(const std::string& line, record_accumulator& acc);
    static void qualifier_line(const std::string& line, record_accumulator& acc);
};

class origin_parser : public section_parser {
public:
    bool can_consume(const std::string& line, const record_accumulator& acc) const override;
    void consume(const std::string& line, record_accumulator& acc) const override;
    section_type section() const override { return section_type::ORIGIN; }
};

using parser_list = std::vector<std::unique_ptr<section_parser>>;

/**
 * All section parsers in dispatch priority order. The order matters: SOURCE
 * and REFERENCE accept foreign lines while their block is open, so they
 * must be tried before COMMENT, PRIMARY and FEATURES.
 */
parser_list make_section_parsers();

} // namespace genbank

#endif //GBFLAT_SECTION_PARSERS_HPP
