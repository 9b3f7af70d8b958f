/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_GENBANK_CONSTANTS_HPP
#define GBFLAT_GENBANK_CONSTANTS_HPP

#include <array>
#include <string>
#include <string_view>

namespace genbank {

/**
 * Top-level sections of a GenBank flat file. BASE and CONTIG have no parser
 * of their own, they only terminate FEATURES/SOURCE/REFERENCE blocks.
 */
enum class section_type {
    LOCUS, DEFINITION, ACCESSION, VERSION, KEYWORDS, SOURCE, REFERENCE,
    COMMENT, PRIMARY, FEATURES, ORIGIN, BASE, CONTIG
};

inline constexpr std::string_view keyword(section_type section) {
    switch (section) {
        case section_type::LOCUS:      return "LOCUS";
        case section_type::DEFINITION: return "DEFINITION";
        case section_type::ACCESSION:  return "ACCESSION";
        case section_type::VERSION:    return "VERSION";
        case section_type::KEYWORDS:   return "KEYWORDS";
        case section_type::SOURCE:     return "SOURCE";
        case section_type::REFERENCE:  return "REFERENCE";
        case section_type::COMMENT:    return "COMMENT";
        case section_type::PRIMARY:    return "PRIMARY";
        case section_type::FEATURES:   return "FEATURES";
        case section_type::ORIGIN:     return "ORIGIN";
        case section_type::BASE:       return "BASE";
        case section_type::CONTIG:     return "CONTIG";
    }
    return "";
}

// keywords that open a new section and trigger a full parser lookup
inline constexpr std::array<section_type, 11> dispatch_sections = {
    section_type::LOCUS, section_type::DEFINITION, section_type::ACCESSION,
    section_type::VERSION, section_type::KEYWORDS, section_type::SOURCE,
    section_type::REFERENCE, section_type::COMMENT, section_type::PRIMARY,
    section_type::FEATURES, section_type::ORIGIN
};

inline constexpr std::string_view record_terminator = "//";

// fixed-column indents of the flat-file layout
namespace indent {
    inline constexpr std::string_view section = "  ";                        // ORGANISM, AUTHORS, ...
    inline constexpr std::string_view pubmed = "   ";
    inline constexpr std::string_view feature = "     ";
    inline constexpr std::string_view taxonomy = "            ";
    inline constexpr std::string_view qualifier = "                     ";
}

inline bool starts_with(std::string_view line, section_type section) {
    return line.starts_with(keyword(section));
}

} // namespace genbank

#endif //GBFLAT_GENBANK_CONSTANTS_HPP
