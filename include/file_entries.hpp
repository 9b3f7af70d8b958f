/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_FILE_ENTRIES_HPP
#define GBFLAT_FILE_ENTRIES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * Qualifiers of a GenBank feature, kept in insertion order.
 *
 * Every key maps to a list of fragments: the value of the /key=value line
 * followed by one entry per continuation line. Fragments are never joined
 * here, the right join rule depends on the qualifier (no separator for
 * /translation, a space for /note).
 */
class qualifier_map {
public:
    using fragments = std::vector<std::string>;
    using entry = std::pair<std::string, fragments>;
    using const_iterator = std::vector<entry>::const_iterator;

    /**
     * Replace the fragment list of key with a single value. An existing key
     * keeps its position; a new key is appended.
     */
    void assign(const std::string& key, std::string value);

    // append a fragment to the key inserted last, no-op on an empty map
    void append_to_last(std::string fragment);

    const fragments* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }


    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    const_iterator begin() const { return entries.begin(); }
    const_iterator end() const { return entries.end(); }

    bool operator==(const qualifier_map& other) const { return entries == other.entries; }

private:
    std::vector<entry> entries;
};

// annotated region of a GenBank record (one entry of the FEATURES table)
struct genbank_feature {
    std::string feature_type;
    std::string location;       // raw location expression, e.g. join(1..10,20..30)
    qualifier_map qualifiers;

    genbank_feature() = default;
    genbank_feature(std::string feature_type, std::string location)
        : feature_type{std::move(feature_type)}, location{std::move(location)} {}
};

// one REFERENCE block, every key holds at most one line of text
struct genbank_reference {
    std::optional<std::string> citation;
    std::optional<std::string> authors;
    std::optional<std::string> title;
    std::optional<std::string> journal;
    std::optional<std::string> pubmed;
};

// represents a single GenBank record (LOCUS ... //)
struct genbank_record {
    std::string locus;
    int64_t size = 0;
    std::string molecule_type;
    std::string genbank_division;
    std::string modification_date;
    std::string definition;
    std::string accession;
    std::string version;
    std::vector<std::string> keywords;
    std::string source;
    std::string organism;       // includes " [taxonomy]" when a lineage was given
    std::string taxonomy;
    std::vector<genbank_reference> references;
    std::vector<genbank_feature> features;
    std::string sequence;
    std::optional<std::string> comment;
    std::optional<std::string> primary;
};

// represents a single FASTA record
struct fasta_entry {
    std::string header;         // identifier, text up to the first space
    std::string description;
    std::string sequence;

    fasta_entry() = default;
    fasta_entry(std::string header, std::string description, std::string sequence)
        : header{std::move(header)}, description{std::move(description)},
          sequence{std::move(sequence)} {}
};

#endif //GBFLAT_FILE_ENTRIES_HPP
