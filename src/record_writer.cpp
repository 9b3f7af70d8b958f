/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "record_writer.hpp"

// standard
#include <optional>
#include <stdexcept>
#include <string>

// rapidjson
#include <rapidjson/encodings.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>

namespace record_writer {

namespace {

    using json_writer = rapidjson::PrettyWriter<rapidjson::OStreamWrapper,
                                                rapidjson::UTF8<>, rapidjson::ASCII<>>;

    void put(json_writer& writer, const std::string& value) {
        if (!writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()))) {
            throw std::runtime_error("Cannot write JSON string, invalid UTF-8: " + value);
        }
    }

    void put(json_writer& writer, const char* key, const std::string& value) {
        writer.Key(key);
        put(writer, value);
    }

    void put_optional(json_writer& writer, const char* key, const std::optional<std::string>& value) {
        if (value) {
            put(writer, key, *value);
        }
    }

    void write_reference(json_writer& writer, const genbank_reference& reference) {
        writer.StartObject();
        put_optional(writer, "citation", reference.citation);
        put_optional(writer, "authors", reference.authors);
        put_optional(writer, "title", reference.title);
        put_optional(writer, "journal", reference.journal);
        put_optional(writer, "pubmed", reference.pubmed);
        writer.EndObject();
    }

    void write_feature(json_writer& writer, const genbank_feature& feature) {
        writer.StartObject();
        put(writer, "feature_type", feature.feature_type);
        put(writer, "location", feature.location);

        writer.Key("qualifiers");
        writer.StartObject();
        for (const auto& [key, fragments] : feature.qualifiers) {
            put(writer, key);
            writer.StartArray();
            for (const auto& fragment : fragments) {
                put(writer, fragment);
            }
            writer.EndArray();
        }
        writer.EndObject();

        writer.EndObject();
    }

    void init(json_writer& writer) {
        writer.SetIndent(' ', 2);
    }

} // namespace

void write_genbank_json(const genbank_record& record, std::ostream& out) {
    rapidjson::OStreamWrapper stream(out);
    json_writer writer(stream);
    init(writer);

    writer.StartObject();
    put(writer, "locus", record.locus);
    writer.Key("size");
    writer.Int64(record.size);
    put(writer, "molecule_type", record.molecule_type);
    put(writer, "genbank_division", record.genbank_division);
    put(writer, "modification_date", record.modification_date);
    put(writer, "definition", record.definition);
    put(writer, "accession", record.accession);
    put(writer, "version", record.version);

    writer.Key("keywords");
    writer.StartArray();
    for (const auto& keyword : record.keywords) {
        put(writer, keyword);
    }
    writer.EndArray();

    put(writer, "source", record.source);
    put(writer, "organism", record.organism);
    put(writer, "taxonomy", record.taxonomy);

    writer.Key("references");
    writer.StartArray();
    for (const auto& reference : record.references) {
        write_reference(writer, reference);
    }
    writer.EndArray();

    writer.Key("features");
    writer.StartArray();
    for (const auto& feature : record.features) {
        write_feature(writer, feature);
    }
    writer.EndArray();

    put(writer, "sequence", record.sequence);
    put(writer, "comment", record.comment.value_or(""));
    put(writer, "primary", record.primary.value_or(""));
    writer.EndObject();

    out << '\n';
}

void write_fasta_json(const fasta_entry& entry, std::ostream& out) {
    rapidjson::OStreamWrapper stream(out);
    json_writer writer(stream);
    init(writer);

    writer.StartObject();
    put(writer, "header", entry.header);
    put(writer, "description", entry.description);
    put(writer, "sequence", entry.sequence);
    writer.EndObject();

    out << '\n';
}

void write_fasta(const fasta_entry& entry, std::ostream& out, size_t line_width) {
    if (line_width == 0) {
        throw std::invalid_argument("FASTA line width must be positive");
    }

    out << '>' << entry.header;
    if (!entry.description.empty()) {
        out << ' ' << entry.description;
    }
    out << '\n';

    for (size_t pos = 0; pos < entry.sequence.size(); pos += line_width) {
        out << entry.sequence.substr(pos, line_width) << '\n';
    }
}

} // namespace record_writer
