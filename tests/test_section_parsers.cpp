/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#define BOOST_TEST_MODULE section_parsers
#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "errors.hpp"
#include "genbank_reader.hpp"
#include "record_accumulator.hpp"
#include "section_parsers.hpp"
#include "test_helpers.hpp"

using namespace genbank;
using test_helpers::FEATURE;
using test_helpers::QUALIFIER;
using test_helpers::TAXONOMY;
using fragments = qualifier_map::fragments;

namespace {

    // drives the dispatcher line by line so the accumulator can be
    // inspected between lines
    struct dispatch_fixture {
        section_dispatcher dispatcher;
        record_accumulator acc;
        const section_parser* active = nullptr;

        void feed(const std::vector<std::string>& lines) {
            for (const auto& line : lines) {
                dispatcher.dispatch(line, acc, active);
            }
        }

        genbank_record finish() {
            return acc.finalize();
        }
    };

    const std::string LOCUS_LINE =
        "LOCUS       NG_009073  128315 bp    DNA     linear   PRI 03-OCT-2024";
}

BOOST_FIXTURE_TEST_SUITE(locus, dispatch_fixture)

BOOST_AUTO_TEST_CASE(well_formed_line) {
    feed({LOCUS_LINE});

    BOOST_CHECK_EQUAL(acc.record.locus, "NG_009073");
    BOOST_CHECK_EQUAL(acc.record.size, 128315);
    BOOST_CHECK_EQUAL(acc.record.molecule_type, "DNA");
    BOOST_CHECK_EQUAL(acc.record.genbank_division, "PRI");
    BOOST_CHECK_EQUAL(acc.record.modification_date, "03-OCT-2024");
    BOOST_CHECK(acc.current_section == section_type::LOCUS);

    // unit and topology are not stored anywhere
    for (const auto& field : {acc.record.locus, acc.record.molecule_type,
                              acc.record.genbank_division, acc.record.modification_date}) {
        BOOST_CHECK_NE(field, "bp");
        BOOST_CHECK_NE(field, "linear");
    }
}

BOOST_AUTO_TEST_CASE(short_line_keeps_defaults) {
    feed({"LOCUS       NG_009073  128315 bp    DNA"});

    BOOST_CHECK_EQUAL(acc.record.locus, "");
    BOOST_CHECK_EQUAL(acc.record.size, 0);
    BOOST_CHECK_EQUAL(acc.record.molecule_type, "");
}

BOOST_AUTO_TEST_CASE(non_numeric_size_is_fatal) {
    BOOST_CHECK_THROW(feed({"LOCUS       NG_009073  12x315 bp    DNA     linear   PRI 03-OCT-2024"}),
                      genbank_parse_error);
    BOOST_CHECK_THROW(feed({"LOCUS       NG_009073  many bp    DNA     linear   PRI 03-OCT-2024"}),
                      genbank_parse_error);
}

BOOST_AUTO_TEST_CASE(no_continuation) {
    feed({LOCUS_LINE, "            NG_000001 1 bp DNA linear PRI 01-JAN-2000"});
    BOOST_CHECK_EQUAL(acc.record.locus, "NG_009073");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(text_sections, dispatch_fixture)

BOOST_AUTO_TEST_CASE(definition_wraps) {
    feed({"DEFINITION  Homo sapiens ATP binding cassette subfamily A member 4 (ABCA4),",
          "            RefSeqGene (LRG_94) on chromosome 1."});

    BOOST_CHECK_EQUAL(acc.record.definition,
        "Homo sapiens ATP binding cassette subfamily A member 4 (ABCA4), "
        "RefSeqGene (LRG_94) on chromosome 1.");
}

BOOST_AUTO_TEST_CASE(accession_wraps) {
    feed({"ACCESSION   NG_009073 REGION: 5000..133314", "            NG_000002"});
    BOOST_CHECK_EQUAL(acc.record.accession, "NG_009073 REGION: 5000..133314 NG_000002");
}

BOOST_AUTO_TEST_CASE(comment_and_primary_are_optional) {
    feed({LOCUS_LINE});
    BOOST_CHECK(!acc.record.comment);
    BOOST_CHECK(!acc.record.primary);

    feed({"COMMENT     REVIEWED REFSEQ: This record has been curated by NCBI staff.",
          "            The reference sequence was derived from AL109810.8.",
          "PRIMARY     REFSEQ_SPAN         PRIMARY_IDENTIFIER PRIMARY_SPAN        COMP",
          "            1-24                AB000001.1         1-24"});

    BOOST_REQUIRE(acc.record.comment);
    BOOST_CHECK_EQUAL(*acc.record.comment,
        "REVIEWED REFSEQ: This record has been curated by NCBI staff. "
        "The reference sequence was derived from AL109810.8.");
    BOOST_REQUIRE(acc.record.primary);
    BOOST_CHECK_EQUAL(*acc.record.primary,
        "REFSEQ_SPAN         PRIMARY_IDENTIFIER PRIMARY_SPAN        COMP "
        "1-24                AB000001.1         1-24");
}

BOOST_AUTO_TEST_CASE(version_last_wins_and_has_no_continuation) {
    feed({"VERSION     NG_009073.1", "            ignored", "VERSION     NG_009073.2"});
    BOOST_CHECK_EQUAL(acc.record.version, "NG_009073.2");
}

BOOST_AUTO_TEST_CASE(unclaimed_lines_are_dropped) {
    feed({"VERSION     NG_009073.2",
          "DBLINK      BioProject: PRJNA000000",
          "            BioSample: SAMN00000000"});

    BOOST_CHECK_EQUAL(acc.record.version, "NG_009073.2");
    BOOST_CHECK(active != nullptr);
    BOOST_CHECK(active->section() == section_type::VERSION);
}

BOOST_AUTO_TEST_CASE(lines_before_first_section_are_dropped) {
    feed({"            stray text", "", "   "});
    BOOST_CHECK(active == nullptr);
    BOOST_CHECK(!acc.current_section);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(keywords, dispatch_fixture)

BOOST_AUTO_TEST_CASE(split_and_trim) {
    feed({"KEYWORDS    RefSeq; ; RefSeqGene; RefSeq."});

    std::vector<std::string> expected{"RefSeq", "RefSeqGene", "RefSeq"};
    BOOST_CHECK_EQUAL_COLLECTIONS(acc.record.keywords.begin(), acc.record.keywords.end(),
                                  expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(empty_keywords_preserve_earlier_ones) {
    feed({"KEYWORDS    RefSeq; RefSeqGene.", "KEYWORDS    ."});
    BOOST_CHECK_EQUAL(acc.record.keywords.size(), 2u);

    feed({"KEYWORDS    "});
    BOOST_CHECK_EQUAL(acc.record.keywords.size(), 2u);

    feed({"KEYWORDS    HTG."});
    BOOST_REQUIRE_EQUAL(acc.record.keywords.size(), 1u);
    BOOST_CHECK_EQUAL(acc.record.keywords[0], "HTG");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(source, dispatch_fixture)

BOOST_AUTO_TEST_CASE(organism_and_taxonomy) {
    feed({"SOURCE      Homo sapiens (human)",
          "  ORGANISM  Homo sapiens",
          TAXONOMY + "Eukaryota; Metazoa; Chordata;",
          TAXONOMY + "Hominidae; Homo."});

    BOOST_CHECK_EQUAL(acc.record.source, "Homo sapiens (human)");
    BOOST_CHECK_EQUAL(acc.record.organism, "Homo sapiens");
    BOOST_CHECK_EQUAL(acc.record.taxonomy, "Eukaryota; Metazoa; Chordata; Hominidae; Homo.");

    auto record = finish();
    BOOST_CHECK_EQUAL(record.organism,
        "Homo sapiens [Eukaryota; Metazoa; Chordata; Hominidae; Homo.]");
}

BOOST_AUTO_TEST_CASE(no_taxonomy_no_suffix) {
    feed({"SOURCE      synthetic construct", "  ORGANISM  synthetic construct"});
    auto record = finish();
    BOOST_CHECK_EQUAL(record.organism, "synthetic construct");
    BOOST_CHECK_EQUAL(record.taxonomy, "");
}

BOOST_AUTO_TEST_CASE(organism_is_overwritten) {
    feed({"SOURCE      x", "  ORGANISM  first", "  ORGANISM  second"});
    BOOST_CHECK_EQUAL(acc.record.organism, "second");
}

BOOST_AUTO_TEST_CASE(other_block_lines_are_swallowed) {
    feed({"SOURCE      Homo sapiens (human)",
          "  ORGANISM  Homo sapiens",
          "  UNKNOWN   something else",
          " odd indent"});

    BOOST_CHECK_EQUAL(acc.record.source, "Homo sapiens (human)");
    BOOST_CHECK_EQUAL(acc.record.organism, "Homo sapiens");
    BOOST_CHECK_EQUAL(acc.record.taxonomy, "");
    BOOST_CHECK(active->section() == section_type::SOURCE);
}

BOOST_AUTO_TEST_CASE(next_section_ends_block) {
    feed({"SOURCE      Homo sapiens (human)",
          "COMMENT     note",
          TAXONOMY + "not a lineage"});

    BOOST_CHECK_EQUAL(acc.record.taxonomy, "");
    BOOST_REQUIRE(acc.record.comment);
    BOOST_CHECK_EQUAL(*acc.record.comment, "note not a lineage");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(reference, dispatch_fixture)

BOOST_AUTO_TEST_CASE(two_blocks) {
    feed({"REFERENCE   1  (bases 1 to 128315)",
          "  AUTHORS   Allikmets R, Singh N, Sun H,",
          "            Chidambaram A, Gerrard B.",
          "  TITLE     A photoreceptor cell-specific ATP-binding transporter gene",
          "  JOURNAL   Nat Genet 15 (3), 236-246 (1997)",
          "   PUBMED   9054934",
          "REFERENCE   2  (bases 1 to 128315)",
          "  AUTHORS   Sun H, Nathans J."});

    // first block flushed when the second starts
    BOOST_REQUIRE_EQUAL(acc.record.references.size(), 1u);
    BOOST_REQUIRE(acc.current_reference);
    BOOST_CHECK_EQUAL(acc.current_reference->citation.value_or(""), "2  (bases 1 to 128315)");

    auto record = finish();
    BOOST_REQUIRE_EQUAL(record.references.size(), 2u);

    const auto& first = record.references[0];
    BOOST_CHECK_EQUAL(first.citation.value_or(""), "1  (bases 1 to 128315)");
    BOOST_CHECK_EQUAL(first.authors.value_or(""), "Allikmets R, Singh N, Sun H,");
    BOOST_CHECK_EQUAL(first.title.value_or(""),
                      "A photoreceptor cell-specific ATP-binding transporter gene");
    BOOST_CHECK_EQUAL(first.journal.value_or(""), "Nat Genet 15 (3), 236-246 (1997)");
    BOOST_CHECK_EQUAL(first.pubmed.value_or(""), "9054934");

    const auto& second = record.references[1];
    BOOST_CHECK_EQUAL(second.authors.value_or(""), "Sun H, Nathans J.");
    BOOST_CHECK(!second.title);
    BOOST_CHECK(!second.journal);
    BOOST_CHECK(!second.pubmed);
}

BOOST_AUTO_TEST_CASE(last_write_wins) {
    feed({"REFERENCE   1", "  TITLE     first", "  TITLE     second"});
    BOOST_CHECK_EQUAL(acc.current_reference->title.value_or(""), "second");
}

BOOST_AUTO_TEST_CASE(block_swallows_organism_line) {
    feed({"SOURCE      x", "REFERENCE   1", "  ORGANISM  ignored"});
    BOOST_CHECK_EQUAL(acc.record.organism, "");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(features, dispatch_fixture)

BOOST_AUTO_TEST_CASE(gene_feature) {
    feed({"FEATURES             Location/Qualifiers",
          FEATURE + "gene            1..128315",
          QUALIFIER + "/gene=\"ABCA4\""});

    auto record = finish();
    BOOST_REQUIRE_EQUAL(record.features.size(), 1u);
    const auto& gene = record.features[0];
    BOOST_CHECK_EQUAL(gene.feature_type, "gene");
    BOOST_CHECK_EQUAL(gene.location, "1..128315");
    BOOST_REQUIRE(gene.qualifiers.contains("gene"));
    BOOST_TEST(*gene.qualifiers.find("gene") == fragments{"ABCA4"}, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(new_feature_flushes_previous) {
    feed({"FEATURES             Location/Qualifiers",
          FEATURE + "source          1..100",
          FEATURE + "gene            complement(join(1..20,30..40))"});

    BOOST_CHECK_EQUAL(acc.record.features.size(), 1u);
    BOOST_REQUIRE(acc.current_feature);
    BOOST_CHECK_EQUAL(acc.current_feature->location, "complement(join(1..20,30..40))");

    auto record = finish();
    BOOST_CHECK_EQUAL(record.features.size(), 2u);
}

BOOST_AUTO_TEST_CASE(continuation_grows_only_last_key) {
    feed({"FEATURES             Location/Qualifiers",
          FEATURE + "CDS             join(5001..5100,5201..5300)",
          QUALIFIER + "/gene=\"ABCA4\"",
          QUALIFIER + "/translation=\"MGFVRQIQLLLWKNW",
          QUALIFIER + "TLRKRQKIRFVVELV",
          QUALIFIER + "WPLSLFLVLI\""});

    const auto& qualifiers = acc.current_feature->qualifiers;
    BOOST_CHECK_EQUAL(qualifiers.find("gene")->size(), 1u);
    BOOST_TEST(*qualifiers.find("translation") ==
               (fragments{"MGFVRQIQLLLWKNW", "TLRKRQKIRFVVELV", "WPLSLFLVLI"}),
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(reassigned_key_keeps_position) {
    feed({"FEATURES             Location/Qualifiers",
          FEATURE + "gene            1..10",
          QUALIFIER + "/gene=\"A\"",
          QUALIFIER + "/note=\"n\"",
          QUALIFIER + "/gene=\"B\"",
          QUALIFIER + "more"});

    const auto& qualifiers = acc.current_feature->qualifiers;
    BOOST_TEST(*qualifiers.find("gene") == fragments{"B"}, boost::test_tools::per_element());
    BOOST_TEST(*qualifiers.find("note") == (fragments{"n", "more"}), boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(qualifier_without_value) {
    feed({"FEATURES             Location/Qualifiers",
          FEATURE + "CDS             1..10",
          QUALIFIER + "/pseudo"});

    BOOST_TEST(*acc.current_feature->qualifiers.find("pseudo") == fragments{""},
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(quote_handling) {
    feed({"FEATURES             Location/Qualifiers",
          FEATURE + "misc_feature    1..10",
          QUALIFIER + "/codon_start=1",
          QUALIFIER + "/label=abc\"",
          QUALIFIER + "/product=\"He said \"hi\"\"",
          QUALIFIER + "/note=\"opened here",
          QUALIFIER + "\"closed\" here\""});

    const auto& qualifiers = acc.current_feature->qualifiers;
    BOOST_CHECK_EQUAL(qualifiers.find("codon_start")->front(), "1");
    // trailing quote only stripped together with a leading one
    BOOST_CHECK_EQUAL(qualifiers.find("label")->front(), "abc\"");
    BOOST_CHECK_EQUAL(qualifiers.find("product")->front(), "He said \"hi\"");
    // quote state is not carried across lines
    BOOST_TEST(*qualifiers.find("note") == (fragments{"opened here", "\"closed\" here"}),
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(feature_without_location_is_skipped) {
    feed({"FEATURES             Location/Qualifiers",
          FEATURE + "gene            1..10",
          QUALIFIER + "/gene=\"A\"",
          FEATURE + "misc_feature",
          QUALIFIER + "/note=\"orphan\""});

    BOOST_CHECK(!acc.current_feature);

    // the flushed gene is not appended a second time at finalization
    auto record = finish();
    BOOST_REQUIRE_EQUAL(record.features.size(), 1u);
    BOOST_CHECK_EQUAL(record.features[0].feature_type, "gene");
    BOOST_CHECK(!record.features[0].qualifiers.contains("note"));
}

BOOST_AUTO_TEST_CASE(qualifier_before_feature_is_ignored) {
    feed({"FEATURES             Location/Qualifiers",
          QUALIFIER + "/note=\"orphan\"",
          FEATURE + "gene            1..10"});

    BOOST_REQUIRE(acc.current_feature);
    BOOST_CHECK(acc.current_feature->qualifiers.empty());
}

BOOST_AUTO_TEST_CASE(origin_ends_features) {
    feed({"FEATURES             Location/Qualifiers",
          FEATURE + "gene            1..10"});
    BOOST_CHECK(acc.in_features);

    feed({"BASE COUNT       3 a    2 c    2 g    3 t"});
    BOOST_CHECK(acc.in_features);
    BOOST_CHECK_EQUAL(acc.record.features.size(), 0u);

    feed({"ORIGIN"});
    BOOST_CHECK(!acc.in_features);
    BOOST_CHECK(acc.in_sequence);
    BOOST_CHECK(active->section() == section_type::ORIGIN);
}

BOOST_AUTO_TEST_CASE(flag_belongs_to_the_accumulator) {
    features_parser parser;
    record_accumulator first;
    record_accumulator second;

    parser.consume("FEATURES             Location/Qualifiers", first);
    BOOST_CHECK(first.in_features);
    BOOST_CHECK(parser.can_consume(FEATURE + "gene            1..10", first));

    // the same parser object knows nothing about the first run
    BOOST_CHECK(!second.in_features);
    BOOST_CHECK(!parser.can_consume(FEATURE + "gene            1..10", second));

    // ORIGIN is left to its own parser, which clears the flag
    BOOST_CHECK(!parser.can_consume("ORIGIN", first));
    origin_parser().consume("ORIGIN", first);
    BOOST_CHECK(!first.in_features);
    BOOST_CHECK(!parser.can_consume(FEATURE + "gene            1..10", first));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(origin, dispatch_fixture)

BOOST_AUTO_TEST_CASE(sequence_fragments) {
    feed({"ORIGIN      ",
          "        1 ggacacagcg ttagacccca agttcttggc",
          "       31 cagctgcgag",
          "       41",
          "//"});

    BOOST_REQUIRE_EQUAL(acc.sequence_fragments.size(), 2u);
    BOOST_CHECK_EQUAL(acc.sequence_fragments[0], "ggacacagcgttagaccccaagttcttggc");

    auto record = finish();
    BOOST_CHECK_EQUAL(record.sequence, "ggacacagcgttagaccccaagttcttggccagctgcgag");
}

BOOST_AUTO_TEST_CASE(blank_lines_are_skipped) {
    feed({"ORIGIN", "", "        1 acgt", "   ", "        5 tgca"});
    BOOST_CHECK_EQUAL(finish().sequence, "acgttgca");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(accumulator)

BOOST_AUTO_TEST_CASE(finalize_once) {
    record_accumulator acc;
    acc.record.organism = "Homo sapiens";
    acc.record.taxonomy = "Homo.";
    acc.current_feature.emplace("gene", "1..10");
    acc.current_reference.emplace();
    acc.sequence_fragments = {"ac", "gt"};

    auto record = acc.finalize();
    BOOST_CHECK_EQUAL(record.organism, "Homo sapiens [Homo.]");
    BOOST_CHECK_EQUAL(record.features.size(), 1u);
    BOOST_CHECK_EQUAL(record.references.size(), 1u);
    BOOST_CHECK_EQUAL(record.sequence, "acgt");

    BOOST_CHECK_THROW(acc.finalize(), std::logic_error);
}

BOOST_AUTO_TEST_CASE(parser_priority_order) {
    auto parsers = make_section_parsers();
    std::vector<section_type> expected{
        section_type::LOCUS, section_type::DEFINITION, section_type::ACCESSION,
        section_type::VERSION, section_type::KEYWORDS, section_type::SOURCE,
        section_type::REFERENCE, section_type::COMMENT, section_type::PRIMARY,
        section_type::FEATURES, section_type::ORIGIN};

    BOOST_REQUIRE_EQUAL(parsers.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        BOOST_CHECK(parsers[i]->section() == expected[i]);
    }
}

BOOST_AUTO_TEST_SUITE_END()
