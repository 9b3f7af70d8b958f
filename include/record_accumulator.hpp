/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_RECORD_ACCUMULATOR_HPP
#define GBFLAT_RECORD_ACCUMULATOR_HPP

#include <optional>
#include <string>
#include <vector>

#include "file_entries.hpp"
#include "genbank_constants.hpp"

namespace genbank {

/**
 * Mutable state of one record while its lines are dispatched.
 *
 * A fresh accumulator is created for every record chunk and owned by that
 * parse run only, so the FEATURES/ORIGIN mode flags can never leak into the
 * next record. Section parsers write the partially built fields directly
 * into `record`; finalize() flushes the pending feature and reference and
 * hands the record out.
 */
struct record_accumulator {
    genbank_record record;

    std::optional<section_type> current_section;
    std::optional<genbank_feature> current_feature;
    std::optional<genbank_reference> current_reference;
    std::vector<std::string> sequence_fragments;

    bool in_features = false;
    bool in_sequence = false;

    // move the in-progress feature into record.features
    void flush_feature();

    // move the in-progress reference into record.references
    void flush_reference();

    /**
     * Flush pending feature/reference, join the sequence fragments and
     * append " [taxonomy]" to the organism.
     * @throws std::logic_error when called a second time
     */
    genbank_record finalize();

private:
    bool finalized = false;
};

} // namespace genbank

#endif //GBFLAT_RECORD_ACCUMULATOR_HPP
