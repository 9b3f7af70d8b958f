/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "record_accumulator.hpp"

#include <stdexcept>

namespace genbank {

void record_accumulator::flush_feature() {
    if (current_feature) {
        record.features.push_back(std::move(*current_feature));
        current_feature.reset();
    }
}

void record_accumulator::flush_reference() {
    if (current_reference) {
        record.references.push_back(std::move(*current_reference));
        current_reference.reset();
    }
}

genbank_record record_accumulator::finalize() {
    if (finalized) {
        throw std::logic_error("GenBank record accumulator finalized twice");
    }
    finalized = true;

    flush_feature();
    flush_reference();

    size_t total = 0;
    for (const auto& fragment : sequence_fragments) {
        total += fragment.size();
    }
    record.sequence.reserve(total);
    for (const auto& fragment : sequence_fragments) {
        record.sequence += fragment;
    }
    sequence_fragments.clear();

    if (!record.taxonomy.empty()) {
        record.organism += " [" + record.taxonomy + "]";
    }

    return std::move(record);
}

} // namespace genbank
