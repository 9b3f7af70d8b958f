/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "file_entries.hpp"

#include <algorithm>

void qualifier_map::assign(const std::string& key, std::string value) {
    auto it = std::find_if(entries.begin(), entries.end(),
        [&key](const entry& e) { return e.first == key; });

    if (it != entries.end()) {
        it->second = fragments{std::move(value)};
    } else {
        entries.emplace_back(key, fragments{std::move(value)});
    }
}

void qualifier_map::append_to_last(std::string fragment) {
    if (!entries.empty()) {
        entries.back().second.push_back(std::move(fragment));
    }
}

const qualifier_map::fragments* qualifier_map::find(const std::string& key) const {
    for (const auto& [name, values] : entries) {
        if (name == key) {
            return &values;
        }
    }
    return nullptr;
}
