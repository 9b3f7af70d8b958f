/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_FILE_READER_HPP
#define GBFLAT_FILE_READER_HPP

#include <cstddef>
#include <utility>
#include <vector>

// Base class for all file readers
class file_reader_base {
    public:
        virtual bool has_next() const = 0;
        virtual size_t records_read() const = 0;
        virtual ~file_reader_base() = default;
};

// Templated derived class for type-specific reading
template<typename EntryType>
class file_reader : public file_reader_base {
    public:
        virtual bool read_next(EntryType& entry) = 0;

        // drain the reader
        std::vector<EntryType> read_all() {
            std::vector<EntryType> entries;
            EntryType entry;
            while (read_next(entry)) {
                entries.push_back(std::move(entry));
                entry = EntryType();
            }
            return entries;
        }
};

#endif //GBFLAT_FILE_READER_HPP
