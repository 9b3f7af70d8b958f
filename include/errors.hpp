/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_ERRORS_HPP
#define GBFLAT_ERRORS_HPP

#include <stdexcept>
#include <string>

// fatal grammar error, aborts parsing of the whole file
class genbank_parse_error : public std::runtime_error {
public:
    explicit genbank_parse_error(const std::string& message)
        : std::runtime_error(message) {}
};

// input file (or format hint) that is neither GenBank nor FASTA
class unsupported_format_error : public std::runtime_error {
public:
    explicit unsupported_format_error(const std::string& what_arg)
        : std::runtime_error("Unsupported file format: " + what_arg) {}
};

// record type that cannot be written in the requested output format
class unsupported_record_error : public std::runtime_error {
public:
    unsupported_record_error(const std::string& record_type, const std::string& output_format)
        : std::runtime_error("Unsupported record type for " + output_format +
                             " output: " + record_type) {}
};

#endif //GBFLAT_ERRORS_HPP
