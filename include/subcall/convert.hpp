/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_SUBCALL_CONVERT_HPP
#define GBFLAT_SUBCALL_CONVERT_HPP

#include "subcall/subcall.hpp"

namespace subcall {

/**
 * Convert subcommand: parse a GenBank or FASTA file and write every record
 * to its own file in the output directory.
 *
 * Output files are named <input stem>.record_<n>.<json|fa>, n counting
 * from 1 in input order.
 */
class convert : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "convert"; }
    std::string description() const override {
        return "Convert GenBank/FASTA records to JSON or FASTA files";
    }
};

} // namespace subcall

#endif // GBFLAT_SUBCALL_CONVERT_HPP
