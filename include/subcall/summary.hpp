/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_SUBCALL_SUMMARY_HPP
#define GBFLAT_SUBCALL_SUMMARY_HPP

#include <ostream>

#include "subcall/subcall.hpp"

namespace subcall {

/**
 * Summary subcommand: print one block per record (identifier, definition,
 * feature count, sequence length) to stdout.
 */
class summary : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "summary"; }
    std::string description() const override {
        return "Print a short overview of every record";
    }

    static void write_summary(const sequence_record& record, size_t index, std::ostream& out);
};

} // namespace subcall

#endif // GBFLAT_SUBCALL_SUMMARY_HPP
