/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef GBFLAT_SUBCALL_HPP
#define GBFLAT_SUBCALL_HPP

#include <filesystem>
#include <optional>
#include <string>

#include <cxxopts.hpp>

#include "filetype_detector.hpp"
#include "sequence_service.hpp"

namespace subcall {

/**
 * Base of the gbflat subcommands (convert, summary). Each one reads a
 * sequence file through the shared sequence_service.
 */
class subcall {
public:
    virtual ~subcall() = default;

    /**
     * Options of this subcommand, including add_common_options().
     * argc/argv start at the subcommand name.
     */
    virtual cxxopts::Options parse_args(int argc, char** argv) = 0;

    // @throws std::runtime_error for missing or inconsistent options
    virtual void validate(const cxxopts::ParseResult& args) = 0;

    virtual void execute(const cxxopts::ParseResult& args) = 0;

    /**
     * validate, apply --quiet, then execute. Errors propagate to main.
     */
    void run(const cxxopts::ParseResult& args);

    /**
     * -i/--input, -f/--format, -o/--output-dir, -q/--quiet and -h/--help
     */
    static void add_common_options(cxxopts::Options& options);

    // used in usage output
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

protected:
    sequence_service service;

    /**
     * --output-dir, else the directory of the input file, else the working
     * directory. The result is created if missing.
     */
    std::filesystem::path resolve_output_dir(const cxxopts::ParseResult& args,
                                             const std::string& fallback_input_path) const;

    // --format, if given
    static std::optional<filetype> format_hint(const cxxopts::ParseResult& args);

    // check that --input is set and exists
    static void validate_input(const cxxopts::ParseResult& args);

private:
    static void apply_common_options(const cxxopts::ParseResult& args);
};

} // namespace subcall

#endif // GBFLAT_SUBCALL_HPP
