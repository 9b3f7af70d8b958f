/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/subcall.hpp"

#include <filesystem>
#include <stdexcept>

#include "utility.hpp"

namespace subcall {

void subcall::add_common_options(cxxopts::Options& options) {
    options.add_options("Common")
        ("i,input", "Input sequence file (GenBank or FASTA, optionally gzipped)",
            cxxopts::value<std::string>())
        ("f,format", "Input format: genbank or fasta (default: detect from content)",
            cxxopts::value<std::string>())
        ("o,output-dir", "Output directory for results (default: input file directory)",
            cxxopts::value<std::string>())
        ("q,quiet", "Only print warnings and errors")
        ("h,help", "Show help message")
        ;
}

void subcall::apply_common_options(const cxxopts::ParseResult& args) {
    if (args.count("quiet")) {
        logging::set_quiet(true);
    }
}

std::filesystem::path subcall::resolve_output_dir(const cxxopts::ParseResult& args,
                                                   const std::string& fallback_input_path) const {
    std::filesystem::path dir;

    if (args.count("output-dir")) {
        dir = args["output-dir"].as<std::string>();
    } else if (!fallback_input_path.empty()) {
        dir = std::filesystem::path(fallback_input_path).parent_path();
    }

    if (dir.empty()) {
        dir = std::filesystem::current_path();
    }

    std::filesystem::create_directories(dir);
    return dir;
}

std::optional<filetype> subcall::format_hint(const cxxopts::ParseResult& args) {
    if (!args.count("format")) {
        return std::nullopt;
    }
    return sequence_service::parse_format_hint(args["format"].as<std::string>());
}

void subcall::validate_input(const cxxopts::ParseResult& args) {
    if (!args.count("input")) {
        throw std::runtime_error("No input file specified. Use -i/--input");
    }

    std::string input = args["input"].as<std::string>();
    if (!std::filesystem::exists(input)) {
        throw std::runtime_error("Input file not found: " + input);
    }
}

void subcall::run(const cxxopts::ParseResult& args) {
    validate(args);
    apply_common_options(args);
    execute(args);
}

} // namespace subcall
