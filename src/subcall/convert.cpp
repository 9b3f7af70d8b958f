/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/convert.hpp"

#include <filesystem>

#include "utility.hpp"

namespace subcall {

cxxopts::Options convert::parse_args(int argc, char** argv) {
    cxxopts::Options options("gbflat convert",
        "Convert GenBank/FASTA records to JSON or FASTA files");

    options.add_options("Output")
        ("t,to", "Output format: json or fasta (FASTA input only)",
            cxxopts::value<std::string>()->default_value("json"))
        ;

    add_common_options(options);

    return options;
}

void convert::validate(const cxxopts::ParseResult& args) {
    validate_input(args);

    // throws for anything but json/fasta
    sequence_service::parse_output_format(args["to"].as<std::string>());
}

void convert::execute(const cxxopts::ParseResult& args) {
    std::string input_path = args["input"].as<std::string>();
    output_format format = sequence_service::parse_output_format(args["to"].as<std::string>());

    auto records = service.parse_file(input_path, format_hint(args));
    if (records.empty()) {
        logging::warning("No records found in " + input_path);
        return;
    }

    auto out_dir = resolve_output_dir(args, input_path);
    std::string basename = std::filesystem::path(input_path).stem().string();
    std::string ext = sequence_service::extension(format);

    for (size_t i = 0; i < records.size(); ++i) {
        auto output_path = out_dir / (basename + ".record_" + std::to_string(i + 1) + "." + ext);
        service.save_record(records[i], output_path, format);
        logging::info("Record " + std::to_string(i + 1) + " written to: " + output_path.string());
    }

    logging::info("Converted " + std::to_string(records.size()) + " record(s)");
}

} // namespace subcall
