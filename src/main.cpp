/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of gbflat and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

// standard
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

// cxxopts
#include <cxxopts.hpp>

// class
#include "config.hpp"
#include "errors.hpp"
#include "utility.hpp"
#include "subcall/convert.hpp"
#include "subcall/summary.hpp"

void showVersion(std::ostream& _str) {
    _str << "gbflat v" << gbflat_VERSION_MAJOR;
    _str << "." << gbflat_VERSION_MINOR << ".";
    _str << gbflat_VERSION_PATCH << " - ";
    _str << "Parse GenBank flat files and FASTA into structured records";
    _str << std::endl;
}

std::unique_ptr<subcall::subcall> make_subcall(const std::string& name) {
    if (name == "convert") {
        return std::make_unique<subcall::convert>();
    }
    if (name == "summary") {
        return std::make_unique<subcall::summary>();
    }
    return nullptr;
}

void showUsage(std::ostream& _str) {
    _str << "Usage: gbflat <subcommand> [options]" << std::endl << std::endl;
    _str << "Subcommands:" << std::endl;
    for (const char* name : {"convert", "summary"}) {
        auto sub = make_subcall(name);
        _str << "  " << std::left << std::setw(11) << sub->name() << sub->description() << std::endl;
    }
    _str << std::endl;
    _str << "Run 'gbflat <subcommand> --help' for subcommand options" << std::endl;
}

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            showUsage(std::cout);
            return 1;
        }

        std::string command = argv[1];
        if (command == "-h" || command == "--help") {
            showUsage(std::cout);
            return 0;
        }
        if (command == "-v" || command == "--version") {
            showVersion(std::cout);
            return 0;
        }

        auto sub = make_subcall(command);
        if (!sub) {
            logging::error("Unknown subcommand: " + command);
            showUsage(std::cerr);
            return 1;
        }

        // subcommand name takes the place of the program name
        cxxopts::Options options = sub->parse_args(argc - 1, argv + 1);
        auto result = options.parse(argc - 1, argv + 1);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        sub->run(result);

    } catch(const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch(const genbank_parse_error& e) {
        std::cerr << "Error: malformed GenBank file: " << e.what() << std::endl;
        return 1;
    } catch(const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
