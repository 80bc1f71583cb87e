/*
 * File:        hexgraph_cli.cpp
 * Module:      hexgraph-cli
 * Purpose:     CLI application
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "command_validate.h"
#include "graph_exporter.h"
#include "logging.h"

#include <iostream>
#include <string>

using namespace hexgraph;

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <manifest-file> [options]\n";
    std::cerr << "\n";
    std::cerr << "Build the architecture graph described by a component manifest,\n";
    std::cerr << "validate it and optionally export it.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config FILE                  Engine configuration (YAML)\n";
    std::cerr << "  --format FORMAT                Export format (dot, mermaid, yaml, text)\n";
    std::cerr << "  --output FILE                  Write the export to FILE instead of stdout\n";
    std::cerr << "  --strict                       Report dangling dependencies as violations\n";
    std::cerr << "  --fail-on LEVEL                Exit with status 2 on findings at or above LEVEL\n";
    std::cerr << "                                 (violation, warning, never)\n";
    std::cerr << "                                 Default: violation\n";
    std::cerr << "  --log-level LEVEL              Set logging verbosity\n";
    std::cerr << "                                 (trace, debug, info, warn, error, critical, off)\n";
    std::cerr << "                                 Default: info\n";
    std::cerr << "  --log-file FILE                Write logs to specified file\n";
    std::cerr << "\n";
    std::cerr << "Exit status: 0 success, 1 error, 2 findings at or above the fail-on level\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program_name << " shop.yaml\n";
    std::cerr << "  " << program_name << " shop.yaml --config hexgraph.yaml --strict\n";
    std::cerr << "  " << program_name << " shop.yaml --format dot --output shop.dot\n";
}

int main(int argc, char* argv[]) {
    std::string log_level;
    std::string log_file;
    std::string fail_on = "violation";
    cli::ValidateOptions options;

    // Check for help or empty args
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            options.export_format = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            options.output_path = argv[++i];
        } else if (arg == "--strict") {
            options.strict = true;
        } else if (arg == "--fail-on" && i + 1 < argc) {
            fail_on = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            log_file = argv[++i];
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional argument - manifest file
            if (options.manifest_path.empty()) {
                options.manifest_path = arg;
            } else {
                std::cerr << "Error: Multiple manifest files specified\n";
                print_usage(argv[0]);
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown option or missing value: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (options.manifest_path.empty()) {
        std::cerr << "Error: No manifest file specified\n";
        print_usage(argv[0]);
        return 1;
    }

    auto parsed_fail_on = cli::parse_fail_on(fail_on);
    if (!parsed_fail_on) {
        std::cerr << "Error: Invalid --fail-on level: " << fail_on << "\n";
        return 1;
    }
    options.fail_on = *parsed_fail_on;

    if (!options.export_format.empty() && !make_exporter(options.export_format)) {
        std::cerr << "Error: Unknown export format: " << options.export_format << "\n";
        std::cerr << "Available formats:";
        for (const auto& format : available_export_formats()) {
            std::cerr << " " << format;
        }
        std::cerr << "\n";
        return 1;
    }

    if (!options.output_path.empty() && options.export_format.empty()) {
        std::cerr << "Error: --output requires --format\n";
        return 1;
    }

    // Initialize logging
    options.log_level = log_level;
    hexgraph::init_logging(log_level.empty() ? "info" : log_level,
                           "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v", log_file);

    try {
        return cli::validate_command(options);
    } catch (const std::exception& e) {
        std::cerr << "\nFATAL ERROR: " << e.what() << "\n";
        return 1;
    }
}
