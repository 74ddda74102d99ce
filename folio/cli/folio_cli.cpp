/*
 * File:        folio_cli.cpp
 * Module:      folio-cli
 * Purpose:     Command line entry point
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "command_resolve.h"
#include "error_codes.h"
#include "logging.h"

#include <iostream>
#include <string>

using namespace folio;

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] <dir>...\n";
    std::cerr << "\n";
    std::cerr << "Group directories of page images into numbered books and pick one\n";
    std::cerr << "directory per book number.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  --name NAME                    Base title for output names (Title3.cbz)\n";
    std::cerr << "  -p, --pick SELECTOR            Pick rule [from=]to, may be repeated\n";
    std::cerr << "                                 from: N, N..M, N..=M, N.., ..M, ..=M or ..\n";
    std::cerr << "                                 to:   first, last, most-pages, INDEX or REGEX\n";
    std::cerr << "  --skip REGEX                   Ignore directories whose name matches\n";
    std::cerr << "  --include RANGE                Only keep these book numbers\n";
    std::cerr << "  -n, --non-interactive          Fail instead of asking when a choice is needed\n";
    std::cerr << "  --number-width N               Zero pad book numbers to N digits\n";
    std::cerr << "  --out DIR                      Output directory for archives (default: .)\n";
    std::cerr << "  --extension EXT                Archive extension (default: cbz)\n";
    std::cerr << "  --plan FILE                    Save the book plan as YAML ('-' for stdout)\n";
    std::cerr << "  --dry-run                      Do not write the plan file\n";
    std::cerr << "  --config FILE                  Read settings from a YAML file\n";
    std::cerr << "\n";
    std::cerr << "ComicInfo.xml metadata:\n";
    std::cerr << "  --series, --author (--writer), --artist (--penciller), --publisher,\n";
    std::cerr << "  --genre, --language, --manga (Yes, No, YesAndRightToLeft), --summary\n";
    std::cerr << "\n";
    std::cerr << "  -v, --verbose                  Show source paths and ComicInfo.xml\n";
    std::cerr << "  --log-level LEVEL              Set logging verbosity\n";
    std::cerr << "                                 (trace, debug, info, warn, error, critical, off)\n";
    std::cerr << "                                 Default: info\n";
    std::cerr << "  --log-file FILE                Write logs to specified file\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program_name << " --name Title -p most-pages scans/\n";
    std::cerr << "  " << program_name << " --name Title -p 3=last -p fix -n scans/\n";
    std::cerr << "  " << program_name << " --name Title -p 1..=5=1 --plan plan.yaml scans/\n";
}

static bool parse_width(const std::string& text, size_t& width) {
    if (text.empty() || text.size() > 3 || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    width = static_cast<size_t>(std::stoul(text));
    return true;
}

int main(int argc, char* argv[]) {
    cli::ResolveOptions options;
    std::string log_level = "info";
    std::string log_file;

    // Check for help or empty args
    if (argc < 2) {
        print_usage(argv[0]);
        return exit_status(ResultCode::ERROR_INVALID_ARGUMENT);
    }

    auto& overrides = options.overrides;

    // Parse all arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--name" && has_value) {
            overrides.name = argv[++i];
        } else if ((arg == "--pick" || arg == "-p") && has_value) {
            overrides.pick.push_back(argv[++i]);
        } else if (arg == "--skip" && has_value) {
            overrides.skip.push_back(argv[++i]);
        } else if (arg == "--include" && has_value) {
            overrides.include.push_back(argv[++i]);
        } else if (arg == "--non-interactive" || arg == "-n") {
            overrides.interactive = false;
        } else if (arg == "--number-width" && has_value) {
            size_t width = 0;
            if (!parse_width(argv[++i], width)) {
                std::cerr << "Error: Invalid number width: " << argv[i] << "\n";
                return exit_status(ResultCode::ERROR_INVALID_ARGUMENT);
            }
            overrides.number_width = width;
        } else if (arg == "--out" && has_value) {
            overrides.output_dir = argv[++i];
        } else if (arg == "--extension" && has_value) {
            overrides.extension = argv[++i];
        } else if (arg == "--plan" && has_value) {
            options.plan_path = argv[++i];
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "--config" && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "--series" && has_value) {
            overrides.metadata.series = argv[++i];
        } else if ((arg == "--author" || arg == "--writer") && has_value) {
            overrides.metadata.author = argv[++i];
        } else if ((arg == "--artist" || arg == "--penciller") && has_value) {
            overrides.metadata.artist = argv[++i];
        } else if (arg == "--publisher" && has_value) {
            overrides.metadata.publisher = argv[++i];
        } else if (arg == "--genre" && has_value) {
            overrides.metadata.genre = argv[++i];
        } else if (arg == "--language" && has_value) {
            overrides.metadata.language = argv[++i];
        } else if (arg == "--manga" && has_value) {
            overrides.metadata.manga = argv[++i];
        } else if (arg == "--summary" && has_value) {
            overrides.metadata.summary = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--log-level" && has_value) {
            log_level = argv[++i];
            overrides.log_level = log_level;
        } else if (arg == "--log-file" && has_value) {
            log_file = argv[++i];
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional argument - directory to scan
            options.paths.push_back(arg);
        } else {
            std::cerr << "Error: Unknown option or missing value: " << arg << "\n";
            print_usage(argv[0]);
            return exit_status(ResultCode::ERROR_INVALID_ARGUMENT);
        }
    }

    if (options.paths.empty()) {
        std::cerr << "Error: No directories specified\n";
        print_usage(argv[0]);
        return exit_status(ResultCode::ERROR_INVALID_ARGUMENT);
    }

    // Initialize logging
    folio::init_logging(log_level, "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v", log_file);

    try {
        return cli::resolve_command(options);
    } catch (const std::exception& e) {
        FOLIO_LOG_CRITICAL("FATAL ERROR: {}", e.what());
        return exit_status(ResultCode::ERROR_UNKNOWN);
    }
}
