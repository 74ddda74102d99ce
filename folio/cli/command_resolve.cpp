/*
 * File:        command_resolve.cpp
 * Module:      folio-cli
 * Purpose:     Resolve catalogues and produce the book plan
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "command_resolve.h"
#include "book_plan.h"
#include "book_scanner.h"
#include "comic_info.h"
#include "error_codes.h"
#include "logging.h"
#include "resolution_pipeline.h"
#include "text_console.h"

#include <iostream>
#include <memory>

namespace folio {
namespace cli {

namespace {

void print_issues(std::ostream& out, const PipelineResult& result, bool verbose) {
    for (const auto& issue : result.report.issues) {
        const auto& catalogue = result.catalogues[issue.catalogue_index];

        if (issue.reason == Resolution::Reason::NoMatchingRule && issue.number) {
            out << "[error] " << issue.label << ": more than one match, use something like `-p "
                      << *issue.number << "=0` to pick one:\n";
        } else {
            out << "[error] " << issue.label << ": " << issue.detail << "\n";
        }

        for (const auto& member : catalogue.members) {
            out << "  " << member.lexical_rank << ": " << member.raw_name << " ("
                      << member.page_count << " pages, " << member.total_bytes << " bytes)\n";
            if (verbose) {
                out << "    [source] " << member.path << "\n";
            }
        }
    }
}

void print_collisions(std::ostream& out, const AggregationReport& report) {
    for (const auto& collision : report.collisions) {
        out << "[error] output name '" << collision.output_name << "' is used by catalogues:";
        for (const auto& label : collision.labels) {
            out << " " << label;
        }
        out << "\n";
    }
}

void print_plan(std::ostream& out, const BookPlan& plan, bool verbose) {
    for (const auto& book : plan.books) {
        out << "[from] " << book.assignment.output_name << ": " << book.assignment.source_path << "\n";
        out << "  [file] " << book.target_path << " (" << book.assignment.page_count << " pages)\n";

        if (verbose) {
            out << "  [info] ComicInfo.xml:\n";
            const std::string xml = render_comic_info(book.comic_info);
            size_t start = 0;
            while (start < xml.size()) {
                const auto end = xml.find('\n', start);
                out << "    " << xml.substr(start, end - start) << "\n";
                if (end == std::string::npos) {
                    break;
                }
                start = end + 1;
            }
        }
    }
}

} // anonymous namespace

int resolve_command(const ResolveOptions& options) {
    return resolve_command(options, std::cin, std::cout);
}

int resolve_command(const ResolveOptions& options, std::istream& in, std::ostream& out) {
    // Layer configuration: file first, then command line
    FolioConfig config;
    try {
        if (options.config_path) {
            config = config_io::load_config(*options.config_path);
            FOLIO_LOG_INFO("Loaded configuration: {}", *options.config_path);
        }
        config = merge_config(config, options.overrides);
        validate_config(config);
    } catch (const ConfigError& e) {
        FOLIO_LOG_ERROR("{}", e.what());
        return exit_status(ResultCode::ERROR_CONFIG);
    }

    if (!options.overrides.log_level && config.log_level) {
        set_log_level(*config.log_level);
    }

    RunContext context;
    try {
        context = make_run_context(config);
    } catch (const PolicySyntaxError& e) {
        FOLIO_LOG_ERROR("Invalid pick policy: {}", e.what());
        return exit_status(ResultCode::ERROR_INVALID_ARGUMENT);
    }

    FOLIO_LOG_DEBUG("{} pick rules, {} skip patterns, {} include ranges, interactive: {}",
                    context.rules.size(), context.skip_patterns.size(),
                    context.include_ranges.size(), context.interactive);

    std::vector<Candidate> candidates;
    try {
        candidates = scan_books(options.paths);
    } catch (const ScanError& e) {
        FOLIO_LOG_ERROR("{}", e.what());
        return exit_status(ResultCode::ERROR_IO_ERROR);
    }

    if (candidates.empty()) {
        FOLIO_LOG_ERROR("No directories with pages found");
        return exit_status(ResultCode::ERROR_INVALID_ARGUMENT);
    }

    std::unique_ptr<TextConsole> console;
    if (context.interactive) {
        console = std::make_unique<TextConsole>(in, out, options.verbose);
    }

    const ResolutionPipeline pipeline(std::move(context));
    PipelineResult result;
    try {
        result = pipeline.run(candidates, console.get());
    } catch (const MissingTitleError& e) {
        FOLIO_LOG_ERROR("{}", e.what());
        return exit_status(ResultCode::ERROR_INVALID_ARGUMENT);
    }

    if (result.outcome == RunOutcome::Cancelled) {
        FOLIO_LOG_ERROR("Aborting due to user cancellation");
        return exit_status(ResultCode::ERROR_CANCELLED);
    }

    std::vector<BookAssignment> assignments;
    try {
        assignments = require_complete(result.report);
    } catch (const ResolutionError& e) {
        // Show every problem, not only the category that was raised
        print_issues(out, result, options.verbose);
        print_collisions(out, result.report);
        FOLIO_LOG_ERROR("{}", e.what());
        if (result.report.issues.empty()) {
            return exit_status(ResultCode::ERROR_NAMING_COLLISION);
        }
        if (!result.report.collisions.empty()) {
            FOLIO_LOG_ERROR("{}", NamingCollisionError(result.report.collisions).what());
        }
        return exit_status(ResultCode::ERROR_UNRESOLVED);
    }

    const auto plan = make_book_plan(assignments, result.title,
                                     config.output_dir.value_or("."),
                                     config.extension.value_or("cbz"),
                                     config.metadata);
    print_plan(out, plan, options.verbose);

    if (options.plan_path) {
        if (*options.plan_path == "-") {
            out << plan_io::to_yaml(plan) << "\n";
        } else if (options.dry_run) {
            FOLIO_LOG_WARN("Dry run: plan not written to {}", *options.plan_path);
        } else {
            try {
                plan_io::save_plan(plan, *options.plan_path);
            } catch (const std::runtime_error& e) {
                FOLIO_LOG_ERROR("{}", e.what());
                return exit_status(ResultCode::ERROR_IO_ERROR);
            }
        }
    }

    FOLIO_LOG_INFO("{} books planned for '{}'", plan.books.size(), result.title);
    return exit_status(ResultCode::SUCCESS);
}

} // namespace cli
} // namespace folio
