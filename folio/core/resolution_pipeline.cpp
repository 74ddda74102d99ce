/*
 * File:        resolution_pipeline.cpp
 * Module:      folio-core
 * Purpose:     Run context and the grouping -> resolution -> aggregation pipeline
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "resolution_pipeline.h"
#include "pick_resolver.h"
#include "logging.h"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <set>

namespace folio {

MissingTitleError::MissingTitleError(std::vector<std::string> detected_names)
    : std::runtime_error(fmt::format("No name specified for the series; use --name with one of: {}",
                                     fmt::join(detected_names, ", "))),
      detected_names_(std::move(detected_names)) {
}

RunContext make_run_context(const FolioConfig& config) {
    RunContext context;
    context.title = config.name.value_or("");
    context.rules = parse_pick_rules(config.pick);
    context.skip_patterns = parse_skip_patterns(config.skip);
    context.include_ranges = parse_include_ranges(config.include);
    context.interactive = config.interactive.value_or(true);
    context.number_width = config.number_width.value_or(0);
    return context;
}

std::vector<Candidate> apply_skip_patterns(const std::vector<Candidate>& candidates,
                                           const std::vector<std::regex>& patterns) {
    std::vector<Candidate> kept;
    kept.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        const bool skipped = std::any_of(patterns.begin(), patterns.end(),
            [&candidate](const std::regex& re) { return std::regex_search(candidate.raw_name, re); });
        if (skipped) {
            FOLIO_LOG_DEBUG("Skipping '{}'", candidate.path);
            continue;
        }
        kept.push_back(candidate);
    }

    return kept;
}

std::vector<Catalogue> apply_include_ranges(const std::vector<Catalogue>& catalogues,
                                            const std::vector<CatalogueRange>& ranges) {
    if (ranges.empty()) {
        return catalogues;
    }

    std::vector<Catalogue> kept;
    for (const auto& catalogue : catalogues) {
        const auto number = catalogue.number();
        if (!number) {
            continue;
        }
        const bool included = std::any_of(ranges.begin(), ranges.end(),
            [&number](const CatalogueRange& range) { return range.matches(*number); });
        if (included) {
            kept.push_back(catalogue);
        }
    }

    return kept;
}

std::vector<std::string> detected_names(const std::vector<Candidate>& candidates) {
    std::set<std::string> names;
    for (const auto& candidate : candidates) {
        names.insert(candidate.raw_name);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

std::string detect_title(const std::vector<Candidate>& candidates) {
    const auto names = detected_names(candidates);
    if (names.size() == 1) {
        return names.front();
    }
    return "";
}

ResolutionPipeline::ResolutionPipeline(RunContext context)
    : context_(std::move(context)) {
}

PipelineResult ResolutionPipeline::run(const std::vector<Candidate>& candidates,
                                       OperatorConsole* console) const {
    if (context_.interactive && !console) {
        throw std::invalid_argument("ResolutionPipeline: interactive mode requires an operator console");
    }

    PipelineResult result;

    const auto kept = apply_skip_patterns(candidates, context_.skip_patterns);
    result.skipped_candidates = candidates.size() - kept.size();

    const auto grouped = group_catalogues(kept);
    result.catalogues = apply_include_ranges(grouped, context_.include_ranges);
    result.excluded_catalogues = grouped.size() - result.catalogues.size();

    FOLIO_LOG_INFO("{} candidates in {} catalogues ({} skipped, {} catalogues excluded)",
                   kept.size(), result.catalogues.size(), result.skipped_candidates,
                   result.excluded_catalogues);

    // Rules first, for every catalogue, before any operator input
    const PickResolver resolver(context_.rules);
    result.resolutions = resolver.resolve_all(result.catalogues);

    result.title = context_.title;
    if (result.title.empty()) {
        result.title = detect_title(kept);
    }
    if (result.title.empty()) {
        const auto names = detected_names(kept);
        if (!context_.interactive) {
            throw MissingTitleError(names);
        }
        const auto chosen = console->choose_title(names);
        if (!chosen || chosen->empty()) {
            FOLIO_LOG_WARN("No series name chosen, cancelling");
            result.outcome = RunOutcome::Cancelled;
            result.report = aggregate_resolutions(result.catalogues, result.resolutions,
                                                  NamingOptions{"", context_.number_width});
            return result;
        }
        result.title = *chosen;
    }

    const bool has_unresolved = std::any_of(result.resolutions.begin(), result.resolutions.end(),
        [](const Resolution& r) { return r.kind() == Resolution::Kind::Unresolved; });

    if (context_.interactive && has_unresolved) {
        InteractiveSession session(result.catalogues, result.resolutions);
        const auto outcome = session.run(*console);
        result.resolutions = session.resolutions();
        if (outcome == SessionOutcome::Cancelled) {
            result.outcome = RunOutcome::Cancelled;
        }
    }

    result.report = aggregate_resolutions(result.catalogues, result.resolutions,
                                          NamingOptions{result.title, context_.number_width});
    return result;
}

} // namespace folio
