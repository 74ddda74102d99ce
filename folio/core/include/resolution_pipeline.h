/*
 * File:        resolution_pipeline.h
 * Module:      folio-core
 * Purpose:     Run context and the grouping -> resolution -> aggregation pipeline
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "candidate.h"
#include "catalogue.h"
#include "folio_config.h"
#include "interactive_session.h"
#include "operator_console.h"
#include "pick_policy.h"
#include "resolution.h"
#include "resolution_aggregator.h"
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief Exception thrown when no base title can be determined
 */
class MissingTitleError : public std::runtime_error {
public:
    explicit MissingTitleError(std::vector<std::string> detected_names);

    const std::vector<std::string>& detected_names() const { return detected_names_; }

private:
    std::vector<std::string> detected_names_;
};

/**
 * @brief Everything one run needs, passed explicitly through each stage
 */
struct RunContext {
    std::string title;                          // Empty: detect from candidates
    std::vector<PickRule> rules;
    std::vector<std::regex> skip_patterns;
    std::vector<CatalogueRange> include_ranges;
    bool interactive = true;
    size_t number_width = 0;
};

/**
 * @brief Compile a configuration into a run context
 * @throws PolicySyntaxError if any pick, skip or include entry is malformed
 */
RunContext make_run_context(const FolioConfig& config);

enum class RunOutcome {
    Completed,
    Cancelled
};

/**
 * @brief Result of a pipeline run
 *
 * On Cancelled the report still lists every catalogue, with the aborted
 * ones as issues.
 */
struct PipelineResult {
    RunOutcome outcome = RunOutcome::Completed;
    std::string title;
    size_t skipped_candidates = 0;
    size_t excluded_catalogues = 0;
    std::vector<Catalogue> catalogues;
    std::vector<Resolution> resolutions;
    AggregationReport report;
};

/**
 * @brief Drop candidates whose name matches any skip pattern
 */
std::vector<Candidate> apply_skip_patterns(const std::vector<Candidate>& candidates,
                                           const std::vector<std::regex>& patterns);

/**
 * @brief Keep catalogues whose number matches any include range
 *
 * An empty range list keeps everything. Unnumbered catalogues are dropped
 * as soon as any range is given.
 */
std::vector<Catalogue> apply_include_ranges(const std::vector<Catalogue>& catalogues,
                                            const std::vector<CatalogueRange>& ranges);

/**
 * @brief Distinct directory names, sorted
 */
std::vector<std::string> detected_names(const std::vector<Candidate>& candidates);

/**
 * @brief Title used when none is given: the name shared by every candidate
 * @return Empty string if the candidates do not share one name
 */
std::string detect_title(const std::vector<Candidate>& candidates);

/**
 * @brief Grouping, rule resolution, interactive resolution and aggregation
 *
 * Interactive resolution only starts after every catalogue went through
 * the pick rules, and only for those still unresolved.
 */
class ResolutionPipeline {
public:
    explicit ResolutionPipeline(RunContext context);

    const RunContext& context() const { return context_; }

    /**
     * @brief Run over scanned candidates
     * @param candidates Scanner output, in scan order
     * @param console Operator console; required when the context is interactive
     * @throws MissingTitleError if no title is available in non-interactive mode
     * @throws std::invalid_argument if interactive without a console
     */
    PipelineResult run(const std::vector<Candidate>& candidates, OperatorConsole* console) const;

private:
    RunContext context_;
};

} // namespace folio
