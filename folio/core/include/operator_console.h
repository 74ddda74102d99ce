/*
 * File:        operator_console.h
 * Module:      folio-core
 * Purpose:     Abstract boundary between interactive resolution and a UI
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "candidate.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief One ambiguous catalogue as shown to the operator
 */
struct CatalogueSummary {
    size_t catalogue_index = 0;     // Position in the catalogue listing
    Identity identity;
    std::string label;
    size_t candidate_count = 0;
};

/**
 * @brief One candidate as shown to the operator
 */
struct CandidateSummary {
    size_t rank = 0;
    std::string path;
    std::string raw_name;
    size_t page_count = 0;
    uint64_t total_bytes = 0;
};

/**
 * @brief Operator answer in the catalogue list
 */
struct CatalogueChoice {
    enum class Action { Select, Abort };

    Action action = Action::Abort;
    size_t catalogue_index = 0;

    static CatalogueChoice select(size_t index) { return {Action::Select, index}; }
    static CatalogueChoice abort() { return {Action::Abort, 0}; }
};

/**
 * @brief Operator answer in a candidate list
 */
struct CandidateChoice {
    enum class Action { Select, Back, Abort };

    Action action = Action::Abort;
    size_t rank = 0;

    static CandidateChoice select(size_t rank) { return {Action::Select, rank}; }
    static CandidateChoice back() { return {Action::Back, 0}; }
    static CandidateChoice abort() { return {Action::Abort, 0}; }
};

/**
 * @brief Abstract interface for the operator side of interactive resolution
 *
 * Calls block until the operator answers. There is no timeout; the only
 * way out early is an Abort answer.
 */
class OperatorConsole {
public:
    virtual ~OperatorConsole() = default;

    /**
     * @brief Present the catalogues still waiting for a choice
     */
    virtual void show_catalogues(const std::vector<CatalogueSummary>& pending) = 0;

    /**
     * @brief Ask which catalogue to disambiguate next
     */
    virtual CatalogueChoice select_catalogue(const std::vector<CatalogueSummary>& pending) = 0;

    /**
     * @brief Present the ordered candidates of one catalogue
     */
    virtual void show_candidates(const CatalogueSummary& catalogue,
                                 const std::vector<CandidateSummary>& candidates) = 0;

    /**
     * @brief Ask which candidate to keep
     */
    virtual CandidateChoice select_candidate(const CatalogueSummary& catalogue,
                                             const std::vector<CandidateSummary>& candidates) = 0;

    /**
     * @brief Tell the operator an answer was not acceptable
     */
    virtual void reject_choice(const std::string& message) = 0;

    /**
     * @brief Ask for the base title when it cannot be determined
     * @param detected Distinct directory names seen during the scan
     * @return Title, or nullopt to cancel the run
     */
    virtual std::optional<std::string> choose_title(const std::vector<std::string>& detected) = 0;
};

} // namespace folio
