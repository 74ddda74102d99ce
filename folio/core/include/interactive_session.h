/*
 * File:        interactive_session.h
 * Module:      folio-core
 * Purpose:     Interactive resolution state machine
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "catalogue.h"
#include "operator_console.h"
#include "resolution.h"
#include <optional>
#include <vector>

namespace folio {

/**
 * @brief States of the interactive protocol
 *
 *   ListCatalogues -> SelectCatalogue -> SelectCandidate -> Confirmed
 *        ^                  |                  |               |
 *        |                  v                  v (back)        |
 *        |               Aborted        ListCatalogues          |
 *        +-----------------------------------------------------+
 *
 * ListCatalogues moves to Completed once no catalogue is pending.
 */
enum class SessionState {
    ListCatalogues,
    SelectCatalogue,
    SelectCandidate,
    Confirmed,
    Completed,
    Aborted
};

enum class SessionOutcome {
    Completed,
    Cancelled
};

const char* to_string(SessionState state);

/**
 * @brief Resolves the remaining Unresolved catalogues with an operator
 *
 * Only catalogues whose resolution is Unresolved are offered; selected and
 * failed ones are left untouched. One catalogue is handled at a time.
 * When the operator aborts, every catalogue still pending becomes
 * Unresolved(OperatorAborted).
 *
 * The session keeps a reference to the catalogues, which must outlive it.
 */
class InteractiveSession {
public:
    InteractiveSession(const std::vector<Catalogue>& catalogues, std::vector<Resolution> resolutions);

    SessionState state() const { return state_; }
    bool is_finished() const;

    /**
     * @brief Perform one transition
     * @return false once the session reached Completed or Aborted
     */
    bool step(OperatorConsole& console);

    /**
     * @brief Step until the session finishes
     */
    SessionOutcome run(OperatorConsole& console);

    const std::vector<Resolution>& resolutions() const { return resolutions_; }

    /// Catalogue indexes still waiting for a choice
    std::vector<size_t> pending() const;

private:
    CatalogueSummary summarize(size_t catalogue_index) const;
    std::vector<CandidateSummary> candidates_of(size_t catalogue_index) const;
    void abort_pending();

    const std::vector<Catalogue>& catalogues_;
    std::vector<Resolution> resolutions_;
    SessionState state_ = SessionState::ListCatalogues;

    std::vector<CatalogueSummary> listing_;
    std::optional<size_t> current_;
    size_t chosen_rank_ = 0;
};

} // namespace folio
