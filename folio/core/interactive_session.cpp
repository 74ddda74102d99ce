/*
 * File:        interactive_session.cpp
 * Module:      folio-core
 * Purpose:     Interactive resolution state machine
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "interactive_session.h"
#include "logging.h"
#include <algorithm>
#include <stdexcept>

namespace folio {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::ListCatalogues: return "ListCatalogues";
        case SessionState::SelectCatalogue: return "SelectCatalogue";
        case SessionState::SelectCandidate: return "SelectCandidate";
        case SessionState::Confirmed: return "Confirmed";
        case SessionState::Completed: return "Completed";
        case SessionState::Aborted: return "Aborted";
    }
    return "Unknown";
}

InteractiveSession::InteractiveSession(const std::vector<Catalogue>& catalogues,
                                       std::vector<Resolution> resolutions)
    : catalogues_(catalogues),
      resolutions_(std::move(resolutions)) {
    if (resolutions_.size() != catalogues_.size()) {
        throw std::invalid_argument("InteractiveSession: one resolution per catalogue is required");
    }
}

bool InteractiveSession::is_finished() const {
    return state_ == SessionState::Completed || state_ == SessionState::Aborted;
}

std::vector<size_t> InteractiveSession::pending() const {
    std::vector<size_t> indexes;
    for (size_t i = 0; i < resolutions_.size(); ++i) {
        if (resolutions_[i].kind() == Resolution::Kind::Unresolved) {
            indexes.push_back(i);
        }
    }
    return indexes;
}

CatalogueSummary InteractiveSession::summarize(size_t catalogue_index) const {
    const auto& catalogue = catalogues_[catalogue_index];

    CatalogueSummary summary;
    summary.catalogue_index = catalogue_index;
    summary.identity = catalogue.identity;
    summary.label = catalogue.label();
    summary.candidate_count = catalogue.members.size();
    return summary;
}

std::vector<CandidateSummary> InteractiveSession::candidates_of(size_t catalogue_index) const {
    std::vector<CandidateSummary> candidates;
    for (const auto& member : catalogues_[catalogue_index].members) {
        CandidateSummary summary;
        summary.rank = member.lexical_rank;
        summary.path = member.path;
        summary.raw_name = member.raw_name;
        summary.page_count = member.page_count;
        summary.total_bytes = member.total_bytes;
        candidates.push_back(std::move(summary));
    }
    return candidates;
}

void InteractiveSession::abort_pending() {
    for (size_t index : pending()) {
        resolutions_[index] = Resolution::operator_aborted();
    }
    current_.reset();
    state_ = SessionState::Aborted;
    FOLIO_LOG_WARN("Interactive selection aborted by operator");
}

bool InteractiveSession::step(OperatorConsole& console) {
    switch (state_) {
        case SessionState::ListCatalogues: {
            listing_.clear();
            for (size_t index : pending()) {
                listing_.push_back(summarize(index));
            }

            if (listing_.empty()) {
                state_ = SessionState::Completed;
                FOLIO_LOG_DEBUG("Interactive selection complete");
                return false;
            }

            console.show_catalogues(listing_);
            state_ = SessionState::SelectCatalogue;
            return true;
        }

        case SessionState::SelectCatalogue: {
            const auto choice = console.select_catalogue(listing_);
            if (choice.action == CatalogueChoice::Action::Abort) {
                abort_pending();
                return false;
            }

            const auto it = std::find_if(listing_.begin(), listing_.end(),
                [&choice](const CatalogueSummary& s) { return s.catalogue_index == choice.catalogue_index; });
            if (it == listing_.end()) {
                console.reject_choice("No such catalogue waiting for a choice");
                return true;
            }

            current_ = choice.catalogue_index;
            console.show_candidates(*it, candidates_of(*current_));
            state_ = SessionState::SelectCandidate;
            return true;
        }

        case SessionState::SelectCandidate: {
            const auto summary = summarize(*current_);
            const auto candidates = candidates_of(*current_);
            const auto choice = console.select_candidate(summary, candidates);

            switch (choice.action) {
                case CandidateChoice::Action::Abort:
                    abort_pending();
                    return false;

                case CandidateChoice::Action::Back:
                    current_.reset();
                    state_ = SessionState::ListCatalogues;
                    return true;

                case CandidateChoice::Action::Select:
                    if (choice.rank >= candidates.size()) {
                        console.reject_choice("No candidate " + std::to_string(choice.rank));
                        return true;
                    }
                    chosen_rank_ = choice.rank;
                    state_ = SessionState::Confirmed;
                    return true;
            }
            return true;
        }

        case SessionState::Confirmed: {
            const auto& catalogue = catalogues_[*current_];
            resolutions_[*current_] = Resolution::operator_selected(chosen_rank_);
            FOLIO_LOG_INFO("Catalogue {}: operator picked '{}'",
                           catalogue.label(), catalogue.members[chosen_rank_].raw_name);
            current_.reset();
            state_ = SessionState::ListCatalogues;
            return true;
        }

        case SessionState::Completed:
        case SessionState::Aborted:
            return false;
    }

    return false;
}

SessionOutcome InteractiveSession::run(OperatorConsole& console) {
    while (step(console)) {
    }
    return state_ == SessionState::Completed ? SessionOutcome::Completed : SessionOutcome::Cancelled;
}

} // namespace folio
