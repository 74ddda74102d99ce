/*
 * File:        text_console.h
 * Module:      folio-cli
 * Purpose:     Line oriented operator console
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "operator_console.h"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace folio {
namespace cli {

/**
 * @brief OperatorConsole reading answers line by line
 *
 * End of input counts as an abort. "q" aborts, "b" goes back from a
 * candidate list.
 */
class TextConsole : public OperatorConsole {
public:
    TextConsole(std::istream& in, std::ostream& out, bool verbose = false);

    void show_catalogues(const std::vector<CatalogueSummary>& pending) override;
    CatalogueChoice select_catalogue(const std::vector<CatalogueSummary>& pending) override;
    void show_candidates(const CatalogueSummary& catalogue,
                         const std::vector<CandidateSummary>& candidates) override;
    CandidateChoice select_candidate(const CatalogueSummary& catalogue,
                                     const std::vector<CandidateSummary>& candidates) override;
    void reject_choice(const std::string& message) override;
    std::optional<std::string> choose_title(const std::vector<std::string>& detected) override;

private:
    std::optional<std::string> prompt(const std::string& text);

    std::istream& in_;
    std::ostream& out_;
    bool verbose_;
};

} // namespace cli
} // namespace folio
