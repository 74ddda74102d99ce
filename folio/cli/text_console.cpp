/*
 * File:        text_console.cpp
 * Module:      folio-cli
 * Purpose:     Line oriented operator console
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "text_console.h"
#include <istream>
#include <ostream>

namespace folio {
namespace cli {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::optional<size_t> parse_index(const std::string& s) {
    if (s.empty() || s.size() > 9 || s.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::stoul(s));
}

const char* plural(size_t n, const char* one, const char* many) {
    return n == 1 ? one : many;
}

} // anonymous namespace

TextConsole::TextConsole(std::istream& in, std::ostream& out, bool verbose)
    : in_(in), out_(out), verbose_(verbose) {
}

std::optional<std::string> TextConsole::prompt(const std::string& text) {
    out_ << text << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return std::nullopt;
    }
    return trim(line);
}

void TextConsole::show_catalogues(const std::vector<CatalogueSummary>& pending) {
    out_ << "\nCatalogues with more than one match:\n";
    for (size_t i = 0; i < pending.size(); ++i) {
        const auto& c = pending[i];
        out_ << "  " << (i + 1) << ") " << c.label << " (" << c.candidate_count << " "
             << plural(c.candidate_count, "book", "books") << ")\n";
    }
}

CatalogueChoice TextConsole::select_catalogue(const std::vector<CatalogueSummary>& pending) {
    while (true) {
        const auto answer = prompt("Pick a catalogue [1-" + std::to_string(pending.size()) + ", q to quit]: ");
        if (!answer || *answer == "q") {
            return CatalogueChoice::abort();
        }

        const auto position = parse_index(*answer);
        if (position && *position >= 1 && *position <= pending.size()) {
            return CatalogueChoice::select(pending[*position - 1].catalogue_index);
        }
        out_ << "  Enter a number between 1 and " << pending.size() << "\n";
    }
}

void TextConsole::show_candidates(const CatalogueSummary& catalogue,
                                  const std::vector<CandidateSummary>& candidates) {
    out_ << "\nCatalogue " << catalogue.label << ":\n";
    for (const auto& c : candidates) {
        out_ << "  " << c.rank << ") " << c.raw_name << " (" << c.page_count << " "
             << plural(c.page_count, "page", "pages") << ", " << c.total_bytes << " bytes)\n";
        if (verbose_) {
            out_ << "     " << c.path << "\n";
        }
    }
}

CandidateChoice TextConsole::select_candidate(const CatalogueSummary&,
                                              const std::vector<CandidateSummary>& candidates) {
    while (true) {
        const auto answer = prompt("Pick a book [0-" + std::to_string(candidates.size() - 1) +
                                   ", b to go back, q to quit]: ");
        if (!answer || *answer == "q") {
            return CandidateChoice::abort();
        }
        if (*answer == "b") {
            return CandidateChoice::back();
        }

        const auto rank = parse_index(*answer);
        if (rank) {
            return CandidateChoice::select(*rank);
        }
        out_ << "  Enter a book index, b or q\n";
    }
}

void TextConsole::reject_choice(const std::string& message) {
    out_ << "  " << message << "\n";
}

std::optional<std::string> TextConsole::choose_title(const std::vector<std::string>& detected) {
    out_ << "\nNo series name given. Directory names found:\n";
    for (const auto& name : detected) {
        out_ << "  " << name << "\n";
    }

    const auto answer = prompt("Series name (empty to quit): ");
    if (!answer || answer->empty()) {
        return std::nullopt;
    }
    return answer;
}

} // namespace cli
} // namespace folio
