/*
 * File:        catalogue.h
 * Module:      folio-core
 * Purpose:     Grouping of candidates into catalogues by identity
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "candidate.h"
#include <optional>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief All candidates sharing one identity
 *
 * Members are ordered by lexical_rank. A candidate without digits in its
 * name gets a catalogue of its own, marked by unnumbered_slot; such
 * catalogues are never merged with each other or with numbered ones.
 */
struct Catalogue {
    Identity identity;
    std::optional<size_t> unnumbered_slot;  // Set only for no-identity catalogues
    std::vector<Candidate> members;         // Ordered by lexical_rank

    bool is_ambiguous() const { return members.size() > 1; }
    bool has_number() const { return !identity.empty(); }

    /// First identity component, absent for unnumbered catalogues
    std::optional<uint64_t> number() const;

    /// Display label: identity for numbered catalogues, the name otherwise
    std::string label() const;
};

/**
 * @brief Partition candidates into catalogues
 *
 * Catalogues are listed in first-encounter order of their identity so
 * that output is stable for a stable scan order. Members are sorted by
 * raw_name (byte order, path breaks ties) and receive their lexical_rank.
 */
std::vector<Catalogue> group_catalogues(const std::vector<Candidate>& candidates);

} // namespace folio
