/*
 * File:        candidate.h
 * Module:      folio-core
 * Purpose:     Scanned book candidate and its numeric identity
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief Ordered sequence of the numbers embedded in a directory name
 *
 * "Vol02-Ch10" has identity {2, 10}. An empty identity means the name
 * contains no digits at all.
 */
using Identity = std::vector<uint64_t>;

/**
 * @brief Extract the identity of a directory name
 *
 * Collects maximal runs of ASCII digits left to right. Leading zeros are
 * ignored and a run too large for uint64_t saturates at UINT64_MAX.
 */
Identity extract_identity(const std::string& raw_name);

/**
 * @brief Render an identity for display, e.g. "2.10" or "(none)"
 */
std::string identity_to_string(const Identity& identity);

/**
 * @brief A directory considered as a book
 *
 * Produced by the scanner and immutable afterwards. lexical_rank is
 * assigned when the candidate is placed into its catalogue.
 */
struct Candidate {
    std::string path;           // Unique within a run
    std::string raw_name;       // Final path segment
    Identity identity;          // Numbers embedded in raw_name
    size_t page_count = 0;      // Orderable image entries
    uint64_t total_bytes = 0;   // Sum of page sizes (informational)
    size_t lexical_rank = 0;    // Rank among catalogue members by raw_name

    bool has_identity() const { return !identity.empty(); }
};

/**
 * @brief Build a candidate from scanner output
 * @param path Directory path; the final segment becomes raw_name
 * @param page_count Number of pages found in the directory
 * @param total_bytes Sum of page sizes
 */
Candidate make_candidate(const std::string& path, size_t page_count, uint64_t total_bytes = 0);

} // namespace folio
