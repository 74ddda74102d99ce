/*
 * File:        resolution_aggregator.h
 * Module:      folio-core
 * Purpose:     Combine per-catalogue resolutions into output assignments
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "catalogue.h"
#include "resolution.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief How output archive names are formed
 */
struct NamingOptions {
    std::string title;          // Base title, e.g. "Title"
    size_t number_width = 0;    // Zero padding for the catalogue number, 0 = none
};

/**
 * @brief One selected book, ready for the archive builder
 */
struct BookAssignment {
    size_t catalogue_index = 0;
    Identity identity;
    std::optional<uint64_t> number;
    std::string source_path;
    std::string raw_name;
    size_t page_count = 0;
    uint64_t total_bytes = 0;
    std::string output_name;    // Without extension
    Resolution::Reason reason = Resolution::Reason::SingleMember;
};

/**
 * @brief A catalogue that did not end in Selected
 */
struct CatalogueIssue {
    size_t catalogue_index = 0;
    std::string label;
    std::optional<uint64_t> number;
    Resolution::Kind kind = Resolution::Kind::Unresolved;
    Resolution::Reason reason = Resolution::Reason::NoMatchingRule;
    std::string detail;
};

/**
 * @brief Several catalogues that would produce the same archive
 */
struct NameCollision {
    std::string output_name;
    std::vector<size_t> catalogue_indexes;
    std::vector<std::string> labels;
};

/**
 * @brief Everything the aggregator found, before deciding success
 */
struct AggregationReport {
    std::vector<BookAssignment> assignments;
    std::vector<CatalogueIssue> issues;
    std::vector<NameCollision> collisions;

    bool is_complete() const { return issues.empty() && collisions.empty(); }
};

/**
 * @brief Base for errors raised after resolution
 */
class ResolutionError : public std::runtime_error {
public:
    explicit ResolutionError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief One or more catalogues are Unresolved or Failed
 */
class UnresolvedCatalogueError : public ResolutionError {
public:
    explicit UnresolvedCatalogueError(std::vector<CatalogueIssue> issues);

    const std::vector<CatalogueIssue>& issues() const { return issues_; }

private:
    std::vector<CatalogueIssue> issues_;
};

/**
 * @brief Two or more catalogues map to the same output name
 */
class NamingCollisionError : public ResolutionError {
public:
    explicit NamingCollisionError(std::vector<NameCollision> collisions);

    const std::vector<NameCollision>& collisions() const { return collisions_; }

private:
    std::vector<NameCollision> collisions_;
};

/**
 * @brief Output name for a catalogue: title followed by its number
 *
 * "Title" + 3 gives "Title3", or "Title003" with a width of 3. An
 * unnumbered catalogue uses the title alone.
 */
std::string make_output_name(const std::string& title, const std::optional<uint64_t>& number,
                             size_t number_width = 0);

/**
 * @brief Build the report for all catalogues
 *
 * Nothing is dropped: every catalogue ends up either in assignments or
 * in issues.
 *
 * @throws std::invalid_argument if the two lists differ in length
 */
AggregationReport aggregate_resolutions(const std::vector<Catalogue>& catalogues,
                                        const std::vector<Resolution>& resolutions,
                                        const NamingOptions& naming);

/**
 * @brief Return the assignments of a complete report
 * @throws UnresolvedCatalogueError if any catalogue is Unresolved or Failed
 * @throws NamingCollisionError if output names collide
 */
std::vector<BookAssignment> require_complete(const AggregationReport& report);

} // namespace folio
