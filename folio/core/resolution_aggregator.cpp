/*
 * File:        resolution_aggregator.cpp
 * Module:      folio-core
 * Purpose:     Combine per-catalogue resolutions into output assignments
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "resolution_aggregator.h"
#include "logging.h"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <map>

namespace folio {

namespace {

std::string describe_issues(const std::vector<CatalogueIssue>& issues) {
    std::string msg = fmt::format("{} catalogue{} could not be resolved:",
                                  issues.size(), issues.size() == 1 ? "" : "s");
    for (const auto& issue : issues) {
        msg += fmt::format("\n  {}: {} ({})", issue.label, to_string(issue.reason), issue.detail);
    }
    return msg;
}

std::string describe_collisions(const std::vector<NameCollision>& collisions) {
    std::string msg = fmt::format("{} output name{} claimed more than once:",
                                  collisions.size(), collisions.size() == 1 ? " is" : "s are");
    for (const auto& collision : collisions) {
        msg += fmt::format("\n  {}: catalogues {}", collision.output_name,
                           fmt::join(collision.labels, ", "));
    }
    return msg;
}

} // anonymous namespace

UnresolvedCatalogueError::UnresolvedCatalogueError(std::vector<CatalogueIssue> issues)
    : ResolutionError(describe_issues(issues)),
      issues_(std::move(issues)) {
}

NamingCollisionError::NamingCollisionError(std::vector<NameCollision> collisions)
    : ResolutionError(describe_collisions(collisions)),
      collisions_(std::move(collisions)) {
}

std::string make_output_name(const std::string& title, const std::optional<uint64_t>& number,
                             size_t number_width) {
    if (!number) {
        return title;
    }
    if (number_width == 0) {
        return title + std::to_string(*number);
    }
    return fmt::format("{}{:0{}}", title, *number, number_width);
}

AggregationReport aggregate_resolutions(const std::vector<Catalogue>& catalogues,
                                        const std::vector<Resolution>& resolutions,
                                        const NamingOptions& naming) {
    if (catalogues.size() != resolutions.size()) {
        throw std::invalid_argument("aggregate_resolutions: one resolution per catalogue is required");
    }

    AggregationReport report;

    for (size_t i = 0; i < catalogues.size(); ++i) {
        const auto& catalogue = catalogues[i];
        const auto& resolution = resolutions[i];

        if (!resolution.is_selected()) {
            CatalogueIssue issue;
            issue.catalogue_index = i;
            issue.label = catalogue.label();
            issue.number = catalogue.number();
            issue.kind = resolution.kind();
            issue.reason = resolution.reason();
            issue.detail = resolution.detail();
            report.issues.push_back(std::move(issue));
            continue;
        }

        const auto& member = catalogue.members.at(resolution.selected_rank());

        BookAssignment assignment;
        assignment.catalogue_index = i;
        assignment.identity = catalogue.identity;
        assignment.number = catalogue.number();
        assignment.source_path = member.path;
        assignment.raw_name = member.raw_name;
        assignment.page_count = member.page_count;
        assignment.total_bytes = member.total_bytes;
        assignment.output_name = make_output_name(naming.title, assignment.number, naming.number_width);
        assignment.reason = resolution.reason();
        report.assignments.push_back(std::move(assignment));
    }

    // Group by output name, keeping first-seen order for reporting
    std::map<std::string, size_t> collision_index;
    std::map<std::string, size_t> first_owner;
    for (const auto& assignment : report.assignments) {
        const auto owner = first_owner.find(assignment.output_name);
        if (owner == first_owner.end()) {
            first_owner.emplace(assignment.output_name, assignment.catalogue_index);
            continue;
        }

        auto it = collision_index.find(assignment.output_name);
        if (it == collision_index.end()) {
            NameCollision collision;
            collision.output_name = assignment.output_name;
            collision.catalogue_indexes.push_back(owner->second);
            collision.labels.push_back(catalogues[owner->second].label());
            it = collision_index.emplace(assignment.output_name, report.collisions.size()).first;
            report.collisions.push_back(std::move(collision));
        }

        auto& collision = report.collisions[it->second];
        collision.catalogue_indexes.push_back(assignment.catalogue_index);
        collision.labels.push_back(catalogues[assignment.catalogue_index].label());
    }

    FOLIO_LOG_DEBUG("Aggregated {} catalogues: {} selected, {} issues, {} name collisions",
                    catalogues.size(), report.assignments.size(), report.issues.size(),
                    report.collisions.size());
    return report;
}

std::vector<BookAssignment> require_complete(const AggregationReport& report) {
    if (!report.issues.empty()) {
        throw UnresolvedCatalogueError(report.issues);
    }
    if (!report.collisions.empty()) {
        throw NamingCollisionError(report.collisions);
    }
    return report.assignments;
}

} // namespace folio
