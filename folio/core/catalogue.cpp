/*
 * File:        catalogue.cpp
 * Module:      folio-core
 * Purpose:     Grouping of candidates into catalogues by identity
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "catalogue.h"
#include "logging.h"
#include <algorithm>
#include <map>

namespace folio {

std::optional<uint64_t> Catalogue::number() const {
    if (identity.empty()) {
        return std::nullopt;
    }
    return identity.front();
}

std::string Catalogue::label() const {
    if (has_number()) {
        return identity_to_string(identity);
    }
    if (!members.empty()) {
        return "\"" + members.front().raw_name + "\"";
    }
    return identity_to_string(identity);
}

std::vector<Catalogue> group_catalogues(const std::vector<Candidate>& candidates) {
    std::vector<Catalogue> catalogues;
    std::map<Identity, size_t> index_by_identity;
    size_t unnumbered_count = 0;

    for (const auto& candidate : candidates) {
        if (!candidate.has_identity()) {
            Catalogue catalogue;
            catalogue.unnumbered_slot = unnumbered_count++;
            catalogue.members.push_back(candidate);
            catalogues.push_back(std::move(catalogue));
            continue;
        }

        auto it = index_by_identity.find(candidate.identity);
        if (it == index_by_identity.end()) {
            Catalogue catalogue;
            catalogue.identity = candidate.identity;
            catalogue.members.push_back(candidate);
            index_by_identity.emplace(candidate.identity, catalogues.size());
            catalogues.push_back(std::move(catalogue));
        } else {
            catalogues[it->second].members.push_back(candidate);
        }
    }

    for (auto& catalogue : catalogues) {
        std::sort(catalogue.members.begin(), catalogue.members.end(),
            [](const Candidate& a, const Candidate& b) {
                if (a.raw_name != b.raw_name) {
                    return a.raw_name < b.raw_name;
                }
                return a.path < b.path;
            });

        for (size_t rank = 0; rank < catalogue.members.size(); ++rank) {
            catalogue.members[rank].lexical_rank = rank;
        }

        if (catalogue.is_ambiguous()) {
            FOLIO_LOG_DEBUG("Catalogue {} has {} candidates", catalogue.label(), catalogue.members.size());
        }
    }

    FOLIO_LOG_DEBUG("Grouped {} candidates into {} catalogues ({} unnumbered)",
                    candidates.size(), catalogues.size(), unnumbered_count);
    return catalogues;
}

} // namespace folio
