/*
 * File:        pick_resolver.cpp
 * Module:      folio-core
 * Purpose:     Apply pick rules to catalogues
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "pick_resolver.h"
#include "logging.h"

namespace folio {

PickResolver::PickResolver(std::vector<PickRule> rules)
    : rules_(std::move(rules)) {
}

bool PickResolver::takes_precedence(const PickRule& a, const PickRule& b) {
    const auto tier_a = a.from.specificity();
    const auto tier_b = b.from.specificity();
    if (tier_a != tier_b) {
        return tier_a < tier_b;
    }

    if (tier_a == CatalogueRange::Specificity::Bounded) {
        const uint64_t span_a = a.from.span();
        const uint64_t span_b = b.from.span();
        if (span_a != span_b) {
            return span_a < span_b;
        }
    }

    // Later declarations override earlier ones
    return a.declaration_index > b.declaration_index;
}

const PickRule* PickResolver::find_rule(const Catalogue& catalogue) const {
    const auto number = catalogue.number();
    const PickRule* best = nullptr;

    for (const auto& rule : rules_) {
        if (!rule.from.matches(number)) {
            continue;
        }
        if (!best || takes_precedence(rule, *best)) {
            best = &rule;
        }
    }

    return best;
}

std::optional<size_t> PickResolver::apply_target(const PickTarget& target,
                                                  const std::vector<Candidate>& members) {
    if (members.empty()) {
        return std::nullopt;
    }

    switch (target.kind()) {
        case PickTarget::Kind::First:
            return 0;

        case PickTarget::Kind::Last:
            return members.size() - 1;

        case PickTarget::Kind::MostPages: {
            // Strictly greater keeps the lowest rank on ties
            size_t best = 0;
            for (size_t rank = 1; rank < members.size(); ++rank) {
                if (members[rank].page_count > members[best].page_count) {
                    best = rank;
                }
            }
            return best;
        }

        case PickTarget::Kind::Index:
            if (target.index_value() < members.size()) {
                return target.index_value();
            }
            return std::nullopt;

        case PickTarget::Kind::Pattern:
            for (size_t rank = 0; rank < members.size(); ++rank) {
                if (target.matches_name(members[rank].raw_name)) {
                    return rank;
                }
            }
            return std::nullopt;
    }

    return std::nullopt;
}

Resolution PickResolver::resolve(const Catalogue& catalogue) const {
    const PickRule* rule = find_rule(catalogue);

    if (catalogue.members.size() == 1) {
        // ".." rules do not target a number, so they cannot fail a lone book
        if (!rule || rule->from.specificity() == CatalogueRange::Specificity::All) {
            return Resolution::single_member();
        }
    }

    if (!rule) {
        FOLIO_LOG_DEBUG("Catalogue {}: no pick rule applies to {} candidates",
                        catalogue.label(), catalogue.members.size());
        return Resolution::no_matching_rule();
    }

    const auto rank = apply_target(rule->to, catalogue.members);
    if (rank) {
        FOLIO_LOG_DEBUG("Catalogue {}: rule #{} '{}' picked '{}'",
                        catalogue.label(), rule->declaration_index + 1, rule->source,
                        catalogue.members[*rank].raw_name);
        return Resolution::rule_selected(*rank, rule->declaration_index);
    }

    FOLIO_LOG_DEBUG("Catalogue {}: rule #{} '{}' found no target",
                    catalogue.label(), rule->declaration_index + 1, rule->source);

    if (rule->to.kind() == PickTarget::Kind::Pattern) {
        return Resolution::no_pattern_match(rule->declaration_index, rule->to.pattern_source());
    }
    return Resolution::index_out_of_range(rule->declaration_index, rule->to.index_value(),
                                          catalogue.members.size());
}

std::vector<Resolution> PickResolver::resolve_all(const std::vector<Catalogue>& catalogues) const {
    std::vector<Resolution> resolutions;
    resolutions.reserve(catalogues.size());

    for (const auto& catalogue : catalogues) {
        resolutions.push_back(resolve(catalogue));
    }

    return resolutions;
}

} // namespace folio
