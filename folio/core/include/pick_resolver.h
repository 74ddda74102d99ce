/*
 * File:        pick_resolver.h
 * Module:      folio-core
 * Purpose:     Apply pick rules to catalogues
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "catalogue.h"
#include "pick_policy.h"
#include "resolution.h"
#include <optional>
#include <vector>

namespace folio {

/**
 * @brief Selects one member per catalogue from the declared pick rules
 *
 * For each catalogue the most specific matching rule wins: an exact
 * number beats a bounded range, which beats "..". Among bounded ranges
 * the narrower span wins. Equally specific rules are decided by
 * declaration order, the later one wins.
 *
 * A single-member catalogue is selected trivially unless a rule that
 * names its number (exact or bounded) matches it; that rule is then
 * applied and may fail.
 */
class PickResolver {
public:
    explicit PickResolver(std::vector<PickRule> rules);

    const std::vector<PickRule>& rules() const { return rules_; }

    /**
     * @brief Most specific rule matching the catalogue
     * @return nullptr if no rule matches
     */
    const PickRule* find_rule(const Catalogue& catalogue) const;

    /**
     * @brief Resolve one catalogue
     */
    Resolution resolve(const Catalogue& catalogue) const;

    /**
     * @brief Resolve every catalogue, in catalogue order
     */
    std::vector<Resolution> resolve_all(const std::vector<Catalogue>& catalogues) const;

    /**
     * @brief Apply a target to members in rank order
     * @return Selected rank, or nullopt if the target finds nothing
     */
    static std::optional<size_t> apply_target(const PickTarget& target,
                                              const std::vector<Candidate>& members);

    /**
     * @brief True if rule a takes precedence over rule b
     */
    static bool takes_precedence(const PickRule& a, const PickRule& b);

private:
    std::vector<PickRule> rules_;
};

} // namespace folio
