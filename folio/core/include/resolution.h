/*
 * File:        resolution.h
 * Module:      folio-core
 * Purpose:     Per-catalogue resolution outcome
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace folio {

/**
 * @brief Final outcome for one catalogue
 *
 * Created once and never modified. The interactive session replaces an
 * Unresolved value with a new Selected one.
 */
class Resolution {
public:
    enum class Kind {
        Selected,
        Unresolved,
        Failed
    };

    enum class Reason {
        SingleMember,       // Selected: nothing to disambiguate
        RuleMatched,        // Selected: a pick rule chose the member
        OperatorChoice,     // Selected: chosen interactively
        NoMatchingRule,     // Unresolved
        OperatorAborted,    // Unresolved
        IndexOutOfRange,    // Failed
        NoPatternMatch      // Failed
    };

    static Resolution single_member();
    static Resolution rule_selected(size_t rank, size_t rule_index);
    static Resolution operator_selected(size_t rank);
    static Resolution no_matching_rule();
    static Resolution operator_aborted();
    static Resolution index_out_of_range(size_t rule_index, size_t index, size_t member_count);
    static Resolution no_pattern_match(size_t rule_index, const std::string& pattern);

    Kind kind() const { return kind_; }
    Reason reason() const { return reason_; }
    bool is_selected() const { return kind_ == Kind::Selected; }

    /// Rank of the selected member; only meaningful when selected
    size_t selected_rank() const { return rank_; }

    /// Declaration index of the rule involved, if any
    const std::optional<size_t>& rule_index() const { return rule_index_; }

    /// Human readable explanation
    const std::string& detail() const { return detail_; }

private:
    Resolution(Kind kind, Reason reason) : kind_(kind), reason_(reason) {}

    Kind kind_;
    Reason reason_;
    size_t rank_ = 0;
    std::optional<size_t> rule_index_;
    std::string detail_;
};

const char* to_string(Resolution::Kind kind);
const char* to_string(Resolution::Reason reason);

} // namespace folio
