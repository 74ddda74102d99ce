/*
 * File:        resolution.cpp
 * Module:      folio-core
 * Purpose:     Per-catalogue resolution outcome
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "resolution.h"
#include <fmt/format.h>

namespace folio {

Resolution Resolution::single_member() {
    Resolution r(Kind::Selected, Reason::SingleMember);
    r.detail_ = "only one candidate";
    return r;
}

Resolution Resolution::rule_selected(size_t rank, size_t rule_index) {
    Resolution r(Kind::Selected, Reason::RuleMatched);
    r.rank_ = rank;
    r.rule_index_ = rule_index;
    r.detail_ = fmt::format("picked by rule #{}", rule_index + 1);
    return r;
}

Resolution Resolution::operator_selected(size_t rank) {
    Resolution r(Kind::Selected, Reason::OperatorChoice);
    r.rank_ = rank;
    r.detail_ = "picked interactively";
    return r;
}

Resolution Resolution::no_matching_rule() {
    Resolution r(Kind::Unresolved, Reason::NoMatchingRule);
    r.detail_ = "more than one match and no pick rule applies";
    return r;
}

Resolution Resolution::operator_aborted() {
    Resolution r(Kind::Unresolved, Reason::OperatorAborted);
    r.detail_ = "interactive selection was cancelled";
    return r;
}

Resolution Resolution::index_out_of_range(size_t rule_index, size_t index, size_t member_count) {
    Resolution r(Kind::Failed, Reason::IndexOutOfRange);
    r.rule_index_ = rule_index;
    r.detail_ = fmt::format("rule #{} picks index {} but there {} only {} candidate{}",
                            rule_index + 1, index, member_count == 1 ? "is" : "are",
                            member_count, member_count == 1 ? "" : "s");
    return r;
}

Resolution Resolution::no_pattern_match(size_t rule_index, const std::string& pattern) {
    Resolution r(Kind::Failed, Reason::NoPatternMatch);
    r.rule_index_ = rule_index;
    r.detail_ = fmt::format("rule #{} pattern '{}' matches no candidate", rule_index + 1, pattern);
    return r;
}

const char* to_string(Resolution::Kind kind) {
    switch (kind) {
        case Resolution::Kind::Selected: return "selected";
        case Resolution::Kind::Unresolved: return "unresolved";
        case Resolution::Kind::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(Resolution::Reason reason) {
    switch (reason) {
        case Resolution::Reason::SingleMember: return "single member";
        case Resolution::Reason::RuleMatched: return "rule matched";
        case Resolution::Reason::OperatorChoice: return "operator choice";
        case Resolution::Reason::NoMatchingRule: return "no matching rule";
        case Resolution::Reason::OperatorAborted: return "operator aborted";
        case Resolution::Reason::IndexOutOfRange: return "index out of range";
        case Resolution::Reason::NoPatternMatch: return "no pattern match";
    }
    return "unknown";
}

} // namespace folio
