/******************************************************************************
 * test_pick_resolver.cpp
 *
 * Unit tests for rule precedence and target application
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "pick_resolver.h"
#include <cassert>
#include <iostream>

using namespace folio;

namespace {

Catalogue make_catalogue(const std::vector<Candidate>& candidates) {
    const auto catalogues = group_catalogues(candidates);
    assert(catalogues.size() == 1);
    return catalogues.front();
}

} // anonymous namespace

void test_exact_beats_all() {
    const PickResolver resolver(parse_pick_rules({"3=last", "first"}));
    const auto catalogue = make_catalogue({
        make_candidate("Title 3 a", 5),
        make_candidate("Title 3 b", 5),
    });

    const auto* rule = resolver.find_rule(catalogue);
    assert(rule != nullptr);
    assert(rule->declaration_index == 0);

    const auto resolution = resolver.resolve(catalogue);
    assert(resolution.is_selected());
    assert(resolution.reason() == Resolution::Reason::RuleMatched);
    assert(resolution.selected_rank() == 1);
    assert(resolution.rule_index() == std::optional<size_t>(0));

    std::cout << "test_exact_beats_all: PASSED\n";
}

void test_narrower_range_wins() {
    const auto catalogue = make_catalogue({
        make_candidate("Title 4 a", 5),
        make_candidate("Title 4 b", 5),
    });

    // Declaration order must not matter
    const PickResolver wide_first(parse_pick_rules({"1..10=first", "3..5=last"}));
    assert(wide_first.resolve(catalogue).selected_rank() == 1);

    const PickResolver narrow_first(parse_pick_rules({"3..5=last", "1..10=first"}));
    assert(narrow_first.resolve(catalogue).selected_rank() == 1);

    std::cout << "test_narrower_range_wins: PASSED\n";
}

void test_equal_width_later_wins() {
    const auto catalogue = make_catalogue({
        make_candidate("Title 4 a", 5),
        make_candidate("Title 4 b", 5),
    });

    const PickResolver resolver(parse_pick_rules({"3..6=first", "4..7=last"}));
    const auto resolution = resolver.resolve(catalogue);
    assert(resolution.selected_rank() == 1);
    assert(resolution.rule_index() == std::optional<size_t>(1));

    const PickResolver all_rules(parse_pick_rules({"last", "first"}));
    assert(all_rules.resolve(catalogue).selected_rank() == 0);

    std::cout << "test_equal_width_later_wins: PASSED\n";
}

void test_precedence_is_total() {
    const auto rules = parse_pick_rules({"first", "2..9=last", "2..=8=last", "5=0", "5=1"});
    for (const auto& a : rules) {
        for (const auto& b : rules) {
            if (&a == &b) {
                assert(!PickResolver::takes_precedence(a, b));
                continue;
            }
            // Exactly one of the two wins
            assert(PickResolver::takes_precedence(a, b) != PickResolver::takes_precedence(b, a));
        }
    }

    std::cout << "test_precedence_is_total: PASSED\n";
}

void test_index_out_of_range() {
    const PickResolver resolver(parse_pick_rules({"5"}));
    const auto catalogue = make_catalogue({
        make_candidate("Title 1 a", 5),
        make_candidate("Title 1 b", 5),
    });

    const auto resolution = resolver.resolve(catalogue);
    assert(resolution.kind() == Resolution::Kind::Failed);
    assert(resolution.reason() == Resolution::Reason::IndexOutOfRange);
    assert(resolution.rule_index() == std::optional<size_t>(0));
    // Not silently clamped to the last member
    assert(!resolution.is_selected());

    std::cout << "test_index_out_of_range: PASSED\n";
}

void test_no_pattern_match() {
    const PickResolver resolver(parse_pick_rules({"1=fix"}));
    const auto catalogue = make_catalogue({
        make_candidate("Title 1 a", 5),
        make_candidate("Title 1 b", 5),
    });

    const auto resolution = resolver.resolve(catalogue);
    assert(resolution.kind() == Resolution::Kind::Failed);
    assert(resolution.reason() == Resolution::Reason::NoPatternMatch);
    assert(resolution.detail().find("fix") != std::string::npos);

    std::cout << "test_no_pattern_match: PASSED\n";
}

void test_no_matching_rule() {
    const PickResolver resolver(parse_pick_rules({"2=last"}));
    const auto catalogue = make_catalogue({
        make_candidate("Title 1 a", 5),
        make_candidate("Title 1 b", 5),
    });

    assert(resolver.find_rule(catalogue) == nullptr);
    const auto resolution = resolver.resolve(catalogue);
    assert(resolution.kind() == Resolution::Kind::Unresolved);
    assert(resolution.reason() == Resolution::Reason::NoMatchingRule);

    std::cout << "test_no_matching_rule: PASSED\n";
}

void test_single_member() {
    const auto catalogue = make_catalogue({make_candidate("Title 2", 5)});

    const PickResolver none(std::vector<PickRule>{});
    assert(none.resolve(catalogue).reason() == Resolution::Reason::SingleMember);

    // A ".." pattern rule leaves a lone book alone
    const PickResolver pattern(parse_pick_rules({"fix"}));
    const auto resolution = pattern.resolve(catalogue);
    assert(resolution.is_selected());
    assert(resolution.reason() == Resolution::Reason::SingleMember);
    assert(resolution.selected_rank() == 0);

    // A rule aimed at this number still has to succeed
    const PickResolver targeted(parse_pick_rules({"2=3"}));
    assert(targeted.resolve(catalogue).reason() == Resolution::Reason::IndexOutOfRange);

    const PickResolver targeted_ok(parse_pick_rules({"1..=4=last"}));
    assert(targeted_ok.resolve(catalogue).reason() == Resolution::Reason::RuleMatched);

    std::cout << "test_single_member: PASSED\n";
}

void test_most_pages_tie() {
    const std::vector<Candidate> members = group_catalogues({
        make_candidate("Title 1 a", 10),
        make_candidate("Title 1 b", 30),
        make_candidate("Title 1 c", 30),
    }).front().members;

    assert(PickResolver::apply_target(PickTarget::most_pages(), members) == std::optional<size_t>(1));
    assert(PickResolver::apply_target(PickTarget::first(), members) == std::optional<size_t>(0));
    assert(PickResolver::apply_target(PickTarget::last(), members) == std::optional<size_t>(2));
    assert(PickResolver::apply_target(PickTarget::index(3), members) == std::nullopt);
    assert(PickResolver::apply_target(PickTarget::pattern("B|C"), members) == std::optional<size_t>(1));

    std::cout << "test_most_pages_tie: PASSED\n";
}

void test_unnumbered_only_matches_all() {
    const auto catalogue = make_catalogue({make_candidate("Cover", 1)});

    const PickResolver bounded(parse_pick_rules({"0..=99=5"}));
    assert(bounded.find_rule(catalogue) == nullptr);
    assert(bounded.resolve(catalogue).reason() == Resolution::Reason::SingleMember);

    std::cout << "test_unnumbered_only_matches_all: PASSED\n";
}

void test_resolve_all_order() {
    const auto catalogues = group_catalogues({
        make_candidate("Title 2", 5),
        make_candidate("Title 1 a", 5),
        make_candidate("Title 1 b", 5),
    });

    const PickResolver resolver(parse_pick_rules({"last"}));
    const auto resolutions = resolver.resolve_all(catalogues);
    assert(resolutions.size() == 2);
    assert(resolutions[0].reason() == Resolution::Reason::SingleMember);
    assert(resolutions[1].reason() == Resolution::Reason::RuleMatched);
    assert(resolutions[1].selected_rank() == 1);

    std::cout << "test_resolve_all_order: PASSED\n";
}

int main() {
    std::cout << "Running PickResolver tests...\n";

    test_exact_beats_all();
    test_narrower_range_wins();
    test_equal_width_later_wins();
    test_precedence_is_total();
    test_index_out_of_range();
    test_no_pattern_match();
    test_no_matching_rule();
    test_single_member();
    test_most_pages_tie();
    test_unnumbered_only_matches_all();
    test_resolve_all_order();

    std::cout << "All PickResolver tests passed!\n";
    return 0;
}
