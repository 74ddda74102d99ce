/******************************************************************************
 * test_pick_policy.cpp
 *
 * Unit tests for selector, skip and include parsing
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "pick_policy.h"
#include <cassert>
#include <iostream>
#include <limits>

using namespace folio;

namespace {

PolicySyntaxError::Reason pick_failure(const std::vector<std::string>& entries, size_t& entry_index) {
    try {
        parse_pick_rules(entries);
    } catch (const PolicySyntaxError& e) {
        entry_index = e.entry_index();
        return e.reason();
    }
    assert(false && "expected PolicySyntaxError");
    return PolicySyntaxError::Reason::BadInteger;
}

} // anonymous namespace

void test_keyword_targets() {
    auto rule = parse_pick_rule("first");
    assert(rule.from.kind() == CatalogueRange::Kind::All);
    assert(rule.to.kind() == PickTarget::Kind::First);

    assert(parse_pick_rule("last").to.kind() == PickTarget::Kind::Last);
    assert(parse_pick_rule("most-pages").to.kind() == PickTarget::Kind::MostPages);

    rule = parse_pick_rule("2");
    assert(rule.from.kind() == CatalogueRange::Kind::All);
    assert(rule.to.kind() == PickTarget::Kind::Index);
    assert(rule.to.index_value() == 2);

    std::cout << "test_keyword_targets: PASSED\n";
}

void test_range_forms() {
    auto rule = parse_pick_rule("3=last");
    assert(rule.from.kind() == CatalogueRange::Kind::Exact);
    assert(rule.from.start() == 3);
    assert(rule.to.kind() == PickTarget::Kind::Last);

    rule = parse_pick_rule("1..5=first");
    assert(rule.from.kind() == CatalogueRange::Kind::HalfOpen);
    assert(rule.from.matches(uint64_t{1}));
    assert(rule.from.matches(uint64_t{4}));
    assert(!rule.from.matches(uint64_t{5}));

    rule = parse_pick_rule("1..=5=most-pages");
    assert(rule.from.kind() == CatalogueRange::Kind::Inclusive);
    assert(rule.from.matches(uint64_t{5}));
    assert(!rule.from.matches(uint64_t{6}));
    assert(rule.to.kind() == PickTarget::Kind::MostPages);

    rule = parse_pick_rule("4..=0");
    assert(rule.from.kind() == CatalogueRange::Kind::From);
    assert(rule.from.start() == 4);
    assert(rule.to.kind() == PickTarget::Kind::Index);
    assert(rule.to.index_value() == 0);

    rule = parse_pick_rule("..=fix");
    assert(rule.from.kind() == CatalogueRange::Kind::All);
    assert(rule.to.kind() == PickTarget::Kind::Pattern);
    assert(rule.to.pattern_source() == "fix");

    rule = parse_pick_rule("..3=last");
    assert(rule.from.kind() == CatalogueRange::Kind::UpTo);
    assert(rule.from.matches(uint64_t{2}));
    assert(!rule.from.matches(uint64_t{3}));

    rule = parse_pick_rule("..=3=last");
    assert(rule.from.kind() == CatalogueRange::Kind::UpToInclusive);
    assert(rule.from.matches(uint64_t{3}));

    std::cout << "test_range_forms: PASSED\n";
}

void test_whitespace_tolerance() {
    const auto rule = parse_pick_rule(" 2 .. 4 = last ");
    assert(rule.from.kind() == CatalogueRange::Kind::HalfOpen);
    assert(rule.from.start() == 2);
    assert(rule.from.end() == 4);
    assert(rule.to.kind() == PickTarget::Kind::Last);

    std::cout << "test_whitespace_tolerance: PASSED\n";
}

void test_pattern_targets() {
    auto rule = parse_pick_rule("fix");
    assert(rule.to.kind() == PickTarget::Kind::Pattern);
    assert(rule.to.matches_name("Chapter 1 - Fix"));
    assert(!rule.to.matches_name("Chapter 1"));

    // No range-shaped prefix, so the whole entry is the pattern
    rule = parse_pick_rule("a=b");
    assert(rule.from.kind() == CatalogueRange::Kind::All);
    assert(rule.to.kind() == PickTarget::Kind::Pattern);
    assert(rule.to.pattern_source() == "a=b");
    assert(rule.to.matches_name("xa=by"));

    rule = parse_pick_rule("2=v[0-9]+");
    assert(rule.from.kind() == CatalogueRange::Kind::Exact);
    assert(rule.to.matches_name("Title 2 v2"));

    std::cout << "test_pattern_targets: PASSED\n";
}

void test_declaration_index() {
    const auto rules = parse_pick_rules({"first", "3=last", "fix"});
    assert(rules.size() == 3);
    for (size_t i = 0; i < rules.size(); ++i) {
        assert(rules[i].declaration_index == i);
    }
    assert(rules[1].source == "3=last");

    std::cout << "test_declaration_index: PASSED\n";
}

void test_syntax_errors() {
    size_t index = 99;

    assert(pick_failure({"first", "5..3=first"}, index) == PolicySyntaxError::Reason::InvertedRange);
    assert(index == 1);

    assert(pick_failure({"3..3=last"}, index) == PolicySyntaxError::Reason::InvertedRange);
    assert(index == 0);

    assert(pick_failure({"..0=last"}, index) == PolicySyntaxError::Reason::InvertedRange);

    // "5..=4" is inverted, "5..=5" is a single number
    assert(pick_failure({"5..=4=last"}, index) == PolicySyntaxError::Reason::InvertedRange);
    assert(parse_pick_rule("5..=5=last").from.matches(uint64_t{5}));

    assert(pick_failure({"last", "first", "3="}, index) == PolicySyntaxError::Reason::EmptyPattern);
    assert(index == 2);

    assert(pick_failure({"fix("}, index) == PolicySyntaxError::Reason::InvalidPattern);
    assert(index == 0);

    assert(pick_failure({"99999999999999999999999=last"}, index) == PolicySyntaxError::Reason::BadInteger);

    std::cout << "test_syntax_errors: PASSED\n";
}

void test_error_message() {
    try {
        parse_pick_rules({"first", "5..3=first"});
        assert(false);
    } catch (const PolicySyntaxError& e) {
        const std::string what = e.what();
        assert(e.option() == "--pick");
        assert(e.entry() == "5..3=first");
        assert(e.token() == "5..3");
        assert(what.find("--pick #2") != std::string::npos);
        assert(what.find("inverted range") != std::string::npos);
    }

    std::cout << "test_error_message: PASSED\n";
}

void test_specificity_and_span() {
    const uint64_t max = std::numeric_limits<uint64_t>::max();

    assert(CatalogueRange::exact(3).specificity() == CatalogueRange::Specificity::Exact);
    assert(CatalogueRange::all().specificity() == CatalogueRange::Specificity::All);
    assert(CatalogueRange::half_open(1, 5).specificity() == CatalogueRange::Specificity::Bounded);
    assert(CatalogueRange::from(1).specificity() == CatalogueRange::Specificity::Bounded);

    assert(CatalogueRange::exact(3).span() == 1);
    assert(CatalogueRange::half_open(1, 5).span() == 4);
    assert(CatalogueRange::inclusive(1, 5).span() == 5);
    assert(CatalogueRange::up_to(4).span() == 4);
    assert(CatalogueRange::up_to_inclusive(4).span() == 5);
    assert(CatalogueRange::inclusive(0, max).span() == max);

    std::cout << "test_specificity_and_span: PASSED\n";
}

void test_unnumbered_matching() {
    assert(CatalogueRange::all().matches(std::optional<uint64_t>()));
    assert(!CatalogueRange::from(0).matches(std::optional<uint64_t>()));
    assert(!CatalogueRange::exact(0).matches(std::optional<uint64_t>()));

    std::cout << "test_unnumbered_matching: PASSED\n";
}

void test_range_to_string() {
    assert(parse_catalogue_range("..").to_string() == "..");
    assert(parse_catalogue_range("").to_string() == "..");
    assert(parse_catalogue_range("7").to_string() == "7");
    assert(parse_catalogue_range("1..=5").to_string() == "1..=5");
    assert(parse_catalogue_range("2..").to_string() == "2..");

    std::cout << "test_range_to_string: PASSED\n";
}

void test_skip_patterns() {
    const auto patterns = parse_skip_patterns({"preview", "^raw"});
    assert(patterns.size() == 2);
    assert(std::regex_search("Title 2 PREVIEW", patterns[0]));
    assert(!std::regex_search("Title raw", patterns[1]));

    try {
        parse_skip_patterns({"ok", ""});
        assert(false);
    } catch (const PolicySyntaxError& e) {
        assert(e.option() == "--skip");
        assert(e.entry_index() == 1);
        assert(e.reason() == PolicySyntaxError::Reason::EmptyPattern);
    }

    std::cout << "test_skip_patterns: PASSED\n";
}

void test_include_ranges() {
    const auto ranges = parse_include_ranges({"1..=3", "10"});
    assert(ranges.size() == 2);
    assert(ranges[0].matches(uint64_t{3}));
    assert(ranges[1].matches(uint64_t{10}));

    try {
        parse_include_ranges({"x"});
        assert(false);
    } catch (const PolicySyntaxError& e) {
        assert(e.option() == "--include");
        assert(e.reason() == PolicySyntaxError::Reason::BadInteger);
    }

    std::cout << "test_include_ranges: PASSED\n";
}

int main() {
    std::cout << "Running PickPolicy tests...\n";

    test_keyword_targets();
    test_range_forms();
    test_whitespace_tolerance();
    test_pattern_targets();
    test_declaration_index();
    test_syntax_errors();
    test_error_message();
    test_specificity_and_span();
    test_unnumbered_matching();
    test_range_to_string();
    test_skip_patterns();
    test_include_ranges();

    std::cout << "All PickPolicy tests passed!\n";
    return 0;
}
