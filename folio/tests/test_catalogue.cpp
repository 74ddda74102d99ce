/******************************************************************************
 * test_catalogue.cpp
 *
 * Unit tests for catalogue grouping
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "catalogue.h"
#include <cassert>
#include <iostream>
#include <set>

using namespace folio;

void test_partition() {
    const std::vector<Candidate> candidates = {
        make_candidate("a/Title 1", 10),
        make_candidate("a/Title 2", 12),
        make_candidate("b/Title 1 - Fix", 11),
        make_candidate("a/Vol2-Ch1", 9),
    };

    const auto catalogues = group_catalogues(candidates);
    assert(catalogues.size() == 3);

    // Every candidate lands in exactly one catalogue
    std::set<std::string> seen;
    size_t total = 0;
    for (const auto& catalogue : catalogues) {
        for (const auto& member : catalogue.members) {
            assert(member.identity == catalogue.identity);
            seen.insert(member.path);
            ++total;
        }
    }
    assert(total == candidates.size());
    assert(seen.size() == candidates.size());

    std::cout << "test_partition: PASSED\n";
}

void test_encounter_order() {
    const std::vector<Candidate> candidates = {
        make_candidate("Title 3", 1),
        make_candidate("Title 1", 1),
        make_candidate("Title 3 alt", 1),
        make_candidate("Title 2", 1),
    };

    const auto catalogues = group_catalogues(candidates);
    assert(catalogues.size() == 3);
    assert(catalogues[0].identity == (Identity{3}));
    assert(catalogues[1].identity == (Identity{1}));
    assert(catalogues[2].identity == (Identity{2}));

    std::cout << "test_encounter_order: PASSED\n";
}

void test_lexical_ranks() {
    const std::vector<Candidate> candidates = {
        make_candidate("x/Title 1 - b", 5),
        make_candidate("x/Title 1 - a", 7),
        make_candidate("y/Title 1 - a", 3),
    };

    const auto catalogues = group_catalogues(candidates);
    assert(catalogues.size() == 1);

    const auto& members = catalogues[0].members;
    assert(members.size() == 3);
    // Ties on raw_name fall back to path
    assert(members[0].path == "x/Title 1 - a");
    assert(members[1].path == "y/Title 1 - a");
    assert(members[2].path == "x/Title 1 - b");
    for (size_t rank = 0; rank < members.size(); ++rank) {
        assert(members[rank].lexical_rank == rank);
    }
    assert(catalogues[0].is_ambiguous());

    std::cout << "test_lexical_ranks: PASSED\n";
}

void test_byte_order() {
    // Uppercase sorts before lowercase
    const std::vector<Candidate> candidates = {
        make_candidate("title 4", 1),
        make_candidate("Title 4", 1),
    };

    const auto catalogues = group_catalogues(candidates);
    assert(catalogues[0].members[0].raw_name == "Title 4");
    assert(catalogues[0].members[1].raw_name == "title 4");

    std::cout << "test_byte_order: PASSED\n";
}

void test_unnumbered_singletons() {
    const std::vector<Candidate> candidates = {
        make_candidate("Cover", 1),
        make_candidate("Title 1", 1),
        make_candidate("Extras", 1),
    };

    const auto catalogues = group_catalogues(candidates);
    assert(catalogues.size() == 3);

    assert(!catalogues[0].has_number());
    assert(catalogues[0].unnumbered_slot == std::optional<size_t>(0));
    assert(catalogues[0].members.size() == 1);
    assert(catalogues[0].label() == "\"Cover\"");

    assert(catalogues[1].number() == std::optional<uint64_t>(1));
    assert(!catalogues[1].unnumbered_slot);
    assert(catalogues[1].label() == "1");

    assert(catalogues[2].unnumbered_slot == std::optional<size_t>(1));
    assert(!catalogues[2].number());

    std::cout << "test_unnumbered_singletons: PASSED\n";
}

void test_multi_component_identity() {
    const std::vector<Candidate> candidates = {
        make_candidate("Vol02-Ch10", 1),
        make_candidate("Vol2-Ch10 hq", 1),
        make_candidate("Vol2-Ch11", 1),
    };

    const auto catalogues = group_catalogues(candidates);
    assert(catalogues.size() == 2);
    assert(catalogues[0].members.size() == 2);
    assert(catalogues[0].number() == std::optional<uint64_t>(2));
    assert(catalogues[0].label() == "2.10");

    std::cout << "test_multi_component_identity: PASSED\n";
}

void test_empty_input() {
    assert(group_catalogues({}).empty());

    std::cout << "test_empty_input: PASSED\n";
}

int main() {
    std::cout << "Running Catalogue tests...\n";

    test_partition();
    test_encounter_order();
    test_lexical_ranks();
    test_byte_order();
    test_unnumbered_singletons();
    test_multi_component_identity();
    test_empty_input();

    std::cout << "All Catalogue tests passed!\n";
    return 0;
}
