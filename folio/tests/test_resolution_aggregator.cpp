/******************************************************************************
 * test_resolution_aggregator.cpp
 *
 * Unit tests for aggregation, output naming and the resolution pipeline
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "resolution_aggregator.h"
#include "resolution_pipeline.h"
#include "pick_resolver.h"
#include <cassert>
#include <iostream>

using namespace folio;

namespace {

std::vector<Candidate> scenario_candidates() {
    return {
        make_candidate("scans/Title - 1", 20),
        make_candidate("scans/Title - 1 - Fix", 21),
        make_candidate("scans/Title - 2", 18),
    };
}

RunContext batch_context(const std::vector<std::string>& picks) {
    FolioConfig config;
    config.name = "Title";
    config.pick = picks;
    config.interactive = false;
    return make_run_context(config);
}

} // anonymous namespace

void test_make_output_name() {
    assert(make_output_name("Title", uint64_t{3}) == "Title3");
    assert(make_output_name("Title", uint64_t{3}, 3) == "Title003");
    assert(make_output_name("Title", uint64_t{1234}, 3) == "Title1234");
    assert(make_output_name("Title", std::nullopt) == "Title");
    assert(make_output_name("Title", std::nullopt, 3) == "Title");

    std::cout << "test_make_output_name: PASSED\n";
}

void test_scenario_unresolved() {
    const ResolutionPipeline pipeline(batch_context({}));
    const auto result = pipeline.run(scenario_candidates(), nullptr);

    assert(result.outcome == RunOutcome::Completed);
    assert(result.catalogues.size() == 2);
    assert(!result.report.is_complete());

    assert(result.report.issues.size() == 1);
    const auto& issue = result.report.issues[0];
    assert(issue.label == "1");
    assert(issue.kind == Resolution::Kind::Unresolved);
    assert(issue.reason == Resolution::Reason::NoMatchingRule);

    // Catalogue 2 still resolves and is reported alongside the failure
    assert(result.report.assignments.size() == 1);
    assert(result.report.assignments[0].raw_name == "Title - 2");
    assert(result.report.assignments[0].output_name == "Title2");

    bool threw = false;
    try {
        require_complete(result.report);
    } catch (const UnresolvedCatalogueError& e) {
        threw = true;
        assert(e.issues().size() == 1);
    }
    assert(threw);

    std::cout << "test_scenario_unresolved: PASSED\n";
}

void test_scenario_pattern_pick() {
    const ResolutionPipeline pipeline(batch_context({"fix"}));
    const auto result = pipeline.run(scenario_candidates(), nullptr);

    assert(result.report.is_complete());
    const auto assignments = require_complete(result.report);
    assert(assignments.size() == 2);

    assert(assignments[0].raw_name == "Title - 1 - Fix");
    assert(assignments[0].output_name == "Title1");
    assert(assignments[0].reason == Resolution::Reason::RuleMatched);

    assert(assignments[1].raw_name == "Title - 2");
    assert(assignments[1].output_name == "Title2");
    assert(assignments[1].reason == Resolution::Reason::SingleMember);

    std::cout << "test_scenario_pattern_pick: PASSED\n";
}

void test_scenario_index_failure() {
    const ResolutionPipeline pipeline(batch_context({"5"}));
    const auto result = pipeline.run(scenario_candidates(), nullptr);

    assert(result.report.issues.size() == 1);
    assert(result.report.issues[0].kind == Resolution::Kind::Failed);
    assert(result.report.issues[0].reason == Resolution::Reason::IndexOutOfRange);

    std::cout << "test_scenario_index_failure: PASSED\n";
}

void test_name_collision() {
    // [2] and [2, 1] are different catalogues with the same first number
    const auto catalogues = group_catalogues({
        make_candidate("Title 2", 10),
        make_candidate("Vol2-Ch1", 10),
        make_candidate("Title 3", 10),
    });
    const auto resolutions = PickResolver(std::vector<PickRule>{}).resolve_all(catalogues);

    const auto report = aggregate_resolutions(catalogues, resolutions, NamingOptions{"Title", 0});
    assert(report.issues.empty());
    assert(report.collisions.size() == 1);
    assert(report.collisions[0].output_name == "Title2");
    assert((report.collisions[0].catalogue_indexes == std::vector<size_t>{0, 1}));
    assert((report.collisions[0].labels == std::vector<std::string>{"2", "2.1"}));

    bool threw = false;
    try {
        require_complete(report);
    } catch (const NamingCollisionError& e) {
        threw = true;
        assert(std::string(e.what()).find("Title2") != std::string::npos);
    }
    assert(threw);

    std::cout << "test_name_collision: PASSED\n";
}

void test_unresolved_reported_before_collisions() {
    const auto catalogues = group_catalogues({
        make_candidate("Title 2", 10),
        make_candidate("Vol2-Ch1", 10),
        make_candidate("Title 4 a", 10),
        make_candidate("Title 4 b", 10),
    });
    const auto resolutions = PickResolver(std::vector<PickRule>{}).resolve_all(catalogues);
    const auto report = aggregate_resolutions(catalogues, resolutions, NamingOptions{"Title", 0});

    assert(report.issues.size() == 1);
    assert(report.collisions.size() == 1);

    bool threw = false;
    try {
        require_complete(report);
    } catch (const UnresolvedCatalogueError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_unresolved_reported_before_collisions: PASSED\n";
}

void test_number_width() {
    const auto catalogues = group_catalogues({make_candidate("Title 7", 10)});
    const auto resolutions = PickResolver(std::vector<PickRule>{}).resolve_all(catalogues);
    const auto report = aggregate_resolutions(catalogues, resolutions, NamingOptions{"Book", 3});

    assert(report.assignments.size() == 1);
    assert(report.assignments[0].output_name == "Book007");
    assert(report.assignments[0].number == std::optional<uint64_t>(7));

    std::cout << "test_number_width: PASSED\n";
}

void test_skip_and_include() {
    FolioConfig config;
    config.name = "Title";
    config.interactive = false;
    config.skip = {"fix"};
    config.include = {"2.."};
    const ResolutionPipeline pipeline(make_run_context(config));

    auto candidates = scenario_candidates();
    candidates.push_back(make_candidate("scans/Title - 3", 5));
    candidates.push_back(make_candidate("scans/Cover", 1));

    const auto result = pipeline.run(candidates, nullptr);
    assert(result.skipped_candidates == 1);
    // Catalogue 1 and the unnumbered cover fall outside "2.."
    assert(result.excluded_catalogues == 2);

    const auto assignments = require_complete(result.report);
    assert(assignments.size() == 2);
    assert(assignments[0].output_name == "Title2");
    assert(assignments[1].output_name == "Title3");

    std::cout << "test_skip_and_include: PASSED\n";
}

void test_title_detection() {
    const std::vector<Candidate> same_name = {
        make_candidate("a/Series", 10),
        make_candidate("b/Series", 12),
    };
    assert(detect_title(same_name) == "Series");
    assert(detect_title(scenario_candidates()).empty());

    const auto names = detected_names(scenario_candidates());
    assert(names.size() == 3);
    assert(names[0] == "Title - 1");

    FolioConfig config;
    config.interactive = false;
    const ResolutionPipeline pipeline(make_run_context(config));

    bool threw = false;
    try {
        pipeline.run(scenario_candidates(), nullptr);
    } catch (const MissingTitleError& e) {
        threw = true;
        assert(e.detected_names().size() == 3);
    }
    assert(threw);

    std::cout << "test_title_detection: PASSED\n";
}

void test_interactive_requires_console() {
    FolioConfig config;
    config.name = "Title";
    const ResolutionPipeline pipeline(make_run_context(config));

    bool threw = false;
    try {
        pipeline.run(scenario_candidates(), nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_interactive_requires_console: PASSED\n";
}

int main() {
    std::cout << "Running ResolutionAggregator tests...\n";

    test_make_output_name();
    test_scenario_unresolved();
    test_scenario_pattern_pick();
    test_scenario_index_failure();
    test_name_collision();
    test_unresolved_reported_before_collisions();
    test_number_width();
    test_skip_and_include();
    test_title_detection();
    test_interactive_requires_console();

    std::cout << "All ResolutionAggregator tests passed!\n";
    return 0;
}
