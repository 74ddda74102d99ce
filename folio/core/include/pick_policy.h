/*
 * File:        pick_policy.h
 * Module:      folio-core
 * Purpose:     Pick rules and the [from=]to selector language
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief Exception thrown when a selector string is malformed
 *
 * Carries which option and entry failed and the offending token, so that
 * the CLI can point at the exact argument.
 */
class PolicySyntaxError : public std::runtime_error {
public:
    enum class Reason {
        BadInteger,
        InvertedRange,
        EmptyPattern,
        InvalidPattern
    };

    PolicySyntaxError(std::string option, size_t entry_index, std::string entry,
                      std::string token, Reason reason, const std::string& detail = "");

    const std::string& option() const { return option_; }
    size_t entry_index() const { return entry_index_; }
    const std::string& entry() const { return entry_; }
    const std::string& token() const { return token_; }
    Reason reason() const { return reason_; }

private:
    std::string option_;
    size_t entry_index_;
    std::string entry_;
    std::string token_;
    Reason reason_;
};

const char* to_string(PolicySyntaxError::Reason reason);

/**
 * @brief Set of catalogue numbers a rule applies to
 *
 * Forms, as written on the command line:
 *   ..      All
 *   N       Exact
 *   N..M    HalfOpen   [N, M)
 *   N..=M   Inclusive  [N, M]
 *   N..     From       [N, inf)
 *   ..M     UpTo       [0, M)
 *   ..=M    UpToInclusive [0, M]
 */
class CatalogueRange {
public:
    enum class Kind {
        All,
        Exact,
        HalfOpen,
        Inclusive,
        From,
        UpTo,
        UpToInclusive
    };

    /// Precedence tier, lower is more specific
    enum class Specificity {
        Exact = 0,
        Bounded = 1,
        All = 2
    };

    CatalogueRange() = default;

    static CatalogueRange all() { return CatalogueRange(Kind::All, 0, 0); }
    static CatalogueRange exact(uint64_t n) { return CatalogueRange(Kind::Exact, n, n); }
    static CatalogueRange half_open(uint64_t start, uint64_t end) { return CatalogueRange(Kind::HalfOpen, start, end); }
    static CatalogueRange inclusive(uint64_t start, uint64_t end) { return CatalogueRange(Kind::Inclusive, start, end); }
    static CatalogueRange from(uint64_t start) { return CatalogueRange(Kind::From, start, 0); }
    static CatalogueRange up_to(uint64_t end) { return CatalogueRange(Kind::UpTo, 0, end); }
    static CatalogueRange up_to_inclusive(uint64_t end) { return CatalogueRange(Kind::UpToInclusive, 0, end); }

    Kind kind() const { return kind_; }
    uint64_t start() const { return start_; }
    uint64_t end() const { return end_; }

    bool matches(uint64_t number) const;

    /// Unnumbered catalogues only match the All range
    bool matches(const std::optional<uint64_t>& number) const;

    Specificity specificity() const;

    /// Count of numbers covered (saturating), used to rank bounded ranges
    uint64_t span() const;

    std::string to_string() const;

private:
    CatalogueRange(Kind kind, uint64_t start, uint64_t end)
        : kind_(kind), start_(start), end_(end) {}

    Kind kind_ = Kind::All;
    uint64_t start_ = 0;
    uint64_t end_ = 0;
};

/**
 * @brief Which member of a catalogue a rule selects
 */
class PickTarget {
public:
    enum class Kind {
        First,
        Last,
        MostPages,
        Index,
        Pattern
    };

    PickTarget() = default;

    static PickTarget first() { return PickTarget(Kind::First); }
    static PickTarget last() { return PickTarget(Kind::Last); }
    static PickTarget most_pages() { return PickTarget(Kind::MostPages); }
    static PickTarget index(size_t k);

    /// @throws std::regex_error if the pattern does not compile
    static PickTarget pattern(const std::string& source);

    Kind kind() const { return kind_; }
    size_t index_value() const { return index_; }
    const std::string& pattern_source() const { return pattern_source_; }

    /// True if a Pattern target matches the name (false for other kinds)
    bool matches_name(const std::string& raw_name) const;

    std::string to_string() const;

private:
    explicit PickTarget(Kind kind) : kind_(kind) {}

    Kind kind_ = Kind::First;
    size_t index_ = 0;
    std::string pattern_source_;
    std::regex pattern_;
};

/**
 * @brief A compiled selector: which catalogues, and which member
 */
struct PickRule {
    CatalogueRange from;
    PickTarget to;
    size_t declaration_index = 0;   // Position in the selector list
    std::string source;             // Selector text as written
};

/**
 * @brief Compile a name pattern the way selectors and skip filters use it
 *
 * ECMAScript syntax, case-insensitive, matched anywhere in the name.
 * @throws std::regex_error on invalid syntax
 */
std::regex compile_name_pattern(const std::string& source);

/**
 * @brief Parse a catalogue range ("3", "1..=5", "..")
 * @throws PolicySyntaxError on malformed input
 */
CatalogueRange parse_catalogue_range(const std::string& text,
                                     const std::string& option = "--include",
                                     size_t entry_index = 0);

/**
 * @brief Parse one "[from=]to" selector
 * @throws PolicySyntaxError on malformed input
 */
PickRule parse_pick_rule(const std::string& entry, size_t declaration_index = 0);

/**
 * @brief Parse selectors in order; the first malformed entry fails the whole parse
 * @throws PolicySyntaxError naming the entry and the reason
 */
std::vector<PickRule> parse_pick_rules(const std::vector<std::string>& entries);

/**
 * @brief Compile skip patterns
 * @throws PolicySyntaxError naming the first invalid pattern
 */
std::vector<std::regex> parse_skip_patterns(const std::vector<std::string>& entries);

/**
 * @brief Parse include ranges
 * @throws PolicySyntaxError naming the first malformed range
 */
std::vector<CatalogueRange> parse_include_ranges(const std::vector<std::string>& entries);

} // namespace folio
