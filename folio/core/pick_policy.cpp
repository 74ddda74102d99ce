/*
 * File:        pick_policy.cpp
 * Module:      folio-core
 * Purpose:     Pick rules and the [from=]to selector language
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "pick_policy.h"
#include "logging.h"
#include <fmt/format.h>
#include <limits>

namespace folio {

namespace {

constexpr uint64_t kMaxNumber = std::numeric_limits<uint64_t>::max();

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

bool is_all_digits(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

struct EntryContext {
    const std::string& option;
    size_t entry_index;
    const std::string& entry;

    [[noreturn]] void fail(const std::string& token, PolicySyntaxError::Reason reason,
                           const std::string& detail = "") const {
        throw PolicySyntaxError(option, entry_index, entry, token, reason, detail);
    }
};

uint64_t parse_number(const std::string& text, const EntryContext& ctx) {
    const std::string token = trim(text);
    if (!is_all_digits(token)) {
        ctx.fail(token, PolicySyntaxError::Reason::BadInteger, "expected a non-negative integer");
    }

    try {
        return std::stoull(token);
    } catch (const std::out_of_range&) {
        ctx.fail(token, PolicySyntaxError::Reason::BadInteger, "number is too large");
    }
}

CatalogueRange parse_range(const std::string& text, const EntryContext& ctx) {
    const std::string s = trim(text);

    if (s.empty()) {
        return CatalogueRange::all();
    }

    // Inclusive forms first, "..=" also contains ".."
    auto pos = s.find("..=");
    if (pos != std::string::npos) {
        const std::string start_str = trim(s.substr(0, pos));
        const std::string end_str = s.substr(pos + 3);

        if (start_str.empty()) {
            return CatalogueRange::up_to_inclusive(parse_number(end_str, ctx));
        }

        const uint64_t start = parse_number(start_str, ctx);
        const uint64_t end = parse_number(end_str, ctx);
        if (end < start) {
            ctx.fail(s, PolicySyntaxError::Reason::InvertedRange,
                     fmt::format("end {} is below start {}", end, start));
        }
        return CatalogueRange::inclusive(start, end);
    }

    pos = s.find("..");
    if (pos != std::string::npos) {
        const std::string start_str = trim(s.substr(0, pos));
        const std::string end_str = trim(s.substr(pos + 2));

        if (start_str.empty() && end_str.empty()) {
            return CatalogueRange::all();
        }

        if (start_str.empty()) {
            const uint64_t end = parse_number(end_str, ctx);
            if (end == 0) {
                ctx.fail(s, PolicySyntaxError::Reason::InvertedRange, "range is empty");
            }
            return CatalogueRange::up_to(end);
        }

        const uint64_t start = parse_number(start_str, ctx);
        if (end_str.empty()) {
            return CatalogueRange::from(start);
        }

        const uint64_t end = parse_number(end_str, ctx);
        if (end <= start) {
            ctx.fail(s, PolicySyntaxError::Reason::InvertedRange,
                     fmt::format("exclusive end {} must be above start {}", end, start));
        }
        return CatalogueRange::half_open(start, end);
    }

    return CatalogueRange::exact(parse_number(s, ctx));
}

PickTarget parse_target(const std::string& text, const EntryContext& ctx) {
    const std::string s = trim(text);

    if (s.empty()) {
        ctx.fail(s, PolicySyntaxError::Reason::EmptyPattern, "nothing to pick");
    }
    if (s == "first") {
        return PickTarget::first();
    }
    if (s == "last") {
        return PickTarget::last();
    }
    if (s == "most-pages") {
        return PickTarget::most_pages();
    }

    if (is_all_digits(s)) {
        try {
            return PickTarget::index(static_cast<size_t>(std::stoull(s)));
        } catch (const std::out_of_range&) {
            ctx.fail(s, PolicySyntaxError::Reason::BadInteger, "index is too large");
        }
    }

    try {
        return PickTarget::pattern(s);
    } catch (const std::regex_error& e) {
        ctx.fail(s, PolicySyntaxError::Reason::InvalidPattern, e.what());
    }
}

// A from part is only recognised when the entry starts with a range-shaped
// prefix followed by '='. Everything else is a target on its own.
const std::regex& from_prefix_regex() {
    static const std::regex re(R"(^\s*([0-9]*\s*(?:\.\.=?\s*[0-9]*)?)\s*=(.*)$)");
    return re;
}

} // anonymous namespace

// === PolicySyntaxError ===

PolicySyntaxError::PolicySyntaxError(std::string option, size_t entry_index, std::string entry,
                                     std::string token, Reason reason, const std::string& detail)
    : std::runtime_error(fmt::format("{} #{} '{}': {} '{}'{}",
                                     option, entry_index + 1, entry, folio::to_string(reason), token,
                                     detail.empty() ? std::string() : " (" + detail + ")")),
      option_(std::move(option)),
      entry_index_(entry_index),
      entry_(std::move(entry)),
      token_(std::move(token)),
      reason_(reason) {
}

const char* to_string(PolicySyntaxError::Reason reason) {
    switch (reason) {
        case PolicySyntaxError::Reason::BadInteger: return "bad integer";
        case PolicySyntaxError::Reason::InvertedRange: return "inverted range";
        case PolicySyntaxError::Reason::EmptyPattern: return "empty pattern";
        case PolicySyntaxError::Reason::InvalidPattern: return "invalid pattern";
    }
    return "syntax error";
}

// === CatalogueRange ===

bool CatalogueRange::matches(uint64_t number) const {
    switch (kind_) {
        case Kind::All: return true;
        case Kind::Exact: return number == start_;
        case Kind::HalfOpen: return number >= start_ && number < end_;
        case Kind::Inclusive: return number >= start_ && number <= end_;
        case Kind::From: return number >= start_;
        case Kind::UpTo: return number < end_;
        case Kind::UpToInclusive: return number <= end_;
    }
    return false;
}

bool CatalogueRange::matches(const std::optional<uint64_t>& number) const {
    if (!number) {
        return kind_ == Kind::All;
    }
    return matches(*number);
}

CatalogueRange::Specificity CatalogueRange::specificity() const {
    switch (kind_) {
        case Kind::All: return Specificity::All;
        case Kind::Exact: return Specificity::Exact;
        default: return Specificity::Bounded;
    }
}

uint64_t CatalogueRange::span() const {
    switch (kind_) {
        case Kind::All: return kMaxNumber;
        case Kind::Exact: return 1;
        case Kind::HalfOpen: return end_ - start_;
        case Kind::Inclusive: {
            const uint64_t width = end_ - start_;
            return width == kMaxNumber ? kMaxNumber : width + 1;
        }
        case Kind::From: return kMaxNumber - start_;
        case Kind::UpTo: return end_;
        case Kind::UpToInclusive: return end_ == kMaxNumber ? kMaxNumber : end_ + 1;
    }
    return kMaxNumber;
}

std::string CatalogueRange::to_string() const {
    switch (kind_) {
        case Kind::All: return "..";
        case Kind::Exact: return std::to_string(start_);
        case Kind::HalfOpen: return fmt::format("{}..{}", start_, end_);
        case Kind::Inclusive: return fmt::format("{}..={}", start_, end_);
        case Kind::From: return fmt::format("{}..", start_);
        case Kind::UpTo: return fmt::format("..{}", end_);
        case Kind::UpToInclusive: return fmt::format("..={}", end_);
    }
    return "..";
}

// === PickTarget ===

PickTarget PickTarget::index(size_t k) {
    PickTarget target(Kind::Index);
    target.index_ = k;
    return target;
}

PickTarget PickTarget::pattern(const std::string& source) {
    PickTarget target(Kind::Pattern);
    target.pattern_ = compile_name_pattern(source);
    target.pattern_source_ = source;
    return target;
}

bool PickTarget::matches_name(const std::string& raw_name) const {
    if (kind_ != Kind::Pattern) {
        return false;
    }
    return std::regex_search(raw_name, pattern_);
}

std::string PickTarget::to_string() const {
    switch (kind_) {
        case Kind::First: return "first";
        case Kind::Last: return "last";
        case Kind::MostPages: return "most-pages";
        case Kind::Index: return std::to_string(index_);
        case Kind::Pattern: return pattern_source_;
    }
    return "";
}

// === Parsing ===

std::regex compile_name_pattern(const std::string& source) {
    return std::regex(source, std::regex::ECMAScript | std::regex::icase);
}

CatalogueRange parse_catalogue_range(const std::string& text, const std::string& option, size_t entry_index) {
    const EntryContext ctx{option, entry_index, text};
    return parse_range(text, ctx);
}

PickRule parse_pick_rule(const std::string& entry, size_t declaration_index) {
    static const std::string option = "--pick";
    const EntryContext ctx{option, declaration_index, entry};

    PickRule rule;
    rule.declaration_index = declaration_index;
    rule.source = entry;

    std::smatch match;
    if (std::regex_match(entry, match, from_prefix_regex())) {
        rule.from = parse_range(match[1].str(), ctx);
        rule.to = parse_target(match[2].str(), ctx);
    } else {
        rule.from = CatalogueRange::all();
        rule.to = parse_target(entry, ctx);
    }

    FOLIO_LOG_TRACE("Parsed pick rule #{} '{}' as {}={}", declaration_index + 1, entry,
                    rule.from.to_string(), rule.to.to_string());
    return rule;
}

std::vector<PickRule> parse_pick_rules(const std::vector<std::string>& entries) {
    std::vector<PickRule> rules;
    rules.reserve(entries.size());

    for (size_t i = 0; i < entries.size(); ++i) {
        rules.push_back(parse_pick_rule(entries[i], i));
    }

    return rules;
}

std::vector<std::regex> parse_skip_patterns(const std::vector<std::string>& entries) {
    static const std::string option = "--skip";
    std::vector<std::regex> patterns;
    patterns.reserve(entries.size());

    for (size_t i = 0; i < entries.size(); ++i) {
        const EntryContext ctx{option, i, entries[i]};
        if (trim(entries[i]).empty()) {
            ctx.fail(entries[i], PolicySyntaxError::Reason::EmptyPattern, "skip pattern is empty");
        }
        try {
            patterns.push_back(compile_name_pattern(entries[i]));
        } catch (const std::regex_error& e) {
            ctx.fail(entries[i], PolicySyntaxError::Reason::InvalidPattern, e.what());
        }
    }

    return patterns;
}

std::vector<CatalogueRange> parse_include_ranges(const std::vector<std::string>& entries) {
    std::vector<CatalogueRange> ranges;
    ranges.reserve(entries.size());

    for (size_t i = 0; i < entries.size(); ++i) {
        ranges.push_back(parse_catalogue_range(entries[i], "--include", i));
    }

    return ranges;
}

} // namespace folio
