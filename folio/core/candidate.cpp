/*
 * File:        candidate.cpp
 * Module:      folio-core
 * Purpose:     Scanned book candidate and its numeric identity
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "candidate.h"
#include <filesystem>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace folio {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

} // anonymous namespace

Identity extract_identity(const std::string& raw_name) {
    constexpr uint64_t max_value = std::numeric_limits<uint64_t>::max();

    Identity identity;
    size_t pos = 0;

    while (pos < raw_name.size()) {
        if (!is_digit(raw_name[pos])) {
            ++pos;
            continue;
        }

        uint64_t value = 0;
        bool saturated = false;
        while (pos < raw_name.size() && is_digit(raw_name[pos])) {
            const uint64_t digit = static_cast<uint64_t>(raw_name[pos] - '0');
            if (!saturated) {
                if (value > (max_value - digit) / 10) {
                    saturated = true;
                    value = max_value;
                } else {
                    value = value * 10 + digit;
                }
            }
            ++pos;
        }
        identity.push_back(value);
    }

    return identity;
}

std::string identity_to_string(const Identity& identity) {
    if (identity.empty()) {
        return "(none)";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < identity.size(); ++i) {
        if (i > 0) {
            oss << '.';
        }
        oss << identity[i];
    }
    return oss.str();
}

Candidate make_candidate(const std::string& path, size_t page_count, uint64_t total_bytes) {
    fs::path p(path);
    if (!p.has_filename() && p.has_parent_path()) {
        // Trailing separator, e.g. "books/Title - 1/"
        p = p.parent_path();
    }

    Candidate candidate;
    candidate.path = path;
    candidate.raw_name = p.filename().string();
    candidate.identity = extract_identity(candidate.raw_name);
    candidate.page_count = page_count;
    candidate.total_bytes = total_bytes;
    return candidate;
}

} // namespace folio
