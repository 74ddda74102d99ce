/*
 * File:        book_scanner.cpp
 * Module:      folio-cli
 * Purpose:     Discover book directories on disk
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "book_scanner.h"
#include "logging.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace folio {
namespace cli {

namespace {

struct PageTally {
    size_t pages = 0;
    uint64_t bytes = 0;
};

// True if path lies at or below root, both canonical
bool is_within(const fs::path& path, const fs::path& root) {
    const auto mismatch = std::mismatch(root.begin(), root.end(), path.begin(), path.end());
    return mismatch.first == root.end();
}

// Drop roots equal to or nested in another root so no page is counted twice
std::vector<std::string> distinct_roots(const std::vector<std::string>& roots) {
    std::vector<fs::path> canonical;
    canonical.reserve(roots.size());
    for (const auto& root : roots) {
        std::error_code ec;
        auto path = fs::weakly_canonical(root, ec);
        if (ec) {
            throw ScanError("Cannot resolve directory '" + root + "': " + ec.message());
        }
        if (path.filename().empty()) {
            path = path.parent_path();
        }
        canonical.push_back(std::move(path));
    }

    std::vector<std::string> kept;
    for (size_t i = 0; i < roots.size(); ++i) {
        bool covered = false;
        for (size_t j = 0; j < roots.size() && !covered; ++j) {
            if (i == j || !is_within(canonical[i], canonical[j])) {
                continue;
            }
            // Equal roots keep the first one given
            covered = canonical[i] != canonical[j] || j < i;
        }
        if (covered) {
            FOLIO_LOG_WARN("Directory '{}' is already covered by another scan root", roots[i]);
            continue;
        }
        kept.push_back(roots[i]);
    }
    return kept;
}

} // anonymous namespace

bool is_page_file(const fs::path& path) {
    static const std::set<std::string> extensions = {
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tif", ".tiff", ".webp", ".avif"
    };

    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extensions.find(ext) != extensions.end();
}

std::vector<Candidate> scan_books(const std::vector<std::string>& roots) {
    std::map<std::string, PageTally> tallies;

    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::exists(root, ec)) {
            throw ScanError("Directory not found: " + root);
        }
        if (!fs::is_directory(root, ec)) {
            throw ScanError("Not a directory: " + root);
        }
    }

    for (const auto& root : distinct_roots(roots)) {
        std::error_code ec;

        FOLIO_LOG_DEBUG("Scanning {}", root);

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw ScanError("Cannot read directory '" + root + "': " + ec.message());
        }

        const fs::recursive_directory_iterator end;
        while (it != end) {
            const auto& entry = *it;
            std::error_code type_ec;
            if (entry.is_regular_file(type_ec) && is_page_file(entry.path())) {
                auto& tally = tallies[entry.path().parent_path().string()];
                ++tally.pages;

                std::error_code size_ec;
                const auto size = entry.file_size(size_ec);
                if (size_ec) {
                    FOLIO_LOG_WARN("Cannot read size of '{}': {}", entry.path().string(), size_ec.message());
                } else {
                    tally.bytes += size;
                }
            }

            // A failed increment leaves the iterator at its end
            it.increment(ec);
            if (ec) {
                FOLIO_LOG_WARN("Scan of '{}' stopped early: {}", root, ec.message());
                break;
            }
        }
    }

    std::vector<Candidate> candidates;
    candidates.reserve(tallies.size());
    for (const auto& [dir, tally] : tallies) {
        candidates.push_back(make_candidate(dir, tally.pages, tally.bytes));
    }

    FOLIO_LOG_INFO("Found {} book directories", candidates.size());
    return candidates;
}

} // namespace cli
} // namespace folio
