/*
 * File:        book_scanner.h
 * Module:      folio-cli
 * Purpose:     Discover book directories on disk
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "candidate.h"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio {
namespace cli {

/**
 * @brief Exception thrown when a scan root cannot be used
 */
class ScanError : public std::runtime_error {
public:
    explicit ScanError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief True for files counted as pages (jpg, jpeg, png, gif, bmp, tif, tiff, webp, avif)
 */
bool is_page_file(const std::filesystem::path& path);

/**
 * @brief Find every directory under the roots that directly holds pages
 *
 * Candidates are returned in path order with their page count and the
 * total size of their pages.
 *
 * @throws ScanError if a root does not exist or is not a directory
 */
std::vector<Candidate> scan_books(const std::vector<std::string>& roots);

} // namespace cli
} // namespace folio
