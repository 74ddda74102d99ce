/*
 * File:        comic_info.h
 * Module:      folio-core
 * Purpose:     ComicInfo.xml metadata for output archives
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "folio_config.h"
#include "resolution_aggregator.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace folio {

/**
 * @brief Metadata stored as ComicInfo.xml in each archive
 */
struct ComicInfo {
    std::string title;                  // Base title followed by the number
    std::string series;
    std::optional<uint64_t> number;
    size_t page_count = 0;
    ComicMetadata extra;                // Writer, Penciller, ...
};

/**
 * @brief Build ComicInfo for one assignment
 *
 * Series defaults to the base title when the metadata has none.
 */
ComicInfo make_comic_info(const BookAssignment& assignment, const std::string& title,
                          const ComicMetadata& metadata);

/**
 * @brief Render ComicInfo.xml text
 */
std::string render_comic_info(const ComicInfo& info);

/**
 * @brief Escape &, <, >, " and ' for XML text
 */
std::string xml_escape(const std::string& input);

} // namespace folio
