/*
 * File:        book_plan.h
 * Module:      folio-core
 * Purpose:     Archive build plan handed to the archive builder
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "comic_info.h"
#include "folio_config.h"
#include "resolution_aggregator.h"
#include <string>
#include <vector>

namespace folio {

/**
 * @brief One archive to build
 */
struct PlannedBook {
    BookAssignment assignment;
    std::string target_path;    // output_dir / output_name.extension
    ComicInfo comic_info;
};

/**
 * @brief All archives of a run
 *
 * Each entry is self-contained, so the builder may process them in any
 * order.
 */
struct BookPlan {
    std::string title;
    std::string output_dir = ".";
    std::string extension = "cbz";
    std::vector<PlannedBook> books;
};

/**
 * @brief Turn complete assignments into a plan
 */
BookPlan make_book_plan(const std::vector<BookAssignment>& assignments,
                        const std::string& title,
                        const std::string& output_dir,
                        const std::string& extension,
                        const ComicMetadata& metadata);

/**
 * Book plan I/O
 */
namespace plan_io {
    /**
     * Serialize a plan as YAML
     */
    std::string to_yaml(const BookPlan& plan);

    /**
     * Save a plan to a YAML file
     * @throws std::runtime_error on I/O errors
     */
    void save_plan(const BookPlan& plan, const std::string& filename);
}

} // namespace folio
