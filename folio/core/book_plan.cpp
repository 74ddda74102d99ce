/*
 * File:        book_plan.cpp
 * Module:      folio-core
 * Purpose:     Archive build plan handed to the archive builder
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "book_plan.h"
#include "logging.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace folio {

namespace {

void emit_optional(YAML::Emitter& out, const char* key, const std::optional<std::string>& value) {
    if (value) {
        out << YAML::Key << key << YAML::Value << *value;
    }
}

} // anonymous namespace

BookPlan make_book_plan(const std::vector<BookAssignment>& assignments,
                        const std::string& title,
                        const std::string& output_dir,
                        const std::string& extension,
                        const ComicMetadata& metadata) {
    BookPlan plan;
    plan.title = title;
    plan.output_dir = output_dir;
    plan.extension = extension;

    for (const auto& assignment : assignments) {
        PlannedBook book;
        book.assignment = assignment;
        book.target_path = (fs::path(output_dir) / (assignment.output_name + "." + extension)).string();
        book.comic_info = make_comic_info(assignment, title, metadata);
        plan.books.push_back(std::move(book));
    }

    return plan;
}

namespace plan_io {

std::string to_yaml(const BookPlan& plan) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "plan";
    out << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "title" << YAML::Value << plan.title;
    out << YAML::Key << "output_dir" << YAML::Value << plan.output_dir;
    out << YAML::Key << "extension" << YAML::Value << plan.extension;
    out << YAML::EndMap;

    out << YAML::Key << "books";
    out << YAML::Value << YAML::BeginSeq;
    for (const auto& book : plan.books) {
        const auto& a = book.assignment;
        const auto& info = book.comic_info;

        out << YAML::BeginMap;
        if (a.number) {
            out << YAML::Key << "number" << YAML::Value << *a.number;
        }
        out << YAML::Key << "identity" << YAML::Value << YAML::Flow << a.identity;
        out << YAML::Key << "source" << YAML::Value << a.source_path;
        out << YAML::Key << "name" << YAML::Value << a.raw_name;
        out << YAML::Key << "target" << YAML::Value << book.target_path;
        out << YAML::Key << "pages" << YAML::Value << a.page_count;
        out << YAML::Key << "picked_by" << YAML::Value << to_string(a.reason);

        out << YAML::Key << "comic_info";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "Title" << YAML::Value << info.title;
        out << YAML::Key << "Series" << YAML::Value << info.series;
        if (info.number) {
            out << YAML::Key << "Number" << YAML::Value << *info.number;
        }
        out << YAML::Key << "PageCount" << YAML::Value << info.page_count;
        emit_optional(out, "Writer", info.extra.author);
        emit_optional(out, "Penciller", info.extra.artist);
        emit_optional(out, "Publisher", info.extra.publisher);
        emit_optional(out, "Genre", info.extra.genre);
        emit_optional(out, "LanguageISO", info.extra.language);
        emit_optional(out, "Manga", info.extra.manga);
        emit_optional(out, "Summary", info.extra.summary);
        out << YAML::EndMap;

        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return out.c_str();
}

void save_plan(const BookPlan& plan, const std::string& filename) {
    const fs::path path(filename);
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create directory '" + path.parent_path().string() +
                                     "': " + ec.message());
        }
    }

    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Failed to open plan file for writing: " + filename);
    }

    file << to_yaml(plan) << "\n";
    if (!file) {
        throw std::runtime_error("Failed to write plan file: " + filename);
    }

    FOLIO_LOG_INFO("Plan saved to {} ({} books)", filename, plan.books.size());
}

} // namespace plan_io

} // namespace folio
