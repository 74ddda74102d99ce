/*
 * File:        comic_info.cpp
 * Module:      folio-core
 * Purpose:     ComicInfo.xml metadata for output archives
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "comic_info.h"
#include <sstream>

namespace folio {

namespace {

void write_element(std::ostringstream& out, const char* element, const std::optional<std::string>& value) {
    if (value) {
        out << "  <" << element << ">" << xml_escape(*value) << "</" << element << ">\n";
    }
}

} // anonymous namespace

std::string xml_escape(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());

    for (char c : input) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped += c; break;
        }
    }

    return escaped;
}

ComicInfo make_comic_info(const BookAssignment& assignment, const std::string& title,
                          const ComicMetadata& metadata) {
    ComicInfo info;
    info.title = make_output_name(title, assignment.number);
    info.series = metadata.series.value_or(title);
    info.number = assignment.number;
    info.page_count = assignment.page_count;
    info.extra = metadata;
    return info;
}

std::string render_comic_info(const ComicInfo& info) {
    std::ostringstream out;

    out << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
    out << "<ComicInfo xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\""
           " xmlns:xsd=\"http://www.w3.org/2001/XMLSchema\">\n";
    out << "  <Title>" << xml_escape(info.title) << "</Title>\n";
    out << "  <Series>" << xml_escape(info.series) << "</Series>\n";
    if (info.number) {
        out << "  <Number>" << *info.number << "</Number>\n";
    }
    out << "  <PageCount>" << info.page_count << "</PageCount>\n";

    write_element(out, "Writer", info.extra.author);
    write_element(out, "Penciller", info.extra.artist);
    write_element(out, "Publisher", info.extra.publisher);
    write_element(out, "Genre", info.extra.genre);
    write_element(out, "LanguageISO", info.extra.language);
    write_element(out, "Manga", info.extra.manga);
    write_element(out, "Summary", info.extra.summary);

    out << "</ComicInfo>\n";
    return out.str();
}

} // namespace folio
