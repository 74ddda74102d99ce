/*
 * File:        folio_config.h
 * Module:      folio-core
 * Purpose:     Run configuration (YAML file and command line overrides)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief Exception thrown when configuration cannot be used
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Optional ComicInfo.xml fields supplied by the user
 */
struct ComicMetadata {
    std::optional<std::string> series;
    std::optional<std::string> author;      // <Writer>
    std::optional<std::string> artist;      // <Penciller>
    std::optional<std::string> publisher;
    std::optional<std::string> genre;       // Comma separated
    std::optional<std::string> language;    // ISO code, e.g. "en"
    std::optional<std::string> manga;       // Yes, No or YesAndRightToLeft
    std::optional<std::string> summary;
};

/**
 * @brief Settings for one run
 *
 * Unset optionals mean "not given here", so a file and the command line
 * can be layered with merge_config().
 *
 * A configuration file is YAML:
 * ```yaml
 * name: Title
 * pick: ["3=last", "fix"]
 * skip: ["preview"]
 * include: ["1..=20"]
 * interactive: false
 * number_width: 3
 * output_dir: out
 * extension: cbz
 * metadata:
 *   author: Someone
 *   language: en
 * log_level: info
 * ```
 */
struct FolioConfig {
    std::optional<std::string> name;
    std::vector<std::string> pick;
    std::vector<std::string> skip;
    std::vector<std::string> include;
    std::optional<bool> interactive;
    std::optional<size_t> number_width;
    std::optional<std::string> output_dir;
    std::optional<std::string> extension;
    std::optional<std::string> log_level;
    ComicMetadata metadata;
};

/**
 * @brief Layer two configurations
 *
 * Scalars set in overrides replace those in base. Lists are appended, so
 * picks from overrides are declared later and win ties.
 */
FolioConfig merge_config(const FolioConfig& base, const FolioConfig& overrides);

/**
 * @brief Check values that have a fixed vocabulary or format
 * @throws ConfigError describing the first invalid value
 */
void validate_config(const FolioConfig& config);

/**
 * Configuration file I/O
 */
namespace config_io {
    /**
     * Load configuration from a YAML file
     * @param filename Path to the file
     * @throws ConfigError on parse or I/O errors
     */
    FolioConfig load_config(const std::string& filename);

    /**
     * Parse configuration from YAML text
     * @param yaml_text Document text
     * @param source_name Name used in error messages
     * @throws ConfigError on parse errors
     */
    FolioConfig parse_config(const std::string& yaml_text, const std::string& source_name = "<config>");
}

} // namespace folio
