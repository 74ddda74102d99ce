/*
 * File:        folio_config.cpp
 * Module:      folio-core
 * Purpose:     Run configuration (YAML file and command line overrides)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "folio_config.h"
#include "logging.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <regex>
#include <set>

namespace fs = std::filesystem;

namespace folio {

namespace {

constexpr size_t kMaxNumberWidth = 20;

template <typename T>
void override_if_set(std::optional<T>& target, const std::optional<T>& value) {
    if (value) {
        target = value;
    }
}

void append(std::vector<std::string>& target, const std::vector<std::string>& values) {
    target.insert(target.end(), values.begin(), values.end());
}

std::optional<std::string> read_string(const YAML::Node& node, const std::string& key,
                                       const std::string& source_name) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return std::nullopt;
    }
    if (!value.IsScalar()) {
        throw ConfigError("Invalid config '" + source_name + "': '" + key + "' must be a string");
    }
    return value.as<std::string>();
}

// Accepts a single string or a list of strings
std::vector<std::string> read_string_list(const YAML::Node& node, const std::string& key,
                                          const std::string& source_name) {
    std::vector<std::string> values;
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return values;
    }

    if (value.IsScalar()) {
        values.push_back(value.as<std::string>());
        return values;
    }

    if (!value.IsSequence()) {
        throw ConfigError("Invalid config '" + source_name + "': '" + key + "' must be a list of strings");
    }

    for (const auto& item : value) {
        if (!item.IsScalar()) {
            throw ConfigError("Invalid config '" + source_name + "': entries of '" + key + "' must be strings");
        }
        values.push_back(item.as<std::string>());
    }
    return values;
}

// The main key wins over its alias when both are present
std::optional<std::string> read_aliased(const YAML::Node& node, const std::string& key,
                                        const std::string& alias, const std::string& source_name) {
    const auto value = read_string(node, key, source_name);
    const auto alias_value = read_string(node, alias, source_name);
    if (value && alias_value) {
        FOLIO_LOG_WARN("Config '{}': both '{}' and '{}' given, '{}' ignored",
                       source_name, key, alias, alias);
    }
    return value ? value : alias_value;
}

ComicMetadata read_metadata(const YAML::Node& node, const std::string& source_name) {
    ComicMetadata metadata;
    if (!node || node.IsNull()) {
        return metadata;
    }
    if (!node.IsMap()) {
        throw ConfigError("Invalid config '" + source_name + "': 'metadata' must be a map");
    }

    static const std::set<std::string> known = {
        "series", "author", "writer", "artist", "penciller",
        "publisher", "genre", "language", "manga", "summary"
    };
    for (const auto& kv : node) {
        const auto key = kv.first.as<std::string>();
        if (known.find(key) == known.end()) {
            FOLIO_LOG_WARN("Config '{}': unknown metadata key '{}' ignored", source_name, key);
        }
    }

    metadata.series = read_string(node, "series", source_name);
    metadata.author = read_aliased(node, "author", "writer", source_name);
    metadata.artist = read_aliased(node, "artist", "penciller", source_name);
    metadata.publisher = read_string(node, "publisher", source_name);
    metadata.genre = read_string(node, "genre", source_name);
    metadata.language = read_string(node, "language", source_name);
    metadata.manga = read_string(node, "manga", source_name);
    metadata.summary = read_string(node, "summary", source_name);
    return metadata;
}

FolioConfig read_root(const YAML::Node& root, const std::string& source_name) {
    FolioConfig config;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Invalid config '" + source_name + "': top level must be a map");
    }

    static const std::set<std::string> known = {
        "name", "pick", "skip", "include", "interactive", "number_width",
        "output_dir", "extension", "metadata", "log_level"
    };
    for (const auto& kv : root) {
        const auto key = kv.first.as<std::string>();
        if (known.find(key) == known.end()) {
            FOLIO_LOG_WARN("Config '{}': unknown key '{}' ignored", source_name, key);
        }
    }

    config.name = read_string(root, "name", source_name);
    config.pick = read_string_list(root, "pick", source_name);
    config.skip = read_string_list(root, "skip", source_name);
    config.include = read_string_list(root, "include", source_name);
    config.output_dir = read_string(root, "output_dir", source_name);
    config.extension = read_string(root, "extension", source_name);
    config.log_level = read_string(root, "log_level", source_name);

    if (root["interactive"]) {
        config.interactive = root["interactive"].as<bool>();
    }
    if (root["number_width"]) {
        const int width = root["number_width"].as<int>();
        if (width < 0) {
            throw ConfigError("Invalid config '" + source_name + "': 'number_width' must not be negative");
        }
        config.number_width = static_cast<size_t>(width);
    }

    config.metadata = read_metadata(root["metadata"], source_name);
    return config;
}

} // anonymous namespace

FolioConfig merge_config(const FolioConfig& base, const FolioConfig& overrides) {
    FolioConfig merged = base;

    override_if_set(merged.name, overrides.name);
    append(merged.pick, overrides.pick);
    append(merged.skip, overrides.skip);
    append(merged.include, overrides.include);
    override_if_set(merged.interactive, overrides.interactive);
    override_if_set(merged.number_width, overrides.number_width);
    override_if_set(merged.output_dir, overrides.output_dir);
    override_if_set(merged.extension, overrides.extension);
    override_if_set(merged.log_level, overrides.log_level);

    override_if_set(merged.metadata.series, overrides.metadata.series);
    override_if_set(merged.metadata.author, overrides.metadata.author);
    override_if_set(merged.metadata.artist, overrides.metadata.artist);
    override_if_set(merged.metadata.publisher, overrides.metadata.publisher);
    override_if_set(merged.metadata.genre, overrides.metadata.genre);
    override_if_set(merged.metadata.language, overrides.metadata.language);
    override_if_set(merged.metadata.manga, overrides.metadata.manga);
    override_if_set(merged.metadata.summary, overrides.metadata.summary);

    return merged;
}

void validate_config(const FolioConfig& config) {
    if (config.name && config.name->empty()) {
        throw ConfigError("Name must not be empty");
    }

    if (config.number_width && *config.number_width > kMaxNumberWidth) {
        throw ConfigError("Number width " + std::to_string(*config.number_width) +
                          " is larger than " + std::to_string(kMaxNumberWidth));
    }

    if (config.extension) {
        const auto& ext = *config.extension;
        if (ext.empty() || ext.find_first_of("/\\.") != std::string::npos) {
            throw ConfigError("Invalid extension '" + ext + "': expected something like 'cbz'");
        }
    }

    if (config.log_level && !is_valid_log_level(*config.log_level)) {
        throw ConfigError("Invalid log level '" + *config.log_level +
                          "': expected trace, debug, info, warn, error, critical or off");
    }

    if (config.metadata.manga) {
        const auto& manga = *config.metadata.manga;
        if (manga != "Yes" && manga != "No" && manga != "YesAndRightToLeft") {
            throw ConfigError("Invalid manga value '" + manga + "': expected Yes, No or YesAndRightToLeft");
        }
    }

    if (config.metadata.language) {
        static const std::regex language_tag(R"(^[A-Za-z]{2,3}(-[A-Za-z0-9]{1,8})*$)");
        if (!std::regex_match(*config.metadata.language, language_tag)) {
            throw ConfigError("Invalid language '" + *config.metadata.language +
                              "': expected an ISO code such as 'en' or 'pt-BR'");
        }
    }
}

namespace config_io {

FolioConfig load_config(const std::string& filename) {
    if (!fs::exists(filename)) {
        throw ConfigError("Config file not found: " + filename);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML file '" + filename + "': " + e.what());
    }

    try {
        auto config = read_root(root, filename);
        FOLIO_LOG_DEBUG("Loaded config '{}' ({} pick rules)", filename, config.pick.size());
        return config;
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid config '" + filename + "': " + e.what());
    }
}

FolioConfig parse_config(const std::string& yaml_text, const std::string& source_name) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML '" + source_name + "': " + e.what());
    }

    try {
        return read_root(root, source_name);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid config '" + source_name + "': " + e.what());
    }
}

} // namespace config_io

} // namespace folio
