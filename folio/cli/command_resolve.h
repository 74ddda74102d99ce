/*
 * File:        command_resolve.h
 * Module:      folio-cli
 * Purpose:     Resolve catalogues and produce the book plan
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "folio_config.h"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace folio {
namespace cli {

struct ResolveOptions {
    std::vector<std::string> paths;         // Directories to scan
    std::optional<std::string> config_path;
    FolioConfig overrides;                  // Values given on the command line
    std::optional<std::string> plan_path;   // "-" writes YAML to stdout
    bool dry_run = false;
    bool verbose = false;
};

/**
 * @brief Run the resolve command on stdin/stdout
 * @return Process exit status
 */
int resolve_command(const ResolveOptions& options);

/**
 * @brief Run the resolve command with the operator console and reports on the given streams
 */
int resolve_command(const ResolveOptions& options, std::istream& in, std::ostream& out);

} // namespace cli
} // namespace folio
