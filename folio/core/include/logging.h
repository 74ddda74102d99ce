/*
 * File:        logging.h
 * Module:      folio-core
 * Purpose:     Logging system
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace folio {

/// Set up the "folio" logger on stderr, replacing any earlier one
/// @param level trace, debug, info, warn, error, critical or off
/// @param pattern spdlog pattern for every sink
/// @param log_file Also write records to this file (truncated) when not empty
void init_logging(const std::string& level = "info",
                  const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                  const std::string& log_file = "");

/// Logger used by the FOLIO_LOG_* macros, created at info level if needed
std::shared_ptr<spdlog::logger> get_logger();

/// Change the level; unknown names fall back to info with a warning
void set_log_level(const std::string& level);

/// Check whether a level name is one set_log_level() understands
bool is_valid_log_level(const std::string& level);

} // namespace folio

#define FOLIO_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(folio::get_logger(), __VA_ARGS__)
#define FOLIO_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(folio::get_logger(), __VA_ARGS__)
#define FOLIO_LOG_INFO(...)     SPDLOG_LOGGER_INFO(folio::get_logger(), __VA_ARGS__)
#define FOLIO_LOG_WARN(...)     SPDLOG_LOGGER_WARN(folio::get_logger(), __VA_ARGS__)
#define FOLIO_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(folio::get_logger(), __VA_ARGS__)
#define FOLIO_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(folio::get_logger(), __VA_ARGS__)
