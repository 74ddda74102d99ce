/*
 * File:        logging.cpp
 * Module:      folio-core
 * Purpose:     Logging system implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace folio {

static std::shared_ptr<spdlog::logger> g_logger;
static std::mutex g_logger_mutex;

namespace {

constexpr const char* kLoggerName = "folio";
constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_level(const std::string& level, spdlog::level::level_enum& out) {
    const std::string l = to_lower(level);
    if (l == "trace") { out = spdlog::level::trace; return true; }
    if (l == "debug") { out = spdlog::level::debug; return true; }
    if (l == "info") { out = spdlog::level::info; return true; }
    if (l == "warn" || l == "warning") { out = spdlog::level::warn; return true; }
    if (l == "error") { out = spdlog::level::err; return true; }
    if (l == "critical") { out = spdlog::level::critical; return true; }
    if (l == "off") { out = spdlog::level::off; return true; }
    return false;
}

// Logs go to stderr so that stdout only carries the book plan
std::shared_ptr<spdlog::logger> make_console_logger(const std::string& pattern) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_pattern(pattern);
    logger->set_level(spdlog::level::info);
    return logger;
}

} // anonymous namespace

void init_logging(const std::string& level, const std::string& pattern, const std::string& log_file) {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);

        // Drop existing logger if present
        if (g_logger) {
            spdlog::drop(g_logger->name());
            g_logger.reset();
        }

        g_logger = make_console_logger(pattern);
        spdlog::register_logger(g_logger);

        if (!log_file.empty()) {
            try {
                // Add file sink while keeping console output
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_pattern(pattern);
                g_logger->sinks().push_back(file_sink);
            } catch (const spdlog::spdlog_ex& e) {
                g_logger->warn("Cannot open log file '{}': {}", log_file, e.what());
            }
        }
    }

    set_log_level(level);
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        // Auto-initialize if not done yet
        g_logger = make_console_logger(kDefaultPattern);
        spdlog::register_logger(g_logger);
    }
    return g_logger;
}

void set_log_level(const std::string& level) {
    auto logger = get_logger();

    spdlog::level::level_enum parsed = spdlog::level::info;
    if (!parse_level(level, parsed)) {
        logger->warn("Unknown log level '{}', using 'info'", level);
    }
    logger->set_level(parsed);
}

bool is_valid_log_level(const std::string& level) {
    spdlog::level::level_enum ignored;
    return parse_level(level, ignored);
}

} // namespace folio
