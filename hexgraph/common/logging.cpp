/*
 * File:        logging.cpp
 * Module:      hexgraph-common
 * Purpose:     Shared logging implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "include/logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cctype>
#include <mutex>

namespace hexgraph {

static std::shared_ptr<spdlog::logger> g_logger;
static std::mutex g_logger_mutex;

static const char* kLoggerName = "hexgraph";
static const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

static bool parse_level(const std::string& level, spdlog::level::level_enum& out) {
    std::string l = level;
    for (auto& c : l) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (l == "trace") { out = spdlog::level::trace; return true; }
    if (l == "debug") { out = spdlog::level::debug; return true; }
    if (l == "info") { out = spdlog::level::info; return true; }
    if (l == "warn" || l == "warning") { out = spdlog::level::warn; return true; }
    if (l == "error") { out = spdlog::level::err; return true; }
    if (l == "critical") { out = spdlog::level::critical; return true; }
    if (l == "off") { out = spdlog::level::off; return true; }
    out = spdlog::level::info;
    return false;
}

// Caller must hold g_logger_mutex
static void create_logger_locked(const std::string& pattern) {
    if (g_logger) {
        spdlog::drop(g_logger->name());
        g_logger.reset();
    }

    // stderr only; stdout carries exported documents
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    spdlog::register_logger(g_logger);
    g_logger->set_pattern(pattern);
    g_logger->set_level(spdlog::level::info);
}

void init_logging(const std::string& level, const std::string& pattern, const std::string& log_file) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        create_logger_locked(pattern);
        logger = g_logger;
    }

    if (!log_file.empty()) {
        try {
            // Add file sink while keeping console output
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
            file_sink->set_pattern(pattern);
            logger->sinks().push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            logger->warn("Cannot open log file '{}': {} (console logging only)", log_file, e.what());
        }
    }

    set_log_level(level);
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        // Auto-initialize if not done yet
        create_logger_locked(kDefaultPattern);
    }
    return g_logger;
}

void set_log_level(const std::string& level) {
    auto logger = get_logger();

    spdlog::level::level_enum parsed;
    if (!parse_level(level, parsed)) {
        logger->warn("Unknown log level '{}', using 'info'", level);
    }
    logger->set_level(parsed);
}

void reset_logging() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        spdlog::drop(g_logger->name());
        g_logger.reset();
    }
}

} // namespace hexgraph
