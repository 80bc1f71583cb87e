/*
 * File:        logging.h
 * Module:      hexgraph-common
 * Purpose:     Shared logging for the engine and the CLI
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace hexgraph {

/// Initialize the logging system
/// Should be called once at application startup
/// @param level Log level (trace, debug, info, warn, error, critical, off)
/// @param pattern Optional custom pattern
/// @param log_file Optional file path to write logs to (in addition to console)
void init_logging(const std::string& level = "info",
                  const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                  const std::string& log_file = "");

/// Get the shared logger (created on first use)
std::shared_ptr<spdlog::logger> get_logger();

/// Set log level at runtime
void set_log_level(const std::string& level);

/// Drop the shared logger (it will be recreated on next use)
void reset_logging();

} // namespace hexgraph

// Convenient logging macros
#define HEXGRAPH_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(hexgraph::get_logger(), __VA_ARGS__)
#define HEXGRAPH_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(hexgraph::get_logger(), __VA_ARGS__)
#define HEXGRAPH_LOG_INFO(...)     SPDLOG_LOGGER_INFO(hexgraph::get_logger(), __VA_ARGS__)
#define HEXGRAPH_LOG_WARN(...)     SPDLOG_LOGGER_WARN(hexgraph::get_logger(), __VA_ARGS__)
#define HEXGRAPH_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(hexgraph::get_logger(), __VA_ARGS__)
#define HEXGRAPH_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(hexgraph::get_logger(), __VA_ARGS__)
