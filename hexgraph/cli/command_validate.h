/*
 * File:        command_validate.h
 * Module:      hexgraph-cli
 * Purpose:     Build and validate command header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "finding.h"
#include <optional>
#include <string>

namespace hexgraph {
namespace cli {

/**
 * @brief Lowest finding severity that makes the command fail
 */
enum class FailOn {
    Violation,
    Warning,
    Never
};

std::optional<FailOn> parse_fail_on(const std::string& name);

/// True if a finding of this severity fails the command
bool fails_on(FailOn fail_on, Severity severity);

struct ValidateOptions {
    std::string manifest_path;
    std::string config_path;        // Empty for defaults
    bool strict = false;            // Overrides engine.strict when set
    FailOn fail_on = FailOn::Violation;
    std::string log_level;          // Empty lets the config file decide
    std::string export_format;      // Empty skips export
    std::string output_path;
};

/**
 * @brief Build the graph from a manifest, validate it and optionally export it
 *
 * @return 0 on success, 2 if findings reach the fail-on threshold, 1 on error
 */
int validate_command(const ValidateOptions& options);

} // namespace cli
} // namespace hexgraph
