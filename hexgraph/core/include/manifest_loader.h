/*
 * File:        manifest_loader.h
 * Module:      hexgraph-core
 * Purpose:     Component entries from YAML manifest files
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "component_entry.h"
#include "component_registry.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace hexgraph {

/**
 * @brief Exception thrown when a manifest cannot be read or parsed
 */
class ManifestError : public std::runtime_error {
public:
    explicit ManifestError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Parse a manifest document
 *
 * Format:
 * ```yaml
 * components:
 *   - type_name: User
 *     layer: Domain
 *     role: Entity
 *     module_path: shop::domain
 *     dependencies: [UserRepository]
 * ```
 *
 * Missing or unrecognised values are kept as blank strings or Unknown
 * enumerators so the builder can report them as malformed entries.
 *
 * @param text  YAML text
 * @param source Name used in error messages
 * @throws ManifestError on YAML syntax errors or a 'components' key that is not a list
 */
std::vector<ComponentEntry> parse_manifest(const std::string& text,
                                           const std::string& source = "<string>");

/**
 * @brief Load and parse a manifest file
 *
 * @throws ManifestError if the file cannot be read or parsed
 */
std::vector<ComponentEntry> load_manifest(const std::string& path);

/**
 * @brief Module that registers every entry of a manifest file
 *
 * The file is read when the initializer runs, so each rebuild sees the
 * current file contents.
 */
ComponentModule manifest_module(const std::string& path);

} // namespace hexgraph
