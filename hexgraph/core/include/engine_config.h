/*
 * File:        engine_config.h
 * Module:      hexgraph-core
 * Purpose:     Engine configuration file
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "graph_builder.h"
#include "validation_engine.h"
#include <stdexcept>
#include <string>

namespace hexgraph {

/**
 * @brief Exception thrown for unreadable or invalid configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Settings for building, validating and logging
 *
 * Defaults match BuildOptions and ValidationOptions.
 */
struct EngineConfig {
    std::string description = GraphMetadata().description;
    DuplicatePolicy duplicate_policy = DuplicatePolicy::FirstWins;
    bool strict = false;
    ValidationOptions validation;
    std::string log_level = "info";

    BuildOptions build_options() const;
};

/**
 * @brief Parse configuration YAML
 *
 * ```yaml
 * engine:
 *   description: "Shop architecture"
 *   duplicate_policy: first_wins    # or fail_build
 *   strict: false
 * validation:
 *   expected_layers: [Domain, Port, Adapter, Application, Infrastructure]
 *   god_component_threshold: 10
 *   disabled_rules: [OrphanNode]
 * logging:
 *   level: info
 * ```
 *
 * Every key is optional.
 *
 * @throws ConfigError on malformed YAML or invalid values
 */
EngineConfig parse_engine_config(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Load configuration from a file
 *
 * @throws ConfigError if the file is missing, unreadable or invalid
 */
EngineConfig load_engine_config(const std::string& path);

} // namespace hexgraph
