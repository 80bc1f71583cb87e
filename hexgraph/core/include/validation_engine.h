/*
 * File:        validation_engine.h
 * Module:      hexgraph-core
 * Purpose:     Runs validation rules against a built graph
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include "validation_rule.h"
#include <set>
#include <string>
#include <vector>

namespace hexgraph {

/**
 * @brief Parameters of the default rule set
 */
struct ValidationOptions {
    std::vector<Layer> expected_layers = std::vector<Layer>(kAllLayers.begin(), kAllLayers.end());
    size_t god_component_threshold = 10;
    std::set<std::string> disabled_rules;   // Rule ids left out of the default set
};

/// Ids of the built-in rules, in evaluation order
const std::vector<std::string>& builtin_rule_ids();

/**
 * @brief An ordered, extensible set of validation rules
 *
 * Running the engine is running each rule and concatenating the findings
 * in rule order. Nothing here throws for graph content.
 *
 * Usage:
 * ```cpp
 * auto engine = ValidationEngine::with_default_rules();
 * auto findings = engine.run(*graph);
 * ```
 */
class ValidationEngine {
public:
    ValidationEngine() = default;

    ValidationEngine(const ValidationEngine&) = delete;
    ValidationEngine& operator=(const ValidationEngine&) = delete;
    ValidationEngine(ValidationEngine&&) = default;
    ValidationEngine& operator=(ValidationEngine&&) = default;

    /**
     * @brief Engine holding the built-in rules minus options.disabled_rules
     */
    static ValidationEngine with_default_rules(const ValidationOptions& options = ValidationOptions());

    /**
     * @brief Append a rule
     *
     * @throws std::invalid_argument if rule is null or its id is already present
     */
    void add_rule(ValidationRulePtr rule);

    /// Remove a rule by id; false if not present
    bool remove_rule(const std::string& rule_id);

    /// Rule ids in evaluation order
    std::vector<std::string> rule_ids() const;

    /// Rule by id, or nullptr
    const ValidationRule* find_rule(const std::string& rule_id) const;

    /// Run every rule
    std::vector<Finding> run(const Graph& graph) const;

    /// Run a single rule; empty if no rule has that id
    std::vector<Finding> run_rule(const std::string& rule_id, const Graph& graph) const;

private:
    std::vector<ValidationRulePtr> rules_;
};

} // namespace hexgraph
