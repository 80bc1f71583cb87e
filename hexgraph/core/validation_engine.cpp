/*
 * File:        validation_engine.cpp
 * Module:      hexgraph-core
 * Purpose:     Runs validation rules against a built graph
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "validation_engine.h"
#include "logging.h"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace hexgraph {

const std::vector<std::string>& builtin_rule_ids() {
    static const std::vector<std::string> ids = {
        rules::kDependencyDirection,
        rules::kOrphanNode,
        rules::kMissingLayer,
        rules::kCircularDependency,
        rules::kGodComponent,
        rules::kUnimplementedPort
    };
    return ids;
}

ValidationEngine ValidationEngine::with_default_rules(const ValidationOptions& options) {
    ValidationEngine engine;

    auto enabled = [&options](const char* rule_id) {
        return options.disabled_rules.count(rule_id) == 0;
    };

    if (enabled(rules::kDependencyDirection)) {
        engine.add_rule(std::make_unique<DependencyDirectionRule>());
    }
    if (enabled(rules::kOrphanNode)) {
        engine.add_rule(std::make_unique<OrphanNodeRule>());
    }
    if (enabled(rules::kMissingLayer)) {
        engine.add_rule(std::make_unique<MissingLayerRule>(options.expected_layers));
    }
    if (enabled(rules::kCircularDependency)) {
        engine.add_rule(std::make_unique<CircularDependencyRule>());
    }
    if (enabled(rules::kGodComponent)) {
        engine.add_rule(std::make_unique<GodComponentRule>(options.god_component_threshold));
    }
    if (enabled(rules::kUnimplementedPort)) {
        engine.add_rule(std::make_unique<UnimplementedPortRule>());
    }

    return engine;
}

void ValidationEngine::add_rule(ValidationRulePtr rule) {
    if (!rule) {
        throw std::invalid_argument("Cannot add a null validation rule");
    }
    if (find_rule(rule->id())) {
        throw std::invalid_argument("Validation rule already present: " + rule->id());
    }
    rules_.push_back(std::move(rule));
}

bool ValidationEngine::remove_rule(const std::string& rule_id) {
    auto it = std::find_if(rules_.begin(), rules_.end(),
        [&rule_id](const ValidationRulePtr& rule) { return rule->id() == rule_id; });
    if (it == rules_.end()) {
        return false;
    }
    rules_.erase(it);
    return true;
}

std::vector<std::string> ValidationEngine::rule_ids() const {
    std::vector<std::string> ids;
    ids.reserve(rules_.size());
    for (const auto& rule : rules_) {
        ids.push_back(rule->id());
    }
    return ids;
}

const ValidationRule* ValidationEngine::find_rule(const std::string& rule_id) const {
    for (const auto& rule : rules_) {
        if (rule->id() == rule_id) {
            return rule.get();
        }
    }
    return nullptr;
}

std::vector<Finding> ValidationEngine::run(const Graph& graph) const {
    std::vector<Finding> findings;

    for (const auto& rule : rules_) {
        auto rule_findings = rule->evaluate(graph);
        HEXGRAPH_LOG_DEBUG("Rule '{}' produced {} finding(s)", rule->id(), rule_findings.size());
        findings.insert(findings.end(),
                        std::make_move_iterator(rule_findings.begin()),
                        std::make_move_iterator(rule_findings.end()));
    }

    return findings;
}

std::vector<Finding> ValidationEngine::run_rule(const std::string& rule_id, const Graph& graph) const {
    const ValidationRule* rule = find_rule(rule_id);
    if (!rule) {
        return {};
    }
    return rule->evaluate(graph);
}

} // namespace hexgraph
