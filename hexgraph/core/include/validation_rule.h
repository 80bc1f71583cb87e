/*
 * File:        validation_rule.h
 * Module:      hexgraph-core
 * Purpose:     Architectural validation rules
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "finding.h"
#include "graph.h"
#include <memory>
#include <string>
#include <vector>

namespace hexgraph {

/**
 * @brief Abstract base class for all validation rules
 *
 * A rule inspects a graph and reports findings without modifying it.
 * Rules are independent of each other and may be run in any order.
 */
class ValidationRule {
public:
    virtual ~ValidationRule() = default;

    /**
     * @brief Unique identifier, used as Finding::rule_id
     */
    virtual std::string id() const = 0;

    /**
     * @brief One-line description of what the rule checks
     */
    virtual std::string description() const = 0;

    /**
     * @brief Evaluate the rule
     * @return Findings (empty if the graph satisfies the rule)
     */
    virtual std::vector<Finding> evaluate(const Graph& graph) const = 0;
};

using ValidationRulePtr = std::unique_ptr<ValidationRule>;

/**
 * @brief Inner layers must not depend on outer layers
 *
 * Flags every edge whose target ranks further out than its source
 * (see layer_rank()). Severity: violation.
 */
class DependencyDirectionRule : public ValidationRule {
public:
    std::string id() const override { return rules::kDependencyDirection; }
    std::string description() const override;
    std::vector<Finding> evaluate(const Graph& graph) const override;
};

/**
 * @brief Nodes with no incident edge. Severity: info.
 */
class OrphanNodeRule : public ValidationRule {
public:
    std::string id() const override { return rules::kOrphanNode; }
    std::string description() const override;
    std::vector<Finding> evaluate(const Graph& graph) const override;
};

/**
 * @brief Expected layers without any node. Severity: warning.
 */
class MissingLayerRule : public ValidationRule {
public:
    explicit MissingLayerRule(std::vector<Layer> expected_layers);

    std::string id() const override { return rules::kMissingLayer; }
    std::string description() const override;
    std::vector<Finding> evaluate(const Graph& graph) const override;

private:
    std::vector<Layer> expected_layers_;
};

/**
 * @brief Dependency cycles, self-loops included. Severity: warning.
 */
class CircularDependencyRule : public ValidationRule {
public:
    std::string id() const override { return rules::kCircularDependency; }
    std::string description() const override;
    std::vector<Finding> evaluate(const Graph& graph) const override;
};

/**
 * @brief Nodes with more incident edges than a threshold. Severity: warning.
 */
class GodComponentRule : public ValidationRule {
public:
    explicit GodComponentRule(size_t threshold) : threshold_(threshold) {}

    std::string id() const override { return rules::kGodComponent; }
    std::string description() const override;
    std::vector<Finding> evaluate(const Graph& graph) const override;

private:
    size_t threshold_;
};

/**
 * @brief Port-layer nodes no adapter depends on. Severity: info.
 */
class UnimplementedPortRule : public ValidationRule {
public:
    std::string id() const override { return rules::kUnimplementedPort; }
    std::string description() const override;
    std::vector<Finding> evaluate(const Graph& graph) const override;
};

} // namespace hexgraph
