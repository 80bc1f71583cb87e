/*
 * File:        validation_rules.cpp
 * Module:      hexgraph-core
 * Purpose:     Architectural validation rules
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "validation_rule.h"
#include "graph_analysis.h"

namespace hexgraph {

// ============================================================================
// DependencyDirectionRule
// ============================================================================

std::string DependencyDirectionRule::description() const {
    return "Dependencies must point toward the domain or stay within a layer";
}

std::vector<Finding> DependencyDirectionRule::evaluate(const Graph& graph) const {
    std::vector<Finding> findings;

    for (const auto& edge : graph.all_edges()) {
        auto from = graph.node(edge.from);
        auto to = graph.node(edge.to);
        if (!from || !to) {
            continue;  // Cannot happen in a built graph
        }

        if (layer_rank(to->layer) > layer_rank(from->layer)) {
            Finding f;
            f.rule_id = id();
            f.severity = Severity::Violation;
            f.nodes = {from->id, to->id};
            f.type_names = {from->type_name, to->type_name};
            f.explanation = fmt::format("'{}' ({}) depends on '{}' ({}); {} must not depend on an outer layer",
                                        from->type_name, layer_to_string(from->layer),
                                        to->type_name, layer_to_string(to->layer),
                                        layer_to_string(from->layer));
            findings.push_back(std::move(f));
        }
    }

    return findings;
}

// ============================================================================
// OrphanNodeRule
// ============================================================================

std::string OrphanNodeRule::description() const {
    return "Components with no dependency and no dependent";
}

std::vector<Finding> OrphanNodeRule::evaluate(const Graph& graph) const {
    std::vector<Finding> findings;

    for (const auto& node : graph.all_nodes()) {
        if (graph.edges_from(node.id).empty() && graph.edges_to(node.id).empty()) {
            Finding f;
            f.rule_id = id();
            f.severity = Severity::Info;
            f.nodes = {node.id};
            f.type_names = {node.type_name};
            f.explanation = fmt::format("'{}' ({}) has no dependencies and no dependents",
                                        node.type_name, layer_to_string(node.layer));
            findings.push_back(std::move(f));
        }
    }

    return findings;
}

// ============================================================================
// MissingLayerRule
// ============================================================================

MissingLayerRule::MissingLayerRule(std::vector<Layer> expected_layers)
    : expected_layers_(std::move(expected_layers)) {}

std::string MissingLayerRule::description() const {
    return "Every expected layer contains at least one component";
}

std::vector<Finding> MissingLayerRule::evaluate(const Graph& graph) const {
    std::vector<Finding> findings;

    for (Layer layer : expected_layers_) {
        if (graph.nodes_by_layer(layer).empty()) {
            Finding f;
            f.rule_id = id();
            f.severity = Severity::Warning;
            f.explanation = fmt::format("No component in layer '{}'", layer_to_string(layer));
            findings.push_back(std::move(f));
        }
    }

    return findings;
}

// ============================================================================
// CircularDependencyRule
// ============================================================================

std::string CircularDependencyRule::description() const {
    return "Dependency cycles between components";
}

std::vector<Finding> CircularDependencyRule::evaluate(const Graph& graph) const {
    std::vector<Finding> findings;

    for (const auto& cycle : GraphAnalysis(graph).detect_cycles()) {
        Finding f;
        f.rule_id = id();
        f.severity = Severity::Warning;
        f.nodes = cycle;

        std::string path;
        for (const auto& node_id : cycle) {
            auto node = graph.node(node_id);
            const std::string name = node ? node->type_name : node_id.to_string();
            f.type_names.push_back(name);
            path += name + " -> ";
        }
        path += f.type_names.front();

        f.explanation = "Dependency cycle: " + path;
        findings.push_back(std::move(f));
    }

    return findings;
}

// ============================================================================
// GodComponentRule
// ============================================================================

std::string GodComponentRule::description() const {
    return fmt::format("Components with more than {} connections", threshold_);
}

std::vector<Finding> GodComponentRule::evaluate(const Graph& graph) const {
    std::vector<Finding> findings;

    for (const auto& node : graph.all_nodes()) {
        const size_t connections = graph.edges_from(node.id).size() + graph.edges_to(node.id).size();
        if (connections > threshold_) {
            Finding f;
            f.rule_id = id();
            f.severity = Severity::Warning;
            f.nodes = {node.id};
            f.type_names = {node.type_name};
            f.explanation = fmt::format("'{}' has {} connections (threshold {})",
                                        node.type_name, connections, threshold_);
            findings.push_back(std::move(f));
        }
    }

    return findings;
}

// ============================================================================
// UnimplementedPortRule
// ============================================================================

std::string UnimplementedPortRule::description() const {
    return "Ports that no adapter depends on";
}

std::vector<Finding> UnimplementedPortRule::evaluate(const Graph& graph) const {
    std::vector<Finding> findings;

    for (const auto& port : graph.nodes_by_layer(Layer::Port)) {
        bool implemented = false;
        for (const auto& edge : graph.edges_to(port.id)) {
            auto dependent = graph.node(edge.from);
            if (dependent && dependent->layer == Layer::Adapter) {
                implemented = true;
                break;
            }
        }

        if (!implemented) {
            Finding f;
            f.rule_id = id();
            f.severity = Severity::Info;
            f.nodes = {port.id};
            f.type_names = {port.type_name};
            f.explanation = fmt::format("Port '{}' has no adapter depending on it", port.type_name);
            findings.push_back(std::move(f));
        }
    }

    return findings;
}

} // namespace hexgraph
