/*
 * File:        graph_analysis.h
 * Module:      hexgraph-core
 * Purpose:     Structural analysis of architecture graphs
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "graph.h"
#include <optional>
#include <vector>

namespace hexgraph {

/**
 * @brief Coupling of a single node
 */
struct CouplingMetrics {
    size_t afferent = 0;      // Incoming edges (dependents)
    size_t efferent = 0;      // Outgoing edges (dependencies)
    double instability = 0.0; // efferent / (afferent + efferent), 0 when isolated
};

/**
 * @brief Read-only structural analysis over a graph
 *
 * Holds a reference to the graph and must not outlive it.
 */
class GraphAnalysis {
public:
    explicit GraphAnalysis(const Graph& graph) : graph_(graph) {}

    /**
     * @brief Find dependency cycles by depth-first search
     *
     * Each back edge found yields one cycle, listed from the node it
     * closes on. Self-loops are cycles of length one. Nodes are visited
     * in graph order so the result is deterministic.
     */
    std::vector<std::vector<NodeId>> detect_cycles() const;

    /**
     * @brief Coupling metrics of a node
     *
     * @return Metrics, or nullopt if the node is not in the graph
     */
    std::optional<CouplingMetrics> coupling(const NodeId& id) const;

    /// Nodes that depend on nothing
    std::vector<GraphNode> leaf_nodes() const;

    /// Nodes nothing depends on
    std::vector<GraphNode> root_nodes() const;

private:
    const Graph& graph_;
};

} // namespace hexgraph
