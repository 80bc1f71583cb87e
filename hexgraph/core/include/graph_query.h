/*
 * File:        graph_query.h
 * Module:      hexgraph-core
 * Purpose:     Composable node filter
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "graph.h"
#include <optional>
#include <string>
#include <vector>

namespace hexgraph {

/**
 * @brief Composable node filter over a graph
 *
 * All filters must match. The query holds a reference to the graph and
 * must not outlive it.
 *
 * Usage:
 * ```cpp
 * auto repos = GraphQuery(graph).layer(Layer::Port).role(Role::Repository).execute();
 * ```
 */
class GraphQuery {
public:
    explicit GraphQuery(const Graph& graph) : graph_(graph) {}

    GraphQuery& layer(Layer layer);
    GraphQuery& role(Role role);
    GraphQuery& type_name_contains(const std::string& text);
    GraphQuery& module_path_contains(const std::string& text);

    std::vector<GraphNode> execute() const;
    size_t count() const;
    std::optional<GraphNode> first() const;

private:
    bool matches(const GraphNode& node) const;

    const Graph& graph_;
    std::vector<Layer> layers_;
    std::vector<Role> roles_;
    std::vector<std::string> type_name_parts_;
    std::vector<std::string> module_path_parts_;
};

} // namespace hexgraph
