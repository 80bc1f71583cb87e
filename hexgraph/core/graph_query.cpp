/*
 * File:        graph_query.cpp
 * Module:      hexgraph-core
 * Purpose:     Composable node filter
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "graph_query.h"
#include <algorithm>

namespace hexgraph {

GraphQuery& GraphQuery::layer(Layer layer) {
    layers_.push_back(layer);
    return *this;
}

GraphQuery& GraphQuery::role(Role role) {
    roles_.push_back(role);
    return *this;
}

GraphQuery& GraphQuery::type_name_contains(const std::string& text) {
    type_name_parts_.push_back(text);
    return *this;
}

GraphQuery& GraphQuery::module_path_contains(const std::string& text) {
    module_path_parts_.push_back(text);
    return *this;
}

bool GraphQuery::matches(const GraphNode& node) const {
    for (Layer l : layers_) {
        if (node.layer != l) return false;
    }
    for (Role r : roles_) {
        if (node.role != r) return false;
    }
    for (const auto& part : type_name_parts_) {
        if (node.type_name.find(part) == std::string::npos) return false;
    }
    for (const auto& part : module_path_parts_) {
        if (node.module_path.find(part) == std::string::npos) return false;
    }
    return true;
}

std::vector<GraphNode> GraphQuery::execute() const {
    std::vector<GraphNode> result;
    for (const auto& node : graph_.all_nodes()) {
        if (matches(node)) {
            result.push_back(node);
        }
    }
    return result;
}

size_t GraphQuery::count() const {
    const auto& nodes = graph_.all_nodes();
    return static_cast<size_t>(std::count_if(nodes.begin(), nodes.end(),
        [this](const GraphNode& node) { return matches(node); }));
}

std::optional<GraphNode> GraphQuery::first() const {
    for (const auto& node : graph_.all_nodes()) {
        if (matches(node)) {
            return node;
        }
    }
    return std::nullopt;
}

} // namespace hexgraph
