/*
 * File:        graph.cpp
 * Module:      hexgraph-core
 * Purpose:     Immutable architecture graph
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "graph.h"

namespace hexgraph {

std::string relationship_to_string(Relationship relation) {
    switch (relation) {
        case Relationship::DependsOn: return "DependsOn";
    }
    return "DependsOn";
}

Graph::Graph(BuildKey, GraphMetadata metadata, std::vector<GraphNode> nodes, std::vector<GraphEdge> edges)
    : metadata_(std::move(metadata)), nodes_(std::move(nodes)), edges_(std::move(edges))
{
    node_index_.reserve(nodes_.size());
    name_index_.reserve(nodes_.size());

    for (size_t i = 0; i < nodes_.size(); ++i) {
        const auto& n = nodes_[i];
        if (!node_index_.emplace(n.id, i).second) {
            throw GraphError("Duplicate node id " + n.id.to_string() + " (" + n.type_name + ")");
        }
        name_index_.emplace(n.type_name, i);
        layer_index_[n.layer].push_back(i);
        role_index_[n.role].push_back(i);
    }

    for (size_t i = 0; i < edges_.size(); ++i) {
        const auto& e = edges_[i];
        if (node_index_.find(e.from) == node_index_.end()) {
            throw GraphError("Edge references non-existent source node " + e.from.to_string());
        }
        if (node_index_.find(e.to) == node_index_.end()) {
            throw GraphError("Edge references non-existent target node " + e.to.to_string());
        }
        outgoing_[e.from].push_back(i);
        incoming_[e.to].push_back(i);
    }
}

std::optional<GraphNode> Graph::node(const NodeId& id) const {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) {
        return std::nullopt;
    }
    return nodes_[it->second];
}

std::optional<GraphNode> Graph::find_node(const std::string& type_name) const {
    auto it = name_index_.find(type_name);
    if (it == name_index_.end()) {
        return std::nullopt;
    }
    return nodes_[it->second];
}

bool Graph::contains(const NodeId& id) const {
    return node_index_.find(id) != node_index_.end();
}

std::vector<GraphNode> Graph::nodes_by_layer(Layer layer) const {
    auto it = layer_index_.find(layer);
    return collect(it == layer_index_.end() ? nullptr : &it->second);
}

std::vector<GraphNode> Graph::nodes_by_role(Role role) const {
    auto it = role_index_.find(role);
    return collect(it == role_index_.end() ? nullptr : &it->second);
}

std::vector<GraphEdge> Graph::edges_from(const NodeId& id) const {
    auto it = outgoing_.find(id);
    return collect_edges(it == outgoing_.end() ? nullptr : &it->second);
}

std::vector<GraphEdge> Graph::edges_to(const NodeId& id) const {
    auto it = incoming_.find(id);
    return collect_edges(it == incoming_.end() ? nullptr : &it->second);
}

std::vector<GraphNode> Graph::collect(const std::vector<size_t>* indices) const {
    std::vector<GraphNode> result;
    if (!indices) {
        return result;
    }
    result.reserve(indices->size());
    for (size_t i : *indices) {
        result.push_back(nodes_[i]);
    }
    return result;
}

std::vector<GraphEdge> Graph::collect_edges(const std::vector<size_t>* indices) const {
    std::vector<GraphEdge> result;
    if (!indices) {
        return result;
    }
    result.reserve(indices->size());
    for (size_t i : *indices) {
        result.push_back(edges_[i]);
    }
    return result;
}

} // namespace hexgraph
