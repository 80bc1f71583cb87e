/*
 * File:        graph.h
 * Module:      hexgraph-core
 * Purpose:     Immutable architecture graph and its query surface
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include "node_id.h"
#include "layer.h"
#include "role.h"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace hexgraph {

/**
 * @brief Exception thrown when a graph would break its own invariants
 */
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Kind of relationship carried by an edge
 */
enum class Relationship {
    DependsOn
};

std::string relationship_to_string(Relationship relation);

/**
 * @brief A component in a built graph
 */
struct GraphNode {
    NodeId id;
    std::string type_name;
    Layer layer = Layer::Unknown;
    Role role = Role::Unknown;
    std::string module_path;
};

/**
 * @brief A directed relationship between two nodes of the same graph
 */
struct GraphEdge {
    NodeId from;
    NodeId to;
    Relationship relation = Relationship::DependsOn;

    bool operator==(const GraphEdge& other) const {
        return from == other.from && to == other.to && relation == other.relation;
    }
    bool operator!=(const GraphEdge& other) const { return !(*this == other); }
};

/**
 * @brief Descriptive data attached to a graph
 */
struct GraphMetadata {
    std::string description = "Hexagonal Architecture Graph";
    uint32_t version = 1;                   // Graph format version
};

/**
 * @brief A frozen architecture graph
 *
 * Nodes, edges and all lookup indices are fixed at construction. Every
 * query is const, returns values or const references, and is safe to call
 * from any number of threads without synchronization.
 *
 * Graphs are produced by GraphBuilder and shared via GraphPtr.
 */
class Graph {
public:
    /**
     * @brief Construction token; only GraphBuilder can create one
     */
    class BuildKey {
    private:
        BuildKey() {}
        friend class GraphBuilder;
    };

    /// An empty graph
    Graph() = default;

    /**
     * @brief Freeze nodes and edges and build the lookup indices
     *
     * Node ids must be unique within the graph; the builder resolves hash
     * collisions before calling this.
     *
     * @throws GraphError on duplicate node ids or edges with unknown endpoints
     */
    Graph(BuildKey key, GraphMetadata metadata, std::vector<GraphNode> nodes, std::vector<GraphEdge> edges);

    // Prevent copying - share via GraphPtr
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    // Node lookup
    std::optional<GraphNode> node(const NodeId& id) const;
    std::optional<GraphNode> find_node(const std::string& type_name) const;
    bool contains(const NodeId& id) const;

    // Filtered views (order not significant)
    std::vector<GraphNode> nodes_by_layer(Layer layer) const;
    std::vector<GraphNode> nodes_by_role(Role role) const;

    // Adjacency (declaration order)
    std::vector<GraphEdge> edges_from(const NodeId& id) const;
    std::vector<GraphEdge> edges_to(const NodeId& id) const;

    // Full enumeration
    const std::vector<GraphNode>& all_nodes() const { return nodes_; }
    const std::vector<GraphEdge>& all_edges() const { return edges_; }

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    /// Number of distinct layers with at least one node
    size_t layer_count() const { return layer_index_.size(); }

    const GraphMetadata& metadata() const { return metadata_; }

private:
    std::vector<GraphNode> collect(const std::vector<size_t>* indices) const;
    std::vector<GraphEdge> collect_edges(const std::vector<size_t>* indices) const;

    GraphMetadata metadata_;
    std::vector<GraphNode> nodes_;
    std::vector<GraphEdge> edges_;

    std::unordered_map<NodeId, size_t> node_index_;
    std::unordered_map<std::string, size_t> name_index_;
    std::unordered_map<NodeId, std::vector<size_t>> outgoing_;   // node -> edge indices
    std::unordered_map<NodeId, std::vector<size_t>> incoming_;   // node -> edge indices
    std::map<Layer, std::vector<size_t>> layer_index_;           // layer -> node indices
    std::map<Role, std::vector<size_t>> role_index_;             // role -> node indices
};

using GraphPtr = std::shared_ptr<const Graph>;

} // namespace hexgraph
