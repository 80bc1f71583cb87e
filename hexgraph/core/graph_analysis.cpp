/*
 * File:        graph_analysis.cpp
 * Module:      hexgraph-core
 * Purpose:     Structural analysis of architecture graphs
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "graph_analysis.h"
#include <algorithm>
#include <unordered_map>

namespace hexgraph {

std::vector<std::vector<NodeId>> GraphAnalysis::detect_cycles() const {
    // Depth-first search on an explicit stack so long chains cannot
    // exhaust the call stack
    struct Frame {
        NodeId node;
        std::vector<GraphEdge> edges;
        size_t next;
    };

    std::vector<std::vector<NodeId>> cycles;
    std::unordered_map<NodeId, int> state;  // 0=unvisited, 1=visiting, 2=visited
    std::vector<NodeId> path;
    std::vector<Frame> stack;

    auto enter = [&](const NodeId& node_id) {
        state[node_id] = 1;  // Mark as visiting
        path.push_back(node_id);
        stack.push_back(Frame{node_id, graph_.edges_from(node_id), 0});
    };

    for (const auto& node : graph_.all_nodes()) {
        if (state[node.id] != 0) {
            continue;
        }

        enter(node.id);
        while (!stack.empty()) {
            Frame& frame = stack.back();
            if (frame.next == frame.edges.size()) {
                state[frame.node] = 2;  // Mark as visited
                path.pop_back();
                stack.pop_back();
                continue;
            }

            const NodeId target = frame.edges[frame.next++].to;
            const int target_state = state[target];
            if (target_state == 0) {
                enter(target);
            } else if (target_state == 1) {
                // Back edge: the cycle is the path suffix starting at the target
                auto start = std::find(path.begin(), path.end(), target);
                cycles.emplace_back(start, path.end());
            }
        }
    }

    return cycles;
}

std::optional<CouplingMetrics> GraphAnalysis::coupling(const NodeId& id) const {
    if (!graph_.contains(id)) {
        return std::nullopt;
    }

    CouplingMetrics metrics;
    metrics.afferent = graph_.edges_to(id).size();
    metrics.efferent = graph_.edges_from(id).size();

    const size_t total = metrics.afferent + metrics.efferent;
    metrics.instability = total == 0 ? 0.0
        : static_cast<double>(metrics.efferent) / static_cast<double>(total);
    return metrics;
}

std::vector<GraphNode> GraphAnalysis::leaf_nodes() const {
    std::vector<GraphNode> result;
    for (const auto& node : graph_.all_nodes()) {
        if (graph_.edges_from(node.id).empty()) {
            result.push_back(node);
        }
    }
    return result;
}

std::vector<GraphNode> GraphAnalysis::root_nodes() const {
    std::vector<GraphNode> result;
    for (const auto& node : graph_.all_nodes()) {
        if (graph_.edges_to(node.id).empty()) {
            result.push_back(node);
        }
    }
    return result;
}

} // namespace hexgraph
