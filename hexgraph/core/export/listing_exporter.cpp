/*
 * File:        listing_exporter.cpp
 * Module:      hexgraph-core
 * Purpose:     Plain text listing export
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "listing_exporter.h"
#include <fmt/format.h>
#include <sstream>

namespace hexgraph {

ExportResult ListingExporter::export_graph(const Graph& graph) const {
    std::ostringstream oss;

    oss << graph.metadata().description << "\n";
    oss << std::string(graph.metadata().description.size(), '=') << "\n\n";
    oss << fmt::format("Components:   {}\n", graph.node_count());
    oss << fmt::format("Dependencies: {}\n\n", graph.edge_count());

    oss << "Layers:\n";
    for (Layer layer : kAllLayers) {
        oss << fmt::format("  {:<16}{}\n", layer_to_string(layer), graph.nodes_by_layer(layer).size());
    }

    for (Layer layer : kAllLayers) {
        auto nodes = graph.nodes_by_layer(layer);
        if (nodes.empty()) {
            continue;
        }

        oss << "\n[" << layer_to_string(layer) << "]\n";
        for (const auto& node : nodes) {
            oss << fmt::format("  {} ({})", node.type_name, role_to_string(node.role));
            if (!node.module_path.empty()) {
                oss << "  " << node.module_path;
            }
            oss << "\n";

            for (const auto& edge : graph.edges_from(node.id)) {
                auto target = graph.node(edge.to);
                oss << "    -> " << (target ? target->type_name : edge.to.to_string()) << "\n";
            }
        }
    }

    return ExportResult::success(oss.str());
}

} // namespace hexgraph
