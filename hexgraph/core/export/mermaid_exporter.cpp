/*
 * File:        mermaid_exporter.cpp
 * Module:      hexgraph-core
 * Purpose:     Mermaid flowchart export
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "mermaid_exporter.h"
#include <sstream>

namespace hexgraph {

static std::string mermaid_id(const NodeId& id) {
    return "n" + id.to_string();
}

// Quotes end a Mermaid label; use the entity form instead
static std::string mermaid_label(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"') {
            out += "#quot;";
        } else {
            out += c;
        }
    }
    return out;
}

ExportResult MermaidExporter::export_graph(const Graph& graph) const {
    std::ostringstream oss;

    oss << "graph " << direction_ << "\n";

    for (const auto& node : graph.all_nodes()) {
        oss << "  " << mermaid_id(node.id) << "[\"" << mermaid_label(node.type_name)
            << "<br/>(" << role_to_string(node.role) << ")\"]\n";
    }

    oss << "\n";

    for (const auto& edge : graph.all_edges()) {
        oss << "  " << mermaid_id(edge.from) << " -->|" << relationship_to_string(edge.relation)
            << "| " << mermaid_id(edge.to) << "\n";
    }

    // Layer styling
    oss << "\n";
    for (Layer layer : kAllLayers) {
        auto nodes = graph.nodes_by_layer(layer);
        if (nodes.empty()) {
            continue;
        }
        oss << "  classDef " << layer_to_string(layer) << " fill:" << layer_color(layer) << "\n";
        oss << "  class ";
        for (size_t i = 0; i < nodes.size(); ++i) {
            if (i > 0) oss << ",";
            oss << mermaid_id(nodes[i].id);
        }
        oss << " " << layer_to_string(layer) << "\n";
    }

    return ExportResult::success(oss.str());
}

} // namespace hexgraph
