/*
 * File:        dot_exporter.cpp
 * Module:      hexgraph-core
 * Purpose:     GraphViz DOT export
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "dot_exporter.h"
#include <sstream>

namespace hexgraph {

// Escape for a double-quoted DOT string
static std::string dot_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

ExportResult DotExporter::export_graph(const Graph& graph) const {
    std::ostringstream oss;

    oss << "digraph hex_architecture {\n";
    oss << "  rankdir=" << rankdir_ << ";\n";
    oss << "  node [shape=box, style=rounded];\n\n";

    for (const auto& node : graph.all_nodes()) {
        const std::string name = dot_escape(node.type_name);
        oss << "  \"" << name << "\" [label=\"" << name << "\\n(" << role_to_string(node.role)
            << ")\", fillcolor=" << layer_color(node.layer) << ", style=filled];\n";
    }

    oss << "\n";

    for (const auto& edge : graph.all_edges()) {
        auto from = graph.node(edge.from);
        auto to = graph.node(edge.to);
        if (!from || !to) {
            return ExportResult::failure(ResultCode::ERROR_INTERNAL,
                "Edge references a node missing from the graph: " + edge.from.to_string() +
                " -> " + edge.to.to_string());
        }
        oss << "  \"" << dot_escape(from->type_name) << "\" -> \"" << dot_escape(to->type_name)
            << "\" [label=\"" << relationship_to_string(edge.relation) << "\"];\n";
    }

    oss << "}\n";
    return ExportResult::success(oss.str());
}

} // namespace hexgraph
