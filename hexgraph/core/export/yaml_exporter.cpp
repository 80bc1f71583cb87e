/*
 * File:        yaml_exporter.cpp
 * Module:      hexgraph-core
 * Purpose:     YAML export
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "yaml_exporter.h"
#include <yaml-cpp/yaml.h>

namespace hexgraph {

ExportResult YamlExporter::export_graph(const Graph& graph) const {
    YAML::Emitter out;
    out << YAML::BeginMap;

    // Graph metadata
    out << YAML::Key << "graph";
    out << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "description" << YAML::Value << graph.metadata().description;
    out << YAML::Key << "version" << YAML::Value << graph.metadata().version;
    out << YAML::Key << "node_count" << YAML::Value << graph.node_count();
    out << YAML::Key << "edge_count" << YAML::Value << graph.edge_count();
    out << YAML::EndMap;

    // Components (manifest compatible)
    out << YAML::Key << "components";
    out << YAML::Value << YAML::BeginSeq;
    for (const auto& node : graph.all_nodes()) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << node.id.to_string();
        out << YAML::Key << "type_name" << YAML::Value << node.type_name;
        out << YAML::Key << "layer" << YAML::Value << layer_to_string(node.layer);
        out << YAML::Key << "role" << YAML::Value << role_to_string(node.role);
        out << YAML::Key << "module_path" << YAML::Value << node.module_path;

        out << YAML::Key << "dependencies";
        out << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (const auto& edge : graph.edges_from(node.id)) {
            auto target = graph.node(edge.to);
            if (target) {
                out << target->type_name;
            }
        }
        out << YAML::EndSeq;

        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    // Edges
    out << YAML::Key << "edges";
    out << YAML::Value << YAML::BeginSeq;
    for (const auto& edge : graph.all_edges()) {
        auto from = graph.node(edge.from);
        auto to = graph.node(edge.to);
        if (!from || !to) {
            return ExportResult::failure(ResultCode::ERROR_INTERNAL,
                "Edge references a node missing from the graph: " + edge.from.to_string() +
                " -> " + edge.to.to_string());
        }
        out << YAML::BeginMap;
        out << YAML::Key << "from" << YAML::Value << from->type_name;
        out << YAML::Key << "to" << YAML::Value << to->type_name;
        out << YAML::Key << "relation" << YAML::Value << relationship_to_string(edge.relation);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    if (!out.good()) {
        return ExportResult::failure(ResultCode::ERROR_INTERNAL,
                                     "YAML emitter error: " + out.GetLastError());
    }

    return ExportResult::success(std::string(out.c_str()) + "\n");
}

} // namespace hexgraph
