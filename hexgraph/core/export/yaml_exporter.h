/*
 * File:        yaml_exporter.h
 * Module:      hexgraph-core
 * Purpose:     Structured YAML exporter
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "graph_exporter.h"

namespace hexgraph {

/**
 * @brief Structured YAML document
 *
 * Sections:
 * - graph: description, version, node and edge counts
 * - components: one manifest entry per node, dependencies = resolved edges
 * - edges: from/to type names and relation
 *
 * The components section is a valid component manifest, so an exported
 * graph can be loaded and rebuilt.
 */
class YamlExporter : public GraphExporter {
public:
    ExportResult export_graph(const Graph& graph) const override;
    std::string format_name() const override { return "YAML"; }
    std::string file_extension() const override { return "yaml"; }
};

} // namespace hexgraph
