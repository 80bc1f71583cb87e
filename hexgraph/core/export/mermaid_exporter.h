/*
 * File:        mermaid_exporter.h
 * Module:      hexgraph-core
 * Purpose:     Mermaid flowchart exporter
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "graph_exporter.h"

namespace hexgraph {

/**
 * @brief Mermaid flowchart
 *
 * Node identifiers are derived from NodeId so arbitrary type names
 * (namespaces, templates) never clash or break the syntax.
 */
class MermaidExporter : public GraphExporter {
public:
    explicit MermaidExporter(std::string direction = "TD") : direction_(std::move(direction)) {}

    ExportResult export_graph(const Graph& graph) const override;
    std::string format_name() const override { return "Mermaid"; }
    std::string file_extension() const override { return "mmd"; }

private:
    std::string direction_;
};

} // namespace hexgraph
