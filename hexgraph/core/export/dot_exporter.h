/*
 * File:        dot_exporter.h
 * Module:      hexgraph-core
 * Purpose:     GraphViz DOT exporter
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "graph_exporter.h"

namespace hexgraph {

/**
 * @brief GraphViz DOT digraph, one box per component filled by layer colour
 */
class DotExporter : public GraphExporter {
public:
    explicit DotExporter(std::string rankdir = "TB") : rankdir_(std::move(rankdir)) {}

    ExportResult export_graph(const Graph& graph) const override;
    std::string format_name() const override { return "DOT (GraphViz)"; }
    std::string file_extension() const override { return "dot"; }

private:
    std::string rankdir_;
};

} // namespace hexgraph
