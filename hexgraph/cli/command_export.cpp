/*
 * File:        command_export.cpp
 * Module:      hexgraph-cli
 * Purpose:     Export graph command
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "command_export.h"
#include "graph_exporter.h"
#include "logging.h"

#include <iostream>

namespace hexgraph {
namespace cli {

int export_command(const ExportOptions& options, const Graph& graph) {
    auto exporter = make_exporter(options.format);
    if (!exporter) {
        HEXGRAPH_LOG_ERROR("Unknown export format: {}", options.format);
        return 1;
    }

    HEXGRAPH_LOG_INFO("Exporting {} nodes and {} edges as {}",
                      graph.node_count(), graph.edge_count(), exporter->format_name());

    if (options.output_path.empty()) {
        ExportResult result = exporter->export_graph(graph);
        if (!result.ok()) {
            HEXGRAPH_LOG_ERROR("Export failed ({}): {}", result_code_name(result.code), result.error);
            return 1;
        }
        std::cout << result.document;
        return 0;
    }

    ExportResult result = write_export(*exporter, graph, options.output_path);
    if (!result.ok()) {
        HEXGRAPH_LOG_ERROR("Export failed ({}): {}", result_code_name(result.code), result.error);
        return 1;
    }
    return 0;
}

} // namespace cli
} // namespace hexgraph
