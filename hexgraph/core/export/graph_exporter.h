/*
 * File:        graph_exporter.h
 * Module:      hexgraph-core
 * Purpose:     Exporter interface for textual graph representations
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "error_codes.h"
#include "graph.h"
#include <memory>
#include <string>
#include <vector>

namespace hexgraph {

/**
 * @brief Document produced by an exporter, or the reason it could not be
 */
struct ExportResult {
    ResultCode code = ResultCode::SUCCESS;
    std::string document;       // Valid when ok()
    std::string error;          // Valid when !ok()

    bool ok() const { return is_success(code); }

    static ExportResult success(std::string document);
    static ExportResult failure(ResultCode code, std::string message);
};

/**
 * @brief Abstract base class for graph exporters
 *
 * Exporters are pure: they read all_nodes()/all_edges() and keep no state
 * between calls.
 */
class GraphExporter {
public:
    virtual ~GraphExporter() = default;

    /**
     * @brief Render the graph
     */
    virtual ExportResult export_graph(const Graph& graph) const = 0;

    /**
     * @brief Human-readable format name (e.g., "DOT (GraphViz)")
     */
    virtual std::string format_name() const = 0;

    /**
     * @brief File extension without the dot (e.g., "dot")
     */
    virtual std::string file_extension() const = 0;
};

using GraphExporterPtr = std::unique_ptr<GraphExporter>;

/**
 * @brief Fill colour used for a layer in diagram formats
 */
std::string layer_color(Layer layer);

/**
 * @brief Create an exporter by short name
 *
 * @param format "dot", "mermaid", "yaml" or "text"
 * @return Exporter, or nullptr if the format is unknown
 */
GraphExporterPtr make_exporter(const std::string& format);

/// Short names accepted by make_exporter()
std::vector<std::string> available_export_formats();

/**
 * @brief Export the graph and write the document to a file
 *
 * @return The export result; I/O failures are reported as ERROR_IO_ERROR
 */
ExportResult write_export(const GraphExporter& exporter, const Graph& graph, const std::string& path);

} // namespace hexgraph
