/*
 * File:        graph_exporter.cpp
 * Module:      hexgraph-core
 * Purpose:     Exporter factory and file output
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "graph_exporter.h"
#include "dot_exporter.h"
#include "mermaid_exporter.h"
#include "yaml_exporter.h"
#include "listing_exporter.h"
#include "logging.h"
#include <fstream>

namespace hexgraph {

ExportResult ExportResult::success(std::string document) {
    ExportResult result;
    result.document = std::move(document);
    return result;
}

ExportResult ExportResult::failure(ResultCode code, std::string message) {
    ExportResult result;
    result.code = code;
    result.error = std::move(message);
    return result;
}

std::string layer_color(Layer layer) {
    switch (layer) {
        case Layer::Domain: return "lightblue";
        case Layer::Port: return "lightgreen";
        case Layer::Adapter: return "lightyellow";
        case Layer::Application: return "lightcoral";
        case Layer::Infrastructure: return "lightgray";
        case Layer::Unknown: return "red";
    }
    return "red";
}

GraphExporterPtr make_exporter(const std::string& format) {
    if (format == "dot") return std::make_unique<DotExporter>();
    if (format == "mermaid") return std::make_unique<MermaidExporter>();
    if (format == "yaml") return std::make_unique<YamlExporter>();
    if (format == "text") return std::make_unique<ListingExporter>();
    return nullptr;
}

std::vector<std::string> available_export_formats() {
    return {"dot", "mermaid", "yaml", "text"};
}

ExportResult write_export(const GraphExporter& exporter, const Graph& graph, const std::string& path) {
    ExportResult result = exporter.export_graph(graph);
    if (!result.ok()) {
        return result;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return ExportResult::failure(ResultCode::ERROR_IO_ERROR, "Cannot open output file: " + path);
    }

    file << result.document;
    file.close();
    if (file.fail()) {
        return ExportResult::failure(ResultCode::ERROR_IO_ERROR, "Failed to write output file: " + path);
    }

    HEXGRAPH_LOG_INFO("Wrote {} export to {}", exporter.format_name(), path);
    return result;
}

} // namespace hexgraph
