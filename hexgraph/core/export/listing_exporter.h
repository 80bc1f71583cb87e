/*
 * File:        listing_exporter.h
 * Module:      hexgraph-core
 * Purpose:     Plain text listing exporter
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "graph_exporter.h"

namespace hexgraph {

/**
 * @brief Flat text listing: counts per layer, then each component and its dependencies
 */
class ListingExporter : public GraphExporter {
public:
    ExportResult export_graph(const Graph& graph) const override;
    std::string format_name() const override { return "Text listing"; }
    std::string file_extension() const override { return "txt"; }
};

} // namespace hexgraph
