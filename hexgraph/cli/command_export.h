/*
 * File:        command_export.h
 * Module:      hexgraph-cli
 * Purpose:     Export graph command header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "graph.h"
#include <string>

namespace hexgraph {
namespace cli {

struct ExportOptions {
    std::string format;         // Short name accepted by make_exporter()
    std::string output_path;    // Empty writes to stdout
};

int export_command(const ExportOptions& options, const Graph& graph);

} // namespace cli
} // namespace hexgraph
