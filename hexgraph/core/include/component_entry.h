/*
 * File:        component_entry.h
 * Module:      hexgraph-core
 * Purpose:     Metadata record describing one component
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "layer.h"
#include "role.h"
#include <string>
#include <vector>

namespace hexgraph {

/**
 * @brief Declared metadata of one component
 *
 * The unit of input to the graph builder. Entries are plain values; the
 * builder decides whether an entry is well formed.
 */
struct ComponentEntry {
    std::string type_name;                  // Globally unique component name
    Layer layer = Layer::Unknown;           // Architectural tier
    Role role = Role::Unknown;              // Structural category
    std::string module_path;                // Informational (e.g., "shop::domain")
    std::vector<std::string> dependencies;  // Type names this component references
};

} // namespace hexgraph
