/*
 * File:        intent_inference.h
 * Module:      hexgraph-core
 * Purpose:     Detection of architectural patterns from node roles
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "graph.h"
#include <string>
#include <variant>
#include <vector>

namespace hexgraph {

/// Repository role nodes, in graph order
struct RepositoryPattern {
    std::vector<NodeId> repositories;
    size_t count = 0;
};

/// Command/query separation: directive and query role counts
struct CqrsPattern {
    size_t directive_count = 0;
    size_t query_count = 0;
};

using ArchitecturalPattern = std::variant<RepositoryPattern, CqrsPattern>;

/// Short form, e.g. "Repository (2)" or "CQRS (1 directive, 3 query)"
std::string describe_pattern(const ArchitecturalPattern& pattern);

/**
 * @brief Infers architectural intent from the roles present in a graph
 *
 * Holds a reference to the graph and must not outlive it.
 */
class IntentInference {
public:
    explicit IntentInference(const Graph& graph) : graph_(graph) {}

    /**
     * @brief Patterns present in the graph
     *
     * Repository is reported when any node has the Repository role, CQRS
     * when any node has the Directive or Query role. Patterns appear in
     * that order; an empty graph yields none.
     */
    std::vector<ArchitecturalPattern> identify_patterns() const;

private:
    const Graph& graph_;
};

} // namespace hexgraph
