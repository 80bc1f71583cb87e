/*
 * File:        graph_builder.h
 * Module:      hexgraph-core
 * Purpose:     Construction of immutable graphs from component entries
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include "component_entry.h"
#include "component_registry.h"
#include "finding.h"
#include "graph.h"
#include <optional>
#include <string>
#include <vector>

namespace hexgraph {

/**
 * @brief What to do when two entries share a type name
 */
enum class DuplicatePolicy {
    /// Keep the first registered entry, report the others
    FirstWins,

    /// Reject the whole build
    FailBuild
};

std::string duplicate_policy_to_string(DuplicatePolicy policy);

/// Parse "first_wins" / "fail_build"; nullopt if unrecognised
std::optional<DuplicatePolicy> parse_duplicate_policy(const std::string& name);

/**
 * @brief Options controlling a build
 */
struct BuildOptions {
    DuplicatePolicy duplicate_policy = DuplicatePolicy::FirstWins;
    bool strict = false;              // Report dangling dependencies as violations
    GraphMetadata metadata;           // Copied into the built graph
};

enum class BuildStatus {
    Built,      // Graph holds every well-formed, non-duplicate entry
    Rejected    // Build refused by policy; graph is empty
};

/**
 * @brief Output of a build
 */
struct BuildResult {
    GraphPtr graph;                   // Never null
    std::vector<Finding> findings;    // Everything irregular seen while building
    BuildStatus status = BuildStatus::Built;

    bool rejected() const { return status == BuildStatus::Rejected; }
};

/**
 * @brief Turns component entries into a frozen Graph
 *
 * Deterministic and free of side effects: the same entries in the same
 * order always yield the same graph and findings. Bad entries never fail
 * the build; they are left out and reported.
 *
 * Steps:
 * 1. Reject malformed entries (MalformedEntry): blank type name, unknown
 *    layer or unknown role
 * 2. Index nodes by type name, applying the duplicate policy (DuplicateNodeId).
 *    A new name whose hash is already taken gets the next free id
 *    (NodeIdCollision)
 * 3. Resolve dependency names to edges (DanglingDependency, DuplicateDependency).
 *    An empty dependency name dangles; the node and its other edges are kept
 * 4. Freeze the graph with its adjacency indices
 */
class GraphBuilder {
public:
    static BuildResult build(const std::vector<ComponentEntry>& entries,
                             const BuildOptions& options = BuildOptions());

    static BuildResult build(const EntryRange& entries,
                             const BuildOptions& options = BuildOptions());

    /**
     * @brief Structural check of a single entry
     *
     * @return Reason the entry is malformed, or nullopt if it is well formed
     */
    static std::optional<std::string> check_entry(const ComponentEntry& entry);
};

} // namespace hexgraph
