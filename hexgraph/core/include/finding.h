/*
 * File:        finding.h
 * Module:      hexgraph-core
 * Purpose:     Advisory records produced by graph building and validation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "node_id.h"
#include <string>
#include <vector>

namespace hexgraph {

/**
 * @brief How serious a finding is
 *
 * Ordered: Info < Warning < Violation.
 */
enum class Severity {
    Info,
    Warning,
    Violation
};

std::string severity_to_string(Severity severity);

// Rule identifiers of findings emitted while building a graph
namespace rules {
    constexpr const char* kMalformedEntry = "MalformedEntry";
    constexpr const char* kDuplicateNodeId = "DuplicateNodeId";
    constexpr const char* kDanglingDependency = "DanglingDependency";
    constexpr const char* kDuplicateDependency = "DuplicateDependency";
    constexpr const char* kNodeIdCollision = "NodeIdCollision";

    // Validation rules
    constexpr const char* kDependencyDirection = "DependencyDirection";
    constexpr const char* kOrphanNode = "OrphanNode";
    constexpr const char* kMissingLayer = "MissingLayer";
    constexpr const char* kCircularDependency = "CircularDependency";
    constexpr const char* kGodComponent = "GodComponent";
    constexpr const char* kUnimplementedPort = "UnimplementedPort";
}

/**
 * @brief One structural observation about a set of entries or a graph
 *
 * Findings are data returned to the caller; they are never stored in the
 * graph they describe.
 */
struct Finding {
    std::string rule_id;                  // e.g. "DependencyDirection"
    Severity severity = Severity::Info;
    std::vector<NodeId> nodes;            // Affected node ids
    std::vector<std::string> type_names;  // Affected type names, same order as nodes where both exist
    std::string explanation;              // Human-readable description

    /// "[violation] DependencyDirection: ..."
    std::string to_string() const;
};

/// Number of findings with exactly the given severity
size_t count_findings(const std::vector<Finding>& findings, Severity severity);

/// Number of findings produced by the given rule
size_t count_findings(const std::vector<Finding>& findings, const std::string& rule_id);

/// Findings produced by the given rule
std::vector<Finding> filter_findings(const std::vector<Finding>& findings, const std::string& rule_id);

/// True if any finding is at or above the given severity
bool has_findings_at_least(const std::vector<Finding>& findings, Severity severity);

} // namespace hexgraph
