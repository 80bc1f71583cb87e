/*
 * File:        graph_builder.cpp
 * Module:      hexgraph-core
 * Purpose:     Construction of immutable graphs from component entries
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "graph_builder.h"
#include "logging.h"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace hexgraph {

namespace {

std::string describe_dependencies(const std::vector<std::string>& deps) {
    if (deps.empty()) {
        return "none";
    }
    std::string text;
    for (size_t i = 0; i < deps.size(); ++i) {
        if (i > 0) text += ", ";
        text += deps[i];
    }
    return text;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

std::string duplicate_policy_to_string(DuplicatePolicy policy) {
    switch (policy) {
        case DuplicatePolicy::FirstWins: return "first_wins";
        case DuplicatePolicy::FailBuild: return "fail_build";
    }
    return "first_wins";
}

std::optional<DuplicatePolicy> parse_duplicate_policy(const std::string& name) {
    if (name == "first_wins") return DuplicatePolicy::FirstWins;
    if (name == "fail_build") return DuplicatePolicy::FailBuild;
    return std::nullopt;
}

std::optional<std::string> GraphBuilder::check_entry(const ComponentEntry& entry) {
    if (entry.type_name.empty() || is_blank(entry.type_name)) {
        return std::string("type_name is empty");
    }
    if (!is_known_layer(entry.layer)) {
        return "layer is not a known layer (" + layer_to_string(entry.layer) + ")";
    }
    if (!is_known_role(entry.role)) {
        return "role is not a known role (" + role_to_string(entry.role) + ")";
    }
    return std::nullopt;
}

BuildResult GraphBuilder::build(const EntryRange& entries, const BuildOptions& options) {
    return build(entries.to_vector(), options);
}

BuildResult GraphBuilder::build(const std::vector<ComponentEntry>& entries, const BuildOptions& options) {
    BuildResult result;

    const Severity duplicate_severity = options.duplicate_policy == DuplicatePolicy::FailBuild
        ? Severity::Violation : Severity::Warning;
    const Severity dangling_severity = options.strict ? Severity::Violation : Severity::Warning;

    // Accepted entries, in registration order
    std::vector<const ComponentEntry*> accepted;
    std::vector<GraphNode> nodes;
    std::unordered_map<NodeId, size_t> accepted_by_id;
    std::unordered_map<std::string, NodeId> accepted_by_name;
    bool duplicate_seen = false;

    accepted.reserve(entries.size());
    nodes.reserve(entries.size());

    // Steps 1 and 2: structural checks and node index
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];

        auto problem = check_entry(entry);
        if (problem) {
            Finding f;
            f.rule_id = rules::kMalformedEntry;
            f.severity = Severity::Warning;
            if (!entry.type_name.empty()) {
                f.nodes.push_back(NodeId::from_type_name(entry.type_name));
                f.type_names.push_back(entry.type_name);
            }
            f.explanation = fmt::format("Entry #{} ('{}') excluded from the graph: {}",
                                        i, entry.type_name, *problem);
            result.findings.push_back(std::move(f));
            continue;
        }

        auto existing = accepted_by_name.find(entry.type_name);
        if (existing != accepted_by_name.end()) {
            duplicate_seen = true;
            const ComponentEntry& kept = *accepted[accepted_by_id.at(existing->second)];

            Finding f;
            f.rule_id = rules::kDuplicateNodeId;
            f.severity = duplicate_severity;
            f.nodes.push_back(existing->second);
            f.type_names.push_back(kept.type_name);
            f.explanation = fmt::format(
                "'{}' registered more than once; entry #{} (module '{}', layer {}, role {}, dependencies: {}) ",
                entry.type_name, i, entry.module_path, layer_to_string(entry.layer),
                role_to_string(entry.role), describe_dependencies(entry.dependencies));
            f.explanation += options.duplicate_policy == DuplicatePolicy::FirstWins
                ? fmt::format("was discarded in favour of the first registration (module '{}')", kept.module_path)
                : std::string("makes the build fail");
            result.findings.push_back(std::move(f));
            continue;
        }

        // Distinct names sharing a hash: move to the next free id
        const NodeId hashed = NodeId::from_type_name(entry.type_name);
        NodeId id = hashed;
        while (!id.is_valid() || accepted_by_id.count(id) != 0) {
            id = NodeId(id.value() + 1);
        }
        if (id != hashed) {
            auto holder = accepted_by_id.find(hashed);
            const std::string holder_name = holder != accepted_by_id.end()
                ? accepted[holder->second]->type_name : std::string();

            Finding f;
            f.rule_id = rules::kNodeIdCollision;
            f.severity = Severity::Info;
            f.nodes = {hashed, id};
            f.type_names = {holder_name, entry.type_name};
            f.explanation = fmt::format("'{}' hashes to NodeId {}, already taken by '{}'; assigned {} instead",
                                        entry.type_name, hashed, holder_name, id);
            result.findings.push_back(std::move(f));
        }

        accepted_by_id.emplace(id, accepted.size());
        accepted_by_name.emplace(entry.type_name, id);
        accepted.push_back(&entry);
        nodes.push_back(GraphNode{id, entry.type_name, entry.layer, entry.role, entry.module_path});
    }

    if (duplicate_seen && options.duplicate_policy == DuplicatePolicy::FailBuild) {
        HEXGRAPH_LOG_DEBUG("Build rejected: duplicate node ids with policy '{}'",
                           duplicate_policy_to_string(options.duplicate_policy));
        result.status = BuildStatus::Rejected;
        result.graph = std::make_shared<Graph>();
        return result;
    }

    // Step 3: resolve dependency names
    std::vector<GraphEdge> edges;
    for (const ComponentEntry* entry : accepted) {
        const NodeId from = accepted_by_name.at(entry->type_name);
        std::unordered_set<std::string> seen;

        for (const auto& dependency : entry->dependencies) {
            if (!seen.insert(dependency).second) {
                Finding f;
                f.rule_id = rules::kDuplicateDependency;
                f.severity = Severity::Info;
                f.nodes.push_back(from);
                f.type_names = {entry->type_name, dependency};
                f.explanation = fmt::format("'{}' declares dependency '{}' more than once; one edge kept",
                                            entry->type_name, dependency);
                result.findings.push_back(std::move(f));
                continue;
            }

            if (dependency.empty() || is_blank(dependency)) {
                Finding f;
                f.rule_id = rules::kDanglingDependency;
                f.severity = dangling_severity;
                f.nodes.push_back(from);
                f.type_names = {entry->type_name, dependency};
                f.explanation = fmt::format("'{}' declares a dependency with an empty name", entry->type_name);
                result.findings.push_back(std::move(f));
                continue;
            }

            auto target = accepted_by_name.find(dependency);
            if (target == accepted_by_name.end()) {
                Finding f;
                f.rule_id = rules::kDanglingDependency;
                f.severity = dangling_severity;
                f.nodes.push_back(from);
                f.type_names = {entry->type_name, dependency};
                f.explanation = fmt::format("'{}' depends on '{}', which is not a registered component",
                                            entry->type_name, dependency);
                result.findings.push_back(std::move(f));
                continue;
            }

            edges.push_back(GraphEdge{from, target->second, Relationship::DependsOn});
        }
    }

    // Steps 4 and 5: indices and freeze
    const size_t node_count = nodes.size();
    const size_t edge_count = edges.size();
    result.graph = std::make_shared<Graph>(Graph::BuildKey(), options.metadata, std::move(nodes), std::move(edges));

    HEXGRAPH_LOG_DEBUG("Built graph from {} entries: {} nodes, {} edges, {} build findings",
                       entries.size(), node_count, edge_count, result.findings.size());
    return result;
}

} // namespace hexgraph
