/*
 * File:        intent_inference.cpp
 * Module:      hexgraph-core
 * Purpose:     Detection of architectural patterns from node roles
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "intent_inference.h"
#include "graph_query.h"
#include <fmt/format.h>

namespace hexgraph {

std::string describe_pattern(const ArchitecturalPattern& pattern) {
    if (const auto* repository = std::get_if<RepositoryPattern>(&pattern)) {
        return fmt::format("Repository ({})", repository->count);
    }
    const auto& cqrs = std::get<CqrsPattern>(pattern);
    return fmt::format("CQRS ({} directive, {} query)", cqrs.directive_count, cqrs.query_count);
}

std::vector<ArchitecturalPattern> IntentInference::identify_patterns() const {
    std::vector<ArchitecturalPattern> patterns;

    RepositoryPattern repository;
    for (const auto& node : GraphQuery(graph_).role(Role::Repository).execute()) {
        repository.repositories.push_back(node.id);
    }
    repository.count = repository.repositories.size();
    if (repository.count > 0) {
        patterns.emplace_back(std::move(repository));
    }

    CqrsPattern cqrs;
    cqrs.directive_count = GraphQuery(graph_).role(Role::Directive).count();
    cqrs.query_count = GraphQuery(graph_).role(Role::Query).count();
    if (cqrs.directive_count > 0 || cqrs.query_count > 0) {
        patterns.emplace_back(cqrs);
    }

    return patterns;
}

} // namespace hexgraph
