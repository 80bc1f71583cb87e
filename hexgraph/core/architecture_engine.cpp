/*
 * File:        architecture_engine.cpp
 * Module:      hexgraph-core
 * Purpose:     Composition root: registration, build and validation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "architecture_engine.h"
#include "graph_builder.h"
#include "validation_engine.h"
#include "logging.h"

namespace hexgraph {

std::vector<Finding> ArchitectureSnapshot::all_findings() const {
    std::vector<Finding> findings = build_findings;
    findings.insert(findings.end(), validation_findings.begin(), validation_findings.end());
    return findings;
}

bool ArchitectureSnapshot::has_violations() const {
    return has_findings_at_least(build_findings, Severity::Violation) ||
           has_findings_at_least(validation_findings, Severity::Violation);
}

ArchitectureEngine::ArchitectureEngine(EngineConfig config)
    : config_(std::move(config)) {}

void ArchitectureEngine::add_module(ComponentModule module) {
    if (!module.initializer) {
        throw RegistryError("Module '" + module.name + "' has no initializer");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    modules_.push_back(std::move(module));
}

void ArchitectureEngine::add_module(const std::string& name, ComponentModule::Initializer initializer) {
    ComponentModule module;
    module.name = name;
    module.initializer = std::move(initializer);
    add_module(std::move(module));
}

size_t ArchitectureEngine::module_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modules_.size();
}

SnapshotPtr ArchitectureEngine::rebuild() {
    // The generation is fixed when the module list is read, so a slow
    // rebuild cannot publish over one that started after it
    std::vector<ComponentModule> modules;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        modules = modules_;
        generation = ++generation_;
    }

    HEXGRAPH_LOG_DEBUG("Rebuilding architecture graph from {} module(s)", modules.size());

    // Registration
    ComponentRegistry registry;
    register_modules(registry, modules);
    registry.seal();

    // Construction
    BuildResult build = GraphBuilder::build(registry.collect_all(), config_.build_options());

    auto snapshot = std::make_shared<ArchitectureSnapshot>();
    snapshot->generation = generation;
    snapshot->graph = build.graph;
    snapshot->status = build.status;
    snapshot->build_findings = std::move(build.findings);

    // Validation
    if (!build.rejected()) {
        auto validator = ValidationEngine::with_default_rules(config_.validation);
        snapshot->validation_findings = validator.run(*snapshot->graph);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_ || current_->generation < snapshot->generation) {
            current_ = snapshot;
        } else {
            HEXGRAPH_LOG_DEBUG("Generation {} finished after generation {}; not published",
                               snapshot->generation, current_->generation);
        }
    }

    HEXGRAPH_LOG_DEBUG("Generation {}: {} node(s), {} edge(s), {} build finding(s), {} validation finding(s)",
                       snapshot->generation, snapshot->graph->node_count(), snapshot->graph->edge_count(),
                       snapshot->build_findings.size(), snapshot->validation_findings.size());
    return snapshot;
}

SnapshotPtr ArchitectureEngine::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

} // namespace hexgraph
