/*
 * File:        architecture_engine.h
 * Module:      hexgraph-core
 * Purpose:     Composition root: registration, build and validation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "component_registry.h"
#include "engine_config.h"
#include "finding.h"
#include "graph.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hexgraph {

/**
 * @brief Result of one full rebuild
 *
 * Immutable once published. Holders keep the graph alive after later
 * rebuilds replace the engine's current snapshot.
 */
struct ArchitectureSnapshot {
    GraphPtr graph;
    BuildStatus status = BuildStatus::Built;
    std::vector<Finding> build_findings;
    std::vector<Finding> validation_findings;
    uint64_t generation = 0;            // 1 for the first rebuild

    /// Build findings followed by validation findings
    std::vector<Finding> all_findings() const;

    bool has_violations() const;
};

using SnapshotPtr = std::shared_ptr<const ArchitectureSnapshot>;

/**
 * @brief Owns the module list and produces architecture snapshots
 *
 * Nothing is built until rebuild() is called, and rebuild() is never
 * called implicitly. Each rebuild runs every module against a fresh
 * registry, seals it, builds the graph and validates it.
 *
 * current() and rebuild() may be called from different threads.
 *
 * Usage:
 * ```cpp
 * ArchitectureEngine engine(config);
 * engine.add_module(manifest_module("shop.yaml"));
 * auto snapshot = engine.rebuild();
 * ```
 */
class ArchitectureEngine {
public:
    explicit ArchitectureEngine(EngineConfig config = EngineConfig());

    ArchitectureEngine(const ArchitectureEngine&) = delete;
    ArchitectureEngine& operator=(const ArchitectureEngine&) = delete;

    /**
     * @brief Add a module; takes effect on the next rebuild
     *
     * @throws RegistryError if the initializer is empty
     */
    void add_module(ComponentModule module);
    void add_module(const std::string& name, ComponentModule::Initializer initializer);

    size_t module_count() const;

    /**
     * @brief Re-run registration and reconstruction from scratch
     *
     * Each call takes the next generation number when it reads the
     * module list. On success the new snapshot becomes current unless a
     * rebuild with a higher generation has already been published. On
     * failure the previous snapshot stays current and its generation
     * number is not reused.
     *
     * @throws RegistryError if a module initializer fails
     */
    SnapshotPtr rebuild();

    /// Latest snapshot, or nullptr before the first rebuild
    SnapshotPtr current() const;

    const EngineConfig& config() const { return config_; }

private:
    const EngineConfig config_;

    mutable std::mutex mutex_;          // Guards modules_, current_ and generation_
    std::vector<ComponentModule> modules_;
    SnapshotPtr current_;
    uint64_t generation_ = 0;
};

} // namespace hexgraph
