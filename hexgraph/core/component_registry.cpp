/*
 * File:        component_registry.cpp
 * Module:      hexgraph-core
 * Purpose:     Component metadata registration
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "component_registry.h"
#include "logging.h"

namespace hexgraph {

void ComponentRegistry::register_component(ComponentEntry entry) {
    if (sealed_) {
        throw RegistryError("Registry is sealed, cannot register component: " + entry.type_name);
    }
    entries_.push_back(std::move(entry));
}

EntryRange ComponentRegistry::collect_all() const {
    return EntryRange(&entries_, entries_.size());
}

void ComponentRegistry::clear() {
    entries_.clear();
    sealed_ = false;
}

void register_modules(ComponentRegistry& registry, const std::vector<ComponentModule>& modules) {
    for (const auto& module : modules) {
        if (!module.initializer) {
            throw RegistryError("Module '" + module.name + "' has no initializer");
        }

        const size_t before = registry.size();
        try {
            module.initializer(registry);
        } catch (const RegistryError&) {
            throw;
        } catch (const std::exception& e) {
            throw RegistryError("Module '" + module.name + "' failed to register: " + e.what());
        }

        HEXGRAPH_LOG_DEBUG("Module '{}' registered {} component(s)", module.name, registry.size() - before);
    }
}

} // namespace hexgraph
