/*
 * File:        component_registry.h
 * Module:      hexgraph-core
 * Purpose:     Component metadata registration
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include "component_entry.h"
#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace hexgraph {

/**
 * @brief Exception thrown when registration is misused
 */
class RegistryError : public std::runtime_error {
public:
    explicit RegistryError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Restartable view over the entries of a registry
 *
 * Captures the entry count at the time it was taken; entries registered
 * afterwards are not visible. Iterating twice yields the same sequence.
 * Must not outlive the registry it was taken from.
 */
class EntryRange {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = ComponentEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = const ComponentEntry*;
        using reference = const ComponentEntry&;

        const_iterator() = default;
        const_iterator(const std::deque<ComponentEntry>* entries, size_t index)
            : entries_(entries), index_(index) {}

        reference operator*() const { return (*entries_)[index_]; }
        pointer operator->() const { return &(*entries_)[index_]; }

        const_iterator& operator++() { ++index_; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++index_; return tmp; }

        bool operator==(const const_iterator& other) const {
            return entries_ == other.entries_ && index_ == other.index_;
        }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        const std::deque<ComponentEntry>* entries_ = nullptr;
        size_t index_ = 0;
    };

    EntryRange(const std::deque<ComponentEntry>* entries, size_t count)
        : entries_(entries), count_(count) {}

    const_iterator begin() const { return const_iterator(entries_, 0); }
    const_iterator end() const { return const_iterator(entries_, count_); }

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    /// Materialize the range (used by the builder)
    std::vector<ComponentEntry> to_vector() const { return std::vector<ComponentEntry>(begin(), end()); }

private:
    const std::deque<ComponentEntry>* entries_;
    size_t count_;
};

/**
 * @brief Accumulates component entries during program initialization
 *
 * An explicit object passed through the initialization path rather than
 * global state. Registration is a single-writer phase ended by seal();
 * after that the registry is read-only.
 *
 * Usage:
 * ```cpp
 * ComponentRegistry registry;
 * register_modules(registry, {shop_domain_module(), shop_adapters_module()});
 * registry.seal();
 * auto result = GraphBuilder::build(registry.collect_all());
 * ```
 *
 * Thread safety: Not thread-safe during registration. Concurrent readers
 * are safe once sealed.
 */
class ComponentRegistry {
public:
    ComponentRegistry() = default;
    ComponentRegistry(const ComponentRegistry&) = delete;
    ComponentRegistry& operator=(const ComponentRegistry&) = delete;

    /**
     * @brief Append an entry
     *
     * Duplicate type names are accepted; the builder resolves them.
     *
     * @throws RegistryError if the registry has been sealed
     */
    void register_component(ComponentEntry entry);

    /**
     * @brief Every entry registered so far, as a restartable range
     */
    EntryRange collect_all() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /**
     * @brief End the registration phase
     */
    void seal() { sealed_ = true; }
    bool is_sealed() const { return sealed_; }

    /**
     * @brief Remove all entries and reopen registration (primarily for testing)
     */
    void clear();

private:
    // deque keeps element addresses stable while the registry grows
    std::deque<ComponentEntry> entries_;
    bool sealed_ = false;
};

/**
 * @brief A named contribution of components
 *
 * Each part of a program exposes one module whose initializer registers
 * that part's components; no central list of components is maintained.
 */
struct ComponentModule {
    using Initializer = std::function<void(ComponentRegistry&)>;

    std::string name;
    Initializer initializer;
};

/**
 * @brief Run every module's initializer against the registry, in order
 *
 * @throws RegistryError naming the module if an initializer fails
 */
void register_modules(ComponentRegistry& registry, const std::vector<ComponentModule>& modules);

} // namespace hexgraph
