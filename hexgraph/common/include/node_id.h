/*
 * File:        node_id.h
 * Module:      hexgraph-common
 * Purpose:     NodeId type definition for graph nodes
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <cstdint>
#include <string>
#include <functional>
#include <fmt/format.h>

namespace hexgraph {

/**
 * @brief NodeId - Stable identifier for nodes in the architecture graph
 *
 * Derived from a component's type name with the djb2 string hash, so the
 * same type name always yields the same id across builds and processes.
 *
 * Properties:
 * - Deterministic (no registration-order dependency)
 * - Efficient for use as map keys
 * - Value 0 is reserved as the invalid id
 */
class NodeId {
public:
    using value_type = uint64_t;

    // Default constructor creates an invalid ID
    constexpr NodeId() noexcept : id_(0) {}

    // Construct from a raw hash value
    constexpr explicit NodeId(value_type id) noexcept : id_(id) {}

    /**
     * @brief Derive the id of a component from its type name
     *
     * djb2: h = 5381, then h = h * 33 + byte for every byte (wrapping).
     */
    static NodeId from_type_name(const std::string& type_name) noexcept;

    // Get the underlying value
    constexpr value_type value() const noexcept { return id_; }

    // Check if ID is valid (non-zero)
    constexpr bool is_valid() const noexcept { return id_ != 0; }

    // 16 lower-case hex digits, or "invalid"
    std::string to_string() const;

    // Comparison operators
    constexpr bool operator==(const NodeId& other) const noexcept {
        return id_ == other.id_;
    }
    constexpr bool operator!=(const NodeId& other) const noexcept {
        return id_ != other.id_;
    }
    constexpr bool operator<(const NodeId& other) const noexcept {
        return id_ < other.id_;
    }
    constexpr bool operator<=(const NodeId& other) const noexcept {
        return id_ <= other.id_;
    }
    constexpr bool operator>(const NodeId& other) const noexcept {
        return id_ > other.id_;
    }
    constexpr bool operator>=(const NodeId& other) const noexcept {
        return id_ >= other.id_;
    }

private:
    value_type id_;
};

} // namespace hexgraph

// Hash function for NodeId to use in unordered_map/unordered_set
namespace std {
    template<>
    struct hash<hexgraph::NodeId> {
        size_t operator()(const hexgraph::NodeId& id) const noexcept {
            return std::hash<hexgraph::NodeId::value_type>{}(id.value());
        }
    };
}

// fmt formatter for NodeId
template <>
struct fmt::formatter<hexgraph::NodeId> : fmt::formatter<fmt::string_view> {
    auto format(const hexgraph::NodeId& id, format_context& ctx) const {
        const std::string text = id.to_string();
        return fmt::formatter<fmt::string_view>::format(fmt::string_view(text), ctx);
    }
};
