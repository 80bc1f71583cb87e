/*
 * File:        layer.h
 * Module:      hexgraph-core
 * Purpose:     Architectural layers and their ranks
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <array>
#include <optional>
#include <string>

namespace hexgraph {

/**
 * @brief Architectural tier of a component
 *
 * Expresses the distance of a component from the core business logic.
 * Declaration order is not the dependency order; see layer_rank().
 */
enum class Layer {
    /// Business entities, value objects, aggregates
    Domain,

    /// Interfaces the domain exposes or requires (repositories, gateways)
    Port,

    /// Concrete implementations of ports (databases, HTTP clients)
    Adapter,

    /// Use cases and orchestration of the domain
    Application,

    /// Wiring, configuration, frameworks
    Infrastructure,

    /// Unrecognised value from a textual source; never valid in a graph
    Unknown
};

/// The five legal layers, in declaration order
constexpr std::array<Layer, 5> kAllLayers = {
    Layer::Domain, Layer::Port, Layer::Adapter, Layer::Application, Layer::Infrastructure
};

/**
 * @brief Inward ordering used by dependency direction validation
 *
 * Domain 0, Port 1, Application 2, Adapter 3, Infrastructure 4.
 * A dependency is legal when rank(to) <= rank(from).
 *
 * @return Rank, or -1 for Unknown and out-of-range values
 */
int layer_rank(Layer layer);

/// True for the five legal layers, false for Unknown and out-of-range values
bool is_known_layer(Layer layer);

/// Canonical name ("Domain", "Port", ...)
std::string layer_to_string(Layer layer);

/// Parse a layer name (case-insensitive); nullopt if unrecognised
std::optional<Layer> parse_layer(const std::string& name);

} // namespace hexgraph
