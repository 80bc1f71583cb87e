/*
 * File:        layer.cpp
 * Module:      hexgraph-core
 * Purpose:     Architectural layer helpers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "include/layer.h"
#include <algorithm>
#include <cctype>

namespace hexgraph {

int layer_rank(Layer layer) {
    switch (layer) {
        case Layer::Domain: return 0;
        case Layer::Port: return 1;
        case Layer::Application: return 2;
        case Layer::Adapter: return 3;
        case Layer::Infrastructure: return 4;
        case Layer::Unknown: return -1;
    }
    return -1;
}

bool is_known_layer(Layer layer) {
    return layer_rank(layer) >= 0;
}

std::string layer_to_string(Layer layer) {
    switch (layer) {
        case Layer::Domain: return "Domain";
        case Layer::Port: return "Port";
        case Layer::Adapter: return "Adapter";
        case Layer::Application: return "Application";
        case Layer::Infrastructure: return "Infrastructure";
        case Layer::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::optional<Layer> parse_layer(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (Layer layer : kAllLayers) {
        std::string candidate = layer_to_string(layer);
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == lower) {
            return layer;
        }
    }
    return std::nullopt;
}

} // namespace hexgraph
