/*
 * File:        node_id.cpp
 * Module:      hexgraph-common
 * Purpose:     NodeId implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "include/node_id.h"

namespace hexgraph {

NodeId NodeId::from_type_name(const std::string& type_name) noexcept {
    value_type hash = 5381;
    for (unsigned char byte : type_name) {
        hash = hash * 33 + static_cast<value_type>(byte);
    }
    return NodeId(hash);
}

std::string NodeId::to_string() const {
    if (!is_valid()) {
        return "invalid";
    }
    return fmt::format("{:016x}", id_);
}

} // namespace hexgraph
