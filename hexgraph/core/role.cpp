/*
 * File:        role.cpp
 * Module:      hexgraph-core
 * Purpose:     Component role helpers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "include/role.h"
#include <algorithm>
#include <cctype>

namespace hexgraph {

static std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_known_role(Role role) {
    return std::find(kAllRoles.begin(), kAllRoles.end(), role) != kAllRoles.end();
}

std::string role_to_string(Role role) {
    switch (role) {
        case Role::Entity: return "Entity";
        case Role::ValueObject: return "ValueObject";
        case Role::Repository: return "Repository";
        case Role::Adapter: return "Adapter";
        case Role::Directive: return "Directive";
        case Role::Query: return "Query";
        case Role::UseCase: return "UseCase";
        case Role::Service: return "Service";
        case Role::Aggregate: return "Aggregate";
        case Role::Other: return "Other";
        case Role::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::optional<Role> parse_role(const std::string& name) {
    const std::string lower = to_lower(name);
    for (Role role : kAllRoles) {
        if (to_lower(role_to_string(role)) == lower) {
            return role;
        }
    }
    return std::nullopt;
}

} // namespace hexgraph
