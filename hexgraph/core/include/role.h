/*
 * File:        role.h
 * Module:      hexgraph-core
 * Purpose:     Component roles
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
 * @brief Structural category of a component within its layer
 */
enum class Role {
    Entity,
    ValueObject,
    Repository,
    Adapter,
    Directive,
    Query,
    UseCase,
    Service,
    Aggregate,
    Other,
    Unknown     // Unrecognised value from a textual source; never valid in a graph
};

/// The legal roles, in declaration order
constexpr std::array<Role, 10> kAllRoles = {
    Role::Entity, Role::ValueObject, Role::Repository, Role::Adapter, Role::Directive,
    Role::Query, Role::UseCase, Role::Service, Role::Aggregate, Role::Other
};

/// True for the legal roles, false for Unknown and out-of-range values
bool is_known_role(Role role);

/// Canonical name ("Entity", "ValueObject", ...)
std::string role_to_string(Role role);

/// Parse a role name (case-insensitive); nullopt if unrecognised
std::optional<Role> parse_role(const std::string& name);

} // namespace hexgraph
