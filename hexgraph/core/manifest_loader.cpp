/*
 * File:        manifest_loader.cpp
 * Module:      hexgraph-core
 * Purpose:     Component entries from YAML manifest files
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "manifest_loader.h"
#include "logging.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace hexgraph {

namespace {

// Scalar text of a node; empty for missing, null, list or map values
std::string scalar_or_empty(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return "";
    }
    return node.Scalar();
}

ComponentEntry entry_from_yaml(const YAML::Node& item) {
    ComponentEntry entry;
    if (!item.IsMap()) {
        return entry;  // Blank type_name, reported by the builder
    }

    entry.type_name = scalar_or_empty(item["type_name"]);
    entry.module_path = scalar_or_empty(item["module_path"]);

    auto layer = parse_layer(scalar_or_empty(item["layer"]));
    entry.layer = layer ? *layer : Layer::Unknown;

    auto role = parse_role(scalar_or_empty(item["role"]));
    entry.role = role ? *role : Role::Unknown;

    const YAML::Node deps = item["dependencies"];
    if (deps && deps.IsSequence()) {
        for (const auto& dep : deps) {
            entry.dependencies.push_back(scalar_or_empty(dep));
        }
    } else if (deps && deps.IsScalar()) {
        entry.dependencies.push_back(deps.Scalar());
    }

    return entry;
}

std::vector<ComponentEntry> entries_from_root(const YAML::Node& root, const std::string& source) {
    std::vector<ComponentEntry> entries;

    if (!root || root.IsNull()) {
        return entries;  // Empty document
    }
    if (!root.IsMap()) {
        throw ManifestError("Invalid manifest '" + source + "': top level must be a map");
    }

    const YAML::Node components = root["components"];
    if (!components || components.IsNull()) {
        return entries;
    }
    if (!components.IsSequence()) {
        throw ManifestError("Invalid manifest '" + source + "': 'components' must be a list");
    }

    entries.reserve(components.size());
    for (const auto& item : components) {
        entries.push_back(entry_from_yaml(item));
    }

    HEXGRAPH_LOG_DEBUG("Manifest '{}': {} component entr{}", source, entries.size(),
                       entries.size() == 1 ? "y" : "ies");
    return entries;
}

} // anonymous namespace

std::vector<ComponentEntry> parse_manifest(const std::string& text, const std::string& source) {
    YAML::Node root;

    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ManifestError("Failed to parse manifest '" + source + "': " + e.what());
    }

    return entries_from_root(root, source);
}

std::vector<ComponentEntry> load_manifest(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw ManifestError("Manifest file not found: " + path);
    }

    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile& e) {
        throw ManifestError("Cannot read manifest file '" + path + "': " + e.what());
    } catch (const YAML::Exception& e) {
        throw ManifestError("Failed to parse manifest '" + path + "': " + e.what());
    }

    return entries_from_root(root, path);
}

ComponentModule manifest_module(const std::string& path) {
    ComponentModule module;
    module.name = "manifest:" + path;
    module.initializer = [path](ComponentRegistry& registry) {
        for (auto& entry : load_manifest(path)) {
            registry.register_component(std::move(entry));
        }
    };
    return module;
}

} // namespace hexgraph
