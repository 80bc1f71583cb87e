/*
 * File:        engine_config.cpp
 * Module:      hexgraph-core
 * Purpose:     Engine configuration file
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "engine_config.h"
#include "logging.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <filesystem>

namespace hexgraph {

namespace {

const std::vector<std::string> kLogLevels = {
    "trace", "debug", "info", "warn", "warning", "error", "critical", "off"
};

std::string scalar_value(const YAML::Node& node, const std::string& key, const std::string& source) {
    if (!node.IsScalar()) {
        throw ConfigError("Invalid configuration '" + source + "': '" + key + "' must be a single value");
    }
    return node.Scalar();
}

std::vector<std::string> list_value(const YAML::Node& node, const std::string& key, const std::string& source) {
    if (!node.IsSequence()) {
        throw ConfigError("Invalid configuration '" + source + "': '" + key + "' must be a list");
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        values.push_back(scalar_value(item, key, source));
    }
    return values;
}

void apply_engine_section(const YAML::Node& section, EngineConfig& config, const std::string& source) {
    if (section["description"]) {
        config.description = scalar_value(section["description"], "engine.description", source);
    }

    if (section["duplicate_policy"]) {
        const std::string name = scalar_value(section["duplicate_policy"], "engine.duplicate_policy", source);
        auto policy = parse_duplicate_policy(name);
        if (!policy) {
            throw ConfigError("Invalid configuration '" + source + "': unknown duplicate_policy '" + name +
                              "'. Valid values are: first_wins, fail_build");
        }
        config.duplicate_policy = *policy;
    }

    if (section["strict"]) {
        config.strict = section["strict"].as<bool>();
    }
}

void apply_validation_section(const YAML::Node& section, EngineConfig& config, const std::string& source) {
    if (section["expected_layers"]) {
        std::vector<Layer> layers;
        for (const auto& name : list_value(section["expected_layers"], "validation.expected_layers", source)) {
            auto layer = parse_layer(name);
            if (!layer || !is_known_layer(*layer)) {
                throw ConfigError("Invalid configuration '" + source + "': unknown layer '" + name + "'");
            }
            layers.push_back(*layer);
        }
        config.validation.expected_layers = layers;
    }

    if (section["god_component_threshold"]) {
        const int threshold = section["god_component_threshold"].as<int>();
        if (threshold < 0) {
            throw ConfigError("Invalid configuration '" + source +
                              "': god_component_threshold must not be negative");
        }
        config.validation.god_component_threshold = static_cast<size_t>(threshold);
    }

    if (section["disabled_rules"]) {
        const auto& known = builtin_rule_ids();
        for (const auto& rule_id : list_value(section["disabled_rules"], "validation.disabled_rules", source)) {
            if (std::find(known.begin(), known.end(), rule_id) == known.end()) {
                throw ConfigError("Invalid configuration '" + source + "': unknown rule '" + rule_id + "'");
            }
            config.validation.disabled_rules.insert(rule_id);
        }
    }
}

void apply_logging_section(const YAML::Node& section, EngineConfig& config, const std::string& source) {
    if (section["level"]) {
        const std::string level = scalar_value(section["level"], "logging.level", source);
        if (std::find(kLogLevels.begin(), kLogLevels.end(), level) == kLogLevels.end()) {
            throw ConfigError("Invalid configuration '" + source + "': unknown log level '" + level + "'");
        }
        config.log_level = level;
    }
}

EngineConfig config_from_root(const YAML::Node& root, const std::string& source) {
    EngineConfig config;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Invalid configuration '" + source + "': top level must be a map");
    }

    try {
        if (root["engine"]) {
            apply_engine_section(root["engine"], config, source);
        }
        if (root["validation"]) {
            apply_validation_section(root["validation"], config, source);
        }
        if (root["logging"]) {
            apply_logging_section(root["logging"], config, source);
        }
    } catch (const YAML::Exception& e) {
        // Type conversion failures (e.g. strict: maybe)
        throw ConfigError("Invalid configuration '" + source + "': " + e.what());
    }

    HEXGRAPH_LOG_DEBUG("Configuration '{}': policy={}, strict={}, {} disabled rule(s)", source,
                       duplicate_policy_to_string(config.duplicate_policy), config.strict,
                       config.validation.disabled_rules.size());
    return config;
}

} // anonymous namespace

BuildOptions EngineConfig::build_options() const {
    BuildOptions options;
    options.duplicate_policy = duplicate_policy;
    options.strict = strict;
    options.metadata.description = description;
    return options;
}

EngineConfig parse_engine_config(const std::string& text, const std::string& source) {
    YAML::Node root;

    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse configuration '" + source + "': " + e.what());
    }

    return config_from_root(root, source);
}

EngineConfig load_engine_config(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("Configuration file not found: " + path);
    }

    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse configuration '" + path + "': " + e.what());
    }

    return config_from_root(root, path);
}

} // namespace hexgraph
