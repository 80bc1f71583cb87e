/*
 * File:        command_validate.cpp
 * Module:      hexgraph-cli
 * Purpose:     Build and validate command
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "command_validate.h"
#include "command_export.h"
#include "architecture_engine.h"
#include "engine_config.h"
#include "intent_inference.h"
#include "manifest_loader.h"
#include "logging.h"

#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

namespace hexgraph {
namespace cli {

std::optional<FailOn> parse_fail_on(const std::string& name) {
    if (name == "violation") return FailOn::Violation;
    if (name == "warning") return FailOn::Warning;
    if (name == "never") return FailOn::Never;
    return std::nullopt;
}

bool fails_on(FailOn fail_on, Severity severity) {
    switch (fail_on) {
        case FailOn::Violation: return severity == Severity::Violation;
        case FailOn::Warning: return severity == Severity::Violation || severity == Severity::Warning;
        case FailOn::Never: return false;
    }
    return false;
}

static void print_findings(std::ostream& os, const std::string& heading, const std::vector<Finding>& findings) {
    if (findings.empty()) {
        return;
    }
    os << heading << ":\n";
    for (const auto& finding : findings) {
        os << "  " << finding.to_string() << "\n";
    }
}

int validate_command(const ValidateOptions& options) {
    if (!fs::exists(options.manifest_path)) {
        HEXGRAPH_LOG_ERROR("Manifest file not found: {}", options.manifest_path);
        return 1;
    }

    // Configuration
    EngineConfig config;
    if (!options.config_path.empty()) {
        try {
            config = load_engine_config(options.config_path);
        } catch (const ConfigError& e) {
            HEXGRAPH_LOG_ERROR("{}", e.what());
            return 1;
        }
        if (options.log_level.empty()) {
            set_log_level(config.log_level);
        }
        HEXGRAPH_LOG_INFO("Configuration loaded: {}", options.config_path);
    }
    if (options.strict) {
        config.strict = true;
    }

    // Registration, construction and validation
    ArchitectureEngine engine(config);
    engine.add_module(manifest_module(options.manifest_path));

    SnapshotPtr snapshot;
    try {
        snapshot = engine.rebuild();
    } catch (const RegistryError& e) {
        HEXGRAPH_LOG_ERROR("Failed to load components: {}", e.what());
        return 1;
    }

    const Graph& graph = *snapshot->graph;
    const bool exporting_to_stdout = !options.export_format.empty() && options.output_path.empty();
    std::ostream& report = exporting_to_stdout ? std::cerr : std::cout;

    if (snapshot->status == BuildStatus::Rejected) {
        report << "Build rejected by duplicate policy '"
               << duplicate_policy_to_string(config.duplicate_policy) << "'\n";
    } else {
        report << graph.metadata().description << ": " << graph.node_count() << " components, "
               << graph.edge_count() << " dependencies, " << graph.layer_count() << " layers\n";

        const auto patterns = IntentInference(graph).identify_patterns();
        if (!patterns.empty()) {
            report << "Patterns:";
            for (size_t i = 0; i < patterns.size(); ++i) {
                report << (i == 0 ? " " : ", ") << describe_pattern(patterns[i]);
            }
            report << "\n";
        }
    }

    print_findings(report, "Build findings", snapshot->build_findings);
    print_findings(report, "Validation findings", snapshot->validation_findings);

    const auto findings = snapshot->all_findings();
    report << count_findings(findings, Severity::Violation) << " violation(s), "
           << count_findings(findings, Severity::Warning) << " warning(s), "
           << count_findings(findings, Severity::Info) << " info\n";
    report.flush();

    // Export
    if (!options.export_format.empty()) {
        if (snapshot->status == BuildStatus::Rejected) {
            HEXGRAPH_LOG_WARN("Skipping export of a rejected build");
        } else {
            ExportOptions export_options;
            export_options.format = options.export_format;
            export_options.output_path = options.output_path;
            const int export_status = export_command(export_options, graph);
            if (export_status != 0) {
                return export_status;
            }
        }
    }

    for (const auto& finding : findings) {
        if (fails_on(options.fail_on, finding.severity)) {
            return 2;
        }
    }
    return 0;
}

} // namespace cli
} // namespace hexgraph
