/*
 * File:        finding.cpp
 * Module:      hexgraph-core
 * Purpose:     Finding helpers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "finding.h"
#include <algorithm>
#include <iterator>

namespace hexgraph {

std::string severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Violation: return "violation";
    }
    return "info";
}

std::string Finding::to_string() const {
    return fmt::format("[{}] {}: {}", severity_to_string(severity), rule_id, explanation);
}

size_t count_findings(const std::vector<Finding>& findings, Severity severity) {
    return static_cast<size_t>(std::count_if(findings.begin(), findings.end(),
        [severity](const Finding& f) { return f.severity == severity; }));
}

size_t count_findings(const std::vector<Finding>& findings, const std::string& rule_id) {
    return static_cast<size_t>(std::count_if(findings.begin(), findings.end(),
        [&rule_id](const Finding& f) { return f.rule_id == rule_id; }));
}

std::vector<Finding> filter_findings(const std::vector<Finding>& findings, const std::string& rule_id) {
    std::vector<Finding> result;
    std::copy_if(findings.begin(), findings.end(), std::back_inserter(result),
        [&rule_id](const Finding& f) { return f.rule_id == rule_id; });
    return result;
}

bool has_findings_at_least(const std::vector<Finding>& findings, Severity severity) {
    return std::any_of(findings.begin(), findings.end(),
        [severity](const Finding& f) { return f.severity >= severity; });
}

} // namespace hexgraph
