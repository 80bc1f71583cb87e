/******************************************************************************
 * test_intent_inference.cpp
 *
 * Unit tests for IntentInference
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "intent_inference.h"
#include "graph_builder.h"
#include <cassert>
#include <iostream>

using namespace hexgraph;

static GraphPtr build(std::vector<ComponentEntry> entries) {
    return GraphBuilder::build(entries).graph;
}

static ComponentEntry entry(const std::string& name, Layer layer, Role role) {
    return ComponentEntry{name, layer, role, "", {}};
}

void test_empty_graph() {
    auto graph = build({});
    assert(IntentInference(*graph).identify_patterns().empty());

    auto plain = build({entry("User", Layer::Domain, Role::Entity)});
    assert(IntentInference(*plain).identify_patterns().empty());

    std::cout << "test_empty_graph: PASSED\n";
}

void test_repository_pattern() {
    auto graph = build({
        entry("UserRepository", Layer::Port, Role::Repository),
        entry("User", Layer::Domain, Role::Entity),
        entry("OrderRepository", Layer::Port, Role::Repository)
    });

    auto patterns = IntentInference(*graph).identify_patterns();
    assert(patterns.size() == 1);

    const auto* repository = std::get_if<RepositoryPattern>(&patterns[0]);
    assert(repository);
    assert(repository->count == 2);
    assert(repository->repositories.size() == 2);
    assert(repository->repositories[0] == NodeId::from_type_name("UserRepository"));
    assert(repository->repositories[1] == NodeId::from_type_name("OrderRepository"));
    assert(describe_pattern(patterns[0]) == "Repository (2)");

    std::cout << "test_repository_pattern: PASSED\n";
}

void test_cqrs_pattern() {
    // Queries alone are enough
    auto queries = build({entry("ListOrders", Layer::Application, Role::Query)});
    auto patterns = IntentInference(*queries).identify_patterns();
    assert(patterns.size() == 1);
    const auto* cqrs = std::get_if<CqrsPattern>(&patterns[0]);
    assert(cqrs);
    assert(cqrs->directive_count == 0);
    assert(cqrs->query_count == 1);

    auto both = build({
        entry("PlaceOrder", Layer::Application, Role::Directive),
        entry("CancelOrder", Layer::Application, Role::Directive),
        entry("ListOrders", Layer::Application, Role::Query)
    });
    patterns = IntentInference(*both).identify_patterns();
    assert(patterns.size() == 1);
    cqrs = std::get_if<CqrsPattern>(&patterns[0]);
    assert(cqrs->directive_count == 2);
    assert(cqrs->query_count == 1);
    assert(describe_pattern(patterns[0]) == "CQRS (2 directive, 1 query)");

    std::cout << "test_cqrs_pattern: PASSED\n";
}

void test_pattern_order() {
    auto graph = build({
        entry("ListOrders", Layer::Application, Role::Query),
        entry("OrderRepository", Layer::Port, Role::Repository)
    });

    auto patterns = IntentInference(*graph).identify_patterns();
    assert(patterns.size() == 2);
    assert(std::holds_alternative<RepositoryPattern>(patterns[0]));
    assert(std::holds_alternative<CqrsPattern>(patterns[1]));

    std::cout << "test_pattern_order: PASSED\n";
}

int main() {
    std::cout << "Running intent inference tests...\n\n";

    test_empty_graph();
    test_repository_pattern();
    test_cqrs_pattern();
    test_pattern_order();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
