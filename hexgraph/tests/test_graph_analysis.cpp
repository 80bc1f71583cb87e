/******************************************************************************
 * test_graph_analysis.cpp
 *
 * Unit tests for GraphAnalysis
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "graph_analysis.h"
#include "graph_builder.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using namespace hexgraph;

static GraphPtr build(std::vector<ComponentEntry> entries) {
    return GraphBuilder::build(entries).graph;
}

static ComponentEntry domain(const std::string& name, std::vector<std::string> deps = {}) {
    return ComponentEntry{name, Layer::Domain, Role::Entity, "", std::move(deps)};
}

void test_no_cycles() {
    auto graph = build({domain("A", {"B"}), domain("B", {"C"}), domain("C")});
    assert(GraphAnalysis(*graph).detect_cycles().empty());

    std::cout << "test_no_cycles: PASSED\n";
}

void test_three_node_cycle() {
    auto graph = build({domain("A", {"B"}), domain("B", {"C"}), domain("C", {"A"})});

    auto cycles = GraphAnalysis(*graph).detect_cycles();
    assert(cycles.size() == 1);
    assert(cycles[0].size() == 3);
    assert(cycles[0][0] == NodeId::from_type_name("A"));
    assert(cycles[0][1] == NodeId::from_type_name("B"));
    assert(cycles[0][2] == NodeId::from_type_name("C"));

    std::cout << "test_three_node_cycle: PASSED\n";
}

void test_self_loop_cycle() {
    auto graph = build({domain("Loop", {"Loop"}), domain("Other")});

    auto cycles = GraphAnalysis(*graph).detect_cycles();
    assert(cycles.size() == 1);
    assert(cycles[0].size() == 1);
    assert(cycles[0][0] == NodeId::from_type_name("Loop"));

    std::cout << "test_self_loop_cycle: PASSED\n";
}

void test_two_independent_cycles() {
    auto graph = build({
        domain("A", {"B"}), domain("B", {"A"}),
        domain("X", {"Y"}), domain("Y", {"X"}),
        domain("Z", {"A"})
    });

    auto cycles = GraphAnalysis(*graph).detect_cycles();
    assert(cycles.size() == 2);
    assert(cycles[0].size() == 2);
    assert(cycles[1].size() == 2);

    std::cout << "test_two_independent_cycles: PASSED\n";
}

void test_long_chain() {
    const size_t length = 100000;
    std::vector<ComponentEntry> entries;
    entries.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        std::vector<std::string> deps;
        if (i + 1 < length) {
            deps.push_back("N" + std::to_string(i + 1));
        }
        entries.push_back(domain("N" + std::to_string(i), deps));
    }

    auto chain = build(entries);
    assert(chain->node_count() == length);
    assert(chain->edge_count() == length - 1);
    assert(GraphAnalysis(*chain).detect_cycles().empty());

    // Closing the chain gives one cycle through every node, in chain order
    entries.back().dependencies.push_back("N0");
    auto ring = build(entries);
    auto cycles = GraphAnalysis(*ring).detect_cycles();
    assert(cycles.size() == 1);
    assert(cycles[0].size() == length);
    assert(cycles[0].front() == NodeId::from_type_name("N0"));
    assert(cycles[0].back() == NodeId::from_type_name("N" + std::to_string(length - 1)));

    std::cout << "test_long_chain: PASSED\n";
}

void test_coupling() {
    auto graph = build({domain("Core"), domain("A", {"Core"}), domain("B", {"Core", "A"}), domain("Lonely")});
    GraphAnalysis analysis(*graph);

    auto core = analysis.coupling(NodeId::from_type_name("Core"));
    assert(core.has_value());
    assert(core->afferent == 2);
    assert(core->efferent == 0);
    assert(core->instability == 0.0);

    auto b = analysis.coupling(NodeId::from_type_name("B"));
    assert(b->afferent == 0);
    assert(b->efferent == 2);
    assert(b->instability == 1.0);

    auto a = analysis.coupling(NodeId::from_type_name("A"));
    assert(std::fabs(a->instability - 0.5) < 1e-9);

    auto lonely = analysis.coupling(NodeId::from_type_name("Lonely"));
    assert(lonely->instability == 0.0);

    assert(!analysis.coupling(NodeId::from_type_name("Missing")).has_value());

    std::cout << "test_coupling: PASSED\n";
}

void test_roots_and_leaves() {
    auto graph = build({domain("Core"), domain("A", {"Core"}), domain("B", {"A"})});
    GraphAnalysis analysis(*graph);

    auto leaves = analysis.leaf_nodes();
    assert(leaves.size() == 1);
    assert(leaves[0].type_name == "Core");

    auto roots = analysis.root_nodes();
    assert(roots.size() == 1);
    assert(roots[0].type_name == "B");

    std::cout << "test_roots_and_leaves: PASSED\n";
}

int main() {
    std::cout << "Running graph analysis tests...\n\n";

    test_no_cycles();
    test_three_node_cycle();
    test_self_loop_cycle();
    test_two_independent_cycles();
    test_long_chain();
    test_coupling();
    test_roots_and_leaves();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
