/******************************************************************************
 * test_exporters.cpp
 *
 * Unit tests for the graph exporters
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "graph_exporter.h"
#include "dot_exporter.h"
#include "mermaid_exporter.h"
#include "yaml_exporter.h"
#include "listing_exporter.h"
#include "graph_builder.h"
#include "manifest_loader.h"
#include <yaml-cpp/yaml.h>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace hexgraph;
namespace fs = std::filesystem;

static GraphPtr build_shop() {
    std::vector<ComponentEntry> entries = {
        ComponentEntry{"User", Layer::Domain, Role::Entity, "shop::domain", {}},
        ComponentEntry{"UserRepository", Layer::Port, Role::Repository, "shop::ports", {"User"}},
        ComponentEntry{"RegisterUser", Layer::Application, Role::UseCase, "shop::app",
                       {"UserRepository", "User"}},
        ComponentEntry{"PgUserRepository", Layer::Adapter, Role::Adapter, "shop::adapters",
                       {"UserRepository"}},
        ComponentEntry{"Clock", Layer::Infrastructure, Role::Service, "", {}}
    };
    return GraphBuilder::build(entries).graph;
}

static size_t count_lines_containing(const std::string& text, const std::string& needle) {
    std::istringstream stream(text);
    std::string line;
    size_t count = 0;
    while (std::getline(stream, line)) {
        if (line.find(needle) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

void test_dot_export() {
    auto graph = build_shop();
    DotExporter exporter;

    auto result = exporter.export_graph(*graph);
    assert(result.ok());
    assert(result.document.find("digraph hex_architecture {") == 0);
    assert(result.document.find("rankdir=TB;") != std::string::npos);
    assert(count_lines_containing(result.document, "fillcolor=") == graph->node_count());
    assert(count_lines_containing(result.document, "\" -> \"") == graph->edge_count());
    assert(result.document.find("\"User\" [label=\"User\\n(Entity)\", fillcolor=lightblue") != std::string::npos);
    assert(result.document.find("\"PgUserRepository\" -> \"UserRepository\" [label=\"DependsOn\"];")
           != std::string::npos);

    assert(DotExporter("LR").export_graph(*graph).document.find("rankdir=LR;") != std::string::npos);
    assert(exporter.file_extension() == "dot");

    std::cout << "test_dot_export: PASSED\n";
}

void test_dot_escaping() {
    auto graph = GraphBuilder::build(std::vector<ComponentEntry>{
        ComponentEntry{"Weird\"Name", Layer::Domain, Role::Entity, "", {}}
    }).graph;

    auto result = DotExporter().export_graph(*graph);
    assert(result.ok());
    assert(result.document.find("\"Weird\\\"Name\"") != std::string::npos);

    std::cout << "test_dot_escaping: PASSED\n";
}

void test_mermaid_export() {
    auto graph = build_shop();
    MermaidExporter exporter;

    auto result = exporter.export_graph(*graph);
    assert(result.ok());
    assert(result.document.find("graph TD\n") == 0);
    assert(count_lines_containing(result.document, "[\"") == graph->node_count());
    assert(count_lines_containing(result.document, "-->|DependsOn|") == graph->edge_count());

    const std::string user_id = "n" + NodeId::from_type_name("User").to_string();
    assert(result.document.find(user_id + "[\"User<br/>(Entity)\"]") != std::string::npos);

    // One class definition per populated layer
    assert(count_lines_containing(result.document, "classDef ") == graph->layer_count());

    std::cout << "test_mermaid_export: PASSED\n";
}

void test_yaml_export_round_trip() {
    auto graph = build_shop();

    auto result = YamlExporter().export_graph(*graph);
    assert(result.ok());

    YAML::Node root = YAML::Load(result.document);
    assert(root["graph"]["node_count"].as<size_t>() == graph->node_count());
    assert(root["graph"]["edge_count"].as<size_t>() == graph->edge_count());
    assert(root["graph"]["description"].as<std::string>() == graph->metadata().description);
    assert(root["edges"].size() == graph->edge_count());
    assert(root["edges"][0]["relation"].as<std::string>() == "DependsOn");

    // The components section is a manifest
    auto entries = parse_manifest(result.document);
    assert(entries.size() == graph->node_count());

    auto rebuilt = GraphBuilder::build(entries);
    assert(rebuilt.findings.empty());
    assert(rebuilt.graph->node_count() == graph->node_count());
    assert(rebuilt.graph->edge_count() == graph->edge_count());
    assert(rebuilt.graph->all_edges() == graph->all_edges());

    for (const auto& node : graph->all_nodes()) {
        auto copy = rebuilt.graph->node(node.id);
        assert(copy.has_value());
        assert(copy->type_name == node.type_name);
        assert(copy->layer == node.layer);
        assert(copy->role == node.role);
        assert(copy->module_path == node.module_path);
    }

    std::cout << "test_yaml_export_round_trip: PASSED\n";
}

void test_listing_export() {
    auto graph = build_shop();

    auto result = ListingExporter().export_graph(*graph);
    assert(result.ok());
    assert(result.document.find("Components:   5") != std::string::npos);
    assert(result.document.find("Dependencies: 4") != std::string::npos);
    assert(result.document.find("[Adapter]") != std::string::npos);
    assert(count_lines_containing(result.document, "    -> ") == graph->edge_count());

    std::cout << "test_listing_export: PASSED\n";
}

void test_empty_graph_export() {
    Graph empty;
    for (const auto& format : available_export_formats()) {
        auto exporter = make_exporter(format);
        assert(exporter);
        auto result = exporter->export_graph(empty);
        assert(result.ok());
        assert(!result.document.empty());
    }

    std::cout << "test_empty_graph_export: PASSED\n";
}

void test_make_exporter() {
    assert(make_exporter("dot")->format_name() == "DOT (GraphViz)");
    assert(make_exporter("mermaid")->file_extension() == "mmd");
    assert(make_exporter("yaml")->file_extension() == "yaml");
    assert(make_exporter("text")->file_extension() == "txt");
    assert(make_exporter("svg") == nullptr);
    assert(available_export_formats().size() == 4);

    std::cout << "test_make_exporter: PASSED\n";
}

void test_write_export() {
    auto graph = build_shop();
    DotExporter exporter;

    const fs::path dir = fs::temp_directory_path() / "hexgraph_test_exporters";
    fs::create_directories(dir);
    const fs::path path = dir / "shop.dot";

    auto result = write_export(exporter, *graph, path.string());
    assert(result.ok());

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    assert(contents.str() == result.document);

    // Unwritable location
    auto failed = write_export(exporter, *graph, (dir / "missing" / "shop.dot").string());
    assert(!failed.ok());
    assert(failed.code == ResultCode::ERROR_IO_ERROR);
    assert(!failed.error.empty());

    fs::remove_all(dir);

    std::cout << "test_write_export: PASSED\n";
}

int main() {
    std::cout << "Running exporter tests...\n\n";

    test_dot_export();
    test_dot_escaping();
    test_mermaid_export();
    test_yaml_export_round_trip();
    test_listing_export();
    test_empty_graph_export();
    test_make_exporter();
    test_write_export();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
