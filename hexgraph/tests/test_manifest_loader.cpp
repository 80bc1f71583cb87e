/******************************************************************************
 * test_manifest_loader.cpp
 *
 * Unit tests for YAML component manifests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "manifest_loader.h"
#include "graph_builder.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace hexgraph;
namespace fs = std::filesystem;

static const char* kShopManifest = R"(
components:
  - type_name: User
    layer: Domain
    role: Entity
    module_path: shop::domain
  - type_name: UserRepository
    layer: Port
    role: Repository
    module_path: shop::ports
    dependencies: [User]
  - type_name: InMemoryUserRepository
    layer: adapter
    role: adapter
    dependencies:
      - UserRepository
)";

static fs::path write_temp_file(const std::string& name, const std::string& contents) {
    const fs::path dir = fs::temp_directory_path() / "hexgraph_test_manifest";
    fs::create_directories(dir);
    const fs::path path = dir / name;
    std::ofstream file(path);
    file << contents;
    return path;
}

void test_parse_manifest() {
    auto entries = parse_manifest(kShopManifest);
    assert(entries.size() == 3);

    assert(entries[0].type_name == "User");
    assert(entries[0].layer == Layer::Domain);
    assert(entries[0].role == Role::Entity);
    assert(entries[0].module_path == "shop::domain");
    assert(entries[0].dependencies.empty());

    assert(entries[1].dependencies.size() == 1);
    assert(entries[1].dependencies[0] == "User");

    // Case-insensitive enumerators, block list
    assert(entries[2].layer == Layer::Adapter);
    assert(entries[2].role == Role::Adapter);
    assert(entries[2].module_path.empty());
    assert(entries[2].dependencies.size() == 1);

    auto result = GraphBuilder::build(entries);
    assert(result.graph->node_count() == 3);
    assert(result.graph->edge_count() == 2);
    assert(result.findings.empty());

    std::cout << "test_parse_manifest: PASSED\n";
}

void test_unrecognised_values_become_malformed() {
    auto entries = parse_manifest(R"(
components:
  - type_name: Mystery
    layer: Presentation
    role: Entity
  - layer: Domain
    role: Entity
  - type_name: Thing
    layer: Domain
    role: Widget
  - just a string
  - type_name: Single
    layer: Domain
    role: Other
    dependencies: Mystery
)");

    assert(entries.size() == 5);
    assert(entries[0].layer == Layer::Unknown);
    assert(entries[1].type_name.empty());
    assert(entries[2].role == Role::Unknown);
    assert(entries[3].type_name.empty());
    assert(entries[4].dependencies.size() == 1);
    assert(entries[4].dependencies[0] == "Mystery");

    auto result = GraphBuilder::build(entries);
    assert(result.graph->node_count() == 1);
    assert(count_findings(result.findings, rules::kMalformedEntry) == 4);
    assert(count_findings(result.findings, rules::kDanglingDependency) == 1);

    std::cout << "test_unrecognised_values_become_malformed: PASSED\n";
}

void test_empty_manifests() {
    assert(parse_manifest("").empty());
    assert(parse_manifest("components:\n").empty());
    assert(parse_manifest("other: 1\n").empty());

    std::cout << "test_empty_manifests: PASSED\n";
}

void test_invalid_manifests() {
    bool threw = false;
    try {
        parse_manifest("components: [unclosed", "broken.yaml");
    } catch (const ManifestError& e) {
        threw = true;
        assert(std::string(e.what()).find("broken.yaml") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        parse_manifest("components:\n  type_name: User\n");
    } catch (const ManifestError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        parse_manifest("- a\n- b\n");
    } catch (const ManifestError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_invalid_manifests: PASSED\n";
}

void test_load_manifest_file() {
    const fs::path path = write_temp_file("shop.yaml", kShopManifest);

    auto entries = load_manifest(path.string());
    assert(entries.size() == 3);

    bool threw = false;
    try {
        load_manifest((path.parent_path() / "absent.yaml").string());
    } catch (const ManifestError& e) {
        threw = true;
        assert(std::string(e.what()).find("absent.yaml") != std::string::npos);
    }
    assert(threw);

    fs::remove_all(path.parent_path());

    std::cout << "test_load_manifest_file: PASSED\n";
}

void test_manifest_module() {
    const fs::path path = write_temp_file("module.yaml", kShopManifest);

    ComponentRegistry registry;
    register_modules(registry, {manifest_module(path.string())});
    assert(registry.size() == 3);

    // A missing file fails registration with the module named
    ComponentRegistry other;
    bool threw = false;
    try {
        register_modules(other, {manifest_module((path.parent_path() / "gone.yaml").string())});
    } catch (const RegistryError& e) {
        threw = true;
        assert(std::string(e.what()).find("manifest:") != std::string::npos);
    }
    assert(threw);

    fs::remove_all(path.parent_path());

    std::cout << "test_manifest_module: PASSED\n";
}

int main() {
    std::cout << "Running manifest loader tests...\n\n";

    test_parse_manifest();
    test_unrecognised_values_become_malformed();
    test_empty_manifests();
    test_invalid_manifests();
    test_load_manifest_file();
    test_manifest_module();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
