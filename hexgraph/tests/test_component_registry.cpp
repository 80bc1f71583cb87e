/******************************************************************************
 * test_component_registry.cpp
 *
 * Unit tests for ComponentRegistry and module registration
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "component_registry.h"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace hexgraph;

static ComponentEntry make_entry(const std::string& name, Layer layer = Layer::Domain,
                                 Role role = Role::Entity) {
    return ComponentEntry{name, layer, role, "test::" + name, {}};
}

void test_registry_accumulates() {
    ComponentRegistry registry;
    assert(registry.empty());

    registry.register_component(make_entry("User"));
    registry.register_component(make_entry("Order"));
    registry.register_component(make_entry("User"));  // Duplicates are accepted

    assert(registry.size() == 3);
    assert(!registry.empty());

    std::cout << "test_registry_accumulates: PASSED\n";
}

void test_collect_all_restartable() {
    ComponentRegistry registry;
    registry.register_component(make_entry("User"));
    registry.register_component(make_entry("Order"));

    auto range = registry.collect_all();
    assert(range.size() == 2);

    std::vector<std::string> first_pass;
    for (const auto& entry : range) {
        first_pass.push_back(entry.type_name);
    }

    std::vector<std::string> second_pass;
    for (const auto& entry : range) {
        second_pass.push_back(entry.type_name);
    }

    assert(first_pass == second_pass);
    assert(first_pass.size() == 2);
    assert(first_pass[0] == "User");
    assert(first_pass[1] == "Order");

    std::cout << "test_collect_all_restartable: PASSED\n";
}

void test_collect_all_snapshot() {
    ComponentRegistry registry;
    registry.register_component(make_entry("User"));

    auto before = registry.collect_all();
    registry.register_component(make_entry("Order"));
    auto after = registry.collect_all();

    assert(before.size() == 1);
    assert(before.to_vector().size() == 1);
    assert(after.size() == 2);

    size_t count = 0;
    for (auto it = before.begin(); it != before.end(); ++it) {
        assert(it->type_name == "User");
        ++count;
    }
    assert(count == 1);

    std::cout << "test_collect_all_snapshot: PASSED\n";
}

void test_registry_seal() {
    ComponentRegistry registry;
    registry.register_component(make_entry("User"));
    registry.seal();
    assert(registry.is_sealed());

    bool threw = false;
    try {
        registry.register_component(make_entry("Order"));
    } catch (const RegistryError& e) {
        threw = true;
        assert(std::string(e.what()).find("Order") != std::string::npos);
    }
    assert(threw);
    assert(registry.size() == 1);

    // clear() reopens registration
    registry.clear();
    assert(!registry.is_sealed());
    assert(registry.empty());
    registry.register_component(make_entry("Order"));
    assert(registry.size() == 1);

    std::cout << "test_registry_seal: PASSED\n";
}

void test_register_modules() {
    ComponentRegistry registry;
    std::vector<std::string> order;

    std::vector<ComponentModule> modules;
    modules.push_back({"domain", [&order](ComponentRegistry& r) {
        order.push_back("domain");
        r.register_component(make_entry("User"));
        r.register_component(make_entry("Order", Layer::Domain, Role::Aggregate));
    }});
    modules.push_back({"ports", [&order](ComponentRegistry& r) {
        order.push_back("ports");
        r.register_component(make_entry("UserRepository", Layer::Port, Role::Repository));
    }});

    register_modules(registry, modules);

    assert(registry.size() == 3);
    assert(order.size() == 2);
    assert(order[0] == "domain");
    assert(order[1] == "ports");

    std::cout << "test_register_modules: PASSED\n";
}

void test_register_modules_failure() {
    ComponentRegistry registry;

    std::vector<ComponentModule> modules;
    modules.push_back({"adapters", [](ComponentRegistry&) {
        throw std::runtime_error("manifest missing");
    }});

    bool threw = false;
    try {
        register_modules(registry, modules);
    } catch (const RegistryError& e) {
        threw = true;
        const std::string message = e.what();
        assert(message.find("adapters") != std::string::npos);
        assert(message.find("manifest missing") != std::string::npos);
    }
    assert(threw);

    // Module without an initializer
    std::vector<ComponentModule> empty_module = {{"empty", nullptr}};
    threw = false;
    try {
        register_modules(registry, empty_module);
    } catch (const RegistryError&) {
        threw = true;
    }
    assert(threw);

    // Registering into a sealed registry surfaces as RegistryError unchanged
    registry.seal();
    std::vector<ComponentModule> late = {{"late", [](ComponentRegistry& r) {
        r.register_component(make_entry("Late"));
    }}};
    threw = false;
    try {
        register_modules(registry, late);
    } catch (const RegistryError& e) {
        threw = true;
        assert(std::string(e.what()).find("sealed") != std::string::npos);
    }
    assert(threw);

    std::cout << "test_register_modules_failure: PASSED\n";
}

int main() {
    std::cout << "Running component registry tests...\n\n";

    test_registry_accumulates();
    test_collect_all_restartable();
    test_collect_all_snapshot();
    test_registry_seal();
    test_register_modules();
    test_register_modules_failure();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
