#include <council/errors.hpp>
#include <council/resolver.hpp>

#include <iostream>

#include "test_support.hpp"

using namespace council;
using namespace council_test;

namespace {

std::vector<std::string> names_of(const Resolution& r) {
    std::vector<std::string> names;
    for (const auto* a : r.adapters) names.push_back(a->name());
    return names;
}

}  // namespace

void test_explicit_targets() {
    std::cout << "Testing explicit targets..." << std::endl;

    AdapterRegistry registry;
    register_builtin_adapters(registry);
    ScratchDir scratch("resolve-explicit");

    Config config = default_config();
    config.targets = {"opencode", "claude", "opencode"};
    config.tool = "generic";  // targets win over tool

    Resolution r = resolve_targets(registry, config, scratch.path());
    assert(names_of(r) == std::vector<std::string>({"opencode", "claude"}));
    assert(!r.auto_detected);

    std::cout << "  PASS" << std::endl;
}

void test_unknown_target() {
    std::cout << "Testing unknown target..." << std::endl;

    AdapterRegistry registry;
    register_builtin_adapters(registry);
    ScratchDir scratch("resolve-unknown");

    Config config = default_config();
    config.targets = {"claude", "cursor"};
    try {
        resolve_targets(registry, config, scratch.path());
        assert(false);
    } catch (const ConfigError& e) {
        std::string msg = e.what();
        assert(msg.find("cursor") != std::string::npos);
        assert(msg.find("claude, generic, opencode") != std::string::npos);
    }

    Config bad_tool = default_config();
    bad_tool.tool = "cursor";
    try {
        resolve_targets(registry, bad_tool, scratch.path());
        assert(false);
    } catch (const ConfigError&) {
    }

    try {
        require_adapter(registry, "nope");
        assert(false);
    } catch (const ConfigError&) {
    }
    assert(require_adapter(registry, "generic").name() == "generic");

    std::cout << "  PASS" << std::endl;
}

void test_configured_tool() {
    std::cout << "Testing configured tool..." << std::endl;

    AdapterRegistry registry;
    register_builtin_adapters(registry);
    ScratchDir scratch("resolve-tool");
    fs::create_directories(scratch.path() / ".claude");

    Config config = default_config();
    config.tool = "opencode";

    Resolution r = resolve_targets(registry, config, scratch.path());
    assert(names_of(r) == std::vector<std::string>({"opencode"}));
    assert(!r.auto_detected);

    std::cout << "  PASS" << std::endl;
}

void test_detection() {
    std::cout << "Testing detection fallback..." << std::endl;

    AdapterRegistry registry;
    register_builtin_adapters(registry);
    Config config = default_config();

    ScratchDir empty("resolve-none");
    Resolution none = resolve_targets(registry, config, empty.path());
    assert(names_of(none) == std::vector<std::string>({"generic"}));
    assert(none.auto_detected);

    ScratchDir one("resolve-one");
    fs::create_directories(one.path() / ".claude");
    Resolution single = resolve_targets(registry, config, one.path());
    assert(names_of(single) == std::vector<std::string>({"claude"}));
    assert(single.auto_detected);

    ScratchDir both("resolve-both");
    fs::create_directories(both.path() / ".opencode");
    fs::create_directories(both.path() / ".claude");
    Resolution many = resolve_targets(registry, config, both.path());
    assert(names_of(many) == std::vector<std::string>({"claude", "opencode"}));
    assert(many.auto_detected);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Resolver Tests ===" << std::endl;

    test_explicit_targets();
    test_unknown_target();
    test_configured_tool();
    test_detection();

    std::cout << std::endl << "All resolver tests passed" << std::endl;
    return 0;
}
