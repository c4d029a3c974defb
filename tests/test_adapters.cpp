#include <council/adapter.hpp>
#include <council/adapters/claude.hpp>
#include <council/adapters/generic.hpp>
#include <council/adapters/opencode.hpp>
#include <council/errors.hpp>

#include <iostream>
#include <memory>

#include "test_support.hpp"

using namespace council;
using namespace council_test;

namespace {

// Replaces the built-in claude adapter to check registration order.
class CustomClaude : public ClaudeAdapter {
public:
    std::string display_name() const override { return "Claude (custom)"; }
};

std::vector<std::string> names_of(const std::vector<const Adapter*>& adapters) {
    std::vector<std::string> names;
    for (const auto* a : adapters) names.push_back(a->name());
    return names;
}

}  // namespace

void test_registry() {
    std::cout << "Testing AdapterRegistry..." << std::endl;

    AdapterRegistry registry;
    assert(registry.empty());
    register_builtin_adapters(registry);

    assert(registry.names() == std::vector<std::string>({"claude", "generic", "opencode"}));
    assert(names_of(registry.all()) == registry.names());
    assert(registry.get("claude") != nullptr);
    assert(registry.get("cursor") == nullptr);
    assert(registry.fallback() != nullptr);
    assert(registry.fallback()->name() == "generic");

    registry.add(std::make_unique<CustomClaude>());
    assert(registry.names().size() == 3);
    assert(registry.get("claude")->display_name() == "Claude (custom)");

    std::cout << "  PASS" << std::endl;
}

void test_detection() {
    std::cout << "Testing detection..." << std::endl;

    AdapterRegistry registry;
    register_builtin_adapters(registry);

    ScratchDir scratch("detect");
    const fs::path& root = scratch.path();

    // The fallback is never reported by detection
    assert(registry.detect(root).empty());

    write_text(root / "opencode.json", "{}\n");
    assert(names_of(registry.detect(root)) == std::vector<std::string>({"opencode"}));

    fs::create_directories(root / ".claude");
    assert(names_of(registry.detect(root)) == std::vector<std::string>({"claude", "opencode"}));

    // A regular file named .claude is not the tool's directory
    ScratchDir other("detect-file");
    write_text(other.path() / ".claude", "");
    assert(registry.detect(other.path()).empty());

    std::cout << "  PASS" << std::endl;
}

void test_paths() {
    std::cout << "Testing adapter paths..." << std::endl;

    ClaudeAdapter claude;
    OpenCodeAdapter opencode;
    GenericAdapter generic;

    assert(claude.name() == "claude");
    assert(claude.paths().agents == ".claude/agents");
    assert(claude.paths().commands == ".claude/commands");
    assert(claude.paths().deprecated.empty());

    assert(opencode.name() == "opencode");
    assert(opencode.paths().agents == ".opencode/agents");
    assert(opencode.paths().deprecated == std::vector<std::string>({".opencode/agent"}));

    assert(generic.name() == "generic");
    assert(generic.is_fallback());
    assert(generic.aggregate_file() == "AGENTS.md");
    assert(claude.aggregate_file().empty());

    for (const Adapter* a : std::vector<const Adapter*>{&claude, &opencode}) {
        TemplateSet t = a->templates();
        assert(!t.install.empty());
        assert(t.commands.size() == 3);
        assert(t.commands.count("council-add"));
        assert(t.commands.count("council-detect"));
        assert(t.commands.count("council-remove"));
    }
    assert(generic.templates().commands.empty());
    assert(!generic.templates().install.empty());

    std::cout << "  PASS" << std::endl;
}

void test_claude_format() {
    std::cout << "Testing Claude formatting..." << std::endl;

    ClaudeAdapter claude;
    Expert e = make_expert("dhh", "DHH", "Rails");
    assert(claude.format_agent(e) == serialize_expert(e));

    e.origin = "---\nid: dhh\nname: DHH\nfocus: Rails\n---\n\nHand written\n";
    assert(claude.format_agent(e) == e.origin);

    assert(claude.format_command("council-add", "Add", "Body\n") == "Body\n");

    Expert bad = make_expert("dhh", "DHH", "");
    try {
        claude.format_agent(bad);
        assert(false);
    } catch (const FormatError&) {
    }

    std::cout << "  PASS" << std::endl;
}

void test_opencode_format() {
    std::cout << "Testing OpenCode formatting..." << std::endl;

    OpenCodeAdapter opencode;
    Expert e = make_expert("dhh", "DHH", "Rails");
    e.principles = {"Convention over configuration"};

    std::string agent = opencode.format_agent(e);
    assert(starts_with(agent, "---\ndescription: Rails\nmode: subagent\n---\n\n# DHH\n\n"));
    assert(agent.find("You are channeling DHH, known for expertise in Rails.") != std::string::npos);
    assert(agent.find("## Principles\n\n- Convention over configuration\n") != std::string::npos);
    assert(agent.find("## Philosophy") == std::string::npos);
    assert(ends_with(agent, "Suggest concrete improvements.\n"));

    std::string command = opencode.format_command("council-remove", command_description("council-remove"), "Body\n");
    assert(command == "---\ndescription: Remove expert from council\nmode: subagent\n---\n\nBody\n");

    std::cout << "  PASS" << std::endl;
}

void test_generic_format() {
    std::cout << "Testing generic formatting..." << std::endl;

    GenericAdapter generic;
    const std::string header =
        "# AGENTS.md - Expert Council\n"
        "\n"
        "This file defines expert personas for AI coding assistants.\n"
        "\n"
        "## Council Members\n";

    assert(generic.format_aggregate({}) == header);
    assert(generic.format_command("council", "Review", "Body").empty());

    Expert e = make_expert("dhh", "DHH", "Rails", "custom");
    e.philosophy = "Happiness first.";
    e.principles = {"Convention"};
    std::string section = generic.format_agent(e);
    assert(section == "### DHH [custom]\n- **ID**: dhh\n- **Focus**: Rails\n\nHappiness first.\n\n**Principles:**\n- Convention\n");

    std::string aggregate = generic.format_aggregate({e, make_expert("kent", "Kent Beck", "Testing")});
    assert(starts_with(aggregate, header + "\n### DHH [custom]\n"));
    assert(aggregate.find("\n### Kent Beck\n- **ID**: kent\n") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_command_description() {
    std::cout << "Testing command_description..." << std::endl;

    assert(command_description("council") == "Convene the council to review code");
    assert(command_description("council-remove") == "Remove expert from council");
    assert(command_description("something-else") == "something-else");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Adapter Tests ===" << std::endl;

    test_registry();
    test_detection();
    test_paths();
    test_claude_format();
    test_opencode_format();
    test_generic_format();
    test_command_description();

    std::cout << std::endl << "All adapter tests passed" << std::endl;
    return 0;
}
