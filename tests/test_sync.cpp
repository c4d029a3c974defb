#include <council/errors.hpp>
#include <council/sync.hpp>

#include <iostream>

#include <spdlog/spdlog.h>

#include "test_support.hpp"

using namespace council;
using namespace council_test;

namespace {

const char* const kDhh = "---\nid: dhh\nname: DHH\nfocus: Rails\n---\n\n# DHH\n\nRails.\n";
const char* const kKent = "---\nid: kent-beck\nname: Kent Beck\nfocus: Testing\n---\n\n# Kent Beck\n\nTests.\n";

// A project with .council/ and a private user config directory.
struct Project {
    ScratchDir scratch;
    Layout layout;

    explicit Project(const std::string& name)
        : scratch(name), layout{scratch.path() / "project", scratch.path() / "user"} {
        fs::create_directories(layout.experts_dir());
        fs::create_directories(layout.commands_dir());
    }

    const fs::path& root() const { return layout.project_root; }
};

AdapterRegistry builtin_registry() {
    AdapterRegistry registry;
    register_builtin_adapters(registry);
    return registry;
}

}  // namespace

void test_sync_all_detected() {
    std::cout << "Testing sync_all with detection..." << std::endl;

    Project p("sync-all");
    write_text(p.layout.experts_dir() / "dhh.md", kDhh);
    write_text(p.layout.custom_dir() / "dhh.md", kDhh);
    fs::create_directories(p.root() / ".claude");

    AdapterRegistry registry = builtin_registry();
    Report report = sync_all(registry, p.layout, default_config(), SyncOptions{});

    assert(report.ok());
    assert(!report.has_errors());
    assert(report.auto_detected);
    assert(report.targets.size() == 1);
    assert(report.targets[0].target == "claude");
    assert(fs::is_regular_file(p.root() / ".claude/agents/dhh.md"));
    assert(fs::is_regular_file(p.root() / ".claude/agents/custom-dhh.md"));

    // Claude Code receives persona files exactly as stored
    assert(read_text(p.root() / ".claude/agents/dhh.md") == kDhh);

    Report again = sync_all(registry, p.layout, default_config(), SyncOptions{});
    assert(again.total_created() == 0);
    assert(again.total_updated() == 0);
    assert(again.total_skipped() == report.total_created());

    std::cout << "  PASS" << std::endl;
}

void test_sync_all_fallback() {
    std::cout << "Testing sync_all fallback to AGENTS.md..." << std::endl;

    Project p("sync-fallback");
    write_text(p.layout.experts_dir() / "kent-beck.md", kKent);

    AdapterRegistry registry = builtin_registry();
    Report report = sync_all(registry, p.layout, default_config(), SyncOptions{});
    assert(report.ok());
    assert(report.targets.size() == 1);
    assert(report.targets[0].target == "generic");
    assert(read_text(p.root() / "AGENTS.md").find("### Kent Beck\n") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_not_initialized() {
    std::cout << "Testing missing council directory..." << std::endl;

    ScratchDir scratch("sync-uninit");
    Layout layout{scratch.path(), scratch.path() / "user"};
    fs::create_directories(scratch.path() / ".claude");

    AdapterRegistry registry = builtin_registry();
    try {
        sync_all(registry, layout, default_config(), SyncOptions{});
        assert(false);
    } catch (const ConfigError&) {
    }
    assert(!fs::exists(scratch.path() / ".claude/agents"));

    std::cout << "  PASS" << std::endl;
}

void test_unknown_target_before_mutation() {
    std::cout << "Testing unknown target fails before any write..." << std::endl;

    Project p("sync-unknown");
    write_text(p.layout.experts_dir() / "dhh.md", kDhh);

    AdapterRegistry registry = builtin_registry();
    Config config = default_config();
    config.targets = {"claude", "cursor"};
    try {
        sync_all(registry, p.layout, config, SyncOptions{});
        assert(false);
    } catch (const ConfigError& e) {
        assert(std::string(e.what()).find("cursor") != std::string::npos);
    }
    assert(!fs::exists(p.root() / ".claude"));

    try {
        sync_target(registry, "cursor", p.layout, default_config(), SyncOptions{});
        assert(false);
    } catch (const ConfigError&) {
    }

    Config bad_commands = default_config();
    bad_commands.commands = {"council-add", "council-frobnicate"};
    try {
        sync_all(registry, p.layout, bad_commands, SyncOptions{});
        assert(false);
    } catch (const ConfigError& e) {
        assert(std::string(e.what()).find("council-frobnicate") != std::string::npos);
    }
    assert(!fs::exists(p.root() / "AGENTS.md"));

    std::cout << "  PASS" << std::endl;
}

void test_sync_target() {
    std::cout << "Testing sync_target..." << std::endl;

    Project p("sync-target");
    write_text(p.layout.experts_dir() / "dhh.md", kDhh);
    fs::create_directories(p.root() / ".claude");

    AdapterRegistry registry = builtin_registry();
    Report report = sync_target(registry, "opencode", p.layout, default_config(), SyncOptions{});
    assert(report.targets.size() == 1);
    assert(report.targets[0].target == "opencode");
    assert(!report.auto_detected);
    assert(fs::is_regular_file(p.root() / ".opencode/agents/dhh.md"));
    assert(!fs::exists(p.root() / ".claude/agents"));

    std::cout << "  PASS" << std::endl;
}

void test_partial_failure_isolation() {
    std::cout << "Testing partial failure isolation..." << std::endl;

    Project p("sync-partial");
    write_text(p.layout.experts_dir() / "dhh.md", kDhh);
    write_text(p.root() / ".claude", "a file, not a directory\n");

    AdapterRegistry registry = builtin_registry();
    Config config = default_config();
    config.targets = {"claude", "opencode"};

    Report report = sync_all(registry, p.layout, config, SyncOptions{});
    assert(!report.ok());
    assert(report.targets.size() == 2);
    assert(report.targets[0].target == "claude");
    assert(report.targets[0].failed);
    assert(!report.targets[0].error.empty());
    assert(report.targets[1].target == "opencode");
    assert(!report.targets[1].failed);
    assert(report.targets[1].created == 5);
    assert(fs::is_regular_file(p.root() / ".opencode/agents/dhh.md"));

    nlohmann::json j = report.to_json();
    assert(j["ok"] == false);
    assert(j["targets"][0]["failed"] == true);
    assert(j["totals"]["created"] == 5);

    std::cout << "  PASS" << std::endl;
}

void test_empty_expert_set() {
    std::cout << "Testing sync with no experts..." << std::endl;

    Project p("sync-empty");
    write_text(p.layout.experts_dir() / "broken.md", "not a persona\n");

    AdapterRegistry registry = builtin_registry();
    Config config = default_config();
    config.tool = "claude";

    Report report = sync_all(registry, p.layout, config, SyncOptions{});
    assert(report.ok());
    assert(report.warnings.size() == 1);
    assert(report.targets[0].created == 4);  // council.md and the bundled commands
    assert(fs::is_directory(p.root() / ".claude/agents"));
    assert(fs::is_empty(p.root() / ".claude/agents"));

    std::cout << "  PASS" << std::endl;
}

void test_dry_run_report() {
    std::cout << "Testing dry-run report..." << std::endl;

    Project p("sync-dry");
    write_text(p.layout.experts_dir() / "dhh.md", kDhh);
    write_text(p.layout.experts_dir() / "kent-beck.md", kKent);

    AdapterRegistry registry = builtin_registry();
    Config config = default_config();
    config.targets = {"claude", "opencode", "generic"};
    SyncOptions options;
    options.dry_run = true;

    Report report = sync_all(registry, p.layout, config, options);
    assert(report.ok());
    assert(report.total_created() == 6 + 6 + 1);
    assert(!fs::exists(p.root() / ".claude"));
    assert(!fs::exists(p.root() / ".opencode"));
    assert(!fs::exists(p.root() / "AGENTS.md"));

    std::cout << "  PASS" << std::endl;
}

void test_remember_detected_tool() {
    std::cout << "Testing remember_detected_tool..." << std::endl;

    AdapterRegistry registry = builtin_registry();

    Project p("sync-remember");
    write_text(p.layout.experts_dir() / "dhh.md", kDhh);
    fs::create_directories(p.root() / ".claude");
    save_config(default_config(), p.layout.config_file());

    SyncOptions dry;
    dry.dry_run = true;
    Config config = default_config();
    Report preview = sync_all(registry, p.layout, config, dry);
    assert(!remember_detected_tool(registry, p.layout, config, preview, dry));
    assert(config.tool.empty());

    Report report = sync_all(registry, p.layout, config, SyncOptions{});
    assert(remember_detected_tool(registry, p.layout, config, report, SyncOptions{}));
    assert(config.tool == "claude");
    assert(load_config(p.layout.config_file()).tool == "claude");

    // Already set, nothing more to remember
    assert(!remember_detected_tool(registry, p.layout, config, report, SyncOptions{}));

    // The fallback is never remembered
    Project fallback("sync-remember-fallback");
    write_text(fallback.layout.experts_dir() / "dhh.md", kDhh);
    Config fallback_config = default_config();
    Report generic = sync_all(registry, fallback.layout, fallback_config, SyncOptions{});
    assert(!remember_detected_tool(registry, fallback.layout, fallback_config, generic, SyncOptions{}));
    assert(!fs::exists(fallback.layout.config_file()));

    // An unwritable config after a good sync is not an error
    Project blocked("sync-remember-blocked");
    write_text(blocked.layout.experts_dir() / "dhh.md", kDhh);
    fs::create_directories(blocked.root() / ".claude");
    fs::create_directories(blocked.layout.config_file());
    Config blocked_config = default_config();
    Report synced = sync_all(registry, blocked.layout, blocked_config, SyncOptions{});
    assert(synced.ok());
    assert(!remember_detected_tool(registry, blocked.layout, blocked_config, synced, SyncOptions{}));
    assert(blocked_config.tool.empty());
    assert(fs::is_regular_file(blocked.root() / ".claude/agents/dhh.md"));

    std::cout << "  PASS" << std::endl;
}

void test_all_clean_paths() {
    std::cout << "Testing all_clean_paths..." << std::endl;

    AdapterRegistry registry = builtin_registry();
    std::vector<std::string> paths = all_clean_paths(registry);
    assert(paths == std::vector<std::string>({
        ".claude/agents",
        ".claude/commands",
        ".opencode/agent",
        ".opencode/agents",
        ".opencode/commands",
        "AGENTS.md",
    }));

    AdapterRegistry empty;
    assert(all_clean_paths(empty).empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    spdlog::set_level(spdlog::level::off);
    std::cout << "=== Sync Tests ===" << std::endl;

    test_sync_all_detected();
    test_sync_all_fallback();
    test_not_initialized();
    test_unknown_target_before_mutation();
    test_sync_target();
    test_partial_failure_isolation();
    test_empty_expert_set();
    test_dry_run_report();
    test_remember_detected_tool();
    test_all_clean_paths();

    std::cout << std::endl << "All sync tests passed" << std::endl;
    return 0;
}
