#include <council/config.hpp>
#include <council/errors.hpp>

#include <iostream>

#include "test_support.hpp"

using namespace council;
using namespace council_test;

namespace {

bool throws_config_error(const std::string& yaml) {
    try {
        parse_config(yaml);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

}  // namespace

void test_defaults() {
    std::cout << "Testing config defaults..." << std::endl;

    Config config = parse_config("");
    assert(config.version == 1);
    assert(config.tool.empty());
    assert(config.targets.empty());
    assert(config.commands.empty());
    assert(config.ai.timeout == 120);
    assert(config.log_level.empty());

    std::cout << "  PASS" << std::endl;
}

void test_parse_full() {
    std::cout << "Testing full config parse..." << std::endl;

    Config config = parse_config(
        "version: 1\n"
        "tool: claude\n"
        "targets: [claude, opencode]\n"
        "commands:\n"
        "  - council-add\n"
        "ai:\n"
        "  command: claude\n"
        "  args: [--print]\n"
        "  timeout: 60\n"
        "log_level: debug\n"
        "log_file: ~/.cache/council/council.log\n"
        "unknown_key: ignored\n");

    assert(config.tool == "claude");
    assert(config.targets == std::vector<std::string>({"claude", "opencode"}));
    assert(config.commands == std::vector<std::string>({"council-add"}));
    assert(config.ai.command == "claude");
    assert(config.ai.args.size() == 1 && config.ai.args[0] == "--print");
    assert(config.ai.timeout == 60);
    assert(config.log_level == "debug");
    assert(config.log_file == "~/.cache/council/council.log");

    std::cout << "  PASS" << std::endl;
}

void test_parse_errors() {
    std::cout << "Testing config errors..." << std::endl;

    assert(throws_config_error("targets: claude\n"));
    assert(throws_config_error("commands: {a: b}\n"));
    assert(throws_config_error("- just\n- a list\n"));
    assert(throws_config_error("tool: [unclosed\n"));
    assert(throws_config_error("ai: 5\n"));

    std::cout << "  PASS" << std::endl;
}

void test_dump_and_reload() {
    std::cout << "Testing dump_config..." << std::endl;

    Config config = default_config();
    config.tool = "opencode";
    config.commands = {"council-add", "council-remove"};
    config.log_level = "info";
    config.ai.command = "claude";
    config.ai.args = {"--print"};

    std::string text = dump_config(config);
    assert(text.find("tool: opencode") != std::string::npos);
    assert(text.find("targets") == std::string::npos);
    assert(text.find("log_file") == std::string::npos);

    Config back = parse_config(text);
    assert(back.tool == "opencode");
    assert(back.commands == config.commands);
    assert(back.log_level == "info");
    assert(back.ai.timeout == 120);
    assert(back.ai.command == "claude");
    assert(back.ai.args == std::vector<std::string>({"--print"}));

    std::cout << "  PASS" << std::endl;
}

void test_load_and_save() {
    std::cout << "Testing load_config and save_config..." << std::endl;

    ScratchDir scratch("config");
    fs::path file = scratch.path() / "config.yaml";

    try {
        load_config(file);
        assert(false);
    } catch (const ConfigError& e) {
        assert(std::string(e.what()).find("council init") != std::string::npos);
    }

    Config config = default_config();
    config.targets = {"generic"};
    save_config(config, file);

    Config loaded = load_config(file);
    assert(loaded.targets == std::vector<std::string>({"generic"}));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Config Tests ===" << std::endl;

    test_defaults();
    test_parse_full();
    test_parse_errors();
    test_dump_and_reload();
    test_load_and_save();

    std::cout << std::endl << "All config tests passed" << std::endl;
    return 0;
}
