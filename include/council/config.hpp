#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace council {

namespace fs = std::filesystem;

// Settings for the external persona generator. council never runs it; the
// section is parsed and written back so saving config leaves it unchanged.
struct AiConfig {
    std::string command;
    std::vector<std::string> args;
    int timeout{120};
};

// .council/config.yaml
struct Config {
    int version{1};
    std::string tool;                   // primary tool; empty means auto-detect
    std::vector<std::string> targets;   // explicit ordered target list
    std::vector<std::string> commands;  // enabled bundled commands; empty means all
    AiConfig ai;
    std::string log_level;
    std::string log_file;
};

Config default_config();

// Throws ConfigError on malformed YAML or wrongly typed keys.
Config parse_config(const std::string& yaml);
std::string dump_config(const Config& config);

Config load_config(const fs::path& file);
void save_config(const Config& config, const fs::path& file);

}  // namespace council
