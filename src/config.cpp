#include <council/config.hpp>
#include <council/errors.hpp>
#include <council/util.hpp>

#include <yaml-cpp/yaml.h>

namespace council {

namespace {
    std::vector<std::string> string_list(const YAML::Node& node, const char* key) {
        std::vector<std::string> out;
        if (!node[key] || node[key].IsNull()) return out;
        if (!node[key].IsSequence()) {
            throw ConfigError(std::string("'") + key + "' must be a list");
        }
        for (const auto& item : node[key]) {
            out.push_back(item.as<std::string>());
        }
        return out;
    }

    void emit_list(YAML::Emitter& out, const char* key, const std::vector<std::string>& items) {
        out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
        for (const auto& item : items) {
            out << item;
        }
        out << YAML::EndSeq;
    }
}

Config default_config() {
    Config config;
    config.version = 1;
    config.ai.timeout = 120;
    return config;
}

Config parse_config(const std::string& yaml_text) {
    Config config = default_config();

    try {
        YAML::Node yaml = YAML::Load(yaml_text);
        if (yaml.IsNull()) {
            return config;
        }
        if (!yaml.IsMap()) {
            throw ConfigError("configuration must be a mapping");
        }

        if (yaml["version"]) {
            config.version = yaml["version"].as<int>();
        }
        if (yaml["tool"] && !yaml["tool"].IsNull()) {
            config.tool = yaml["tool"].as<std::string>();
        }
        config.targets = string_list(yaml, "targets");
        config.commands = string_list(yaml, "commands");

        if (const YAML::Node ai = yaml["ai"]) {
            if (!ai.IsMap() && !ai.IsNull()) {
                throw ConfigError("'ai' must be a mapping");
            }
            if (ai.IsMap()) {
                if (ai["command"] && !ai["command"].IsNull()) {
                    config.ai.command = ai["command"].as<std::string>();
                }
                config.ai.args = string_list(ai, "args");
                if (ai["timeout"]) {
                    config.ai.timeout = ai["timeout"].as<int>();
                }
            }
        }

        if (yaml["log_level"]) {
            config.log_level = yaml["log_level"].as<std::string>();
        }
        if (yaml["log_file"]) {
            config.log_file = yaml["log_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error parsing configuration file: " + std::string(e.what()));
    }

    // Missing values fall back to defaults
    if (config.ai.timeout <= 0) {
        config.ai.timeout = default_config().ai.timeout;
    }

    return config;
}

std::string dump_config(const Config& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << config.version;
    if (!config.tool.empty()) {
        out << YAML::Key << "tool" << YAML::Value << config.tool;
    }
    if (!config.targets.empty()) {
        emit_list(out, "targets", config.targets);
    }
    if (!config.commands.empty()) {
        emit_list(out, "commands", config.commands);
    }
    out << YAML::Key << "ai" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "command" << YAML::Value << config.ai.command;
    if (!config.ai.args.empty()) {
        emit_list(out, "args", config.ai.args);
    }
    out << YAML::Key << "timeout" << YAML::Value << config.ai.timeout;
    out << YAML::EndMap;
    if (!config.log_level.empty()) {
        out << YAML::Key << "log_level" << YAML::Value << config.log_level;
    }
    if (!config.log_file.empty()) {
        out << YAML::Key << "log_file" << YAML::Value << config.log_file;
    }
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Config load_config(const fs::path& file) {
    auto text = read_file(file);
    if (!text) {
        if (!file_exists(file)) {
            throw ConfigError("council not initialized: run 'council init' first");
        }
        throw ConfigError("failed to read config: " + file.string());
    }
    return parse_config(*text);
}

void save_config(const Config& config, const fs::path& file) {
    try {
        write_file(file, dump_config(config));
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to write config: " + std::string(e.what()));
    }
}

}  // namespace council
