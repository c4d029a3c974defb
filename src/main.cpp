#include <council/adapter.hpp>
#include <council/config.hpp>
#include <council/errors.hpp>
#include <council/export.hpp>
#include <council/logging.hpp>
#include <council/project.hpp>
#include <council/resolver.hpp>
#include <council/sync.hpp>
#include <council/util.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#ifndef COUNCIL_VERSION
#define COUNCIL_VERSION "0.0.0"
#endif

using namespace council;

namespace {

const int kExitOk = 0;
const int kExitError = 1;
const int kExitUsage = 2;

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

struct CliOptions {
    std::string command;
    std::string target;
    std::string directory;
    std::string log_level;
    std::string log_file;
    std::string tool;
    bool dry_run{false};
    bool clean{false};
    bool force{false};
    bool json{false};
};

const std::vector<std::string> kCommands = {
    "init", "sync", "list", "show", "export", "targets", "doctor", "reset", "install-doc",
};

std::string usage_text(cxxopts::Options& options) {
    return options.help() +
           "\nCommands:\n"
           "  init [--tool T] [--clean]      Create .council/ in the project\n"
           "  sync [target]                  Mirror experts into AI tool directories\n"
           "  list                           Show the experts in the council\n"
           "  show <id>                      Show one expert in detail\n"
           "  export                         Print the council as portable markdown\n"
           "  targets                        Show the supported AI tools\n"
           "  doctor                         Check the council setup\n"
           "  reset [--dry-run]              Remove every generated file and directory\n"
           "  install-doc [target]           Print setup instructions for a tool\n";
}

CliOptions parse_arguments(int argc, char* argv[]) {
    CliOptions cli;

    try {
        cxxopts::Options options("council", "Keep expert personas in sync across AI coding tools");
        options.positional_help("<command> [target|id]");

        options.add_options()
            ("C,directory", "Project directory", cxxopts::value<std::string>()->default_value("."))
            ("l,log-level", "Log level (trace, debug, info, warn, error)", cxxopts::value<std::string>())
            ("log-file", "Log file path", cxxopts::value<std::string>())
            ("tool", "Primary AI tool for init", cxxopts::value<std::string>())
            ("n,dry-run", "Show what would change without writing", cxxopts::value<bool>()->default_value("false"))
            ("clean", "Remove stale and deprecated files", cxxopts::value<bool>()->default_value("false"))
            ("f,force", "Overwrite without asking", cxxopts::value<bool>()->default_value("false"))
            ("json", "Machine-readable output", cxxopts::value<bool>()->default_value("false"))
            ("version", "Print version")
            ("h,help", "Print usage")
            ("command", "Command", cxxopts::value<std::string>())
            ("target", "Target", cxxopts::value<std::string>());

        options.parse_positional({"command", "target"});
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << usage_text(options) << std::endl;
            exit(kExitOk);
        }

        if (result.count("version")) {
            std::cout << "council " << COUNCIL_VERSION << std::endl;
            exit(kExitOk);
        }

        if (!result.unmatched().empty()) {
            throw UsageError("unexpected argument '" + result.unmatched().front() + "'");
        }

        if (!result.count("command")) {
            throw UsageError("a command is required\n\n" + usage_text(options));
        }

        cli.command = result["command"].as<std::string>();
        if (std::find(kCommands.begin(), kCommands.end(), cli.command) == kCommands.end()) {
            throw UsageError("unknown command '" + cli.command + "' - valid commands: " + join(kCommands, ", "));
        }

        if (result.count("target")) {
            cli.target = result["target"].as<std::string>();
            if (cli.command != "sync" && cli.command != "install-doc" && cli.command != "show") {
                throw UsageError("'" + cli.command + "' does not take a target");
            }
        } else if (cli.command == "show") {
            throw UsageError("'show' requires an expert id");
        }

        cli.directory = result["directory"].as<std::string>();
        if (result.count("log-level")) {
            cli.log_level = result["log-level"].as<std::string>();
        }
        if (result.count("log-file")) {
            cli.log_file = result["log-file"].as<std::string>();
        }
        if (result.count("tool")) {
            cli.tool = result["tool"].as<std::string>();
        }
        cli.dry_run = result["dry-run"].as<bool>();
        cli.clean = result["clean"].as<bool>();
        cli.force = result["force"].as<bool>();
        cli.json = result["json"].as<bool>();

        return cli;

    } catch (const cxxopts::exceptions::parsing& e) {
        throw UsageError("Error parsing command line options: " + std::string(e.what()));
    }
}

// Command-line values win over the ones in config. A relative log_file in
// config is relative to the .council directory.
void apply_log_settings(const CliOptions& cli, const Config* config, const fs::path& config_dir = {}) {
    LogSettings settings;
    if (!cli.log_level.empty()) {
        settings.level = cli.log_level;
    } else if (config && !config->log_level.empty()) {
        settings.level = config->log_level;
    }
    if (!cli.log_file.empty()) {
        settings.file = cli.log_file;
    } else if (config && !config->log_file.empty()) {
        settings.file = resolve_path(config->log_file, config_dir).string();
    }
    setup_logging(settings);
}

Config load_project_config(const Layout& layout, const CliOptions& cli) {
    if (!council_exists(layout)) {
        throw ConfigError("council not initialized in " + layout.project_root.string() +
                          ": run 'council init' first");
    }
    Config config = default_config();
    if (file_exists(layout.config_file())) {
        config = load_config(layout.config_file());
    } else {
        spdlog::warn("No config file at {}, using defaults", layout.config_file().string());
    }
    apply_log_settings(cli, &config, layout.council_dir());
    return config;
}

bool confirm(const std::string& question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    answer = trim(answer);
    return answer == "y" || answer == "Y" || answer == "yes";
}

void remove_generated(const AdapterRegistry& registry, const fs::path& root, bool dry_run) {
    for (const auto& rel : all_clean_paths(registry)) {
        fs::path path = root / rel;
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(path, ec))) {
            continue;
        }
        if (dry_run) {
            std::cout << "Would remove: " << rel << std::endl;
            continue;
        }
        fs::remove_all(path, ec);
        if (ec) {
            throw std::runtime_error("failed to remove " + rel + ": " + ec.message());
        }
        std::cout << "Removed: " << rel << std::endl;
    }
}

int handle_init(const AdapterRegistry& registry, const Layout& layout, const CliOptions& cli) {
    apply_log_settings(cli, nullptr);

    if (!cli.tool.empty()) {
        require_adapter(registry, cli.tool);
    }

    if (cli.clean) {
        remove_generated(registry, layout.project_root, false);
        std::error_code ec;
        fs::remove_all(layout.council_dir(), ec);
        if (ec) {
            throw std::runtime_error("failed to remove " + layout.council_dir().string() + ": " + ec.message());
        }
    } else if (council_exists(layout)) {
        throw ConfigError(".council/ already exists (use --clean to remove and reinitialize)");
    }

    for (const auto& dir : {layout.experts_dir(), layout.commands_dir()}) {
        fs::create_directories(dir);
        write_file(dir / ".gitkeep", "");
    }

    Config config = default_config();
    config.tool = cli.tool;
    save_config(config, layout.config_file());

    std::cout << "Initialized council in " << layout.council_dir().string() << std::endl;
    std::cout << "Add persona files to " << layout.experts_dir().string()
              << ", then run 'council sync'" << std::endl;
    return kExitOk;
}

void print_target_result(const TargetResult& t) {
    if (t.failed) {
        std::cout << t.display_name << ": FAILED - " << t.error << std::endl;
        return;
    }

    std::cout << (t.dry_run ? "[DRY RUN] " : "") << t.display_name << ": "
              << t.created << " created, " << t.updated << " updated, "
              << t.deleted << " deleted, " << t.skipped << " unchanged" << std::endl;

    if (t.dry_run) {
        for (const auto& c : t.plan.changes) {
            std::cout << "  " << to_string(c.action) << " " << c.path << std::endl;
        }
    }
    for (const auto& path : t.plan.kept_stale) {
        std::cout << "  stale (kept, use --clean to remove): " << path << std::endl;
    }
    for (const auto& path : t.plan.kept_deprecated) {
        std::cout << "  deprecated (kept, use --clean to remove): " << path << std::endl;
    }
    for (const auto& e : t.errors) {
        std::cout << "  error: " << e.path << ": " << e.message << std::endl;
    }
}

int handle_sync(const AdapterRegistry& registry, const Layout& layout, const CliOptions& cli) {
    Config config = load_project_config(layout, cli);

    SyncOptions options;
    options.dry_run = cli.dry_run;
    options.clean = cli.clean;
    options.force = cli.force;

    auto run = [&](const SyncOptions& opts) {
        return cli.target.empty() ? sync_all(registry, layout, config, opts)
                                  : sync_target(registry, cli.target, layout, config, opts);
    };

    if (!options.dry_run && !options.force && isatty(STDIN_FILENO)) {
        SyncOptions preview = options;
        preview.dry_run = true;
        Report planned = run(preview);
        if (planned.total_updated() > 0 &&
            !confirm("Overwrite " + std::to_string(planned.total_updated()) + " existing file(s)?")) {
            std::cout << "Sync cancelled" << std::endl;
            return kExitError;
        }
    }

    Report report = run(options);

    if (cli.json) {
        std::cout << report.to_json().dump(2) << std::endl;
    } else {
        for (const auto& w : report.warnings) {
            std::cout << "warning: " << w << std::endl;
        }
        for (const auto& t : report.targets) {
            print_target_result(t);
        }
    }

    // Remember a single detected tool so later runs do not depend on detection
    remember_detected_tool(registry, layout, config, report, options);

    return report.ok() && !report.has_errors() ? kExitOk : kExitError;
}

int handle_list(const Layout& layout, const CliOptions& cli) {
    load_project_config(layout, cli);
    ExpertList list = list_experts(layout);

    if (cli.json) {
        nlohmann::json experts = nlohmann::json::array();
        for (const auto& e : list.experts) {
            experts.push_back(expert_to_json(e));
        }
        nlohmann::json out = {{"experts", experts}, {"warnings", list.warnings}};
        std::cout << out.dump(2) << std::endl;
        return kExitOk;
    }

    for (const auto& w : list.warnings) {
        std::cout << "warning: " << w << std::endl;
    }
    if (list.experts.empty()) {
        std::cout << "No experts in the council" << std::endl;
        return kExitOk;
    }
    std::cout << "Council (" << list.experts.size() << " experts):" << std::endl;
    for (const auto& e : list.experts) {
        std::cout << "  " << e.id << ": " << e.name << " - " << e.focus << source_marker(e) << std::endl;
    }
    return kExitOk;
}

int handle_show(const Layout& layout, const CliOptions& cli) {
    load_project_config(layout, cli);
    ExpertList list = list_experts(layout);
    for (const auto& w : list.warnings) {
        spdlog::warn("{}", w);
    }

    const Expert& e = find_expert(list.experts, cli.target);
    if (cli.json) {
        std::cout << expert_to_json(e).dump(2) << std::endl;
    } else {
        std::cout << format_expert_details(e);
    }
    return kExitOk;
}

int handle_export(const Layout& layout, const CliOptions& cli) {
    load_project_config(layout, cli);
    ExpertList list = list_experts(layout);
    for (const auto& w : list.warnings) {
        spdlog::warn("{}", w);
    }

    if (list.experts.empty()) {
        spdlog::error("No experts to export, add persona files to {}", layout.experts_dir().string());
        return kExitError;
    }

    if (cli.json) {
        std::cout << export_json(list.experts).dump(2) << std::endl;
    } else {
        std::cout << export_markdown(list.experts);
    }
    return kExitOk;
}

int handle_targets(const AdapterRegistry& registry, const Layout& layout, const CliOptions& cli) {
    apply_log_settings(cli, nullptr);

    nlohmann::json out = nlohmann::json::array();
    for (const Adapter* adapter : registry.all()) {
        PathSet paths = adapter->paths();
        bool detected = !adapter->is_fallback() && adapter->detect(layout.project_root);

        if (cli.json) {
            nlohmann::json entry = {
                {"name", adapter->name()},
                {"display_name", adapter->display_name()},
                {"detected", detected},
                {"fallback", adapter->is_fallback()},
                {"agents", paths.agents},
                {"commands", paths.commands},
                {"deprecated", paths.deprecated},
            };
            if (!adapter->aggregate_file().empty()) {
                entry["aggregate_file"] = adapter->aggregate_file();
            }
            out.push_back(entry);
            continue;
        }

        std::string state = adapter->is_fallback() ? "fallback" : (detected ? "detected" : "not detected");
        std::cout << adapter->name() << " (" << adapter->display_name() << ") - " << state << std::endl;
        if (!adapter->aggregate_file().empty()) {
            std::cout << "  file: " << adapter->aggregate_file() << std::endl;
        } else {
            std::cout << "  agents: " << paths.agents << std::endl;
            std::cout << "  commands: " << paths.commands << std::endl;
        }
    }

    if (cli.json) {
        std::cout << out.dump(2) << std::endl;
    }
    return kExitOk;
}

struct Check {
    std::string name;
    bool ok;
    std::string message;
};

int handle_doctor(const AdapterRegistry& registry, const Layout& layout, const CliOptions& cli) {
    apply_log_settings(cli, nullptr);
    std::vector<Check> checks;

    bool initialized = council_exists(layout);
    checks.push_back({"council directory", initialized,
                      initialized ? layout.council_dir().string() : "missing, run 'council init'"});

    std::optional<Config> config;
    if (initialized) {
        try {
            config = file_exists(layout.config_file()) ? load_config(layout.config_file()) : default_config();
            validate_commands(registry, *config);
            checks.push_back({"config", true, layout.config_file().string()});
        } catch (const ConfigError& e) {
            config.reset();
            checks.push_back({"config", false, e.what()});
        }
    }

    if (initialized) {
        ExpertList list = list_experts(layout);
        checks.push_back({"experts", list.warnings.empty(),
                          std::to_string(list.experts.size()) + " loaded, " +
                          std::to_string(list.warnings.size()) + " unreadable"});
        for (const auto& w : list.warnings) {
            checks.push_back({"expert file", false, w});
        }
    }

    if (config) {
        try {
            Resolution resolution = resolve_targets(registry, *config, layout.project_root);
            for (const Adapter* adapter : resolution.adapters) {
                std::string rel = adapter->aggregate_file().empty() ? adapter->paths().agents
                                                                   : adapter->aggregate_file();
                bool synced = fs::exists(layout.project_root / rel);
                checks.push_back({"target " + adapter->name(), synced,
                                  synced ? rel : rel + " missing, run 'council sync'"});
            }
        } catch (const ConfigError& e) {
            checks.push_back({"targets", false, e.what()});
        }
    }

    bool healthy = true;
    nlohmann::json out = nlohmann::json::array();
    for (const auto& c : checks) {
        healthy = healthy && c.ok;
        if (cli.json) {
            out.push_back({{"check", c.name}, {"ok", c.ok}, {"message", c.message}});
        } else {
            std::cout << (c.ok ? "[ok] " : "[!!] ") << c.name << ": " << c.message << std::endl;
        }
    }
    if (cli.json) {
        std::cout << nlohmann::json{{"healthy", healthy}, {"checks", out}}.dump(2) << std::endl;
    }
    return healthy ? kExitOk : kExitError;
}

int handle_reset(const AdapterRegistry& registry, const Layout& layout, const CliOptions& cli) {
    apply_log_settings(cli, nullptr);
    remove_generated(registry, layout.project_root, cli.dry_run);
    if (!cli.dry_run) {
        std::cout << "Generated files removed. Experts preserved in: " << layout.experts_dir().string() << std::endl;
    }
    return kExitOk;
}

int handle_install_doc(const AdapterRegistry& registry, const Layout& layout, const CliOptions& cli) {
    apply_log_settings(cli, nullptr);

    const Adapter* adapter = nullptr;
    if (!cli.target.empty()) {
        adapter = &require_adapter(registry, cli.target);
    } else {
        Config config = default_config();
        if (file_exists(layout.config_file())) {
            config = load_config(layout.config_file());
        }
        adapter = resolve_targets(registry, config, layout.project_root).adapters.front();
    }

    std::cout << adapter->templates().install;
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        setup_console_logging();

        CliOptions cli = parse_arguments(argc, argv);

        std::error_code ec;
        fs::path root = fs::absolute(expand_path(cli.directory), ec);
        if (ec || !fs::is_directory(root)) {
            throw UsageError("not a directory: " + cli.directory);
        }
        Layout layout = make_layout(root.lexically_normal());

        AdapterRegistry registry;
        register_builtin_adapters(registry);

        if (cli.command == "init") return handle_init(registry, layout, cli);
        if (cli.command == "sync") return handle_sync(registry, layout, cli);
        if (cli.command == "list") return handle_list(layout, cli);
        if (cli.command == "show") return handle_show(layout, cli);
        if (cli.command == "export") return handle_export(layout, cli);
        if (cli.command == "targets") return handle_targets(registry, layout, cli);
        if (cli.command == "doctor") return handle_doctor(registry, layout, cli);
        if (cli.command == "reset") return handle_reset(registry, layout, cli);
        return handle_install_doc(registry, layout, cli);

    } catch (const UsageError& e) {
        std::cerr << "council: " << e.what() << std::endl;
        return kExitUsage;
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return kExitError;
    } catch (const ExpertLookupError& e) {
        spdlog::error("{}", e.what());
        return kExitError;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return kExitError;
    }
}
