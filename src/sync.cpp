#include <council/sync.hpp>
#include <council/errors.hpp>
#include <council/resolver.hpp>
#include <council/util.hpp>

#include <set>

#include <spdlog/spdlog.h>

namespace council {

namespace {
    void require_council(const Layout& layout) {
        if (!council_exists(layout)) {
            throw ConfigError("council not initialized in " + layout.project_root.string() +
                              ": run 'council init' first");
        }
    }

    Report load_and_sync(const std::vector<const Adapter*>& adapters,
                         bool auto_detected,
                         const Layout& layout,
                         const Config& config,
                         const SyncOptions& options) {
        ExpertList list = list_experts(layout);
        for (const auto& w : list.warnings) {
            spdlog::warn("{}", w);
        }
        if (list.experts.empty()) {
            spdlog::warn("No experts in the council; syncing an empty set");
        }

        Report report = sync_experts(adapters, layout.project_root, config, list.experts, options);
        report.warnings = std::move(list.warnings);
        report.auto_detected = auto_detected;
        return report;
    }
}

bool Report::ok() const {
    for (const auto& t : targets) {
        if (t.failed) return false;
    }
    return true;
}

bool Report::has_errors() const {
    for (const auto& t : targets) {
        if (!t.errors.empty()) return true;
    }
    return false;
}

size_t Report::total_created() const {
    size_t n = 0;
    for (const auto& t : targets) n += t.created;
    return n;
}

size_t Report::total_updated() const {
    size_t n = 0;
    for (const auto& t : targets) n += t.updated;
    return n;
}

size_t Report::total_deleted() const {
    size_t n = 0;
    for (const auto& t : targets) n += t.deleted;
    return n;
}

size_t Report::total_skipped() const {
    size_t n = 0;
    for (const auto& t : targets) n += t.skipped;
    return n;
}

nlohmann::json Report::to_json() const {
    nlohmann::json targets_json = nlohmann::json::array();
    for (const auto& t : targets) {
        targets_json.push_back(council::to_json(t));
    }
    return {
        {"ok", ok()},
        {"has_errors", has_errors()},
        {"auto_detected", auto_detected},
        {"targets", targets_json},
        {"warnings", warnings},
        {"totals", {
            {"created", total_created()},
            {"updated", total_updated()},
            {"deleted", total_deleted()},
            {"skipped", total_skipped()},
        }},
    };
}

Report sync_experts(const std::vector<const Adapter*>& adapters,
                    const fs::path& project_root,
                    const Config& config,
                    const std::vector<Expert>& experts,
                    const SyncOptions& options) {
    Reconciler reconciler(project_root, options);
    reconciler.set_enabled_commands(config.commands);

    Report report;
    for (const Adapter* adapter : adapters) {
        spdlog::info("Syncing {} expert(s) to {}", experts.size(), adapter->display_name());
        try {
            report.targets.push_back(reconciler.reconcile(*adapter, experts));
        } catch (const std::exception& e) {
            spdlog::error("Failed to sync {}: {}", adapter->display_name(), e.what());
            TargetResult failed;
            failed.target = adapter->name();
            failed.display_name = adapter->display_name();
            failed.dry_run = options.dry_run;
            failed.failed = true;
            failed.error = e.what();
            report.targets.push_back(std::move(failed));
        }
    }
    return report;
}

void validate_commands(const AdapterRegistry& registry, const Config& config) {
    std::set<std::string> known;
    for (const Adapter* adapter : registry.all()) {
        for (const auto& [name, _] : adapter->templates().commands) {
            known.insert(name);
        }
    }
    for (const auto& name : config.commands) {
        if (!known.count(name)) {
            throw ConfigError("unknown command '" + name + "' in config - valid commands: " +
                              join(std::vector<std::string>(known.begin(), known.end()), ", "));
        }
    }
}

Report sync_all(const AdapterRegistry& registry,
                const Layout& layout,
                const Config& config,
                const SyncOptions& options) {
    require_council(layout);
    validate_commands(registry, config);
    Resolution resolution = resolve_targets(registry, config, layout.project_root);
    return load_and_sync(resolution.adapters, resolution.auto_detected, layout, config, options);
}

Report sync_target(const AdapterRegistry& registry,
                   const std::string& name,
                   const Layout& layout,
                   const Config& config,
                   const SyncOptions& options) {
    const Adapter& adapter = require_adapter(registry, name);
    require_council(layout);
    validate_commands(registry, config);
    return load_and_sync({&adapter}, false, layout, config, options);
}

bool remember_detected_tool(const AdapterRegistry& registry,
                            const Layout& layout,
                            Config& config,
                            const Report& report,
                            const SyncOptions& options) {
    if (options.dry_run || !report.auto_detected || !report.ok() || report.targets.size() != 1 ||
        !config.tool.empty() || !config.targets.empty()) {
        return false;
    }

    const Adapter* adapter = registry.get(report.targets.front().target);
    if (!adapter || adapter->is_fallback()) {
        return false;
    }

    Config updated = config;
    updated.tool = adapter->name();
    try {
        save_config(updated, layout.config_file());
    } catch (const std::exception& e) {
        spdlog::warn("Could not save tool '{}' to config: {}", updated.tool, e.what());
        return false;
    }

    config = updated;
    spdlog::info("Saved tool '{}' to {}", config.tool, layout.config_file().string());
    return true;
}

std::vector<std::string> all_clean_paths(const AdapterRegistry& registry) {
    std::set<std::string> paths;
    auto add = [&paths](const std::string& p) {
        if (p.empty()) return;
        std::string normal = fs::path(p).lexically_normal().generic_string();
        if (normal == "." || normal == "./") return;
        paths.insert(normal);
    };

    for (const Adapter* adapter : registry.all()) {
        PathSet p = adapter->paths();
        add(p.agents);
        if (p.commands != p.agents) add(p.commands);
        for (const auto& d : p.deprecated) add(d);
        add(adapter->aggregate_file());
    }
    return std::vector<std::string>(paths.begin(), paths.end());
}

}  // namespace council
