#pragma once

#include <council/adapter.hpp>
#include <council/config.hpp>
#include <council/expert.hpp>
#include <council/project.hpp>
#include <council/reconciler.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace council {

struct Report {
    std::vector<TargetResult> targets;
    std::vector<std::string> warnings;  // from expert loading
    bool auto_detected{false};

    // No target failed.
    bool ok() const;
    // Any per-file error in any target.
    bool has_errors() const;

    size_t total_created() const;
    size_t total_updated() const;
    size_t total_deleted() const;
    size_t total_skipped() const;

    nlohmann::json to_json() const;
};

// Reconciles each adapter in order. A failure in one target is recorded
// against it and the next target still runs.
Report sync_experts(const std::vector<const Adapter*>& adapters,
                    const fs::path& project_root,
                    const Config& config,
                    const std::vector<Expert>& experts,
                    const SyncOptions& options);

// Loads the expert set, resolves targets from config and syncs all of them.
// Throws ConfigError before touching anything when the project is not
// initialized or the configuration names something unknown.
Report sync_all(const AdapterRegistry& registry,
                const Layout& layout,
                const Config& config,
                const SyncOptions& options);

// Same as sync_all for exactly one named target.
Report sync_target(const AdapterRegistry& registry,
                   const std::string& name,
                   const Layout& layout,
                   const Config& config,
                   const SyncOptions& options);

// After a real run where detection found exactly one tool and config names
// none, writes that tool to config. A failed write is only a warning since
// the sync itself already succeeded. Returns true when config was saved.
bool remember_detected_tool(const AdapterRegistry& registry,
                            const Layout& layout,
                            Config& config,
                            const Report& report,
                            const SyncOptions& options);

// Every path any registered adapter may write, sorted, without ".".
std::vector<std::string> all_clean_paths(const AdapterRegistry& registry);

// Throws ConfigError for names in config.commands that no adapter bundles.
void validate_commands(const AdapterRegistry& registry, const Config& config);

}  // namespace council
