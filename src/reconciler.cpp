#include <council/reconciler.hpp>
#include <council/errors.hpp>
#include <council/review_template.hpp>
#include <council/util.hpp>

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

namespace council {

namespace {
    const char* const kReviewCommand = "council";

    std::string rel_path(const std::string& dir, const std::string& filename) {
        return (fs::path(dir) / filename).lexically_normal().generic_string();
    }

    bool is_managed_dir(const std::string& dir) {
        return !dir.empty() && dir != ".";
    }

    // Writing must never follow a link out of the managed directory
    void replace_symlink(const fs::path& path) {
        std::error_code ec;
        if (!fs::is_symlink(fs::symlink_status(path, ec))) {
            return;
        }
        fs::remove(path, ec);
        if (ec) {
            throw std::runtime_error("cannot replace symlink: " + ec.message());
        }
    }

    std::vector<std::string> owned_candidates(const fs::path& dir) {
        std::vector<std::string> names;
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            return names;
        }
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            // Symlinks point at content we did not write
            std::error_code type_ec;
            if (!fs::is_regular_file(it->symlink_status(type_ec))) continue;
            std::string filename = it->path().filename().string();
            if (filename.empty() || filename[0] == '.' || !ends_with(filename, ".md")) continue;
            names.push_back(filename);
        }
        if (ec) {
            spdlog::warn("Could not list {}: {}", dir.string(), ec.message());
        }
        std::sort(names.begin(), names.end());
        return names;
    }
}

const char* to_string(FileAction action) {
    switch (action) {
        case FileAction::create: return "create";
        case FileAction::update: return "update";
        case FileAction::remove: return "remove";
        case FileAction::remove_deprecated: return "remove_deprecated";
    }
    return "unknown";
}

size_t Plan::count(FileAction action) const {
    return static_cast<size_t>(std::count_if(changes.begin(), changes.end(),
        [action](const PlannedChange& c) { return c.action == action; }));
}

nlohmann::json to_json(const TargetResult& result) {
    nlohmann::json j = {
        {"target", result.target},
        {"display_name", result.display_name},
        {"dry_run", result.dry_run},
        {"failed", result.failed},
        {"created", result.created},
        {"updated", result.updated},
        {"deleted", result.deleted},
        {"skipped", result.skipped},
    };
    if (!result.error.empty()) {
        j["error"] = result.error;
    }

    nlohmann::json changes = nlohmann::json::array();
    for (const auto& c : result.plan.changes) {
        nlohmann::json change = {{"action", to_string(c.action)}, {"path", c.path}};
        if (!c.digest.empty()) change["digest"] = c.digest;
        changes.push_back(change);
    }
    j["changes"] = changes;
    j["unchanged"] = result.plan.unchanged;
    j["kept_stale"] = result.plan.kept_stale;
    j["kept_deprecated"] = result.plan.kept_deprecated;

    nlohmann::json errors = nlohmann::json::array();
    for (const auto& e : result.errors) {
        errors.push_back({{"path", e.path}, {"message", e.message}});
    }
    j["errors"] = errors;
    return j;
}

Reconciler::Reconciler(fs::path project_root, SyncOptions options)
    : root_(std::move(project_root)), options_(options) {}

void Reconciler::set_enabled_commands(std::vector<std::string> commands) {
    enabled_commands_ = std::move(commands);
}

bool Reconciler::command_enabled(const std::string& name) const {
    return enabled_commands_.empty() ||
           std::find(enabled_commands_.begin(), enabled_commands_.end(), name) != enabled_commands_.end();
}

bool Reconciler::owns_command_file(const Adapter& adapter, const std::string& filename) const {
    if (filename == std::string(kReviewCommand) + ".md") return true;
    if (starts_with(filename, std::string(kReviewCommand) + "-")) return true;
    for (const auto& [name, _] : adapter.templates().commands) {
        if (filename == name + ".md") return true;
    }
    return false;
}

std::string Reconciler::review_command(const Adapter& adapter, const std::vector<Expert>& experts) const {
    std::string body;
    try {
        body = render_review_command(review_command_template(), experts);
    } catch (const TemplateError& e) {
        spdlog::warn("Review command template failed for {}: {}", adapter.name(), e.what());
        body = fallback_review_command();
    }
    return adapter.format_command(kReviewCommand, command_description(kReviewCommand), body);
}

std::vector<DesiredFile> Reconciler::desired_files(const Adapter& adapter,
                                                   const std::vector<Expert>& experts,
                                                   std::vector<FileError>& errors) const {
    std::vector<DesiredFile> desired;
    std::set<std::string> seen;
    const PathSet paths = adapter.paths();

    auto add = [&](std::string path, std::string content) {
        if (!seen.insert(path).second) {
            errors.push_back({path, "more than one file maps to this path"});
            return;
        }
        desired.push_back({std::move(path), std::move(content)});
    };

    // Experts the adapter can render; the rest are recorded and skipped
    std::vector<Expert> valid;
    std::vector<std::string> agent_contents;
    for (const auto& e : experts) {
        try {
            agent_contents.push_back(adapter.format_agent(e));
            valid.push_back(e);
        } catch (const std::exception& ex) {
            std::string where = e.id.empty() ? rel_path(paths.agents, "(unnamed)")
                                             : rel_path(paths.agents, agent_filename(e));
            errors.push_back({where, ex.what()});
        }
    }

    if (!adapter.aggregate_file().empty()) {
        add(rel_path(".", adapter.aggregate_file()), adapter.format_aggregate(valid));
        return desired;
    }

    for (size_t i = 0; i < valid.size(); i++) {
        add(rel_path(paths.agents, agent_filename(valid[i])), std::move(agent_contents[i]));
    }

    std::string review = review_command(adapter, valid);
    if (!review.empty()) {
        add(rel_path(paths.commands, std::string(kReviewCommand) + ".md"), std::move(review));
    }

    for (const auto& [name, body] : adapter.templates().commands) {
        if (!command_enabled(name)) {
            continue;
        }
        std::string content = adapter.format_command(name, command_description(name), body);
        if (content.empty()) {
            continue;
        }
        add(rel_path(paths.commands, name + ".md"), std::move(content));
    }

    return desired;
}

std::map<std::string, std::optional<ContentDigest>> Reconciler::actual_files(const Adapter& adapter) const {
    std::map<std::string, std::optional<ContentDigest>> actual;

    auto record = [&](const std::string& rel) {
        auto content = read_file(root_ / rel);
        if (content) {
            actual[rel] = digest_of(*content);
        } else {
            actual[rel] = std::nullopt;
        }
    };

    if (!adapter.aggregate_file().empty()) {
        std::string rel = rel_path(".", adapter.aggregate_file());
        std::error_code ec;
        if (fs::is_regular_file(fs::symlink_status(root_ / rel, ec))) {
            record(rel);
        }
        return actual;
    }

    const PathSet paths = adapter.paths();
    const bool shared_dir = paths.agents == paths.commands;

    if (is_managed_dir(paths.agents)) {
        for (const auto& filename : owned_candidates(root_ / paths.agents)) {
            if (shared_dir && owns_command_file(adapter, filename)) continue;
            record(rel_path(paths.agents, filename));
        }
    }

    if (is_managed_dir(paths.commands)) {
        for (const auto& filename : owned_candidates(root_ / paths.commands)) {
            if (owns_command_file(adapter, filename)) {
                record(rel_path(paths.commands, filename));
            }
        }
    }

    return actual;
}

Plan Reconciler::plan(const Adapter& adapter, const std::vector<Expert>& experts) const {
    Plan plan;
    plan.target = adapter.name();

    const PathSet paths = adapter.paths();
    if (adapter.aggregate_file().empty()) {
        if (is_managed_dir(paths.agents)) plan.directories.push_back(paths.agents);
        if (is_managed_dir(paths.commands) && paths.commands != paths.agents) {
            plan.directories.push_back(paths.commands);
        }
    } else {
        auto parent = fs::path(adapter.aggregate_file()).parent_path();
        if (!parent.empty()) plan.directories.push_back(parent.generic_string());
    }

    std::vector<DesiredFile> desired = desired_files(adapter, experts, plan.errors);
    auto actual = actual_files(adapter);

    std::set<std::string> desired_paths;
    for (auto& file : desired) {
        desired_paths.insert(file.path);
        ContentDigest digest = digest_of(file.content);

        auto it = actual.find(file.path);
        if (it == actual.end()) {
            plan.changes.push_back({FileAction::create, file.path, std::move(file.content), digest.hex()});
        } else if (!it->second || *it->second != digest) {
            plan.changes.push_back({FileAction::update, file.path, std::move(file.content), digest.hex()});
        } else {
            plan.unchanged.push_back(file.path);
        }
    }

    for (const auto& [path, _] : actual) {
        if (desired_paths.count(path)) continue;
        if (options_.clean) {
            plan.changes.push_back({FileAction::remove, path, "", ""});
        } else {
            plan.kept_stale.push_back(path);
        }
    }

    // An obsolete layout goes entirely, regardless of what it contains
    for (const auto& deprecated : paths.deprecated) {
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(root_ / deprecated, ec))) continue;
        if (options_.clean) {
            plan.changes.push_back({FileAction::remove_deprecated, deprecated, "", ""});
        } else {
            plan.kept_deprecated.push_back(deprecated);
        }
    }

    return plan;
}

TargetResult Reconciler::apply(const Adapter& adapter, const Plan& plan) const {
    TargetResult result;
    result.target = adapter.name();
    result.display_name = adapter.display_name();
    result.plan = plan;
    result.skipped = plan.unchanged.size();
    result.errors = plan.errors;

    for (const auto& dir : plan.directories) {
        std::error_code ec;
        fs::create_directories(root_ / dir, ec);
        if (ec || !fs::is_directory(root_ / dir)) {
            std::string reason = ec ? ec.message() : "path exists and is not a directory";
            throw TargetError("cannot create " + dir + ": " + reason);
        }
    }

    for (const auto& change : plan.changes) {
        const fs::path target = root_ / change.path;
        std::error_code ec;

        switch (change.action) {
            case FileAction::create:
            case FileAction::update:
                try {
                    replace_symlink(target);
                    write_file(target, change.content);
                    if (change.action == FileAction::create) {
                        result.created++;
                        spdlog::debug("Created {}", change.path);
                    } else {
                        result.updated++;
                        spdlog::debug("Updated {}", change.path);
                    }
                } catch (const std::exception& e) {
                    spdlog::warn("Failed to write {}: {}", change.path, e.what());
                    result.errors.push_back({change.path, e.what()});
                }
                break;

            case FileAction::remove:
                fs::remove(target, ec);
                if (ec) {
                    spdlog::warn("Failed to remove {}: {}", change.path, ec.message());
                    result.errors.push_back({change.path, "cannot remove: " + ec.message()});
                } else {
                    result.deleted++;
                    spdlog::debug("Removed {}", change.path);
                }
                break;

            case FileAction::remove_deprecated:
                fs::remove_all(target, ec);
                if (ec) {
                    spdlog::warn("Failed to remove deprecated {}: {}", change.path, ec.message());
                    result.errors.push_back({change.path, "cannot remove deprecated path: " + ec.message()});
                } else {
                    result.deleted++;
                    spdlog::debug("Removed deprecated {}", change.path);
                }
                break;
        }
    }

    spdlog::info("{}: {} created, {} updated, {} deleted, {} unchanged, {} errors",
                 adapter.name(), result.created, result.updated, result.deleted,
                 result.skipped, result.errors.size());
    return result;
}

TargetResult Reconciler::reconcile(const Adapter& adapter, const std::vector<Expert>& experts) const {
    Plan p = plan(adapter, experts);

    if (!options_.dry_run) {
        return apply(adapter, p);
    }

    TargetResult result;
    result.target = adapter.name();
    result.display_name = adapter.display_name();
    result.dry_run = true;
    result.created = p.count(FileAction::create);
    result.updated = p.count(FileAction::update);
    result.deleted = p.count(FileAction::remove) + p.count(FileAction::remove_deprecated);
    result.skipped = p.unchanged.size();
    result.errors = p.errors;
    result.plan = std::move(p);
    spdlog::info("[DRY RUN] {}: {} changes planned", adapter.name(), result.plan.changes.size());
    return result;
}

}  // namespace council
