#pragma once

#include <council/adapter.hpp>
#include <council/digest.hpp>
#include <council/expert.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace council {

namespace fs = std::filesystem;

struct SyncOptions {
    bool dry_run{false};  // compute the plan, touch nothing
    bool clean{false};    // delete stale owned files and deprecated paths
    // Never read by the reconciler, which always applies updates. The CLI
    // uses it to skip the overwrite confirmation.
    bool force{false};
};

enum class FileAction {
    create,
    update,
    remove,
    remove_deprecated,
};

const char* to_string(FileAction action);

// A file that should exist, relative to the project root.
struct DesiredFile {
    std::string path;
    std::string content;
};

struct PlannedChange {
    FileAction action;
    std::string path;
    std::string content;  // empty for removals
    std::string digest;   // of content, empty for removals
};

struct FileError {
    std::string path;
    std::string message;
};

struct Plan {
    std::string target;
    std::vector<std::string> directories;  // must exist before writing
    // Writes in desired order, then removals, then deprecated removals
    std::vector<PlannedChange> changes;
    std::vector<std::string> unchanged;
    std::vector<std::string> kept_stale;       // left in place, clean is off
    std::vector<std::string> kept_deprecated;  // left in place, clean is off
    std::vector<FileError> errors;             // records that could not be formatted

    size_t count(FileAction action) const;
};

struct TargetResult {
    std::string target;
    std::string display_name;
    bool dry_run{false};
    bool failed{false};
    std::string error;  // target-level failure

    Plan plan;

    size_t created{0};
    size_t updated{0};
    size_t deleted{0};
    size_t skipped{0};
    std::vector<FileError> errors;
};

nlohmann::json to_json(const TargetResult& result);

/**
 * Brings one adapter's directories into agreement with the expert set.
 *
 * Only files matching the owned naming convention are ever considered:
 * `*.md` files in the agents directory, `council.md`, `council-*.md` and
 * bundled command files in the commands directory, or the single aggregate
 * file. Everything else in those directories is left alone.
 */
class Reconciler {
public:
    Reconciler(fs::path project_root, SyncOptions options);

    // Enabled bundled commands; empty means all of them. The review
    // command is always generated.
    void set_enabled_commands(std::vector<std::string> commands);

    std::vector<DesiredFile> desired_files(const Adapter& adapter,
                                           const std::vector<Expert>& experts,
                                           std::vector<FileError>& errors) const;

    // Owned files currently on disk, keyed by project-relative path. A file
    // that cannot be read maps to nullopt.
    std::map<std::string, std::optional<ContentDigest>> actual_files(const Adapter& adapter) const;

    Plan plan(const Adapter& adapter, const std::vector<Expert>& experts) const;

    // Throws TargetError when the base directories cannot be created.
    TargetResult apply(const Adapter& adapter, const Plan& plan) const;

    // plan() and, unless dry-run, apply().
    TargetResult reconcile(const Adapter& adapter, const std::vector<Expert>& experts) const;

    const SyncOptions& options() const { return options_; }

private:
    bool command_enabled(const std::string& name) const;
    bool owns_command_file(const Adapter& adapter, const std::string& filename) const;
    std::string review_command(const Adapter& adapter, const std::vector<Expert>& experts) const;

    fs::path root_;
    SyncOptions options_;
    std::vector<std::string> enabled_commands_;
};

}  // namespace council
