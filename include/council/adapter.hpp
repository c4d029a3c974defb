#pragma once

#include <council/expert.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace council {

namespace fs = std::filesystem;

// Directory layout of one tool, relative to the project root.
struct PathSet {
    std::string agents;
    std::string commands;
    // Locations the tool used before a layout change; removed on --clean
    std::vector<std::string> deprecated;
};

// Static content bundled with an adapter.
struct TemplateSet {
    std::string install;
    std::map<std::string, std::string> commands;  // name -> body
};

/**
 * Per-tool strategy: identity, detection, paths and content formatting.
 *
 * Formatters are pure. format_agent throws FormatError for records it
 * cannot render; the reconciler records that against the file and moves on.
 */
class Adapter {
public:
    virtual ~Adapter() = default;

    virtual std::string name() const = 0;
    virtual std::string display_name() const = 0;

    // Stat-only check for the tool's marker files under project_root.
    virtual bool detect(const fs::path& project_root) const = 0;

    virtual PathSet paths() const = 0;
    virtual TemplateSet templates() const = 0;

    virtual std::string format_agent(const Expert& e) const = 0;

    // Empty result means the adapter does not support commands.
    virtual std::string format_command(const std::string& name,
                                       const std::string& description,
                                       const std::string& body) const = 0;

    // The fallback adapter is used when nothing is detected and is never
    // reported by detection itself.
    virtual bool is_fallback() const { return false; }

    // Non-empty for adapters that write one combined file instead of one
    // file per expert plus commands.
    virtual std::string aggregate_file() const { return {}; }

    // Content of the aggregate file for already-validated experts.
    virtual std::string format_aggregate(const std::vector<Expert>& experts) const;
};

class AdapterRegistry {
public:
    AdapterRegistry() = default;
    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;
    AdapterRegistry(AdapterRegistry&&) = default;
    AdapterRegistry& operator=(AdapterRegistry&&) = default;

    // Last registration for a name wins.
    void add(std::unique_ptr<Adapter> adapter);

    // nullptr when not registered.
    const Adapter* get(const std::string& name) const;

    std::vector<std::string> names() const;

    // Sorted by name.
    std::vector<const Adapter*> all() const;

    // Adapters that recognize the project, fallback excluded, sorted by name.
    std::vector<const Adapter*> detect(const fs::path& project_root) const;

    const Adapter* fallback() const;

    bool empty() const { return adapters_.empty(); }

private:
    std::map<std::string, std::unique_ptr<Adapter>> adapters_;
};

// claude, opencode and generic.
void register_builtin_adapters(AdapterRegistry& registry);

// Description used in command frontmatter.
std::string command_description(const std::string& name);

}  // namespace council
