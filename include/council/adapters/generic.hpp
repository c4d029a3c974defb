#pragma once

#include <council/adapter.hpp>

namespace council {

// Fallback for projects without a recognized tool: a single AGENTS.md in
// the project root, no commands.
class GenericAdapter : public Adapter {
public:
    std::string name() const override { return "generic"; }
    std::string display_name() const override { return "Generic (AGENTS.md)"; }

    // Always true, but excluded from detection as the fallback.
    bool detect(const fs::path& project_root) const override;
    PathSet paths() const override;
    TemplateSet templates() const override;

    // One AGENTS.md section.
    std::string format_agent(const Expert& e) const override;
    std::string format_command(const std::string& name,
                               const std::string& description,
                               const std::string& body) const override;

    bool is_fallback() const override { return true; }
    std::string aggregate_file() const override { return "AGENTS.md"; }
    std::string format_aggregate(const std::vector<Expert>& experts) const override;
};

}  // namespace council
