#pragma once

#include <council/adapter.hpp>

namespace council {

// OpenCode: .opencode/agents and .opencode/commands. Earlier releases used
// the singular .opencode/agent directory.
class OpenCodeAdapter : public Adapter {
public:
    std::string name() const override { return "opencode"; }
    std::string display_name() const override { return "OpenCode"; }

    bool detect(const fs::path& project_root) const override;
    PathSet paths() const override;
    TemplateSet templates() const override;

    std::string format_agent(const Expert& e) const override;
    std::string format_command(const std::string& name,
                               const std::string& description,
                               const std::string& body) const override;
};

}  // namespace council
