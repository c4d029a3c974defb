#pragma once

#include <council/adapter.hpp>

namespace council {

// Claude Code: .claude/agents and .claude/commands.
class ClaudeAdapter : public Adapter {
public:
    std::string name() const override { return "claude"; }
    std::string display_name() const override { return "Claude Code"; }

    bool detect(const fs::path& project_root) const override;
    PathSet paths() const override;
    TemplateSet templates() const override;

    // The persona file as stored, so the source formatting is preserved.
    std::string format_agent(const Expert& e) const override;

    // Claude Code commands are plain markdown.
    std::string format_command(const std::string& name,
                               const std::string& description,
                               const std::string& body) const override;
};

}  // namespace council
