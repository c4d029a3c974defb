#pragma once

#include <council/expert.hpp>

#include <filesystem>

namespace council {

namespace fs = std::filesystem;

// Where council data lives for one invocation.
struct Layout {
    fs::path project_root;
    fs::path user_dir;  // $XDG_CONFIG_HOME/council

    fs::path council_dir() const { return project_root / ".council"; }
    fs::path config_file() const { return council_dir() / "config.yaml"; }
    fs::path experts_dir() const { return council_dir() / "experts"; }
    fs::path commands_dir() const { return council_dir() / "commands"; }
    fs::path custom_dir() const { return user_dir / "my-council"; }
    fs::path installed_dir() const { return user_dir / "installed"; }
};

// user_dir from $XDG_CONFIG_HOME, falling back to $HOME/.config.
Layout make_layout(const fs::path& project_root);

bool council_exists(const Layout& layout);

// Project experts, then the personal council, then every installed
// repository in name order. Files that fail to load become warnings.
ExpertList list_experts(const Layout& layout);

// Names of installed persona repositories, sorted.
std::vector<std::string> list_installed(const Layout& layout);

}  // namespace council
