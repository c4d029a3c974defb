#include <council/project.hpp>
#include <council/util.hpp>

#include <algorithm>
#include <cstdlib>

namespace council {

Layout make_layout(const fs::path& project_root) {
    Layout layout;
    layout.project_root = project_root;

    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        layout.user_dir = fs::path(xdg) / "council";
    } else {
        layout.user_dir = fs::path(expand_path("~/.config")) / "council";
    }
    return layout;
}

bool council_exists(const Layout& layout) {
    return dir_exists(layout.council_dir());
}

std::vector<std::string> list_installed(const Layout& layout) {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(layout.installed_dir(), ec)) {
        return names;
    }
    for (fs::directory_iterator it(layout.installed_dir(), ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

ExpertList list_experts(const Layout& layout) {
    ExpertList all;

    auto merge = [&all](ExpertList part) {
        for (auto& e : part.experts) {
            all.experts.push_back(std::move(e));
        }
        for (auto& w : part.warnings) {
            all.warnings.push_back(std::move(w));
        }
    };

    merge(list_experts_in_dir(layout.experts_dir(), ""));
    merge(list_experts_in_dir(layout.custom_dir(), "custom"));
    for (const auto& repo : list_installed(layout)) {
        merge(list_experts_in_dir(layout.installed_dir() / repo, "installed:" + repo));
    }

    return all;
}

}  // namespace council
