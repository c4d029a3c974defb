#include <council/resolver.hpp>
#include <council/errors.hpp>
#include <council/util.hpp>

#include <algorithm>

#include <spdlog/spdlog.h>

namespace council {

const Adapter& require_adapter(const AdapterRegistry& registry, const std::string& name) {
    const Adapter* adapter = registry.get(name);
    if (!adapter) {
        throw ConfigError("unknown target '" + name + "' - valid targets: " +
                          join(registry.names(), ", "));
    }
    return *adapter;
}

Resolution resolve_targets(const AdapterRegistry& registry,
                           const Config& config,
                           const fs::path& project_root) {
    Resolution resolution;

    if (!config.targets.empty()) {
        for (const auto& name : config.targets) {
            const Adapter* adapter = &require_adapter(registry, name);
            if (std::find(resolution.adapters.begin(), resolution.adapters.end(), adapter) ==
                resolution.adapters.end()) {
                resolution.adapters.push_back(adapter);
            }
        }
        return resolution;
    }

    if (!config.tool.empty()) {
        const Adapter* adapter = registry.get(config.tool);
        if (!adapter) {
            throw ConfigError("unknown tool '" + config.tool + "' in config - valid tools: " +
                              join(registry.names(), ", "));
        }
        resolution.adapters.push_back(adapter);
        return resolution;
    }

    resolution.auto_detected = true;
    resolution.adapters = registry.detect(project_root);

    if (resolution.adapters.empty()) {
        const Adapter* fallback = registry.fallback();
        if (!fallback) {
            throw ConfigError("no AI tool detected and no fallback target is registered");
        }
        spdlog::info("No AI tool detected, using {}", fallback->display_name());
        resolution.adapters.push_back(fallback);
    } else if (resolution.adapters.size() > 1) {
        std::vector<std::string> names;
        for (const auto* a : resolution.adapters) {
            names.push_back(a->name());
        }
        spdlog::info("Multiple tools detected ({}), syncing to all of them", join(names, ", "));
    } else {
        spdlog::info("Detected: {}", resolution.adapters.front()->display_name());
    }

    return resolution;
}

}  // namespace council
