#pragma once

#include <council/adapter.hpp>
#include <council/config.hpp>

#include <filesystem>
#include <vector>

namespace council {

struct Resolution {
    std::vector<const Adapter*> adapters;
    // True when the list came from detection rather than configuration
    bool auto_detected{false};
};

// Explicit targets, else the configured tool, else detection (none ->
// fallback, one -> it, several -> all in name order). Unknown names throw
// ConfigError.
Resolution resolve_targets(const AdapterRegistry& registry,
                           const Config& config,
                           const fs::path& project_root);

// Throws ConfigError naming the valid targets.
const Adapter& require_adapter(const AdapterRegistry& registry, const std::string& name);

}  // namespace council
