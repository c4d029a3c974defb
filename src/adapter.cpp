#include <council/adapter.hpp>
#include <council/adapters/claude.hpp>
#include <council/adapters/generic.hpp>
#include <council/adapters/opencode.hpp>

#include <spdlog/spdlog.h>

namespace council {

std::string Adapter::format_aggregate(const std::vector<Expert>& experts) const {
    std::string out;
    for (const auto& e : experts) {
        out += format_agent(e);
        out += "\n";
    }
    return out;
}

void AdapterRegistry::add(std::unique_ptr<Adapter> adapter) {
    if (!adapter) return;
    std::string name = adapter->name();
    if (adapters_.count(name)) {
        spdlog::debug("Replacing adapter registration for {}", name);
    }
    adapters_[name] = std::move(adapter);
}

const Adapter* AdapterRegistry::get(const std::string& name) const {
    auto it = adapters_.find(name);
    return it == adapters_.end() ? nullptr : it->second.get();
}

std::vector<std::string> AdapterRegistry::names() const {
    std::vector<std::string> names;
    names.reserve(adapters_.size());
    for (const auto& [name, _] : adapters_) {
        names.push_back(name);
    }
    return names;
}

std::vector<const Adapter*> AdapterRegistry::all() const {
    std::vector<const Adapter*> out;
    out.reserve(adapters_.size());
    for (const auto& [_, adapter] : adapters_) {
        out.push_back(adapter.get());
    }
    return out;
}

std::vector<const Adapter*> AdapterRegistry::detect(const fs::path& project_root) const {
    std::vector<const Adapter*> detected;
    for (const auto& [name, adapter] : adapters_) {
        if (adapter->is_fallback()) {
            continue;
        }
        if (adapter->detect(project_root)) {
            spdlog::debug("Detected {} in {}", name, project_root.string());
            detected.push_back(adapter.get());
        }
    }
    return detected;
}

const Adapter* AdapterRegistry::fallback() const {
    for (const auto& [_, adapter] : adapters_) {
        if (adapter->is_fallback()) {
            return adapter.get();
        }
    }
    return nullptr;
}

void register_builtin_adapters(AdapterRegistry& registry) {
    registry.add(std::make_unique<ClaudeAdapter>());
    registry.add(std::make_unique<OpenCodeAdapter>());
    registry.add(std::make_unique<GenericAdapter>());
}

std::string command_description(const std::string& name) {
    static const std::map<std::string, std::string> descriptions = {
        {"council", "Convene the council to review code"},
        {"council-add", "Add expert to council with AI-generated content"},
        {"council-detect", "Detect the project stack and suggest experts"},
        {"council-remove", "Remove expert from council"},
    };
    auto it = descriptions.find(name);
    return it == descriptions.end() ? name : it->second;
}

}  // namespace council
