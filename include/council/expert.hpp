#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace council {

namespace fs = std::filesystem;

// An expert persona. Persisted as markdown with YAML frontmatter.
struct Expert {
    std::string id;
    std::string name;
    std::string focus;
    std::string philosophy;
    std::vector<std::string> principles;
    std::vector<std::string> red_flags;

    // Suggestion metadata, persisted but never read by the reconciler
    bool core{false};
    std::vector<std::string> triggers;
    std::string category;
    std::string priority;  // "normal", "high" or "always"

    // Markdown after the frontmatter
    std::string body;

    // Not persisted: "", "custom" or "installed:<repo>", set by the lister
    std::string source;
    // Not persisted: raw text of the file this record was parsed from
    std::string origin;
};

struct ExpertList {
    std::vector<Expert> experts;
    std::vector<std::string> warnings;
};

void apply_defaults(Expert& e);

// Throws FormatError when a required field is missing or the id cannot be
// used as a file stem.
void validate(const Expert& e);

// Filename inside an adapter's agents directory, prefixed by provenance so
// experts with the same id from different sources never collide.
std::string agent_filename(const Expert& e);

std::string source_marker(const Expert& e);

bool is_installed_source(const std::string& source);

std::string generate_body(const Expert& e);

std::string to_id(const std::string& name);

Expert parse_expert(const std::string& text);
std::string serialize_expert(const Expert& e);

Expert load_expert(const fs::path& path);
void save_expert(Expert& e, const fs::path& path);

ExpertList list_experts_in_dir(const fs::path& dir, const std::string& source);

nlohmann::json expert_to_json(const Expert& e);

}  // namespace council
