#include <council/expert.hpp>
#include <council/errors.hpp>
#include <council/util.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace council {

namespace {
    const char* const kInstalledPrefix = "installed:";

    std::string get_string(const YAML::Node& node, const char* key) {
        if (!node[key] || node[key].IsNull()) return "";
        if (!node[key].IsScalar()) {
            throw ExpertParseError(std::string("field '") + key + "' must be a string");
        }
        return node[key].as<std::string>();
    }

    std::vector<std::string> get_list(const YAML::Node& node, const char* key) {
        std::vector<std::string> out;
        if (!node[key] || node[key].IsNull()) return out;
        if (!node[key].IsSequence()) {
            throw ExpertParseError(std::string("field '") + key + "' must be a list");
        }
        for (const auto& item : node[key]) {
            out.push_back(item.as<std::string>());
        }
        return out;
    }

    // YAML errors with the offending line and its neighbours.
    std::string describe_yaml_error(const std::string& frontmatter, const YAML::ParserException& e) {
        std::vector<std::string> lines;
        std::istringstream in(frontmatter);
        for (std::string line; std::getline(in, line);) {
            lines.push_back(line);
        }

        int line_num = e.mark.line + 1;
        if (e.mark.is_null() || line_num < 1 || line_num > static_cast<int>(lines.size())) {
            return "failed to parse YAML: " + e.msg +
                   "\n\nHint: Check indentation and special characters";
        }

        std::ostringstream out;
        out << "YAML error at line " << line_num << ":\n\n";
        int start = std::max(0, line_num - 2);
        int end = std::min(static_cast<int>(lines.size()), line_num + 1);
        for (int i = start; i < end; i++) {
            out << "  " << (i == line_num - 1 ? "> " : "  ") << (i + 1) << ": " << lines[i] << "\n";
        }
        out << "\nError: " << e.msg;
        if (e.msg.find("end of map") != std::string::npos ||
            e.msg.find("illegal") != std::string::npos) {
            out << "\n\nHint: Check for:\n"
                << "  - Missing or extra spaces in indentation\n"
                << "  - Special characters that need quoting (: @ # etc)\n"
                << "  - Missing dash (-) for list items\n";
        }
        return out.str();
    }

    void emit_list(YAML::Emitter& out, const char* key, const std::vector<std::string>& items) {
        if (items.empty()) return;
        out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
        for (const auto& item : items) {
            out << item;
        }
        out << YAML::EndSeq;
    }
}

void apply_defaults(Expert& e) {
    if (e.category.empty()) e.category = "custom";
    if (e.priority.empty()) e.priority = "normal";
}

void validate(const Expert& e) {
    if (e.id.empty()) {
        throw FormatError("expert has no id");
    }
    if (e.name.empty()) {
        throw FormatError("expert '" + e.id + "' has no name");
    }
    if (e.focus.empty()) {
        throw FormatError("expert '" + e.id + "' has no focus");
    }
    bool bad_char = std::any_of(e.id.begin(), e.id.end(), [](unsigned char c) {
        return c == '/' || c == '\\' || std::iscntrl(c) || std::isspace(c);
    });
    if (bad_char || e.id[0] == '.') {
        throw FormatError("expert id '" + e.id + "' is not a valid file name");
    }
}

bool is_installed_source(const std::string& source) {
    return starts_with(source, kInstalledPrefix);
}

std::string agent_filename(const Expert& e) {
    if (e.source == "custom") {
        return "custom-" + e.id + ".md";
    }
    if (is_installed_source(e.source)) {
        return "installed-" + e.id + ".md";
    }
    return e.id + ".md";
}

std::string source_marker(const Expert& e) {
    if (e.source == "custom") return " [custom]";
    if (is_installed_source(e.source)) return " [" + e.source + "]";
    return "";
}

std::string generate_body(const Expert& e) {
    std::ostringstream out;
    out << "# " << e.name << " - " << e.focus << "\n\n";
    out << "You are channeling " << e.name << ", known for expertise in " << e.focus << ".\n";

    if (!trim(e.philosophy).empty()) {
        out << "\n## Philosophy\n\n" << trim(e.philosophy) << "\n";
    }

    if (!e.principles.empty()) {
        out << "\n## Principles\n\n";
        for (const auto& p : e.principles) {
            out << "- " << p << "\n";
        }
    }

    if (!e.red_flags.empty()) {
        out << "\n## Red Flags\n\nWatch for these patterns:\n";
        for (const auto& r : e.red_flags) {
            out << "- " << r << "\n";
        }
    }

    out << "\n## Review Style\n\n"
        << "When reviewing code, focus on your area of expertise. Be direct and specific.\n"
        << "Explain your reasoning. Suggest concrete improvements.";
    return out.str();
}

std::string to_id(const std::string& name) {
    std::string id;
    bool pending_dash = false;
    for (unsigned char c : name) {
        char lower = static_cast<char>(std::tolower(c));
        if ((lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9')) {
            if (pending_dash && !id.empty()) id += '-';
            pending_dash = false;
            id += lower;
        } else {
            pending_dash = true;
        }
    }
    return id;
}

Expert parse_expert(const std::string& text) {
    if (!starts_with(text, "---")) {
        throw ExpertParseError("missing frontmatter: file must start with '---'");
    }

    // The frontmatter closes at the next line that starts with ---
    auto first_nl = text.find('\n');
    if (first_nl == std::string::npos) {
        throw ExpertParseError("invalid frontmatter: missing closing '---'");
    }
    auto close = text.find("\n---", first_nl);
    if (close == std::string::npos) {
        throw ExpertParseError("invalid frontmatter: missing closing '---'");
    }

    std::string frontmatter = text.substr(first_nl + 1, close - first_nl);
    auto body_start = text.find('\n', close + 4);
    std::string body = body_start == std::string::npos ? "" : trim(text.substr(body_start + 1));

    YAML::Node node;
    try {
        node = YAML::Load(frontmatter);
    } catch (const YAML::ParserException& e) {
        throw ExpertParseError(describe_yaml_error(frontmatter, e));
    }

    if (!node.IsMap()) {
        throw ExpertParseError("invalid frontmatter: expected a mapping of fields");
    }

    Expert e;
    try {
        e.id = get_string(node, "id");
        e.name = get_string(node, "name");
        e.focus = get_string(node, "focus");
        e.philosophy = get_string(node, "philosophy");
        e.principles = get_list(node, "principles");
        e.red_flags = get_list(node, "red_flags");
        e.core = node["core"] && node["core"].as<bool>();
        e.triggers = get_list(node, "triggers");
        e.category = get_string(node, "category");
        e.priority = get_string(node, "priority");
    } catch (const YAML::Exception& ex) {
        throw ExpertParseError("invalid frontmatter value: " + ex.msg);
    }
    e.body = body;
    return e;
}

std::string serialize_expert(const Expert& e) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << e.id;
    out << YAML::Key << "name" << YAML::Value << e.name;
    out << YAML::Key << "focus" << YAML::Value << e.focus;
    if (!e.philosophy.empty()) {
        out << YAML::Key << "philosophy" << YAML::Value;
        if (e.philosophy.find('\n') != std::string::npos) {
            out << YAML::Literal;
        }
        out << e.philosophy;
    }
    emit_list(out, "principles", e.principles);
    emit_list(out, "red_flags", e.red_flags);
    if (e.core) {
        out << YAML::Key << "core" << YAML::Value << true;
    }
    emit_list(out, "triggers", e.triggers);
    if (!e.category.empty()) {
        out << YAML::Key << "category" << YAML::Value << e.category;
    }
    if (!e.priority.empty()) {
        out << YAML::Key << "priority" << YAML::Value << e.priority;
    }
    out << YAML::EndMap;

    if (!out.good()) {
        throw FormatError("failed to serialize expert '" + e.id + "': " + out.GetLastError());
    }

    std::string body = e.body.empty() ? generate_body(e) : e.body;
    return "---\n" + std::string(out.c_str()) + "\n---\n\n" + body;
}

Expert load_expert(const fs::path& path) {
    auto text = read_file(path);
    if (!text) {
        throw ExpertParseError("cannot read " + path.string());
    }
    Expert e = parse_expert(*text);
    e.origin = *text;
    return e;
}

void save_expert(Expert& e, const fs::path& path) {
    if (e.id.empty()) {
        e.id = to_id(e.name);
    }
    apply_defaults(e);
    validate(e);
    if (e.body.empty()) {
        e.body = generate_body(e);
    }

    std::string content = serialize_expert(e);

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("failed to create directory " +
                                     path.parent_path().string() + ": " + ec.message());
        }
    }

    write_file(path, content);

    // Verify the saved file parses back to the same identity
    Expert loaded;
    try {
        loaded = load_expert(path);
    } catch (const std::exception& ex) {
        fs::remove(path, ec);
        throw std::runtime_error("saved file is invalid: " + std::string(ex.what()));
    }
    if (loaded.id != e.id || loaded.name != e.name) {
        fs::remove(path, ec);
        throw std::runtime_error("saved file has corrupted data: id or name mismatch");
    }
    e.origin = content;
}

ExpertList list_experts_in_dir(const fs::path& dir, const std::string& source) {
    ExpertList result;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return result;
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;
        std::string filename = entry.path().filename().string();
        if (!ends_with(filename, ".md") || filename == "README.md") continue;
        files.push_back(entry.path());
    }
    if (ec) {
        result.warnings.push_back("could not read " + dir.string() + ": " + ec.message());
    }

    // Directory order is unspecified
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        try {
            Expert e = load_expert(file);
            e.source = source;
            result.experts.push_back(std::move(e));
        } catch (const std::exception& ex) {
            spdlog::debug("Skipping {}: {}", file.string(), ex.what());
            result.warnings.push_back("could not load " + file.filename().string() + ": " + ex.what());
        }
    }

    return result;
}

nlohmann::json expert_to_json(const Expert& e) {
    nlohmann::json j = {
        {"id", e.id},
        {"name", e.name},
        {"focus", e.focus},
    };
    if (!e.philosophy.empty()) j["philosophy"] = e.philosophy;
    if (!e.principles.empty()) j["principles"] = e.principles;
    if (!e.red_flags.empty()) j["red_flags"] = e.red_flags;
    if (!e.category.empty()) j["category"] = e.category;
    if (!e.priority.empty()) j["priority"] = e.priority;
    if (!e.source.empty()) j["source"] = e.source;
    return j;
}

}  // namespace council
