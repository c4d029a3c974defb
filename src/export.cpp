#include <council/export.hpp>
#include <council/errors.hpp>
#include <council/util.hpp>

#include <sstream>

namespace council {

namespace {
    std::string file_stem(const Expert& e) {
        std::string filename = agent_filename(e);
        return filename.substr(0, filename.size() - 3);
    }
}

std::string export_markdown(const std::vector<Expert>& experts) {
    std::ostringstream out;
    out << "# Expert Council\n\n"
        << "Use these expert perspectives when reviewing my work.\n\n";

    for (size_t i = 0; i < experts.size(); ++i) {
        const Expert& e = experts[i];
        out << "## " << e.name << source_marker(e) << "\n"
            << "**Focus**: " << e.focus << "\n\n";

        if (!trim(e.philosophy).empty()) {
            out << trim(e.philosophy) << "\n\n";
        }

        if (!e.principles.empty()) {
            out << "**Principles**:\n";
            for (const auto& p : e.principles) {
                out << "- " << p << "\n";
            }
            out << "\n";
        }

        if (!e.red_flags.empty()) {
            out << "**Watch for**:\n";
            for (const auto& r : e.red_flags) {
                out << "- " << r << "\n";
            }
            out << "\n";
        }

        if (i + 1 < experts.size()) {
            out << "---\n\n";
        }
    }
    return out.str();
}

nlohmann::json export_json(const std::vector<Expert>& experts) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& e : experts) {
        list.push_back(expert_to_json(e));
    }
    return {{"experts", list}, {"markdown", export_markdown(experts)}};
}

const Expert& find_expert(const std::vector<Expert>& experts, const std::string& key) {
    for (const auto& e : experts) {
        if (file_stem(e) == key) {
            return e;
        }
    }

    std::vector<const Expert*> by_id;
    for (const auto& e : experts) {
        if (e.id == key) {
            by_id.push_back(&e);
        }
    }

    if (by_id.empty()) {
        throw ExpertLookupError("expert '" + key + "' not found - run 'council list' to see available experts");
    }
    if (by_id.size() > 1) {
        std::vector<std::string> stems;
        for (const Expert* e : by_id) {
            stems.push_back(file_stem(*e));
        }
        throw ExpertLookupError("expert id '" + key + "' is ambiguous: " + join(stems, ", "));
    }
    return *by_id.front();
}

std::string format_expert_details(const Expert& e) {
    std::ostringstream out;
    out << "ID:     " << e.id << "\n"
        << "Name:   " << e.name << "\n"
        << "Focus:  " << e.focus << "\n"
        << "Source: " << (e.source.empty() ? "project" : e.source) << "\n";

    if (!trim(e.philosophy).empty()) {
        out << "\nPhilosophy:\n  " << trim(e.philosophy) << "\n";
    }

    if (!e.principles.empty()) {
        out << "\nPrinciples:\n";
        for (const auto& p : e.principles) {
            out << "  - " << p << "\n";
        }
    }

    if (!e.red_flags.empty()) {
        out << "\nRed Flags:\n";
        for (const auto& r : e.red_flags) {
            out << "  - " << r << "\n";
        }
    }

    out << "\nAgent file: " << agent_filename(e) << "\n";
    return out.str();
}

}  // namespace council
