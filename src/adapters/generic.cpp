#include <council/adapters/generic.hpp>
#include <council/util.hpp>

#include <sstream>

namespace council {

namespace {

const char* const kInstallDoc = R"md(# Install Council

Set up the council for your project.

## Quick Start

1. Initialize the council:
```bash
council init --tool=generic
```

2. Add experts by writing persona files to `.council/experts/`.

3. Sync to generate AGENTS.md:
```bash
council sync
```

The AGENTS.md file is created in your project root. AI tools that support
the AGENTS.md convention will use these expert personas.
)md";

const char* const kHeader =
    "# AGENTS.md - Expert Council\n"
    "\n"
    "This file defines expert personas for AI coding assistants.\n"
    "\n"
    "## Council Members\n";

}  // namespace

bool GenericAdapter::detect(const fs::path& project_root) const {
    (void)project_root;
    return true;
}

PathSet GenericAdapter::paths() const {
    return PathSet{".", ".", {}};
}

TemplateSet GenericAdapter::templates() const {
    TemplateSet t;
    t.install = kInstallDoc;
    return t;
}

std::string GenericAdapter::format_agent(const Expert& e) const {
    validate(e);

    std::ostringstream out;
    out << "### " << e.name << source_marker(e) << "\n"
        << "- **ID**: " << e.id << "\n"
        << "- **Focus**: " << e.focus << "\n";

    if (!trim(e.philosophy).empty()) {
        out << "\n" << trim(e.philosophy) << "\n";
    }

    if (!e.principles.empty()) {
        out << "\n**Principles:**\n";
        for (const auto& p : e.principles) {
            out << "- " << p << "\n";
        }
    }
    return out.str();
}

std::string GenericAdapter::format_command(const std::string& name,
                                           const std::string& description,
                                           const std::string& body) const {
    (void)name;
    (void)description;
    (void)body;
    return "";
}

std::string GenericAdapter::format_aggregate(const std::vector<Expert>& experts) const {
    std::string out = kHeader;
    for (const auto& e : experts) {
        out += "\n";
        out += format_agent(e);
    }
    return out;
}

}  // namespace council
