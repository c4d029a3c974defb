#include <council/adapters/opencode.hpp>
#include <council/util.hpp>

#include <sstream>

namespace council {

namespace {

const char* const kInstallDoc = R"md(# Install Council

Set up the council for your project.

## Quick Start

1. Check if council is already initialized:
```bash
ls -la .council/
```

2. If not initialized, run:
```bash
council init --tool=opencode
```

3. Add experts by writing persona files to `.council/experts/`, or use
   `/council-add` to search for one.

4. Sync to OpenCode:
```bash
council sync
```
)md";

// OpenCode has no question tool, so choices are numbered text.
const char* const kAddCommand = R"md(# Add Expert to Council

Add a new expert to the council: $ARGUMENTS

## Step 1: Classify Input

Determine what type of input $ARGUMENTS is:

- **Name**: Quoted string, or 2-3 capitalized words forming a person's name (e.g., "Kent Beck")
- **Description**: Contains "a ", "someone", "expert in", "help with" (e.g., "a testing expert")
- **Keyword**: Single word describing a domain (e.g., "testing", "APIs")

**If ambiguous, treat as description.**

## Step 2: Check the Current Council

```bash
council list --json
```

Avoid suggesting experts already in the council.

## Step 3: Present Options

```
Based on your request, here are 4 options:

1. {Name} - {focus}
2. {Name} - {focus}
3. {Name} - {focus}
4. Custom - Create a persona matching your description

Which option? (1/2/3/4):
```

Wait for the user's response before continuing.

## Step 4: Write the Persona

Create `.council/experts/{id}.md`:

```markdown
---
id: {kebab-case-id}
name: {Full Name}
focus: {focus area}
philosophy: |
  {first person, 2-4 sentences}
principles:
  - {principle 1}
  - {principle 2}
  - {principle 3}
  - {principle 4}
red_flags:
  - {red flag 1}
  - {red flag 2}
  - {red flag 3}
---

# {Name} - {focus}

You are channeling {Name}, known for expertise in {focus}.
```

## After Creating

1. Run `council sync` to update AI tool configurations
2. Confirm with: "Added {Name} ({id}) to the council"
)md";

const char* const kDetectCommand = R"md(# Detect Stack and Suggest Experts

Analyze this codebase and suggest council experts.

## Step 1: Survey the Project

Look at build files, manifests and the source tree to determine the
languages, frameworks, testing tools, architectural patterns and domain.

## Step 2: Suggest Experts

Suggest **3-5 experts** (maximum 7), each filling a unique role:

- **Framework experts** (1-2)
- **Language experts** (1-2)
- **Practice experts** (1-2)

Present them as a numbered list with name, focus and one sentence on why.

## After Analysis

Ask which numbers to add, then use `/council-add` for each one.
If the user says "all", add every suggested expert.
)md";

const char* const kRemoveCommand = R"md(# Remove Expert from Council

Remove an expert from the council: $ARGUMENTS

## Step 1: Identify the Expert

If no expert was named, list the council and ask for the number to remove:

```bash
council list
```

## Step 2: Remove the Persona

Delete `.council/experts/{expert-id}.md` after the user confirms (y/n).

## Step 3: Sync Changes

```bash
council sync --clean
```

## After Removing

Confirm with: "Removed {Name} from the council"
)md";

}  // namespace

bool OpenCodeAdapter::detect(const fs::path& project_root) const {
    return dir_exists(project_root / ".opencode") || file_exists(project_root / "opencode.json");
}

PathSet OpenCodeAdapter::paths() const {
    return PathSet{".opencode/agents", ".opencode/commands", {".opencode/agent"}};
}

TemplateSet OpenCodeAdapter::templates() const {
    TemplateSet t;
    t.install = kInstallDoc;
    t.commands = {
        {"council-add", kAddCommand},
        {"council-detect", kDetectCommand},
        {"council-remove", kRemoveCommand},
    };
    return t;
}

std::string OpenCodeAdapter::format_agent(const Expert& e) const {
    validate(e);

    std::ostringstream out;
    out << "---\n"
        << "description: " << e.focus << source_marker(e) << "\n"
        << "mode: subagent\n"
        << "---\n\n"
        << "# " << e.name << source_marker(e) << "\n\n"
        << "You are channeling " << e.name << ", known for expertise in " << e.focus << ".\n\n";

    if (!trim(e.philosophy).empty()) {
        out << "## Philosophy\n\n" << trim(e.philosophy) << "\n\n";
    }

    if (!e.principles.empty()) {
        out << "## Principles\n\n";
        for (const auto& p : e.principles) {
            out << "- " << p << "\n";
        }
        out << "\n";
    }

    if (!e.red_flags.empty()) {
        out << "## Red Flags\n\nWatch for these patterns:\n";
        for (const auto& r : e.red_flags) {
            out << "- " << r << "\n";
        }
        out << "\n";
    }

    out << "## Review Style\n\n"
        << "When reviewing code, focus on your area of expertise. Be direct and specific.\n"
        << "Explain your reasoning. Suggest concrete improvements.\n";
    return out.str();
}

std::string OpenCodeAdapter::format_command(const std::string& name,
                                            const std::string& description,
                                            const std::string& body) const {
    (void)name;
    return "---\ndescription: " + description + "\nmode: subagent\n---\n\n" + body;
}

}  // namespace council
