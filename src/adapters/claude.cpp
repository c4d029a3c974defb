#include <council/adapters/claude.hpp>
#include <council/errors.hpp>
#include <council/util.hpp>

namespace council {

namespace {

const char* const kInstallDoc = R"md(# Install Council

Your AI tool will read these instructions to set up the council.

## Quick Start

1. Check if council is already initialized:
```bash
ls -la .council/
```

2. If not initialized, run:
```bash
council init --tool=claude
```

3. Add experts by writing persona files to `.council/experts/`, or use
   `/council-add` for an interactive search.

4. Sync to Claude Code:
```bash
council sync
```
)md";

const char* const kAddCommand = R"md(# Add Expert to Council

Add a new expert to the council: $ARGUMENTS

## Step 1: Classify Input

Determine what type of input $ARGUMENTS is:

| Type | Pattern | Examples |
|------|---------|----------|
| **Name** | Quoted string, or 2-3 capitalized words forming a person's name | `"Kent Beck"`, `Sandi Metz` |
| **Description** | Contains "a ", "someone", "expert in", "help with" | `a testing expert`, `someone for API design` |
| **Keyword** | Single word describing a domain | `testing`, `APIs`, `security` |

**If ambiguous, treat as description.**

## Step 2: Check the Current Council

```bash
council list --json
```

Avoid suggesting experts already in the council.

## Step 3: Present Options

Build exactly 4 options and use **AskUserQuestion** to present them:

| Label | Description |
|-------|-------------|
| "{Name}" | {focus} |
| "{Name}" | {focus} |
| "{Name}" | {focus} |
| "Custom" | Create a persona matching your description |

If the user gave a name, the first option is that person.

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

## Philosophy

{philosophy text}

## Principles

- {principle 1}
- ...

## Red Flags

Watch for these patterns:
- {red flag 1}
- ...

## Review Style

{2-3 sentences describing how they approach code review}
```

## After Creating

1. Run `council sync` to update AI tool configurations
2. Confirm with: "Added {Name} ({id}) to the council"
3. Show the file path
)md";

const char* const kDetectCommand = R"md(# Detect Stack and Suggest Experts

Analyze this codebase and suggest council experts.

## Step 1: Survey the Project

Look at build files, manifests and the source tree to determine:

1. **Languages**: the primary language and its share of the code
2. **Frameworks**: frameworks and major libraries in use
3. **Testing**: test tools and approaches
4. **Patterns**: architectural patterns
5. **Domain**: the problem the project solves

## Step 2: Suggest Experts

Suggest **3-5 experts** (maximum 7). Consider:

- **Framework experts** (1-2): DHH for Rails, Chris McCord for Phoenix
- **Language experts** (1-2): Rob Pike for Go, Matz for Ruby
- **Practice experts** (1-2): Kent Beck if tests exist, Sandi Metz for OO design

Each expert fills a unique role. Prefer direct stack matches over general wisdom.

For each expert give the **Name**, the **Focus** relevant to this project and
one sentence on **Why**.

## After Analysis

Ask which experts to add, then use `/council-add` for each one.
If the user says "all", add every suggested expert.
)md";

const char* const kRemoveCommand = R"md(# Remove Expert from Council

Remove an expert from the council: $ARGUMENTS

## Step 1: Identify the Expert

If no expert was named, list the council and ask which one to remove:

```bash
council list
```

## Step 2: Remove the Persona

Delete `.council/experts/{expert-id}.md` after confirming with the user.

## Step 3: Sync Changes

```bash
council sync --clean
```

## After Removing

Confirm with: "Removed {Name} from the council"
)md";

}  // namespace

bool ClaudeAdapter::detect(const fs::path& project_root) const {
    return dir_exists(project_root / ".claude");
}

PathSet ClaudeAdapter::paths() const {
    return PathSet{".claude/agents", ".claude/commands", {}};
}

TemplateSet ClaudeAdapter::templates() const {
    TemplateSet t;
    t.install = kInstallDoc;
    t.commands = {
        {"council-add", kAddCommand},
        {"council-detect", kDetectCommand},
        {"council-remove", kRemoveCommand},
    };
    return t;
}

std::string ClaudeAdapter::format_agent(const Expert& e) const {
    validate(e);
    std::string text = e.origin.empty() ? serialize_expert(e) : e.origin;
    if (e.source.empty()) {
        return text;
    }

    // Personas from outside the project are tagged right after the opening ---
    auto first_nl = text.find('\n');
    if (first_nl == std::string::npos) {
        throw FormatError("expert '" + e.id + "' has no frontmatter");
    }
    return text.substr(0, first_nl + 1) + "source: " + e.source + "\n" + text.substr(first_nl + 1);
}

std::string ClaudeAdapter::format_command(const std::string& name,
                                          const std::string& description,
                                          const std::string& body) const {
    (void)name;
    (void)description;
    return body;
}

}  // namespace council
