#include <council/review_template.hpp>
#include <council/errors.hpp>

namespace council {

namespace {

const char* const kSectionOpen = "#experts";
const char* const kSectionClose = "/experts";

struct Token {
    bool is_tag{false};
    std::string text;  // literal text, or the tag name
};

std::vector<Token> tokenize(const std::string& tmpl) {
    std::vector<Token> tokens;
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find("{{", pos);
        if (open == std::string::npos) {
            tokens.push_back({false, tmpl.substr(pos)});
            break;
        }
        if (open > pos) {
            tokens.push_back({false, tmpl.substr(pos, open - pos)});
        }
        size_t close = tmpl.find("}}", open + 2);
        if (close == std::string::npos) {
            throw TemplateError("unterminated tag at offset " + std::to_string(open));
        }
        tokens.push_back({true, tmpl.substr(open + 2, close - open - 2)});
        pos = close + 2;
    }
    return tokens;
}

std::string field(const Expert& e, const std::string& tag) {
    if (tag == "name") return e.name;
    if (tag == "focus") return e.focus;
    if (tag == "id") return e.id;
    if (tag == "marker") return source_marker(e);
    throw TemplateError("unknown tag '{{" + tag + "}}'");
}

}  // namespace

const std::string& review_command_template() {
    static const std::string tmpl = R"md(# Code Review Council

Convene the council to review: $ARGUMENTS

## Council Members
{{#experts}}
### {{name}}
**Focus**: {{focus}}
{{/experts}}
## Instructions

Review the code from each expert's perspective. For each expert:
1. State the expert's name
2. Provide their assessment focused on their domain
3. Note any concerns or suggestions

At the end, synthesize the key points and provide actionable recommendations.
)md";
    return tmpl;
}

std::string render_review_command(const std::string& tmpl, const std::vector<Expert>& experts) {
    std::vector<Token> tokens = tokenize(tmpl);

    std::string out;
    for (size_t i = 0; i < tokens.size(); i++) {
        const Token& tok = tokens[i];
        if (!tok.is_tag) {
            out += tok.text;
            continue;
        }
        if (tok.text == kSectionClose) {
            throw TemplateError("'{{/experts}}' without matching '{{#experts}}'");
        }
        if (tok.text != kSectionOpen) {
            throw TemplateError("tag '{{" + tok.text + "}}' is only valid inside {{#experts}}");
        }

        // Collect the section body
        size_t end = i + 1;
        while (end < tokens.size() && !(tokens[end].is_tag && tokens[end].text == kSectionClose)) {
            if (tokens[end].is_tag && tokens[end].text == kSectionOpen) {
                throw TemplateError("nested {{#experts}} sections are not supported");
            }
            end++;
        }
        if (end == tokens.size()) {
            throw TemplateError("'{{#experts}}' is never closed");
        }

        // Validate tags even when there are no experts to expand
        for (size_t j = i + 1; j < end; j++) {
            if (tokens[j].is_tag) {
                field(Expert{}, tokens[j].text);
            }
        }

        for (const auto& e : experts) {
            for (size_t j = i + 1; j < end; j++) {
                out += tokens[j].is_tag ? field(e, tokens[j].text) : tokens[j].text;
            }
        }
        i = end;
    }
    return out;
}

std::string fallback_review_command() {
    return "# Code Review Council\n\nConvene the council to review: $ARGUMENTS\n";
}

}  // namespace council
