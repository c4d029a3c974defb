#pragma once

#include <council/expert.hpp>

#include <string>
#include <vector>

namespace council {

// Body of the dynamic /council review command. The {{#experts}} ...
// {{/experts}} section repeats once per expert; inside it {{name}},
// {{focus}}, {{id}} and {{marker}} expand to that expert's fields.
const std::string& review_command_template();

// Pure: same template and experts give the same bytes. Throws
// TemplateError for unbalanced sections, unknown or misplaced tags.
std::string render_review_command(const std::string& tmpl, const std::vector<Expert>& experts);

// Minimal body used when the template cannot be rendered.
std::string fallback_review_command();

}  // namespace council
