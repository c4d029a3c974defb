#pragma once

#include <council/expert.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace council {

// Portable markdown of the whole council, for pasting into any AI chat.
std::string export_markdown(const std::vector<Expert>& experts);

nlohmann::json export_json(const std::vector<Expert>& experts);

// Finds one expert by agent file stem ("dhh", "custom-dhh") or by id.
// Throws ExpertLookupError when nothing matches or an id is ambiguous.
const Expert& find_expert(const std::vector<Expert>& experts, const std::string& key);

// Human-readable details for `council show`.
std::string format_expert_details(const Expert& e);

}  // namespace council
