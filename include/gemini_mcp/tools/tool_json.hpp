#pragma once

#include <gemini_mcp/extract/ideas.hpp>
#include <gemini_mcp/extract/search_extract.hpp>
#include <gemini_mcp/extract/text_extract.hpp>

#include <nlohmann/json.hpp>

namespace gemini_mcp {

// JSON shapes of the extracted structures as they appear in v2 results.
// The extraction layer itself stays free of any JSON dependency.

void to_json(nlohmann::json& j, const Idea& idea);
void to_json(nlohmann::json& j, const ConsensusTheme& theme);
void to_json(nlohmann::json& j, const SourceResult& result);
void to_json(nlohmann::json& j, const Citation& citation);
void to_json(nlohmann::json& j, const CodeIssue& issue);
void to_json(nlohmann::json& j, const Emotion& emotion);

} // namespace gemini_mcp
