#include <gemini_mcp/tools/tool_json.hpp>

namespace gemini_mcp {

void to_json(nlohmann::json& j, const Idea& idea) {
    j = nlohmann::json{{"id", idea.id}, {"text", idea.text}};
}

void to_json(nlohmann::json& j, const ConsensusTheme& theme) {
    j = nlohmann::json{{"theme", theme.theme},
                       {"frequency", theme.frequency},
                       {"related_ideas", theme.related_ideas}};
}

void to_json(nlohmann::json& j, const SourceResult& result) {
    j = nlohmann::json{{"source_id", result.source_id},
                       {"source_title", result.source_title},
                       {"excerpt", result.excerpt},
                       {"relevance_score", result.relevance_score}};
}

void to_json(nlohmann::json& j, const Citation& citation) {
    j = nlohmann::json{{"source_id", citation.source_id},
                       {"source_title", citation.source_title},
                       {"quote", citation.quote}};
}

void to_json(nlohmann::json& j, const CodeIssue& issue) {
    j = nlohmann::json{{"severity", issue.severity},
                       {"category", issue.category},
                       {"description", issue.description},
                       {"location", nullptr}};
    if (issue.location.has_value()) {
        j["location"] = *issue.location;
    }
}

void to_json(nlohmann::json& j, const Emotion& emotion) {
    j = nlohmann::json{{"name", emotion.name}, {"intensity", emotion.intensity}};
}

} // namespace gemini_mcp
