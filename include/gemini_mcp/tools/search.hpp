#pragma once

#include <gemini_mcp/core/result.hpp>
#include <gemini_mcp/extract/search_extract.hpp>
#include <gemini_mcp/gemini/i_generation_service.hpp>
#include <gemini_mcp/tools/tool_types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace gemini_mcp {

// ---------------------------------------------------------------------------
// gemini-search-v2: semantic search across caller-supplied sources.
// ---------------------------------------------------------------------------
struct SearchFilters {
    std::optional<std::vector<std::string>> source_ids;
    std::optional<double> min_relevance;
    std::optional<std::size_t> max_results;
};

struct SearchInput {
    std::string query;
    std::vector<Source> sources;
    std::optional<SearchFilters> filters;
    RankingCriteria ranking = RankingCriteria::Relevance;
    bool include_citations = true;
    std::optional<ModelVariant> model;
    std::optional<GenerationParams> params;
};

struct SearchOutput {
    std::string answer;
    std::vector<SourceResult> results;
    std::vector<Citation> citations;
};

void to_json(nlohmann::json& j, const SearchOutput& output);

constexpr double kSearchTemperature = 0.3;
constexpr uint32_t kSearchMaxTokens = 2048;

[[nodiscard]] Result<SearchInput, Error> DecodeSearchInput(
    const nlohmann::json& args);

/// Prompt listing every source under a "--- Source: <title> (ID: <id>) ---"
/// header followed by the answer/results/citations instructions.
std::string BuildSearchPrompt(const std::string& query,
                              const std::vector<Source>& sources);

[[nodiscard]] Result<ToolResponse<SearchOutput>, Error> ExecuteSearch(
    IGenerationService& service,
    const SearchInput& input);

} // namespace gemini_mcp
