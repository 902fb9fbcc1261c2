#include <gemini_mcp/tools/search.hpp>

#include <gemini_mcp/core/log.hpp>
#include <gemini_mcp/tools/tool_json.hpp>

#include "tool_args.hpp"

#include <algorithm>

namespace gemini_mcp {

namespace {

const char* kOperation = "Search";

Result<RankingCriteria, Error> ParseRanking(const std::string& name) {
    using R = Result<RankingCriteria, Error>;
    if (name == "relevance") return R::Ok(RankingCriteria::Relevance);
    if (name == "recency") return R::Ok(RankingCriteria::Recency);
    if (name == "popularity") return R::Ok(RankingCriteria::Popularity);
    return R::Err(Error::InvalidInput(
        kOperation, "Invalid ranking '" + name +
                        "': expected relevance, recency or popularity"));
}

Result<std::vector<Source>, Error> DecodeSources(const nlohmann::json& args) {
    using R = Result<std::vector<Source>, Error>;
    if (tool_args::IsAbsent(args, "sources")) {
        return R::Err(Error::InvalidInput(kOperation,
                                          "Missing required parameter: sources"));
    }
    if (!args["sources"].is_array()) {
        return R::Err(tool_args::InvalidType(kOperation, "sources", "array"));
    }

    std::vector<Source> sources;
    for (const auto& item : args["sources"]) {
        if (!item.is_object()) {
            return R::Err(tool_args::InvalidType(kOperation, "sources", "array of objects"));
        }
        Source source;
        auto id = tool_args::RequireString(item, "id", kOperation);
        if (id.IsErr()) return R::Err(id.Error());
        auto title = tool_args::RequireString(item, "title", kOperation);
        if (title.IsErr()) return R::Err(title.Error());
        auto content = tool_args::RequireString(item, "content", kOperation);
        if (content.IsErr()) return R::Err(content.Error());
        source.id = id.Value();
        source.title = title.Value();
        source.content = content.Value();
        sources.push_back(std::move(source));
    }
    return R::Ok(std::move(sources));
}

Result<std::optional<SearchFilters>, Error> DecodeFilters(const nlohmann::json& args) {
    using R = Result<std::optional<SearchFilters>, Error>;
    auto obj = tool_args::OptObject(args, "filters", kOperation);
    if (obj.IsErr()) return R::Err(obj.Error());
    if (!obj.Value().has_value()) return R::Ok(std::nullopt);
    const auto& f = *obj.Value();

    SearchFilters filters;
    auto ids = tool_args::OptStringArray(f, "source_ids", kOperation);
    if (ids.IsErr()) return R::Err(ids.Error());
    filters.source_ids = ids.Value();

    auto min_relevance = tool_args::OptNumber(f, "min_relevance", kOperation);
    if (min_relevance.IsErr()) return R::Err(min_relevance.Error());
    filters.min_relevance = min_relevance.Value();

    auto max_results = tool_args::OptCount(f, "max_results", kOperation);
    if (max_results.IsErr()) return R::Err(max_results.Error());
    if (max_results.Value().has_value()) {
        filters.max_results = static_cast<std::size_t>(*max_results.Value());
    }
    return R::Ok(filters);
}

} // anonymous namespace

void to_json(nlohmann::json& j, const SearchOutput& output) {
    j = nlohmann::json{{"answer", output.answer},
                       {"results", output.results},
                       {"citations", output.citations}};
}

Result<SearchInput, Error> DecodeSearchInput(const nlohmann::json& args) {
    using R = Result<SearchInput, Error>;
    SearchInput input;

    auto query = tool_args::RequireString(args, "query", kOperation);
    if (query.IsErr()) return R::Err(query.Error());
    input.query = query.Value();

    auto sources = DecodeSources(args);
    if (sources.IsErr()) return R::Err(sources.Error());
    input.sources = sources.Value();

    auto filters = DecodeFilters(args);
    if (filters.IsErr()) return R::Err(filters.Error());
    input.filters = filters.Value();

    auto ranking = tool_args::OptString(args, "ranking", kOperation);
    if (ranking.IsErr()) return R::Err(ranking.Error());
    if (ranking.Value().has_value()) {
        auto criteria = ParseRanking(*ranking.Value());
        if (criteria.IsErr()) return R::Err(criteria.Error());
        input.ranking = criteria.Value();
    }

    auto citations = tool_args::OptBool(args, "include_citations", true, kOperation);
    if (citations.IsErr()) return R::Err(citations.Error());
    input.include_citations = citations.Value();

    auto model = tool_args::OptModel(args, kOperation);
    if (model.IsErr()) return R::Err(model.Error());
    input.model = model.Value();

    auto params = tool_args::OptParams(args, kOperation);
    if (params.IsErr()) return R::Err(params.Error());
    input.params = params.Value();

    return R::Ok(std::move(input));
}

std::string BuildSearchPrompt(const std::string& query,
                              const std::vector<Source>& sources) {
    std::string prompt =
        "You are performing a semantic search across multiple sources.\n\n"
        "Query: " + query + "\n\nSources:\n\n";
    for (const auto& source : sources) {
        prompt += "--- Source: " + source.title + " (ID: " + source.id + ") ---\n";
        prompt += source.content + "\n\n";
    }
    prompt +=
        "Based on the query, provide:\n"
        "1. A direct answer to the query\n"
        "2. For each relevant source, provide:\n"
        "   - Source ID and title\n"
        "   - A brief excerpt showing relevance\n"
        "   - Relevance score (0.0-1.0)\n"
        "3. If applicable, include direct quotes as citations\n\n"
        "Format your response clearly with sections for Answer, Results, and Citations.";
    return prompt;
}

Result<ToolResponse<SearchOutput>, Error> ExecuteSearch(
    IGenerationService& service,
    const SearchInput& input) {
    using R = Result<ToolResponse<SearchOutput>, Error>;

    auto valid = tool_args::RequireNonBlank(input.query, kOperation,
                                            "Query cannot be empty");
    if (valid.IsErr()) return R::Err(valid.Error());
    if (input.sources.empty()) {
        return R::Err(Error::InvalidInput(kOperation, "At least one source is required"));
    }

    std::vector<Source> sources = input.sources;
    if (input.filters && input.filters->source_ids) {
        const auto& ids = *input.filters->source_ids;
        sources.erase(std::remove_if(sources.begin(), sources.end(),
                                     [&ids](const Source& s) {
                                         return std::find(ids.begin(), ids.end(),
                                                          s.id) == ids.end();
                                     }),
                      sources.end());
        if (sources.empty()) {
            return R::Err(Error::InvalidInput(kOperation,
                                              "No sources match the filter criteria"));
        }
    }

    const auto variant = input.model.value_or(ModelVariant::Pro);
    const auto model_id = service.ModelId(variant);
    LogInfo("search", "model=" + model_id + ", sources=" +
                          std::to_string(sources.size()));

    GenerationConfig defaults;
    defaults.temperature = kSearchTemperature;
    defaults.max_output_tokens = kSearchMaxTokens;
    const auto config = ResolveGenerationConfig(input.params, defaults);

    auto response = service.Generate(BuildSearchPrompt(input.query, sources),
                                     variant, config);
    if (response.IsErr()) return R::Err(response.Error());
    const auto& text = response.Value().text;

    RankingOptions ranking;
    ranking.criteria = input.ranking;
    if (input.filters) {
        ranking.min_relevance = input.filters->min_relevance;
        ranking.max_results = input.filters->max_results;
    }

    SearchOutput output;
    output.answer = ExtractAnswer(text);
    output.results = RankResults(ExtractResults(text, sources), ranking);
    if (input.include_citations) {
        output.citations = ExtractCitations(text, sources);
    }

    LogDebug("search", "results=" + std::to_string(output.results.size()) +
                           ", citations=" + std::to_string(output.citations.size()));

    return R::Ok(ToolResponse<SearchOutput>{
        std::move(output),
        ResponseMetadata::WithUsage(model_id, response.Value().usage)});
}

} // namespace gemini_mcp
