#include <gemini_mcp/mcp/mcp_tool_handlers.hpp>

#include <gemini_mcp/tools/analyze.hpp>
#include <gemini_mcp/tools/brainstorm.hpp>
#include <gemini_mcp/tools/query.hpp>
#include <gemini_mcp/tools/search.hpp>
#include <gemini_mcp/tools/summarize.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace gemini_mcp {

namespace {

// ---------------------------------------------------------------------------
// Result adapters
// ---------------------------------------------------------------------------

// v1 tools return their text as-is.
template <typename Input>
Result<ToolResult, Error> RunText(
    Result<Input, Error> (*decode)(const nlohmann::json&),
    Result<std::string, Error> (*execute)(IGenerationService&, const Input&),
    IGenerationService& service,
    const nlohmann::json& args) {
    auto input = decode(args);
    if (input.IsErr()) return Result<ToolResult, Error>::Err(input.Error());
    auto text = execute(service, input.Value());
    if (text.IsErr()) return Result<ToolResult, Error>::Err(text.Error());
    return Result<ToolResult, Error>::Ok(ToolResult::Text(text.Value()));
}

// v2 tools return {"result", "metadata"} pretty-printed.
template <typename Input, typename Output>
Result<ToolResult, Error> RunDocument(
    Result<Input, Error> (*decode)(const nlohmann::json&),
    Result<ToolResponse<Output>, Error> (*execute)(IGenerationService&, const Input&),
    IGenerationService& service,
    const nlohmann::json& args) {
    auto input = decode(args);
    if (input.IsErr()) return Result<ToolResult, Error>::Err(input.Error());
    auto response = execute(service, input.Value());
    if (response.IsErr()) return Result<ToolResult, Error>::Err(response.Error());
    return Result<ToolResult, Error>::Ok(
        ToolResult::Text(nlohmann::json(response.Value()).dump(2)));
}

Result<std::string, Error> ExecuteBrainstormText(IGenerationService& service,
                                                 const BrainstormInput& input) {
    auto output = ExecuteBrainstormLegacy(service, input);
    if (output.IsErr()) return Result<std::string, Error>::Err(output.Error());
    return Result<std::string, Error>::Ok(FormatLegacyBrainstorm(output.Value()));
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc) {
    return {{"type", "integer"}, {"description", desc}};
}

nlohmann::json NumberProp(const std::string& desc) {
    return {{"type", "number"}, {"description", desc}};
}

nlohmann::json BoolProp(const std::string& desc, bool default_val) {
    return {{"type", "boolean"}, {"description", desc}, {"default", default_val}};
}

nlohmann::json EnumProp(const std::string& desc,
                        const std::vector<std::string>& values,
                        const std::string& default_val = "") {
    nlohmann::json prop = {{"type", "string"},
                           {"description", desc},
                           {"enum", values}};
    if (!default_val.empty()) prop["default"] = default_val;
    return prop;
}

nlohmann::json StringArrayProp(const std::string& desc) {
    return {{"type", "array"},
            {"description", desc},
            {"items", {{"type", "string"}}}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

nlohmann::json ObjectProp(const std::string& desc,
                          const nlohmann::json& properties) {
    return {{"type", "object"},
            {"description", desc},
            {"properties", properties}};
}

nlohmann::json ModelProp() {
    return EnumProp("Model variant: 'pro' (quality, default) or 'flash' (fast)",
                    {"pro", "flash"});
}

nlohmann::json ParamsProp() {
    return ObjectProp(
        "Generation parameters overriding the tool defaults",
        {{"temperature", NumberProp("Sampling temperature")},
         {"max_tokens", IntProp("Maximum output tokens")},
         {"top_p", NumberProp("Nucleus sampling probability")},
         {"top_k", IntProp("Top-k sampling")}});
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterGeminiTools
// ---------------------------------------------------------------------------
void RegisterGeminiTools(ToolRegistry& registry, IGenerationService& service) {
    // === v1 tools ===

    registry.Register(
        "gemini-query",
        "Send direct queries to Gemini models",
        MakeSchema(
            {{"prompt", StringProp("The prompt to send")},
             {"model", EnumProp("Model variant", {"pro", "flash"}, "pro")},
             {"temperature", NumberProp("Sampling temperature")},
             {"max_output_tokens", IntProp("Maximum output tokens")}},
            {"prompt"}),
        [&service](const nlohmann::json& args) {
            return RunText(&DecodeQueryInput, &ExecuteQuery, service, args);
        });

    registry.Register(
        "gemini-analyze-code",
        "Analyze code",
        MakeSchema(
            {{"code", StringProp("Source code to analyze")},
             {"language", StringProp("Programming language")},
             {"focus", EnumProp("Analysis focus",
                                {"general", "quality", "security", "performance", "bugs"},
                                "general")}},
            {"code"}),
        [&service](const nlohmann::json& args) {
            return RunText(&DecodeAnalyzeCodeInput, &ExecuteAnalyzeCode, service, args);
        });

    registry.Register(
        "gemini-analyze-text",
        "Analyze text",
        MakeSchema(
            {{"text", StringProp("Text to analyze")},
             {"focus", StringProp("Aspect to focus on")}},
            {"text"}),
        [&service](const nlohmann::json& args) {
            return RunText(&DecodeAnalyzeTextInput, &ExecuteAnalyzeText, service, args);
        });

    registry.Register(
        "gemini-summarize",
        "Summarize content",
        MakeSchema(
            {{"content", StringProp("Content to summarize")},
             {"length", EnumProp("Summary length", {"brief", "medium", "detailed"}, "medium")},
             {"format", EnumProp("Summary format",
                                 {"paragraph", "bullet_points", "executive", "key_points"},
                                 "paragraph")},
             {"focus", StringProp("Aspect to focus on")}},
            {"content"}),
        [&service](const nlohmann::json& args) {
            return RunText(&DecodeSummarizeInput, &ExecuteSummarizeLegacy, service, args);
        });

    registry.Register(
        "gemini-brainstorm",
        "Collaborative brainstorming",
        MakeSchema(
            {{"prompt", StringProp("The topic or problem to brainstorm")},
             {"claude_thoughts", StringProp("Your own thoughts to build on")},
             {"max_rounds", IntProp("Maximum collaboration rounds (default: 3)")}},
            {"prompt"}),
        [&service](const nlohmann::json& args) {
            return RunText(&DecodeBrainstormInput, &ExecuteBrainstormText, service, args);
        });

    // === v2 tools ===

    registry.Register(
        "gemini-search-v2",
        "Multi-source semantic search with citations and ranking",
        MakeSchema(
            {{"query", StringProp("The search query")},
             {"sources",
              {{"type", "array"},
               {"description", "Sources to search across"},
               {"items", MakeSchema({{"id", StringProp("Unique identifier for this source")},
                                     {"title", StringProp("Title of the source")},
                                     {"content", StringProp("Content to search")}},
                                    {"id", "title", "content"})}}},
             {"filters",
              ObjectProp("Search filters",
                         {{"source_ids", StringArrayProp("Limit search to specific source IDs")},
                          {"min_relevance", NumberProp("Minimum relevance score (0-1)")},
                          {"max_results", IntProp("Maximum number of results")}})},
             {"ranking", EnumProp("Ranking criteria",
                                  {"relevance", "recency", "popularity"}, "relevance")},
             {"include_citations", BoolProp("Include citations in results", true)},
             {"model", ModelProp()},
             {"params", ParamsProp()}},
            {"query", "sources"}),
        [&service](const nlohmann::json& args) {
            return RunDocument(&DecodeSearchInput, &ExecuteSearch, service, args);
        });

    registry.Register(
        "gemini-analyze-v2",
        "Unified analyzer with 5 types: text, code, document, sentiment, comparison",
        MakeSchema(
            {{"content", StringProp("The content to analyze")},
             {"analyzer_type",
              {{"type", "object"},
               {"description",
                "Analyzer selection; 'code' accepts params.language, "
                "'comparison' requires params.compare_with"},
               {"properties",
                {{"type", EnumProp("Analyzer type",
                                   {"text", "code", "document", "sentiment", "comparison"})},
                 {"params", ObjectProp("Analyzer parameters",
                                       {{"language", StringProp("Programming language")},
                                        {"compare_with", StringProp("Text to compare against")}})}}},
               {"required", {"type"}}}},
             {"options",
              ObjectProp("Analyzer options",
                         {{"focus_areas", StringArrayProp("Specific aspects to focus on")},
                          {"detail_level", EnumProp("Level of detail in analysis",
                                                    {"brief", "standard", "comprehensive"},
                                                    "standard")}})},
             {"model", ModelProp()},
             {"params", ParamsProp()}},
            {"content", "analyzer_type"}),
        [&service](const nlohmann::json& args) {
            return RunDocument(&DecodeAnalyzeInput, &ExecuteAnalyze, service, args);
        });

    registry.Register(
        "gemini-summarize-v2",
        "Enhanced summarization with key topics extraction and word count",
        MakeSchema(
            {{"content", StringProp("Content to summarize (max 1M characters)")},
             {"length", EnumProp("Summary length", {"brief", "medium", "detailed"}, "medium")},
             {"format", EnumProp("Summary format",
                                 {"paragraph", "bullet_points", "executive", "key_points"},
                                 "paragraph")},
             {"focus", StringProp("Aspect to focus on")},
             {"model", ModelProp()},
             {"params", ParamsProp()}},
            {"content"}),
        [&service](const nlohmann::json& args) {
            return RunDocument(&DecodeSummarizeInput, &ExecuteSummarize, service, args);
        });

    auto num_ideas = IntProp("Number of ideas to generate (1-50, default: 10)");
    num_ideas["minimum"] = 1;
    num_ideas["maximum"] = 50;
    num_ideas["default"] = 10;
    registry.Register(
        "gemini-brainstorm-v2",
        "Idea generation with consensus theme extraction",
        MakeSchema(
            {{"prompt", StringProp("The topic or problem to brainstorm")},
             {"num_ideas", num_ideas},
             {"constraints", StringProp("Optional constraints or context for brainstorming")},
             {"extract_consensus", BoolProp("Extract consensus themes from generated ideas", true)},
             {"model", ModelProp()},
             {"params", ParamsProp()}},
            {"prompt"}),
        [&service](const nlohmann::json& args) {
            return RunDocument(&DecodeBrainstormInput, &ExecuteBrainstorm, service, args);
        });
}

} // namespace gemini_mcp
