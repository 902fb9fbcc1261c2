#include <gemini_mcp/tools/analyze.hpp>

#include <gemini_mcp/core/log.hpp>
#include <gemini_mcp/tools/tool_json.hpp>

#include "tool_args.hpp"

namespace gemini_mcp {

namespace {

const char* kOperation = "Analyze";

const char* KindName(AnalyzerKind kind) {
    switch (kind) {
        case AnalyzerKind::Text:       return "text";
        case AnalyzerKind::Code:       return "code";
        case AnalyzerKind::Document:   return "document";
        case AnalyzerKind::Sentiment:  return "sentiment";
        case AnalyzerKind::Comparison: return "comparison";
    }
    return "text";
}

Result<AnalyzerType, Error> DecodeAnalyzerType(const nlohmann::json& args) {
    using R = Result<AnalyzerType, Error>;
    if (tool_args::IsAbsent(args, "analyzer_type")) {
        return R::Err(Error::InvalidInput(
            kOperation, "Missing required parameter: analyzer_type"));
    }
    if (!args["analyzer_type"].is_object()) {
        return R::Err(tool_args::InvalidType(kOperation, "analyzer_type", "object"));
    }
    const auto& spec = args["analyzer_type"];

    auto type = tool_args::RequireString(spec, "type", kOperation);
    if (type.IsErr()) return R::Err(type.Error());

    auto params_obj = tool_args::OptObject(spec, "params", kOperation);
    if (params_obj.IsErr()) return R::Err(params_obj.Error());
    const auto params = params_obj.Value().value_or(nlohmann::json::object());

    AnalyzerType analyzer;
    const auto& name = type.Value();
    if (name == "text") {
        analyzer.kind = AnalyzerKind::Text;
    } else if (name == "code") {
        analyzer.kind = AnalyzerKind::Code;
        auto language = tool_args::OptString(params, "language", kOperation);
        if (language.IsErr()) return R::Err(language.Error());
        analyzer.language = language.Value();
    } else if (name == "document") {
        analyzer.kind = AnalyzerKind::Document;
    } else if (name == "sentiment") {
        analyzer.kind = AnalyzerKind::Sentiment;
    } else if (name == "comparison") {
        analyzer.kind = AnalyzerKind::Comparison;
        auto other = tool_args::RequireString(params, "compare_with", kOperation);
        if (other.IsErr()) return R::Err(other.Error());
        analyzer.compare_with = other.Value();
    } else {
        return R::Err(Error::InvalidInput(
            kOperation, "Unknown analyzer type: " + name));
    }
    return R::Ok(std::move(analyzer));
}

Result<AnalyzerOptions, Error> DecodeOptions(const nlohmann::json& args) {
    using R = Result<AnalyzerOptions, Error>;
    AnalyzerOptions options;

    auto obj = tool_args::OptObject(args, "options", kOperation);
    if (obj.IsErr()) return R::Err(obj.Error());
    if (!obj.Value().has_value()) return R::Ok(options);
    const auto& o = *obj.Value();

    auto focus = tool_args::OptStringArray(o, "focus_areas", kOperation);
    if (focus.IsErr()) return R::Err(focus.Error());
    if (focus.Value().has_value()) options.focus_areas = *focus.Value();

    auto detail = tool_args::OptString(o, "detail_level", kOperation);
    if (detail.IsErr()) return R::Err(detail.Error());
    if (detail.Value().has_value()) {
        const auto& level = *detail.Value();
        if (level == "brief") {
            options.detail_level = DetailLevel::Brief;
        } else if (level == "standard") {
            options.detail_level = DetailLevel::Standard;
        } else if (level == "comprehensive") {
            options.detail_level = DetailLevel::Comprehensive;
        } else {
            return R::Err(Error::InvalidInput(
                kOperation, "Invalid detail_level '" + level +
                                "': expected brief, standard or comprehensive"));
        }
    }
    return R::Ok(std::move(options));
}

std::string JoinComma(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

std::string DetailInstruction(DetailLevel level) {
    switch (level) {
        case DetailLevel::Brief:
            return "\n\nKeep the analysis brief and limited to the most important findings.";
        case DetailLevel::Comprehensive:
            return "\n\nProvide a comprehensive, in-depth analysis.";
        case DetailLevel::Standard:
            break;
    }
    return "";
}

std::string LanguageLine(const std::optional<std::string>& language) {
    return language.has_value() ? "Language: " + *language + "\n" : "";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

void to_json(nlohmann::json& j, const TextAnalysis& a) {
    j = nlohmann::json{{"sentiment", a.sentiment},
                       {"themes", a.themes},
                       {"tone", a.tone},
                       {"key_points", a.key_points}};
}

void to_json(nlohmann::json& j, const CodeAnalysis& a) {
    j = nlohmann::json{{"quality_score", a.quality_score},
                       {"issues", a.issues},
                       {"patterns", a.patterns},
                       {"complexity", a.complexity},
                       {"suggestions", a.suggestions}};
}

void to_json(nlohmann::json& j, const DocumentAnalysis& a) {
    j = nlohmann::json{{"structure", a.structure},
                       {"readability_score", a.readability_score},
                       {"sections", a.sections},
                       {"key_points", a.key_points}};
}

void to_json(nlohmann::json& j, const SentimentAnalysis& a) {
    j = nlohmann::json{{"overall_sentiment", a.overall_sentiment},
                       {"confidence", a.confidence},
                       {"emotions", a.emotions}};
}

void to_json(nlohmann::json& j, const ComparisonAnalysis& a) {
    j = nlohmann::json{{"similarities", a.similarities},
                       {"differences", a.differences},
                       {"verdict", a.verdict}};
}

void to_json(nlohmann::json& j, const AnalyzeResult& result) {
    static const char* kTypeNames[] = {"text", "code", "document", "sentiment",
                                       "comparison"};
    std::visit([&j](const auto& analysis) { j = analysis; }, result);
    j["type"] = kTypeNames[result.index()];
}

// ---------------------------------------------------------------------------
// v2
// ---------------------------------------------------------------------------

Result<AnalyzeInput, Error> DecodeAnalyzeInput(const nlohmann::json& args) {
    using R = Result<AnalyzeInput, Error>;
    AnalyzeInput input;

    auto content = tool_args::RequireString(args, "content", kOperation);
    if (content.IsErr()) return R::Err(content.Error());
    input.content = content.Value();

    auto analyzer = DecodeAnalyzerType(args);
    if (analyzer.IsErr()) return R::Err(analyzer.Error());
    input.analyzer_type = analyzer.Value();

    auto options = DecodeOptions(args);
    if (options.IsErr()) return R::Err(options.Error());
    input.options = options.Value();

    auto model = tool_args::OptModel(args, kOperation);
    if (model.IsErr()) return R::Err(model.Error());
    input.model = model.Value();

    auto params = tool_args::OptParams(args, kOperation);
    if (params.IsErr()) return R::Err(params.Error());
    input.params = params.Value();

    return R::Ok(std::move(input));
}

std::string BuildAnalyzePrompt(const AnalyzeInput& input) {
    std::string prompt;
    switch (input.analyzer_type.kind) {
        case AnalyzerKind::Text: {
            std::string focus;
            if (!input.options.focus_areas.empty()) {
                focus = "\nFocus on: " + JoinComma(input.options.focus_areas);
            }
            prompt =
                "Analyze the following text and provide:\n"
                "1. Overall sentiment (positive, negative, neutral, mixed)\n"
                "2. Main themes (3-5 themes)\n"
                "3. Tone (formal, informal, technical, conversational, etc.)\n"
                "4. Key points (3-5 bullet points)" + focus + "\n\n"
                "Text:\n" + input.content + "\n\n"
                "Provide analysis in a structured format.";
            break;
        }
        case AnalyzerKind::Code:
            prompt =
                "Analyze this code and provide:\n"
                "1. Quality score (0-10)\n"
                "2. List of issues with severity (critical/high/medium/low) and category\n"
                "3. Design patterns used\n"
                "4. Complexity assessment\n"
                "5. Improvement suggestions\n\n" +
                LanguageLine(input.analyzer_type.language) +
                "```\n" + input.content + "\n```\n\n"
                "Be specific and actionable.";
            break;
        case AnalyzerKind::Document:
            prompt =
                "Analyze this document's structure and readability:\n"
                "1. Overall structure (how it's organized)\n"
                "2. Readability score (0-10, where 10 is most readable)\n"
                "3. Main sections\n"
                "4. Key points\n\n"
                "Document:\n" + input.content + "\n\n"
                "Provide structured analysis.";
            break;
        case AnalyzerKind::Sentiment:
            prompt =
                "Perform detailed sentiment analysis:\n"
                "1. Overall sentiment (very negative, negative, neutral, positive, very positive)\n"
                "2. Confidence level (0-1)\n"
                "3. Detected emotions with intensity (0-1): joy, sadness, anger, fear, surprise, etc.\n\n"
                "Text:\n" + input.content + "\n\n"
                "Be precise and nuanced.";
            break;
        case AnalyzerKind::Comparison:
            prompt =
                "Compare these two texts:\n\n"
                "Text A:\n" + input.content + "\n\n"
                "Text B:\n" + input.analyzer_type.compare_with + "\n\n"
                "Provide:\n"
                "1. Key similarities\n"
                "2. Key differences\n"
                "3. Overall verdict on how similar they are";
            break;
    }
    return prompt + DetailInstruction(input.options.detail_level);
}

TextAnalysis ParseTextAnalysis(std::string_view reply) {
    return TextAnalysis{ExtractField(reply, "sentiment", "neutral"),
                        ExtractList(reply, "theme"),
                        ExtractField(reply, "tone", "neutral"),
                        ExtractList(reply, "key point")};
}

CodeAnalysis ParseCodeAnalysis(std::string_view reply) {
    return CodeAnalysis{ExtractScore(reply, 5.0),
                        ExtractIssues(reply),
                        ExtractList(reply, "pattern"),
                        ExtractField(reply, "complexity", "moderate"),
                        ExtractList(reply, "suggestion")};
}

DocumentAnalysis ParseDocumentAnalysis(std::string_view reply) {
    return DocumentAnalysis{ExtractField(reply, "structure", "linear"),
                            ExtractScore(reply, 7.0),
                            ExtractList(reply, "section"),
                            ExtractList(reply, "key point")};
}

SentimentAnalysis ParseSentimentAnalysis(std::string_view reply) {
    return SentimentAnalysis{ExtractField(reply, "sentiment", "neutral"),
                             ExtractScore(reply, 0.5),
                             ExtractEmotions(reply)};
}

ComparisonAnalysis ParseComparisonAnalysis(std::string_view reply) {
    return ComparisonAnalysis{ExtractList(reply, "similar"),
                              ExtractList(reply, "differ"),
                              ExtractField(reply, "verdict", "moderately similar")};
}

Result<ToolResponse<AnalyzeResult>, Error> ExecuteAnalyze(
    IGenerationService& service,
    const AnalyzeInput& input) {
    using R = Result<ToolResponse<AnalyzeResult>, Error>;

    auto valid = tool_args::RequireNonBlank(input.content, kOperation,
                                            "Content cannot be empty");
    if (valid.IsErr()) return R::Err(valid.Error());
    if (input.analyzer_type.kind == AnalyzerKind::Comparison) {
        auto other = tool_args::RequireNonBlank(input.analyzer_type.compare_with,
                                                kOperation,
                                                "compare_with cannot be empty");
        if (other.IsErr()) return R::Err(other.Error());
    }

    const auto variant = input.model.value_or(ModelVariant::Pro);
    const auto model_id = service.ModelId(variant);
    LogInfo("analyze", std::string("type=") + KindName(input.analyzer_type.kind) +
                           ", model=" + model_id +
                           ", content_len=" + std::to_string(input.content.size()));

    std::optional<GenerationConfig> config;
    if (input.params.has_value()) {
        config = ResolveGenerationConfig(input.params, GenerationConfig{});
    }

    auto response = service.Generate(BuildAnalyzePrompt(input), variant, config);
    if (response.IsErr()) return R::Err(response.Error());
    const auto& text = response.Value().text;

    AnalyzeResult result;
    switch (input.analyzer_type.kind) {
        case AnalyzerKind::Text:       result = ParseTextAnalysis(text); break;
        case AnalyzerKind::Code:       result = ParseCodeAnalysis(text); break;
        case AnalyzerKind::Document:   result = ParseDocumentAnalysis(text); break;
        case AnalyzerKind::Sentiment:  result = ParseSentimentAnalysis(text); break;
        case AnalyzerKind::Comparison: result = ParseComparisonAnalysis(text); break;
    }

    return R::Ok(ToolResponse<AnalyzeResult>{
        std::move(result),
        ResponseMetadata::WithUsage(model_id, response.Value().usage)});
}

// ---------------------------------------------------------------------------
// v1
// ---------------------------------------------------------------------------

Result<AnalyzeCodeInput, Error> DecodeAnalyzeCodeInput(const nlohmann::json& args) {
    using R = Result<AnalyzeCodeInput, Error>;
    AnalyzeCodeInput input;

    auto code = tool_args::RequireString(args, "code", kOperation);
    if (code.IsErr()) return R::Err(code.Error());
    input.code = code.Value();

    auto language = tool_args::OptString(args, "language", kOperation);
    if (language.IsErr()) return R::Err(language.Error());
    input.language = language.Value();

    auto focus = tool_args::OptString(args, "focus", kOperation);
    if (focus.IsErr()) return R::Err(focus.Error());
    if (focus.Value().has_value()) input.focus = *focus.Value();

    return R::Ok(std::move(input));
}

Result<AnalyzeTextInput, Error> DecodeAnalyzeTextInput(const nlohmann::json& args) {
    using R = Result<AnalyzeTextInput, Error>;
    AnalyzeTextInput input;

    auto text = tool_args::RequireString(args, "text", kOperation);
    if (text.IsErr()) return R::Err(text.Error());
    input.text = text.Value();

    auto focus = tool_args::OptString(args, "focus", kOperation);
    if (focus.IsErr()) return R::Err(focus.Error());
    input.focus = focus.Value();

    return R::Ok(std::move(input));
}

std::string BuildAnalyzeCodePrompt(const AnalyzeCodeInput& input) {
    std::string instruction;
    if (input.focus == "quality") {
        instruction = "Focus on code quality, readability, and best practices.";
    } else if (input.focus == "security") {
        instruction = "Focus on security vulnerabilities and potential exploits.";
    } else if (input.focus == "performance") {
        instruction = "Focus on performance optimizations and bottlenecks.";
    } else if (input.focus == "bugs") {
        instruction = "Focus on identifying bugs and logical errors.";
    } else {
        instruction = "Provide a general comprehensive analysis.";
    }
    return "Analyze the following code:\n\n" + LanguageLine(input.language) +
           "```\n" + input.code + "\n```\n\n" + instruction;
}

std::string BuildAnalyzeTextPrompt(const AnalyzeTextInput& input) {
    std::string focus;
    if (input.focus.has_value()) {
        focus = "\n\nFocus on: " + *input.focus;
    }
    return "Analyze the following text:" + focus + "\n\n" + input.text;
}

Result<std::string, Error> ExecuteAnalyzeCode(IGenerationService& service,
                                              const AnalyzeCodeInput& input) {
    using R = Result<std::string, Error>;
    auto valid = tool_args::RequireNonBlank(input.code, kOperation,
                                            "Code cannot be empty");
    if (valid.IsErr()) return R::Err(valid.Error());

    LogInfo("analyze", "legacy code analysis, focus=" + input.focus +
                           ", code_len=" + std::to_string(input.code.size()));
    auto response = service.Generate(BuildAnalyzeCodePrompt(input),
                                     ModelVariant::Pro, std::nullopt);
    if (response.IsErr()) return R::Err(response.Error());
    return R::Ok(response.Value().text);
}

Result<std::string, Error> ExecuteAnalyzeText(IGenerationService& service,
                                              const AnalyzeTextInput& input) {
    using R = Result<std::string, Error>;
    auto valid = tool_args::RequireNonBlank(input.text, kOperation,
                                            "Text cannot be empty");
    if (valid.IsErr()) return R::Err(valid.Error());

    LogInfo("analyze", "legacy text analysis, text_len=" +
                           std::to_string(input.text.size()));
    auto response = service.Generate(BuildAnalyzeTextPrompt(input),
                                     ModelVariant::Pro, std::nullopt);
    if (response.IsErr()) return R::Err(response.Error());
    return R::Ok(response.Value().text);
}

} // namespace gemini_mcp
