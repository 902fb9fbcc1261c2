#pragma once

#include <gemini_mcp/core/result.hpp>
#include <gemini_mcp/extract/text_extract.hpp>
#include <gemini_mcp/gemini/i_generation_service.hpp>
#include <gemini_mcp/tools/tool_types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace gemini_mcp {

// ---------------------------------------------------------------------------
// gemini-analyze-v2: typed analysis of a piece of content.
//
// The analyzer kind selects the prompt and the extraction applied to the
// model's free-text reply. Results are tagged with "type" when serialized.
// ---------------------------------------------------------------------------
enum class AnalyzerKind {
    Text,
    Code,
    Document,
    Sentiment,
    Comparison,
};

struct AnalyzerType {
    AnalyzerKind kind = AnalyzerKind::Text;
    std::optional<std::string> language;  // code only
    std::string compare_with;             // comparison only, required
};

enum class DetailLevel {
    Brief,
    Standard,
    Comprehensive,
};

struct AnalyzerOptions {
    std::vector<std::string> focus_areas;
    DetailLevel detail_level = DetailLevel::Standard;
};

struct AnalyzeInput {
    std::string content;
    AnalyzerType analyzer_type;
    AnalyzerOptions options;
    std::optional<ModelVariant> model;
    std::optional<GenerationParams> params;
};

struct TextAnalysis {
    std::string sentiment;
    std::vector<std::string> themes;
    std::string tone;
    std::vector<std::string> key_points;
};

struct CodeAnalysis {
    double quality_score = 0.0;
    std::vector<CodeIssue> issues;
    std::vector<std::string> patterns;
    std::string complexity;
    std::vector<std::string> suggestions;
};

struct DocumentAnalysis {
    std::string structure;
    double readability_score = 0.0;
    std::vector<std::string> sections;
    std::vector<std::string> key_points;
};

struct SentimentAnalysis {
    std::string overall_sentiment;
    double confidence = 0.0;
    std::vector<Emotion> emotions;
};

struct ComparisonAnalysis {
    std::vector<std::string> similarities;
    std::vector<std::string> differences;
    std::string verdict;
};

using AnalyzeResult = std::variant<TextAnalysis, CodeAnalysis, DocumentAnalysis,
                                   SentimentAnalysis, ComparisonAnalysis>;

void to_json(nlohmann::json& j, const TextAnalysis& a);
void to_json(nlohmann::json& j, const CodeAnalysis& a);
void to_json(nlohmann::json& j, const DocumentAnalysis& a);
void to_json(nlohmann::json& j, const SentimentAnalysis& a);
void to_json(nlohmann::json& j, const ComparisonAnalysis& a);
void to_json(nlohmann::json& j, const AnalyzeResult& result);

[[nodiscard]] Result<AnalyzeInput, Error> DecodeAnalyzeInput(
    const nlohmann::json& args);

std::string BuildAnalyzePrompt(const AnalyzeInput& input);

// Extraction from the model's reply, one per analyzer kind.
TextAnalysis ParseTextAnalysis(std::string_view reply);
CodeAnalysis ParseCodeAnalysis(std::string_view reply);
DocumentAnalysis ParseDocumentAnalysis(std::string_view reply);
SentimentAnalysis ParseSentimentAnalysis(std::string_view reply);
ComparisonAnalysis ParseComparisonAnalysis(std::string_view reply);

/// Only caller-supplied params are sent; this tool has no sampling defaults.
[[nodiscard]] Result<ToolResponse<AnalyzeResult>, Error> ExecuteAnalyze(
    IGenerationService& service,
    const AnalyzeInput& input);

// ---------------------------------------------------------------------------
// gemini-analyze-code / gemini-analyze-text: single-prompt analyses that
// return the reply text unchanged. Always Pro, no generation config.
// ---------------------------------------------------------------------------
struct AnalyzeCodeInput {
    std::string code;
    std::optional<std::string> language;
    std::string focus = "general";  // general | quality | security | performance | bugs
};

struct AnalyzeTextInput {
    std::string text;
    std::optional<std::string> focus;
};

[[nodiscard]] Result<AnalyzeCodeInput, Error> DecodeAnalyzeCodeInput(
    const nlohmann::json& args);
[[nodiscard]] Result<AnalyzeTextInput, Error> DecodeAnalyzeTextInput(
    const nlohmann::json& args);

std::string BuildAnalyzeCodePrompt(const AnalyzeCodeInput& input);
std::string BuildAnalyzeTextPrompt(const AnalyzeTextInput& input);

[[nodiscard]] Result<std::string, Error> ExecuteAnalyzeCode(
    IGenerationService& service,
    const AnalyzeCodeInput& input);

[[nodiscard]] Result<std::string, Error> ExecuteAnalyzeText(
    IGenerationService& service,
    const AnalyzeTextInput& input);

} // namespace gemini_mcp
