#pragma once

#include <gemini_mcp/core/result.hpp>
#include <gemini_mcp/gemini/i_generation_service.hpp>
#include <gemini_mcp/tools/tool_types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace gemini_mcp {

enum class SummaryLength {
    Brief,
    Medium,
    Detailed,
};

enum class SummaryFormat {
    Paragraph,
    BulletPoints,
    Executive,
    KeyPoints,
};

struct SummarizeInput {
    std::string content;
    SummaryLength length = SummaryLength::Medium;
    SummaryFormat format = SummaryFormat::Paragraph;
    std::optional<std::string> focus;
    std::optional<ModelVariant> model;
    std::optional<GenerationParams> params;
};

struct SummarizeOutput {
    std::string summary;
    std::size_t word_count = 0;
    std::vector<std::string> key_topics;
};

void to_json(nlohmann::json& j, const SummarizeOutput& output);

constexpr std::size_t kMaxSummarizeContentBytes = 1000000;
constexpr double kSummarizeTemperature = 0.4;

/// Default max output tokens per length: 256 / 1024 / 2048.
uint32_t SummaryMaxTokens(SummaryLength length);

[[nodiscard]] Result<SummarizeInput, Error> DecodeSummarizeInput(
    const nlohmann::json& args);

std::string BuildSummarizePrompt(const SummarizeInput& input);

[[nodiscard]] Result<ToolResponse<SummarizeOutput>, Error> ExecuteSummarize(
    IGenerationService& service,
    const SummarizeInput& input);

/// gemini-summarize: the v2 response document, pretty-printed.
[[nodiscard]] Result<std::string, Error> ExecuteSummarizeLegacy(
    IGenerationService& service,
    const SummarizeInput& input);

} // namespace gemini_mcp
