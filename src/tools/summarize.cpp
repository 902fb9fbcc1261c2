#include <gemini_mcp/tools/summarize.hpp>

#include <gemini_mcp/core/log.hpp>
#include <gemini_mcp/extract/text_extract.hpp>

#include "tool_args.hpp"

namespace gemini_mcp {

namespace {

const char* kOperation = "Summarize";

Result<SummaryLength, Error> ParseLength(const std::string& name) {
    using R = Result<SummaryLength, Error>;
    if (name == "brief") return R::Ok(SummaryLength::Brief);
    if (name == "medium") return R::Ok(SummaryLength::Medium);
    if (name == "detailed") return R::Ok(SummaryLength::Detailed);
    return R::Err(Error::InvalidInput(
        kOperation, "Invalid length '" + name + "': expected brief, medium or detailed"));
}

Result<SummaryFormat, Error> ParseFormat(const std::string& name) {
    using R = Result<SummaryFormat, Error>;
    if (name == "paragraph") return R::Ok(SummaryFormat::Paragraph);
    if (name == "bullet_points") return R::Ok(SummaryFormat::BulletPoints);
    if (name == "executive") return R::Ok(SummaryFormat::Executive);
    if (name == "key_points") return R::Ok(SummaryFormat::KeyPoints);
    return R::Err(Error::InvalidInput(
        kOperation, "Invalid format '" + name +
                        "': expected paragraph, bullet_points, executive or key_points"));
}

const char* LengthInstruction(SummaryLength length) {
    switch (length) {
        case SummaryLength::Brief:
            return "Provide a very brief, concise summary (2-3 sentences max).";
        case SummaryLength::Detailed:
            return "Provide a comprehensive, detailed summary covering all key points and nuances.";
        case SummaryLength::Medium:
            break;
    }
    return "Provide a balanced summary with key points and main themes.";
}

const char* FormatInstruction(SummaryFormat format) {
    switch (format) {
        case SummaryFormat::BulletPoints:
            return "\n\nFormat the summary as bullet points.";
        case SummaryFormat::Executive:
            return "\n\nFormat as an executive summary with clear sections.";
        case SummaryFormat::KeyPoints:
            return "\n\nExtract and list only the key takeaways.";
        case SummaryFormat::Paragraph:
            break;
    }
    return "\n\nFormat the summary as coherent paragraphs.";
}

} // anonymous namespace

void to_json(nlohmann::json& j, const SummarizeOutput& output) {
    j = nlohmann::json{{"summary", output.summary},
                       {"word_count", output.word_count},
                       {"key_topics", output.key_topics}};
}

uint32_t SummaryMaxTokens(SummaryLength length) {
    switch (length) {
        case SummaryLength::Brief:    return 256;
        case SummaryLength::Medium:   return 1024;
        case SummaryLength::Detailed: return 2048;
    }
    return 1024;
}

Result<SummarizeInput, Error> DecodeSummarizeInput(const nlohmann::json& args) {
    using R = Result<SummarizeInput, Error>;
    SummarizeInput input;

    auto content = tool_args::RequireString(args, "content", kOperation);
    if (content.IsErr()) return R::Err(content.Error());
    input.content = content.Value();

    auto length = tool_args::OptString(args, "length", kOperation);
    if (length.IsErr()) return R::Err(length.Error());
    if (length.Value().has_value()) {
        auto parsed = ParseLength(*length.Value());
        if (parsed.IsErr()) return R::Err(parsed.Error());
        input.length = parsed.Value();
    }

    auto format = tool_args::OptString(args, "format", kOperation);
    if (format.IsErr()) return R::Err(format.Error());
    if (format.Value().has_value()) {
        auto parsed = ParseFormat(*format.Value());
        if (parsed.IsErr()) return R::Err(parsed.Error());
        input.format = parsed.Value();
    }

    auto focus = tool_args::OptString(args, "focus", kOperation);
    if (focus.IsErr()) return R::Err(focus.Error());
    input.focus = focus.Value();

    auto model = tool_args::OptModel(args, kOperation);
    if (model.IsErr()) return R::Err(model.Error());
    input.model = model.Value();

    auto params = tool_args::OptParams(args, kOperation);
    if (params.IsErr()) return R::Err(params.Error());
    input.params = params.Value();

    return R::Ok(std::move(input));
}

std::string BuildSummarizePrompt(const SummarizeInput& input) {
    std::string prompt = "Summarize the following content:\n\n" + input.content +
                         "\n\n" + LengthInstruction(input.length) +
                         FormatInstruction(input.format);
    if (input.focus.has_value()) {
        prompt += "\n\nFocus specifically on: " + *input.focus;
    }
    return prompt;
}

Result<ToolResponse<SummarizeOutput>, Error> ExecuteSummarize(
    IGenerationService& service,
    const SummarizeInput& input) {
    using R = Result<ToolResponse<SummarizeOutput>, Error>;

    auto valid = tool_args::RequireNonBlank(input.content, kOperation,
                                            "Content cannot be empty");
    if (valid.IsErr()) return R::Err(valid.Error());
    if (input.content.size() > kMaxSummarizeContentBytes) {
        return R::Err(Error::InvalidInput(kOperation,
                                          "Content too large (max 1M characters)"));
    }

    const auto variant = input.model.value_or(ModelVariant::Pro);
    const auto model_id = service.ModelId(variant);
    LogInfo("summarize", "model=" + model_id +
                             ", content_len=" + std::to_string(input.content.size()));

    GenerationConfig defaults;
    defaults.temperature = kSummarizeTemperature;
    defaults.max_output_tokens = SummaryMaxTokens(input.length);
    const auto config = ResolveGenerationConfig(input.params, defaults);

    auto response = service.Generate(BuildSummarizePrompt(input), variant, config);
    if (response.IsErr()) return R::Err(response.Error());
    const auto& text = response.Value().text;
    LogDebug("summarize", "summary_len=" + std::to_string(text.size()));

    SummarizeOutput output{text, CountWords(text), ExtractKeyTopics(text)};
    return R::Ok(ToolResponse<SummarizeOutput>{
        std::move(output),
        ResponseMetadata::WithUsage(model_id, response.Value().usage)});
}

Result<std::string, Error> ExecuteSummarizeLegacy(IGenerationService& service,
                                                  const SummarizeInput& input) {
    auto response = ExecuteSummarize(service, input);
    if (response.IsErr()) return Result<std::string, Error>::Err(response.Error());
    return Result<std::string, Error>::Ok(nlohmann::json(response.Value()).dump(2));
}

} // namespace gemini_mcp
