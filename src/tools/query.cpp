#include <gemini_mcp/tools/query.hpp>

#include <gemini_mcp/core/log.hpp>
#include <gemini_mcp/core/text.hpp>

#include "tool_args.hpp"

namespace gemini_mcp {

namespace {

const char* kOperation = "Query";

} // anonymous namespace

Result<QueryInput, Error> DecodeQueryInput(const nlohmann::json& args) {
    using R = Result<QueryInput, Error>;
    QueryInput input;

    auto prompt = tool_args::RequireString(args, "prompt", kOperation);
    if (prompt.IsErr()) return R::Err(prompt.Error());
    input.prompt = prompt.Value();

    auto model = tool_args::OptString(args, "model", kOperation);
    if (model.IsErr()) return R::Err(model.Error());
    if (model.Value().has_value()) input.model = *model.Value();

    auto temperature = tool_args::OptNumber(args, "temperature", kOperation);
    if (temperature.IsErr()) return R::Err(temperature.Error());
    input.temperature = temperature.Value();

    auto max_tokens = tool_args::OptCount(args, "max_output_tokens", kOperation);
    if (max_tokens.IsErr()) return R::Err(max_tokens.Error());
    input.max_output_tokens = max_tokens.Value();

    return R::Ok(std::move(input));
}

Result<std::string, Error> ExecuteQuery(IGenerationService& service,
                                        const QueryInput& input) {
    using R = Result<std::string, Error>;

    auto valid = tool_args::RequireNonBlank(input.prompt, kOperation,
                                            "Prompt cannot be empty");
    if (valid.IsErr()) return R::Err(valid.Error());

    const auto variant = ModelVariantFromName(input.model);
    LogInfo("query", "model=" + service.ModelId(variant) +
                         ", prompt_len=" + std::to_string(input.prompt.size()));

    std::optional<GenerationConfig> config;
    if (input.temperature.has_value() || input.max_output_tokens.has_value()) {
        GenerationConfig c;
        c.temperature = input.temperature;
        c.max_output_tokens = input.max_output_tokens;
        config = c;
    }

    auto response = service.Generate(input.prompt, variant, config);
    if (response.IsErr()) return R::Err(response.Error());

    if (Trim(response.Value().text).empty()) {
        return R::Err(Error{kOperation, "Empty response from Gemini API",
                            std::nullopt, std::nullopt,
                            ErrorCategory::EmptyResponse});
    }

    LogDebug("query", "response_len=" + std::to_string(response.Value().text.size()));
    return R::Ok(response.Value().text);
}

} // namespace gemini_mcp
