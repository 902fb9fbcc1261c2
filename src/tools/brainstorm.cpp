#include <gemini_mcp/tools/brainstorm.hpp>

#include <gemini_mcp/core/log.hpp>
#include <gemini_mcp/tools/tool_json.hpp>

#include "tool_args.hpp"

namespace gemini_mcp {

namespace {

const char* kOperation = "Brainstorm";

Result<void, Error> ValidateBrainstorm(const BrainstormInput& input) {
    if (input.num_ideas < kMinIdeas || input.num_ideas > kMaxIdeas) {
        return Result<void, Error>::Err(Error::InvalidInput(
            kOperation, "num_ideas must be between 1 and 50"));
    }
    return tool_args::RequireNonBlank(input.prompt, kOperation,
                                      "Topic cannot be empty");
}

} // anonymous namespace

void to_json(nlohmann::json& j, const BrainstormOutput& output) {
    j = nlohmann::json{{"ideas", output.ideas}, {"consensus_themes", nullptr}};
    if (output.consensus_themes.has_value()) {
        j["consensus_themes"] = *output.consensus_themes;
    }
}

Result<BrainstormInput, Error> DecodeBrainstormInput(const nlohmann::json& args) {
    using R = Result<BrainstormInput, Error>;
    BrainstormInput input;

    auto prompt = tool_args::RequireString(args, "prompt", kOperation);
    if (prompt.IsErr()) return R::Err(prompt.Error());
    input.prompt = prompt.Value();

    auto num_ideas = tool_args::OptInteger(args, "num_ideas", kOperation);
    if (num_ideas.IsErr()) return R::Err(num_ideas.Error());
    if (num_ideas.Value().has_value()) input.num_ideas = *num_ideas.Value();

    auto constraints = tool_args::OptString(args, "constraints", kOperation);
    if (constraints.IsErr()) return R::Err(constraints.Error());
    input.constraints = constraints.Value();

    auto consensus = tool_args::OptBool(args, "extract_consensus", true, kOperation);
    if (consensus.IsErr()) return R::Err(consensus.Error());
    input.extract_consensus = consensus.Value();

    auto model = tool_args::OptModel(args, kOperation);
    if (model.IsErr()) return R::Err(model.Error());
    input.model = model.Value();

    auto params = tool_args::OptParams(args, kOperation);
    if (params.IsErr()) return R::Err(params.Error());
    input.params = params.Value();

    auto thoughts = tool_args::OptString(args, "claude_thoughts", kOperation);
    if (thoughts.IsErr()) return R::Err(thoughts.Error());
    input.claude_thoughts = thoughts.Value();

    auto rounds = tool_args::OptCount(args, "max_rounds", kOperation);
    if (rounds.IsErr()) return R::Err(rounds.Error());
    if (rounds.Value().has_value()) input.max_rounds = *rounds.Value();

    return R::Ok(std::move(input));
}

std::string BuildBrainstormPrompt(const BrainstormInput& input) {
    std::string prompt = "Generate " + std::to_string(input.num_ideas) +
                         " creative, diverse ideas for the following topic:\n\n" +
                         input.prompt + "\n\n";
    if (input.constraints.has_value()) {
        prompt += "Constraints: " + *input.constraints + "\n\n";
    }
    prompt += "List each idea on a new line, numbered (1., 2., 3., etc.).\n";
    prompt += "Make ideas specific, actionable, and varied in approach.";
    return prompt;
}

Result<ToolResponse<BrainstormOutput>, Error> ExecuteBrainstorm(
    IGenerationService& service,
    const BrainstormInput& input) {
    using R = Result<ToolResponse<BrainstormOutput>, Error>;

    auto valid = ValidateBrainstorm(input);
    if (valid.IsErr()) return R::Err(valid.Error());

    const auto variant = input.model.value_or(ModelVariant::Pro);
    const auto model_id = service.ModelId(variant);
    LogInfo("brainstorm", "model=" + model_id +
                              ", num_ideas=" + std::to_string(input.num_ideas));

    GenerationConfig defaults;
    defaults.temperature = kBrainstormTemperature;
    defaults.max_output_tokens = kBrainstormMaxTokens;
    const auto config = ResolveGenerationConfig(input.params, defaults);

    auto response = service.Generate(BuildBrainstormPrompt(input), variant, config);
    if (response.IsErr()) return R::Err(response.Error());

    BrainstormOutput output;
    output.ideas = ParseIdeas(response.Value().text);
    LogDebug("brainstorm", "parsed " + std::to_string(output.ideas.size()) + " ideas");
    if (input.extract_consensus) {
        output.consensus_themes = ExtractConsensusThemes(output.ideas);
    }

    return R::Ok(ToolResponse<BrainstormOutput>{
        std::move(output),
        ResponseMetadata::WithUsage(model_id, response.Value().usage)});
}

Result<LegacyBrainstormOutput, Error> ExecuteBrainstormLegacy(
    IGenerationService& service,
    const BrainstormInput& input) {
    using R = Result<LegacyBrainstormOutput, Error>;

    if (!input.claude_thoughts.has_value()) {
        auto response = ExecuteBrainstorm(service, input);
        if (response.IsErr()) return R::Err(response.Error());
        return R::Ok(LegacyBrainstormOutput{
            nlohmann::json(response.Value()).dump(2), ""});
    }

    auto valid = tool_args::RequireNonBlank(input.prompt, kOperation,
                                            "Topic cannot be empty");
    if (valid.IsErr()) return R::Err(valid.Error());

    LogInfo("brainstorm", "collaborative round with supplied thoughts");
    const auto& thoughts = *input.claude_thoughts;
    const std::string prompt = "Collaborative brainstorm on: " + input.prompt +
                               "\n\nClaude's thoughts: " + thoughts +
                               "\n\nRespond with your insights.";

    auto response = service.Generate(prompt, ModelVariant::Pro, std::nullopt);
    if (response.IsErr()) return R::Err(response.Error());

    const auto& reply = response.Value().text;
    return R::Ok(LegacyBrainstormOutput{
        reply, "Round 1\nClaude: " + thoughts + "\nGemini: " + reply});
}

std::string FormatLegacyBrainstorm(const LegacyBrainstormOutput& output) {
    return "# Synthesis\n\n" + output.synthesis +
           "\n\n# Conversation History\n\n" + output.conversation_history;
}

} // namespace gemini_mcp
