#pragma once

#include <gemini_mcp/core/result.hpp>
#include <gemini_mcp/extract/ideas.hpp>
#include <gemini_mcp/gemini/i_generation_service.hpp>
#include <gemini_mcp/tools/tool_types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace gemini_mcp {

// ---------------------------------------------------------------------------
// gemini-brainstorm-v2: numbered idea generation plus consensus themes.
//
// claude_thoughts and max_rounds are only read by the v1 tool; max_rounds is
// accepted for compatibility and a single round is always run.
// ---------------------------------------------------------------------------
struct BrainstormInput {
    std::string prompt;
    int64_t num_ideas = 10;
    std::optional<std::string> constraints;
    bool extract_consensus = true;
    std::optional<ModelVariant> model;
    std::optional<GenerationParams> params;
    std::optional<std::string> claude_thoughts;
    uint32_t max_rounds = 3;
};

struct BrainstormOutput {
    std::vector<Idea> ideas;
    std::optional<std::vector<ConsensusTheme>> consensus_themes;
};

void to_json(nlohmann::json& j, const BrainstormOutput& output);

constexpr int64_t kMinIdeas = 1;
constexpr int64_t kMaxIdeas = 50;
constexpr double kBrainstormTemperature = 0.9;
constexpr uint32_t kBrainstormMaxTokens = 2048;

[[nodiscard]] Result<BrainstormInput, Error> DecodeBrainstormInput(
    const nlohmann::json& args);

std::string BuildBrainstormPrompt(const BrainstormInput& input);

[[nodiscard]] Result<ToolResponse<BrainstormOutput>, Error> ExecuteBrainstorm(
    IGenerationService& service,
    const BrainstormInput& input);

// v1 output: a synthesis and the collaborative conversation that led to it.
struct LegacyBrainstormOutput {
    std::string synthesis;
    std::string conversation_history;
};

/// gemini-brainstorm. With claude_thoughts, one collaborative round on Pro;
/// otherwise the pretty-printed v2 document and an empty history.
[[nodiscard]] Result<LegacyBrainstormOutput, Error> ExecuteBrainstormLegacy(
    IGenerationService& service,
    const BrainstormInput& input);

std::string FormatLegacyBrainstorm(const LegacyBrainstormOutput& output);

} // namespace gemini_mcp
