#pragma once

#include <gemini_mcp/gemini/i_generation_service.hpp>

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace gemini_mcp {

// ---------------------------------------------------------------------------
// GenerationParams: caller overrides accepted by every v2 tool as "params".
// ---------------------------------------------------------------------------
struct GenerationParams {
    std::optional<double> temperature;
    std::optional<uint32_t> max_tokens;
    std::optional<double> top_p;
    std::optional<uint32_t> top_k;
};

/// Caller overrides take precedence over the tool's defaults field by field.
GenerationConfig ResolveGenerationConfig(
    const std::optional<GenerationParams>& params,
    const GenerationConfig& defaults);

// ---------------------------------------------------------------------------
// ResponseMetadata: model and token usage attached to every v2 result.
// ---------------------------------------------------------------------------
struct ResponseMetadata {
    std::string model_used;
    uint32_t prompt_tokens = 0;
    uint32_t response_tokens = 0;
    uint32_t total_tokens = 0;

    static ResponseMetadata WithUsage(const std::string& model,
                                      const UsageMetadata& usage) {
        return ResponseMetadata{model, usage.prompt_token_count,
                                usage.candidates_token_count,
                                usage.total_token_count};
    }
};

// ---------------------------------------------------------------------------
// ToolResponse<T>: typed tool result plus metadata. Serialized as
// {"result": ..., "metadata": ...}.
// ---------------------------------------------------------------------------
template <typename T>
struct ToolResponse {
    T result;
    ResponseMetadata metadata;
};

void to_json(nlohmann::json& j, const ResponseMetadata& m);

template <typename T>
void to_json(nlohmann::json& j, const ToolResponse<T>& r) {
    j = nlohmann::json{{"result", r.result}, {"metadata", r.metadata}};
}

} // namespace gemini_mcp
