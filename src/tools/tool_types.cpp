#include <gemini_mcp/tools/tool_types.hpp>

namespace gemini_mcp {

GenerationConfig ResolveGenerationConfig(
    const std::optional<GenerationParams>& params,
    const GenerationConfig& defaults) {
    GenerationConfig config = defaults;
    if (!params.has_value()) {
        return config;
    }
    if (params->temperature) config.temperature = params->temperature;
    if (params->max_tokens) config.max_output_tokens = params->max_tokens;
    if (params->top_p) config.top_p = params->top_p;
    if (params->top_k) config.top_k = params->top_k;
    return config;
}

void to_json(nlohmann::json& j, const ResponseMetadata& m) {
    j = nlohmann::json{{"model_used", m.model_used},
                       {"prompt_tokens", m.prompt_tokens},
                       {"response_tokens", m.response_tokens},
                       {"total_tokens", m.total_tokens}};
}

} // namespace gemini_mcp
