#pragma once

#include <gemini_mcp/core/result.hpp>
#include <gemini_mcp/gemini/i_generation_service.hpp>

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace gemini_mcp {

// ---------------------------------------------------------------------------
// gemini-query: send a prompt as-is and return the raw reply text.
//
// `model` is matched leniently: any name containing "flash" selects the
// Flash variant, everything else selects Pro. A generation config is only
// sent when the caller sets temperature or max_output_tokens.
// ---------------------------------------------------------------------------
struct QueryInput {
    std::string prompt;
    std::string model = "pro";
    std::optional<double> temperature;
    std::optional<uint32_t> max_output_tokens;
};

[[nodiscard]] Result<QueryInput, Error> DecodeQueryInput(
    const nlohmann::json& args);

[[nodiscard]] Result<std::string, Error> ExecuteQuery(
    IGenerationService& service,
    const QueryInput& input);

} // namespace gemini_mcp
