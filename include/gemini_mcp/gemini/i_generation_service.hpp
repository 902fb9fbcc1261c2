#pragma once

#include <gemini_mcp/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gemini_mcp {

// ---------------------------------------------------------------------------
// ModelVariant: the two selectable backend configurations.
//   Pro  : "quality" variant, default for every tool.
//   Flash: "fast" variant.
// ---------------------------------------------------------------------------
enum class ModelVariant {
    Pro,
    Flash,
};

constexpr const char* kDefaultProModel = "gemini-3-pro-preview";
constexpr const char* kDefaultFlashModel = "gemini-3-flash-preview";

/// Lenient mapping used by the v1 query tool: any name containing "flash"
/// selects Flash, anything else selects Pro.
ModelVariant ModelVariantFromName(std::string_view name);

// ---------------------------------------------------------------------------
// GenerationConfig: sampling parameters. Unset fields are omitted from the
// backend request so that the backend's own defaults apply.
// ---------------------------------------------------------------------------
struct GenerationConfig {
    std::optional<double> temperature;
    std::optional<uint32_t> max_output_tokens;
    std::optional<double> top_p;
    std::optional<uint32_t> top_k;
};

// ---------------------------------------------------------------------------
// UsageMetadata: token accounting reported by the backend (zero if absent).
// ---------------------------------------------------------------------------
struct UsageMetadata {
    uint32_t prompt_token_count = 0;
    uint32_t candidates_token_count = 0;
    uint32_t total_token_count = 0;
};

// ---------------------------------------------------------------------------
// GenerationResponse: reply text plus usage, one per Generate() call.
// ---------------------------------------------------------------------------
struct GenerationResponse {
    std::string text;
    UsageMetadata usage;
};

// ---------------------------------------------------------------------------
// IGenerationService: abstract interface to the generative-text backend.
//
// Tool executors depend on this interface rather than a concrete HTTP client.
// This enables offline testing via MockGenerationService.
//
// Methods return Result<T, Error>: never throw on expected failures.
// ---------------------------------------------------------------------------
class IGenerationService {
public:
    virtual ~IGenerationService() = default;

    // Non-copyable, non-movable (polymorphic base).
    IGenerationService(const IGenerationService&) = delete;
    IGenerationService& operator=(const IGenerationService&) = delete;
    IGenerationService(IGenerationService&&) = delete;
    IGenerationService& operator=(IGenerationService&&) = delete;

    [[nodiscard]] virtual Result<GenerationResponse, Error> Generate(
        std::string_view prompt,
        ModelVariant model,
        const std::optional<GenerationConfig>& config) = 0;

    /// Backend model identifier a variant resolves to (reported in metadata).
    [[nodiscard]] virtual std::string ModelId(ModelVariant model) const = 0;

protected:
    IGenerationService() = default;
};

} // namespace gemini_mcp
