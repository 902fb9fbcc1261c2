#pragma once

#include <gemini_mcp/gemini/i_generation_service.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace gemini_mcp {

constexpr const char* kGeminiBaseUrl = "https://generativelanguage.googleapis.com";
constexpr const char* kGeminiApiPath = "/v1beta";

struct GeminiClientOptions {
    std::string base_url = kGeminiBaseUrl;
    std::string pro_model = kDefaultProModel;
    std::string flash_model = kDefaultFlashModel;
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{120};
};

// ---------------------------------------------------------------------------
// Wire codec: pure functions, exposed for unit tests.
// ---------------------------------------------------------------------------

/// Build the generateContent request body for a single user turn.
nlohmann::json BuildGenerateContentRequest(
    std::string_view prompt, const std::optional<GenerationConfig>& config);

/// Decode a 200 response body: first candidate's first text part plus usage.
Result<GenerationResponse, Error> ParseGenerateContentResponse(
    std::string_view body);

// ---------------------------------------------------------------------------
// GeminiClient: concrete IGenerationService using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header. The Impl
// struct is defined in the .cpp file. Blocking: one request at a time.
// ---------------------------------------------------------------------------
class GeminiClient : public IGenerationService {
public:
    GeminiClient(std::string api_key, const GeminiClientOptions& options = {});

    ~GeminiClient() override;

    GeminiClient(const GeminiClient&) = delete;
    GeminiClient& operator=(const GeminiClient&) = delete;
    GeminiClient(GeminiClient&&) = delete;
    GeminiClient& operator=(GeminiClient&&) = delete;

    [[nodiscard]] Result<GenerationResponse, Error> Generate(
        std::string_view prompt,
        ModelVariant model,
        const std::optional<GenerationConfig>& config) override;

    [[nodiscard]] std::string ModelId(ModelVariant model) const override;

    /// Round-trip a trivial prompt against the Pro model.
    [[nodiscard]] Result<void, Error> TestConnection();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gemini_mcp
