#include <gemini_mcp/gemini/gemini_client.hpp>

#include <gemini_mcp/core/log.hpp>

#include <httplib.h>

#include <string>

namespace gemini_mcp {

namespace {

constexpr const char* kOperation = "GenerateContent";

Error MakeClientError(const std::string& message,
                      ErrorCategory category,
                      std::optional<std::string> detail = std::nullopt) {
    return Error{kOperation, message, std::nullopt, std::move(detail), category};
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

uint32_t CountField(const nlohmann::json& usage, const char* key) {
    auto it = usage.find(key);
    if (it == usage.end() || !it->is_number_unsigned()) return 0;
    return it->get<uint32_t>();
}

} // anonymous namespace

ModelVariant ModelVariantFromName(std::string_view name) {
    return name.find("flash") != std::string_view::npos ? ModelVariant::Flash
                                                        : ModelVariant::Pro;
}

// ---------------------------------------------------------------------------
// Wire codec
// ---------------------------------------------------------------------------
nlohmann::json BuildGenerateContentRequest(
    std::string_view prompt, const std::optional<GenerationConfig>& config) {
    nlohmann::json request;
    request["contents"] = nlohmann::json::array({
        {{"role", "user"},
         {"parts", nlohmann::json::array({{{"text", std::string(prompt)}}})}}
    });

    if (config.has_value()) {
        nlohmann::json gen = nlohmann::json::object();
        if (config->temperature) gen["temperature"] = *config->temperature;
        if (config->max_output_tokens) gen["maxOutputTokens"] = *config->max_output_tokens;
        if (config->top_p) gen["topP"] = *config->top_p;
        if (config->top_k) gen["topK"] = *config->top_k;
        request["generationConfig"] = std::move(gen);
    }
    return request;
}

Result<GenerationResponse, Error> ParseGenerateContentResponse(
    std::string_view body) {
    auto parsed = nlohmann::json::parse(body.begin(), body.end(), nullptr,
                                        /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Result<GenerationResponse, Error>::Err(MakeClientError(
            "Invalid JSON in response body", ErrorCategory::Api));
    }

    GenerationResponse response;
    auto usage = parsed.find("usageMetadata");
    if (usage != parsed.end() && usage->is_object()) {
        response.usage.prompt_token_count = CountField(*usage, "promptTokenCount");
        response.usage.candidates_token_count = CountField(*usage, "candidatesTokenCount");
        response.usage.total_token_count = CountField(*usage, "totalTokenCount");
    }

    // candidates[0].content.parts[0].text
    const auto empty = MakeClientError("Empty response from Gemini API",
                                       ErrorCategory::EmptyResponse);
    auto candidates = parsed.find("candidates");
    if (candidates == parsed.end() || !candidates->is_array() ||
        candidates->empty()) {
        return Result<GenerationResponse, Error>::Err(empty);
    }
    const auto& first = (*candidates)[0];
    if (!first.is_object() || !first.contains("content") ||
        !first["content"].is_object()) {
        return Result<GenerationResponse, Error>::Err(empty);
    }
    const auto& content = first["content"];
    if (!content.contains("parts") || !content["parts"].is_array() ||
        content["parts"].empty()) {
        return Result<GenerationResponse, Error>::Err(empty);
    }
    const auto& part = content["parts"][0];
    if (!part.is_object() || !part.contains("text") || !part["text"].is_string()) {
        return Result<GenerationResponse, Error>::Err(empty);
    }

    response.text = part["text"].get<std::string>();
    return Result<GenerationResponse, Error>::Ok(std::move(response));
}

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct GeminiClient::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string api_key;
    GeminiClientOptions options;

    Impl(std::string key, const GeminiClientOptions& opts)
        : api_key(std::move(key)), options(opts) {
        client = std::make_unique<httplib::Client>(options.base_url);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
    }

    const std::string& ModelName(ModelVariant model) const {
        return model == ModelVariant::Flash ? options.flash_model
                                            : options.pro_model;
    }

    Result<GenerationResponse, Error> Post(std::string_view prompt,
                                           ModelVariant model,
                                           const std::optional<GenerationConfig>& config) {
        const auto& model_name = ModelName(model);
        // The key travels in the query string; never log the full path.
        auto path = std::string(kGeminiApiPath) + "/models/" + model_name +
                    ":generateContent?key=" + api_key;
        auto body = BuildGenerateContentRequest(prompt, config).dump();

        LogDebug("gemini", "POST models/" + model_name + ":generateContent (" +
                               std::to_string(prompt.size()) + " prompt bytes)");

        auto res = client->Post(path, body, "application/json");
        if (!res) {
            const auto http_error = res.error();
            return Result<GenerationResponse, Error>::Err(MakeClientError(
                "HTTP request failed: " + httplib::to_string(http_error),
                CategoryFromHttpTransportError(http_error)));
        }

        if (res->status != 200) {
            LogWarn("gemini", "HTTP " + std::to_string(res->status) +
                                  " from " + model_name);
            return Result<GenerationResponse, Error>::Err(
                Error::FromHttpStatus(kOperation, res->status, res->body));
        }

        auto parsed = ParseGenerateContentResponse(res->body);
        if (parsed.IsOk()) {
            const auto& usage = parsed.Value().usage;
            LogDebug("gemini",
                     "Tokens - prompt: " + std::to_string(usage.prompt_token_count) +
                     ", response: " + std::to_string(usage.candidates_token_count) +
                     ", total: " + std::to_string(usage.total_token_count));
        }
        return parsed;
    }
};

// ---------------------------------------------------------------------------
// GeminiClient
// ---------------------------------------------------------------------------
GeminiClient::GeminiClient(std::string api_key, const GeminiClientOptions& options)
    : impl_(std::make_unique<Impl>(std::move(api_key), options)) {
    LogInfo("gemini", "Gemini client initialized");
    LogDebug("gemini", "Pro model: " + options.pro_model);
    LogDebug("gemini", "Flash model: " + options.flash_model);
}

GeminiClient::~GeminiClient() = default;

Result<GenerationResponse, Error> GeminiClient::Generate(
    std::string_view prompt,
    ModelVariant model,
    const std::optional<GenerationConfig>& config) {
    return impl_->Post(prompt, model, config);
}

std::string GeminiClient::ModelId(ModelVariant model) const {
    return impl_->ModelName(model);
}

Result<void, Error> GeminiClient::TestConnection() {
    LogInfo("gemini", "Testing connection to Gemini API...");
    auto result = Generate("Test", ModelVariant::Pro, std::nullopt);
    if (result.IsErr()) {
        return Result<void, Error>::Err(std::move(result).Error());
    }
    LogInfo("gemini", "Connection test successful");
    return Result<void, Error>::Ok();
}

} // namespace gemini_mcp
