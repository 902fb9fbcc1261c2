#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <gemini_mcp/gemini/gemini_client.hpp>

using namespace gemini_mcp;
using Catch::Matchers::WithinAbs;

// ===========================================================================
// BuildGenerateContentRequest
// ===========================================================================

TEST_CASE("BuildGenerateContentRequest: single user turn", "[gemini][codec]") {
    auto request = BuildGenerateContentRequest("Hello there", std::nullopt);

    REQUIRE(request["contents"].is_array());
    REQUIRE(request["contents"].size() == 1);
    CHECK(request["contents"][0]["role"] == "user");
    CHECK(request["contents"][0]["parts"][0]["text"] == "Hello there");
    CHECK_FALSE(request.contains("generationConfig"));
}

TEST_CASE("BuildGenerateContentRequest: unset config fields are omitted", "[gemini][codec]") {
    GenerationConfig config;
    config.temperature = 0.3;
    config.max_output_tokens = 2048;
    auto request = BuildGenerateContentRequest("q", config);

    const auto& gen = request["generationConfig"];
    CHECK_THAT(gen["temperature"].get<double>(), WithinAbs(0.3, 1e-9));
    CHECK(gen["maxOutputTokens"] == 2048);
    CHECK_FALSE(gen.contains("topP"));
    CHECK_FALSE(gen.contains("topK"));
}

TEST_CASE("BuildGenerateContentRequest: all config fields", "[gemini][codec]") {
    GenerationConfig config{0.9, 100, 0.95, 40};
    auto gen = BuildGenerateContentRequest("q", config)["generationConfig"];
    CHECK_THAT(gen["topP"].get<double>(), WithinAbs(0.95, 1e-9));
    CHECK(gen["topK"] == 40);
}

TEST_CASE("BuildGenerateContentRequest: empty config is an empty object", "[gemini][codec]") {
    auto request = BuildGenerateContentRequest("q", GenerationConfig{});
    REQUIRE(request.contains("generationConfig"));
    CHECK(request["generationConfig"].empty());
}

// ===========================================================================
// ParseGenerateContentResponse
// ===========================================================================

TEST_CASE("ParseGenerateContentResponse: text and usage", "[gemini][codec]") {
    auto body = R"({
        "candidates": [{"content": {"role": "model", "parts": [{"text": "Hi!"}, {"text": "ignored"}]}}],
        "usageMetadata": {"promptTokenCount": 12, "candidatesTokenCount": 3, "totalTokenCount": 15}
    })";
    auto result = ParseGenerateContentResponse(body);
    REQUIRE(result.IsOk());
    CHECK(result.Value().text == "Hi!");
    CHECK(result.Value().usage.prompt_token_count == 12);
    CHECK(result.Value().usage.candidates_token_count == 3);
    CHECK(result.Value().usage.total_token_count == 15);
}

TEST_CASE("ParseGenerateContentResponse: missing usage counts as zero", "[gemini][codec]") {
    auto result = ParseGenerateContentResponse(
        R"({"candidates":[{"content":{"parts":[{"text":"ok"}]}}]})");
    REQUIRE(result.IsOk());
    CHECK(result.Value().usage.total_token_count == 0);
}

TEST_CASE("ParseGenerateContentResponse: no candidates is an empty response", "[gemini][codec]") {
    for (const char* body : {R"({"candidates":[]})", R"({})",
                             R"({"candidates":[{"finishReason":"SAFETY"}]})",
                             R"({"candidates":[{"content":{"parts":[]}}]})"}) {
        auto result = ParseGenerateContentResponse(body);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::EmptyResponse);
        CHECK(result.Error().message == "Empty response from Gemini API");
    }
}

TEST_CASE("ParseGenerateContentResponse: invalid JSON", "[gemini][codec]") {
    auto result = ParseGenerateContentResponse("<html>oops</html>");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Api);
}

// ===========================================================================
// ModelVariantFromName
// ===========================================================================

TEST_CASE("ModelVariantFromName: flash substring selects Flash", "[gemini]") {
    CHECK(ModelVariantFromName("gemini-3-flash-preview") == ModelVariant::Flash);
    CHECK(ModelVariantFromName("flash") == ModelVariant::Flash);
    CHECK(ModelVariantFromName("gemini-3-pro-preview") == ModelVariant::Pro);
    CHECK(ModelVariantFromName("") == ModelVariant::Pro);
}

// ===========================================================================
// GeminiClient
// ===========================================================================

TEST_CASE("GeminiClient: ModelId reflects options", "[gemini]") {
    GeminiClientOptions options;
    options.pro_model = "custom-pro";
    options.flash_model = "custom-flash";
    GeminiClient client("test-key", options);
    CHECK(client.ModelId(ModelVariant::Pro) == "custom-pro");
    CHECK(client.ModelId(ModelVariant::Flash) == "custom-flash");
}

TEST_CASE("GeminiClient: unreachable host is a connection error", "[gemini]") {
    GeminiClientOptions options;
    options.base_url = "http://127.0.0.1:1";
    options.connect_timeout = std::chrono::seconds(1);
    GeminiClient client("test-key", options);

    auto result = client.Generate("hi", ModelVariant::Pro, std::nullopt);
    REQUIRE(result.IsErr());
    CHECK((result.Error().category == ErrorCategory::Connection ||
           result.Error().category == ErrorCategory::Timeout));
}

TEST_CASE("GeminiClient: failed connection test exits with code 2", "[gemini]") {
    GeminiClientOptions options;
    options.base_url = "http://127.0.0.1:1";
    options.connect_timeout = std::chrono::seconds(1);
    GeminiClient client("test-key", options);

    auto result = client.TestConnection();
    REQUIRE(result.IsErr());
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("Error: backend HTTP failures exit with code 2", "[gemini]") {
    for (int status : {400, 401, 403, 404, 429, 500, 503}) {
        CHECK(Error::FromHttpStatus("GenerateContent", status).ExitCode() == 2);
    }
}
