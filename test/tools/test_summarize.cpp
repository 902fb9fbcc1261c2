#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <gemini_mcp/tools/summarize.hpp>
#include "../mocks/mock_generation_service.hpp"

using namespace gemini_mcp;
using gemini_mcp::testing::MockGenerationService;
using Catch::Matchers::WithinAbs;

// ===========================================================================
// DecodeSummarizeInput
// ===========================================================================

TEST_CASE("DecodeSummarizeInput: defaults", "[tools][summarize]") {
    auto input = DecodeSummarizeInput({{"content", "text"}});
    REQUIRE(input.IsOk());
    CHECK(input.Value().length == SummaryLength::Medium);
    CHECK(input.Value().format == SummaryFormat::Paragraph);
    CHECK_FALSE(input.Value().focus.has_value());
}

TEST_CASE("DecodeSummarizeInput: enum values", "[tools][summarize]") {
    auto input = DecodeSummarizeInput(
        {{"content", "text"}, {"length", "brief"}, {"format", "bullet_points"}});
    REQUIRE(input.IsOk());
    CHECK(input.Value().length == SummaryLength::Brief);
    CHECK(input.Value().format == SummaryFormat::BulletPoints);

    CHECK(DecodeSummarizeInput({{"content", "t"}, {"length", "tiny"}}).IsErr());
    CHECK(DecodeSummarizeInput({{"content", "t"}, {"format", "haiku"}}).IsErr());
}

// ===========================================================================
// BuildSummarizePrompt / SummaryMaxTokens
// ===========================================================================

TEST_CASE("BuildSummarizePrompt: medium paragraph without focus", "[tools][summarize]") {
    SummarizeInput input;
    input.content = "Body";
    CHECK(BuildSummarizePrompt(input) ==
          "Summarize the following content:\n\nBody\n\n"
          "Provide a balanced summary with key points and main themes.\n\n"
          "Format the summary as coherent paragraphs.");
}

TEST_CASE("BuildSummarizePrompt: focus appended last", "[tools][summarize]") {
    SummarizeInput input;
    input.content = "Body";
    input.length = SummaryLength::Brief;
    input.format = SummaryFormat::KeyPoints;
    input.focus = "costs";
    auto prompt = BuildSummarizePrompt(input);
    CHECK(prompt.find("2-3 sentences max") != std::string::npos);
    CHECK(prompt.find("key takeaways") != std::string::npos);
    CHECK(prompt.size() >= 28);
    CHECK(prompt.substr(prompt.size() - 28) == "Focus specifically on: costs");
}

TEST_CASE("SummaryMaxTokens: per length", "[tools][summarize]") {
    CHECK(SummaryMaxTokens(SummaryLength::Brief) == 256);
    CHECK(SummaryMaxTokens(SummaryLength::Medium) == 1024);
    CHECK(SummaryMaxTokens(SummaryLength::Detailed) == 2048);
}

// ===========================================================================
// ExecuteSummarize
// ===========================================================================

TEST_CASE("ExecuteSummarize: summary, word count and key topics", "[tools][summarize]") {
    MockGenerationService mock;
    mock.EnqueueText("Caching speeds reads. Caching needs invalidation.");

    SummarizeInput input;
    input.content = "A long document about caches.";
    input.length = SummaryLength::Detailed;
    auto result = ExecuteSummarize(mock, input);

    REQUIRE(result.IsOk());
    const auto& out = result.Value().result;
    CHECK(out.summary == "Caching speeds reads. Caching needs invalidation.");
    CHECK(out.word_count == 6);
    CHECK(out.key_topics == std::vector<std::string>{"caching"});

    const auto& config = *mock.Calls()[0].config;
    CHECK_THAT(*config.temperature, WithinAbs(kSummarizeTemperature, 1e-9));
    CHECK(config.max_output_tokens == 2048u);
    CHECK(mock.Calls()[0].model == ModelVariant::Pro);
}

TEST_CASE("ExecuteSummarize: content limits", "[tools][summarize]") {
    MockGenerationService mock;
    SummarizeInput input;

    input.content = "\n\t ";
    auto blank = ExecuteSummarize(mock, input);
    REQUIRE(blank.IsErr());
    CHECK(blank.Error().message == "Content cannot be empty");

    input.content = std::string(kMaxSummarizeContentBytes + 1, 'a');
    auto large = ExecuteSummarize(mock, input);
    REQUIRE(large.IsErr());
    CHECK(large.Error().message == "Content too large (max 1M characters)");

    CHECK(mock.CallCount() == 0);
}

TEST_CASE("ExecuteSummarize: content at the limit is accepted", "[tools][summarize]") {
    MockGenerationService mock;
    mock.EnqueueText("ok");

    SummarizeInput input;
    input.content = std::string(kMaxSummarizeContentBytes, 'a');
    CHECK(ExecuteSummarize(mock, input).IsOk());
}

TEST_CASE("ExecuteSummarizeLegacy: pretty-printed v2 document", "[tools][summarize]") {
    MockGenerationService mock;
    mock.EnqueueText("Short summary.");

    SummarizeInput input;
    input.content = "Body";
    auto result = ExecuteSummarizeLegacy(mock, input);
    REQUIRE(result.IsOk());

    auto doc = nlohmann::json::parse(result.Value());
    CHECK(doc["result"]["summary"] == "Short summary.");
    CHECK(doc["result"]["word_count"] == 2);
    CHECK(doc["metadata"]["model_used"] == "mock-pro");
    CHECK(result.Value().find("\n  ") != std::string::npos);
}
