#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <gemini_mcp/tools/search.hpp>
#include "../mocks/mock_generation_service.hpp"

using namespace gemini_mcp;
using gemini_mcp::testing::MockGenerationService;
using Catch::Matchers::WithinAbs;

namespace {

SearchInput SampleInput() {
    SearchInput input;
    input.query = "How is memory managed?";
    input.sources = {
        Source{"src-1", "Rust Book", "Ownership gives memory safety without a garbage collector."},
        Source{"src-2", "Go Tour", "Go uses a concurrent garbage collector."},
    };
    return input;
}

const char* kReply =
    "Answer: Rust uses ownership while Go uses a garbage collector.\n\n"
    "Results:\n- Rust Book explains ownership.\n\n"
    "Citations: \"Ownership gives memory safety without\"";

} // namespace

// ===========================================================================
// DecodeSearchInput
// ===========================================================================

TEST_CASE("DecodeSearchInput: full argument set", "[tools][search]") {
    auto args = nlohmann::json::parse(R"({
        "query": "q",
        "sources": [{"id": "a", "title": "A", "content": "alpha"}],
        "filters": {"source_ids": ["a"], "min_relevance": 0.5, "max_results": 3},
        "ranking": "recency",
        "include_citations": false,
        "model": "FLASH",
        "params": {"temperature": 0.1, "top_k": 5}
    })");
    auto input = DecodeSearchInput(args);
    REQUIRE(input.IsOk());
    const auto& v = input.Value();
    REQUIRE(v.sources.size() == 1);
    CHECK(v.sources[0].content == "alpha");
    REQUIRE(v.filters.has_value());
    CHECK(v.filters->max_results == 3u);
    CHECK(v.ranking == RankingCriteria::Recency);
    CHECK_FALSE(v.include_citations);
    CHECK(v.model == ModelVariant::Flash);
    REQUIRE(v.params.has_value());
    CHECK(v.params->top_k == 5u);
}

TEST_CASE("DecodeSearchInput: rejects bad arguments", "[tools][search]") {
    CHECK(DecodeSearchInput({{"query", "q"}}).IsErr());
    CHECK(DecodeSearchInput(nlohmann::json::parse(
              R"({"query": "q", "sources": [{"id": "a"}]})")).IsErr());

    auto bad_ranking = DecodeSearchInput(
        {{"query", "q"}, {"sources", nlohmann::json::array()}, {"ranking", "random"}});
    REQUIRE(bad_ranking.IsErr());
    CHECK(bad_ranking.Error().message.find("Invalid ranking") == 0);

    auto bad_model = DecodeSearchInput(
        {{"query", "q"}, {"sources", nlohmann::json::array()}, {"model", "ultra"}});
    REQUIRE(bad_model.IsErr());
    CHECK(bad_model.Error().category == ErrorCategory::InvalidInput);
}

// ===========================================================================
// BuildSearchPrompt
// ===========================================================================

TEST_CASE("BuildSearchPrompt: lists every source with its header", "[tools][search]") {
    auto input = SampleInput();
    auto prompt = BuildSearchPrompt(input.query, input.sources);
    CHECK(prompt.find("Query: How is memory managed?") != std::string::npos);
    CHECK(prompt.find("--- Source: Rust Book (ID: src-1) ---\n") != std::string::npos);
    CHECK(prompt.find("--- Source: Go Tour (ID: src-2) ---\n") != std::string::npos);
    CHECK(prompt.find("sections for Answer, Results, and Citations.") != std::string::npos);
}

// ===========================================================================
// ExecuteSearch
// ===========================================================================

TEST_CASE("ExecuteSearch: answer, results, citations and metadata", "[tools][search]") {
    MockGenerationService mock;
    mock.EnqueueText(kReply, UsageMetadata{100, 50, 150});

    auto result = ExecuteSearch(mock, SampleInput());
    REQUIRE(result.IsOk());
    const auto& out = result.Value().result;
    CHECK(out.answer == "Rust uses ownership while Go uses a garbage collector.");
    REQUIRE(out.results.size() == 1);
    CHECK(out.results[0].source_id == "src-1");
    CHECK_THAT(out.results[0].relevance_score, WithinAbs(kPlaceholderRelevance, 1e-9));
    REQUIRE(out.citations.size() == 1);
    CHECK(out.citations[0].source_id == "src-1");

    const auto& meta = result.Value().metadata;
    CHECK(meta.model_used == "mock-pro");
    CHECK(meta.prompt_tokens == 100);
    CHECK(meta.response_tokens == 50);
    CHECK(meta.total_tokens == 150);

    const auto& config = mock.Calls()[0].config;
    REQUIRE(config.has_value());
    CHECK_THAT(*config->temperature, WithinAbs(kSearchTemperature, 1e-9));
    CHECK(config->max_output_tokens == kSearchMaxTokens);
}

TEST_CASE("ExecuteSearch: citations skipped when disabled", "[tools][search]") {
    MockGenerationService mock;
    mock.EnqueueText(kReply);

    auto input = SampleInput();
    input.include_citations = false;
    auto result = ExecuteSearch(mock, input);
    REQUIRE(result.IsOk());
    CHECK(result.Value().result.citations.empty());
}

TEST_CASE("ExecuteSearch: source_ids filter narrows the prompt", "[tools][search]") {
    MockGenerationService mock;
    mock.EnqueueText(kReply);

    auto input = SampleInput();
    input.filters = SearchFilters{std::vector<std::string>{"src-2"}, std::nullopt, std::nullopt};
    input.model = ModelVariant::Flash;
    auto result = ExecuteSearch(mock, input);
    REQUIRE(result.IsOk());

    const auto& prompt = mock.Calls()[0].prompt;
    CHECK(prompt.find("(ID: src-2)") != std::string::npos);
    CHECK(prompt.find("(ID: src-1)") == std::string::npos);
    CHECK(mock.Calls()[0].model == ModelVariant::Flash);
    CHECK(result.Value().metadata.model_used == "mock-flash");
}

TEST_CASE("ExecuteSearch: min_relevance above the placeholder drops results", "[tools][search]") {
    MockGenerationService mock;
    mock.EnqueueText(kReply);

    auto input = SampleInput();
    input.filters = SearchFilters{std::nullopt, 0.8, std::nullopt};
    auto result = ExecuteSearch(mock, input);
    REQUIRE(result.IsOk());
    CHECK(result.Value().result.results.empty());
}

TEST_CASE("ExecuteSearch: caller params override defaults", "[tools][search]") {
    MockGenerationService mock;
    mock.EnqueueText(kReply);

    auto input = SampleInput();
    GenerationParams params;
    params.temperature = 0.0;
    params.top_p = 0.5;
    input.params = params;
    REQUIRE(ExecuteSearch(mock, input).IsOk());

    const auto& config = *mock.Calls()[0].config;
    CHECK_THAT(*config.temperature, WithinAbs(0.0, 1e-9));
    CHECK(config.max_output_tokens == kSearchMaxTokens);
    CHECK_THAT(*config.top_p, WithinAbs(0.5, 1e-9));
}

TEST_CASE("ExecuteSearch: validation happens before any backend call", "[tools][search]") {
    MockGenerationService mock;

    auto blank = SampleInput();
    blank.query = " ";
    auto r1 = ExecuteSearch(mock, blank);
    REQUIRE(r1.IsErr());
    CHECK(r1.Error().message == "Query cannot be empty");

    auto no_sources = SampleInput();
    no_sources.sources.clear();
    auto r2 = ExecuteSearch(mock, no_sources);
    REQUIRE(r2.IsErr());
    CHECK(r2.Error().message == "At least one source is required");

    auto filtered_out = SampleInput();
    filtered_out.filters = SearchFilters{std::vector<std::string>{"none"}, std::nullopt, std::nullopt};
    auto r3 = ExecuteSearch(mock, filtered_out);
    REQUIRE(r3.IsErr());
    CHECK(r3.Error().message == "No sources match the filter criteria");

    CHECK(mock.CallCount() == 0);
}

TEST_CASE("SearchOutput: JSON shape", "[tools][search]") {
    SearchOutput out;
    out.answer = "a";
    out.results.push_back(SourceResult{"id", "Title", "excerpt", 0.7});
    nlohmann::json j = out;
    CHECK(j["answer"] == "a");
    CHECK(j["results"][0]["source_id"] == "id");
    CHECK(j["citations"].is_array());
}
