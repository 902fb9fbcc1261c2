#include <catch2/catch_test_macros.hpp>

#include <gemini_mcp/mcp/tool_registry.hpp>

#include <stdexcept>

using namespace gemini_mcp;

namespace {

nlohmann::json EmptySchema() {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

} // anonymous namespace

TEST_CASE("ToolRegistry: preserves registration order", "[mcp][registry]") {
    ToolRegistry registry;
    for (const char* name : {"zeta", "alpha", "mid"}) {
        registry.Register(name, "desc", EmptySchema(),
                          [](const nlohmann::json&) {
                              return Result<ToolResult, Error>::Ok(ToolResult::Text("ok"));
                          });
    }

    const auto& tools = registry.Tools();
    REQUIRE(tools.size() == 3);
    CHECK(tools[0].name == "zeta");
    CHECK(tools[1].name == "alpha");
    CHECK(tools[2].name == "mid");
    CHECK(registry.HasTool("alpha"));
    CHECK_FALSE(registry.HasTool("beta"));
}

TEST_CASE("ToolRegistry: duplicate names are rejected", "[mcp][registry]") {
    ToolRegistry registry;
    auto handler = [](const nlohmann::json&) {
        return Result<ToolResult, Error>::Ok(ToolResult::Text(""));
    };
    registry.Register("dup", "first", EmptySchema(), handler);
    CHECK_THROWS_AS(registry.Register("dup", "second", EmptySchema(), handler),
                    std::invalid_argument);
    CHECK(registry.Tools().size() == 1);
}

TEST_CASE("ToolRegistry: Execute passes arguments to the handler", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("echo", "Echo", EmptySchema(),
                      [](const nlohmann::json& args) {
                          return Result<ToolResult, Error>::Ok(
                              ToolResult::Text(args.value("message", "")));
                      });

    auto result = registry.Execute("echo", {{"message", "hi"}});
    REQUIRE(result.IsOk());
    CHECK(result.Value().content[0]["type"] == "text");
    CHECK(result.Value().content[0]["text"] == "hi");
}

TEST_CASE("ToolRegistry: unknown tool is NotFound", "[mcp][registry]") {
    ToolRegistry registry;
    auto result = registry.Execute("missing", nlohmann::json::object());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::NotFound);
    CHECK(result.Error().message == "Tool not found: missing");
}

TEST_CASE("ToolRegistry: handler exceptions become Internal errors", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("boom", "Throws", EmptySchema(),
                      [](const nlohmann::json&) -> Result<ToolResult, Error> {
                          throw std::runtime_error("kaput");
                      });

    auto result = registry.Execute("boom", nlohmann::json::object());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Internal);
    CHECK(result.Error().message == "Tool error: kaput");
}
