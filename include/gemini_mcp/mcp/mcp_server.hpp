#pragma once

#include <gemini_mcp/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace gemini_mcp {

// JSON-RPC error codes used by the dispatcher.
constexpr int kParseError = -32700;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over line-delimited JSON-RPC.
//
// Implements:
//   - initialize
//   - tools/list
//   - tools/call
//
// Requests are handled strictly one at a time; each non-empty input line
// produces exactly one response line, flushed before the next line is read.
// A request without "id" is answered with a null id.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF or a stream error on input).
    void Run();

    // Process one raw input line. Returns nullopt for a blank line.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(std::string_view line);

    // Process a single parsed JSON-RPC message.
    [[nodiscard]] nlohmann::json HandleMessage(const nlohmann::json& message);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    nlohmann::json MakeError(const nlohmann::json& id,
                             int code, const std::string& message);
    nlohmann::json MakeResult(const nlohmann::json& id,
                              const nlohmann::json& result);

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace gemini_mcp
