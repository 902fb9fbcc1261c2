#pragma once

#include <gemini_mcp/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace gemini_mcp {

// ---------------------------------------------------------------------------
// ToolSchema: descriptor advertised by tools/list.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult: successful tool output: an array of MCP content blocks.
// ---------------------------------------------------------------------------
struct ToolResult {
    nlohmann::json content;

    static ToolResult Text(const std::string& text) {
        return ToolResult{
            nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
    }
};

// A tool handler takes the call's arguments object and returns its output or
// the Error that prevented it.
using ToolHandler =
    std::function<Result<ToolResult, Error>(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: ordered, name-unique catalog of MCP tools.
//
// Built once at startup and read-only afterwards. Registering a name twice
// throws std::invalid_argument.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Unknown names yield a NotFound error; exceptions escaping the handler
    // become Internal errors.
    [[nodiscard]] Result<ToolResult, Error> Execute(
        const std::string& name,
        const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace gemini_mcp
