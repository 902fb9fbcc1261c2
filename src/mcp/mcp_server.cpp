#include <gemini_mcp/mcp/mcp_server.hpp>

#include <gemini_mcp/core/log.hpp>
#include <gemini_mcp/core/text.hpp>
#include <gemini_mcp/core/version.hpp>

#include <string>

namespace gemini_mcp {

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo("mcp", "Serving " + std::to_string(registry_.Tools().size()) +
                       " tools on stdio");
    std::string line;
    while (std::getline(in_, line)) {
        auto response = HandleLine(line);
        if (response) {
            out_ << response->dump(-1, ' ', false,
                                   nlohmann::json::error_handler_t::replace)
                 << "\n";
            out_.flush();
        }
    }
    if (in_.bad()) {
        LogError("mcp", "Input stream failed; stopping");
        return;
    }
    LogInfo("mcp", "End of input; shutting down");
}

std::optional<nlohmann::json> McpServer::HandleLine(std::string_view line) {
    auto trimmed = Trim(line);
    if (trimmed.empty()) return std::nullopt;

    auto message = nlohmann::json::parse(trimmed.begin(), trimmed.end(), nullptr,
                                         /*allow_exceptions=*/false);
    if (message.is_discarded()) {
        LogWarn("mcp", "Parse error on input line");
        return MakeError(nullptr, kParseError, "Parse error");
    }
    return HandleMessage(message);
}

nlohmann::json McpServer::HandleMessage(const nlohmann::json& message) {
    if (!message.is_object() ||
        !message.contains("jsonrpc") || !message["jsonrpc"].is_string() ||
        !message.contains("method") || !message["method"].is_string()) {
        LogWarn("mcp", "Malformed JSON-RPC envelope");
        return MakeError(nullptr, kParseError, "Parse error");
    }

    const auto id = message.contains("id") ? message["id"] : nlohmann::json(nullptr);
    const auto method = message["method"].get<std::string>();
    const auto params = message.contains("params") ? message["params"]
                                                   : nlohmann::json::object();
    LogDebug("mcp", "Request: " + method + " id=" + id.dump());

    if (method == "initialize") {
        return HandleInitialize(id);
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        try {
            return HandleToolsCall(params, id);
        } catch (const std::exception& e) {
            LogError("mcp", std::string("tools/call failed: ") + e.what());
            return MakeError(id, kInternalError, e.what());
        }
    }
    LogWarn("mcp", "Method not found: " + method);
    return MakeError(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& id) {
    nlohmann::json result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", "gemini-mcp"},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") ||
        !params["name"].is_string()) {
        LogWarn("mcp", "tools/call without a tool name");
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.contains("arguments") && !params["arguments"].is_null()
                         ? params["arguments"]
                         : nlohmann::json::object();

    if (!registry_.HasTool(tool_name)) {
        LogWarn("mcp", "Tool not found: " + tool_name);
        return MakeError(id, kMethodNotFound, "Tool not found: " + tool_name);
    }

    LogInfo("mcp", "Calling tool: " + tool_name);
    auto result = registry_.Execute(tool_name, arguments);
    if (result.IsErr()) {
        LogWarn("mcp", tool_name + " failed: " + result.Error().ToString());
        return MakeError(id, kInternalError, result.Error().ToString());
    }

    return MakeResult(id, {{"content", result.Value().content}});
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace gemini_mcp
