#include <gemini_mcp/mcp/tool_registry.hpp>

#include <gemini_mcp/core/log.hpp>

#include <stdexcept>

namespace gemini_mcp {

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (handlers_.count(name) > 0) {
        throw std::invalid_argument("Tool already registered: " + name);
    }
    schemas_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

Result<ToolResult, Error> ToolRegistry::Execute(
    const std::string& name,
    const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return Result<ToolResult, Error>::Err(Error{
            "ToolRegistry", "Tool not found: " + name, std::nullopt,
            std::nullopt, ErrorCategory::NotFound});
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        LogError("mcp", "Tool '" + name + "' threw: " + e.what());
        return Result<ToolResult, Error>::Err(Error{
            name, std::string("Tool error: ") + e.what(), std::nullopt,
            std::nullopt, ErrorCategory::Internal});
    }
}

} // namespace gemini_mcp
