#pragma once

#include <gemini_mcp/gemini/i_generation_service.hpp>
#include <gemini_mcp/mcp/tool_registry.hpp>

namespace gemini_mcp {

// Register all Gemini tools with the MCP tool registry, in catalog order.
// Each tool handler captures &service by reference; the service must outlive
// the registry.
void RegisterGeminiTools(ToolRegistry& registry, IGenerationService& service);

} // namespace gemini_mcp
