#ifndef WEBPUPPET_MCP_TOOL_HANDLERS_HPP
#define WEBPUPPET_MCP_TOOL_HANDLERS_HPP

// Tool registration.
// Each tool_*.cpp file provides a register function that is called during startup.

namespace mcp_tools {
class ToolRegistry;
}

namespace tool_handlers {

// Register all available tools with the registry.
void register_all_tools(mcp_tools::ToolRegistry &registry);

} // namespace tool_handlers

#endif // WEBPUPPET_MCP_TOOL_HANDLERS_HPP
