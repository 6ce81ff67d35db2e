#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_prompt { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_list_providers { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_provider_capabilities { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_detect_browsers { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_screenshot { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_check_permission { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_intervention_status { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_intervention_complete { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_pause { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_resume { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_navigate { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_browser_status { void register_tool(mcp_tools::ToolRegistry &registry); }

namespace tool_handlers {

void register_all_tools(mcp_tools::ToolRegistry &registry) {
    // Provider prompting
    tool_prompt::register_tool(registry);
    tool_list_providers::register_tool(registry);
    tool_provider_capabilities::register_tool(registry);

    // Browser
    tool_detect_browsers::register_tool(registry);
    tool_navigate::register_tool(registry);
    tool_screenshot::register_tool(registry);
    tool_browser_status::register_tool(registry);

    // Policy
    tool_check_permission::register_tool(registry);

    // Human-in-the-loop
    tool_intervention_status::register_tool(registry);
    tool_intervention_complete::register_tool(registry);
    tool_pause::register_tool(registry);
    tool_resume::register_tool(registry);
}

} // namespace tool_handlers
