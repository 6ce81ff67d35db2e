#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool "webpuppet_pause".

namespace tool_pause {

class PauseTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["required"] = json::array();

        return {
            "webpuppet_pause",
            "Pause browser automation. Use this when you need to manually interact with the browser.",
            input_schema
        };
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        (void)arguments;
        context.intervention().pause();
        return mcp_tools::ok(mcp_types::text_result(
            "# Automation Paused\n\n⏸️ Automation is now paused. The browser is available for manual "
            "interaction.\n\nCall `webpuppet_resume` when ready to continue."));
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<PauseTool>());
}

} // namespace tool_pause
