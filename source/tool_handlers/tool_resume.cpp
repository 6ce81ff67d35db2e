#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool "webpuppet_resume".

namespace tool_resume {

class ResumeTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["required"] = json::array();

        return {"webpuppet_resume", "Resume browser automation after a pause or manual intervention.",
                input_schema};
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        (void)arguments;
        context.intervention().resume();
        return mcp_tools::ok(mcp_types::text_result(
            "# Automation Resumed\n\n▶️ Automation has been resumed. Browser operations will continue."));
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<ResumeTool>());
}

} // namespace tool_resume
