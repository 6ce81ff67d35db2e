#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool "webpuppet_browser_status".
// Never starts a browser; reports on the live one if there is one.

namespace tool_browser_status {

class BrowserStatusTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["required"] = json::array();

        return {"webpuppet_browser_status", "Get current browser status including URL, title, and visibility.",
                input_schema};
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        (void)arguments;

        std::shared_ptr<automation::AutomationHandle> handle = context.current_automation();
        if (!handle || !handle->is_alive()) {
            return mcp_tools::ok(mcp_types::text_result(
                "# Browser Status\n\n⚪ No browser session is currently active.\n\nA browser will be launched "
                "when you use `webpuppet_navigate` or `webpuppet_prompt`."));
        }

        std::shared_ptr<automation::Session> session = handle->get_session(providers::Provider::Grok);
        std::string current_url;
        if (!session->current_url(current_url)) {
            current_url = "unknown";
        }
        std::string title;
        if (!session->get_title(title)) {
            title = "Unknown";
        }

        return mcp_tools::ok(mcp_types::text_result(
            std::string("# Browser Status\n\n🟢 Browser session is active.\n\n- **Mode**: ") +
            (context.headless() ? "Headless" : "Visible") + "\n- **URL**: " + current_url + "\n- **Title**: " +
            title));
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<BrowserStatusTool>());
}

} // namespace tool_browser_status
