#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/server_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool "webpuppet_navigate".
// Navigates the automation tab, starting the browser if needed. The reported
// URL and title are best effort.

namespace tool_navigate {

class NavigateTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["properties"]["url"] = {
            {"type", "string"},
            {"description", "URL to navigate to"}
        };
        input_schema["required"] = json::array({"url"});

        return {"webpuppet_navigate", "Navigate browser to a URL. Opens a browser window if not already open.",
                input_schema};
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        std::string denial_reason;
        if (!context.gate().require(permission_gate::Operation::Navigate, denial_reason)) {
            return mcp_tools::fail(mcp_error::ErrorKind::PermissionDenied, denial_reason);
        }

        std::string url;
        std::string argument_error;
        if (!mcp_tools::require_string_argument(arguments, "url", url, argument_error)) {
            return mcp_tools::fail(mcp_error::ErrorKind::InvalidParams, argument_error);
        }

        mcp_types::ToolCallResult refusal;
        if (!mcp_tools::automation_may_proceed(context, refusal)) {
            return mcp_tools::ok(refusal);
        }

        std::shared_ptr<automation::AutomationHandle> handle;
        std::string automation_error;
        if (!context.acquire_automation(handle, automation_error)) {
            return mcp_tools::fail(mcp_error::ErrorKind::Automation, automation_error);
        }

        server_log::debug("webpuppet_navigate: " + url);
        std::shared_ptr<automation::Session> session = handle->get_session(providers::Provider::Grok);
        automation::OperationResult navigated = session->navigate(url);
        if (!navigated.success) {
            return mcp_tools::fail(mcp_error::ErrorKind::Automation, navigated.error_detail);
        }

        std::string current_url;
        if (!session->current_url(current_url)) {
            current_url = url;
        }
        std::string title;
        if (!session->get_title(title)) {
            title = "Unknown";
        }

        return mcp_tools::ok(mcp_types::text_result(
            "# Browser Navigated\n\n✅ Successfully navigated to URL.\n\n- **URL**: " + current_url +
            "\n- **Title**: " + title));
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<NavigateTool>());
}

} // namespace tool_navigate
