#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/server_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool "webpuppet_screenshot".
// Navigates to the URL (allowed domains only) and captures a PNG of the tab.

namespace tool_screenshot {

class ScreenshotTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["properties"]["url"] = {
            {"type", "string"},
            {"description", "URL to take a screenshot of"}
        };
        input_schema["required"] = json::array({"url"});

        return {"webpuppet_screenshot", "Take a screenshot of a web page. Only allowed domains can be accessed.",
                input_schema};
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        std::string url;
        std::string argument_error;
        if (!mcp_tools::require_string_argument(arguments, "url", url, argument_error)) {
            return mcp_tools::fail(mcp_error::ErrorKind::InvalidParams, argument_error);
        }

        std::string denial_reason;
        if (!context.gate().require_with_url(permission_gate::Operation::Navigate, url, denial_reason) ||
            !context.gate().require(permission_gate::Operation::Screenshot, denial_reason)) {
            return mcp_tools::fail(mcp_error::ErrorKind::PermissionDenied, denial_reason);
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

        std::shared_ptr<automation::Session> session = handle->get_session(providers::Provider::Grok);
        automation::OperationResult navigated = session->navigate(url);
        if (!navigated.success) {
            return mcp_tools::fail(mcp_error::ErrorKind::Automation, navigated.error_detail);
        }

        automation::ScreenshotResult screenshot = handle->capture_screenshot();
        if (!screenshot.success) {
            return mcp_tools::ok(mcp_types::text_result("Screenshot failed: " + screenshot.error_detail, true));
        }

        server_log::debug("webpuppet_screenshot: captured " + url);
        mcp_types::ToolCallResult result;
        result.content.push_back(mcp_types::text_content("Screenshot of `" + url + "` captured."));
        result.content.push_back(mcp_types::image_content(screenshot.image_base64, screenshot.mime_type));
        return mcp_tools::ok(result);
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<ScreenshotTool>());
}

} // namespace tool_screenshot
