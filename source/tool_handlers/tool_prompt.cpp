#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "automation/providers.hpp"
#include "utils/server_log.hpp"

#include <nlohmann/json.hpp>
#include <cstdio>

using json = nlohmann::json;

// Tool "webpuppet_prompt".
// Sends a prompt to an AI provider through the browser and returns the
// screened answer. Answers that fail screening are still returned, prefixed
// with a visible warning.

namespace tool_prompt {

std::string format_screened_text(const automation::PromptResult &prompt_result) {
    if (prompt_result.screening.passed) {
        return prompt_result.response.text;
    }
    char warning[96];
    std::snprintf(warning, sizeof(warning), "[SECURITY WARNING: Response had risk score %.2f]\n\n",
                  prompt_result.screening.risk_score);
    return warning + prompt_result.response.text;
}

class PromptTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["properties"]["provider"] = {
            {"type", "string"},
            {"enum", providers::provider_ids()},
            {"description", "Provider/tool to use"}
        };
        input_schema["properties"]["message"] = {
            {"type", "string"},
            {"description", "The prompt message to send"}
        };
        input_schema["properties"]["context"] = {
            {"type", "string"},
            {"description", "Optional context or system instructions"}
        };
        input_schema["required"] = json::array({"provider", "message"});

        return {
            "webpuppet_prompt",
            "Send a prompt through browser automation (AI providers + select web tools). "
            "Uses existing authenticated sessions.",
            input_schema
        };
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        std::string denial_reason;
        if (!context.gate().require(permission_gate::Operation::SendPrompt, denial_reason)) {
            return mcp_tools::fail(mcp_error::ErrorKind::PermissionDenied, denial_reason);
        }

        std::string provider_name;
        std::string message;
        std::string argument_error;
        if (!mcp_tools::require_string_argument(arguments, "provider", provider_name, argument_error) ||
            !mcp_tools::require_string_argument(arguments, "message", message, argument_error)) {
            return mcp_tools::fail(mcp_error::ErrorKind::InvalidParams, argument_error);
        }

        providers::Provider provider;
        if (!providers::parse_provider(provider_name, provider)) {
            return mcp_tools::fail(mcp_error::ErrorKind::InvalidParams, "unknown provider: " + provider_name);
        }

        automation::PromptRequest request;
        request.message = message;
        request.context = mcp_tools::optional_string_argument(arguments, "context");

        mcp_types::ToolCallResult refusal;
        if (!mcp_tools::automation_may_proceed(context, refusal)) {
            return mcp_tools::ok(refusal);
        }

        std::shared_ptr<automation::AutomationHandle> handle;
        std::string automation_error;
        if (!context.acquire_automation(handle, automation_error)) {
            return mcp_tools::fail(mcp_error::ErrorKind::Automation, automation_error);
        }

        automation::OperationResult authenticated = handle->authenticate(provider);
        if (!authenticated.success) {
            return mcp_tools::fail(mcp_error::ErrorKind::Automation, authenticated.error_detail);
        }

        server_log::debug("webpuppet_prompt: sending to " + providers::to_string(provider));
        automation::PromptResult prompt_result = handle->prompt_screened(provider, request);
        if (!prompt_result.success) {
            return mcp_tools::fail(mcp_error::ErrorKind::Automation, prompt_result.error_detail);
        }

        return mcp_tools::ok(mcp_types::text_result(format_screened_text(prompt_result)));
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<PromptTool>());
}

} // namespace tool_prompt
