#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool "webpuppet_check_permission".
// Reports whether the active policy allows an operation, optionally for a URL.
// An unknown operation name is a tool-level error, not a protocol error.

namespace tool_check_permission {

class CheckPermissionTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["properties"]["operation"] = {
            {"type", "string"},
            {"description", "Operation to check (e.g., Navigate, SendPrompt, DeleteAccount)"}
        };
        input_schema["properties"]["url"] = {
            {"type", "string"},
            {"description", "Optional URL context for navigation checks"}
        };
        input_schema["required"] = json::array({"operation"});

        return {"webpuppet_check_permission", "Check if an operation is allowed by the security policy.",
                input_schema};
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        std::string operation_text;
        std::string argument_error;
        if (!mcp_tools::require_string_argument(arguments, "operation", operation_text, argument_error)) {
            return mcp_tools::fail(mcp_error::ErrorKind::InvalidParams, argument_error);
        }

        permission_gate::Operation operation;
        if (!permission_gate::parse_operation(operation_text, operation)) {
            return mcp_tools::ok(mcp_types::text_result(
                "Unknown operation: `" + operation_text + "`\n\nValid operations: " +
                    permission_gate::operation_list(),
                true));
        }

        std::string url = mcp_tools::optional_string_argument(arguments, "url");
        permission_gate::Decision decision =
            url.empty() ? context.gate().check(operation) : context.gate().check_with_url(operation, url);

        std::string text = std::string("# Permission Check\n\n**Operation**: `") +
                           permission_gate::operation_name(operation) + "`\n**Status**: " +
                           (decision.allowed ? "✅ ALLOWED" : "❌ DENIED") + "\n**Reason**: " + decision.reason +
                           "\n**Risk Level**: " + std::to_string(decision.risk_level) + "/10";
        if (!url.empty()) {
            text += "\n**URL**: " + url;
        }
        return mcp_tools::ok(mcp_types::text_result(text));
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<CheckPermissionTool>());
}

} // namespace tool_check_permission
