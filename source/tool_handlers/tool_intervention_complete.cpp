#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool "webpuppet_intervention_complete".
// Records the human's outcome and lets automation resume.

namespace tool_intervention_complete {

class InterventionCompleteTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["properties"]["success"] = {
            {"type", "boolean"},
            {"description", "Whether the intervention was completed successfully"}
        };
        input_schema["properties"]["message"] = {
            {"type", "string"},
            {"description", "Optional message about what was done"}
        };
        input_schema["required"] = json::array({"success"});

        return {
            "webpuppet_intervention_complete",
            "Signal that a human intervention (captcha, 2FA, etc.) has been completed. "
            "Call this after manually handling the intervention in the browser.",
            input_schema
        };
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        if (!arguments.contains("success") || !arguments["success"].is_boolean()) {
            return mcp_tools::fail(mcp_error::ErrorKind::InvalidParams,
                                   "missing required argument 'success' (boolean)");
        }
        if (arguments.contains("message") && !arguments["message"].is_string() && !arguments["message"].is_null()) {
            return mcp_tools::fail(mcp_error::ErrorKind::InvalidParams, "argument 'message' must be a string");
        }

        bool success = arguments["success"].get<bool>();
        std::string message = mcp_tools::optional_string_argument(arguments, "message");

        context.intervention().complete(success, message);

        std::string text = std::string("# Intervention Complete\n\n**Status**: ") +
                           (success ? "✅ SUCCESS" : "❌ FAILED") + "\n**Message**: " +
                           (message.empty() ? "None" : message) + "\n\nAutomation will now resume.";
        return mcp_tools::ok(mcp_types::text_result(text));
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<InterventionCompleteTool>());
}

} // namespace tool_intervention_complete
