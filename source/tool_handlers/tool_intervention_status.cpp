#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>
#include <ctime>

using json = nlohmann::json;

// Tool "webpuppet_intervention_status".
// Current intervention state, the pending reason and the last recorded outcome.

namespace tool_intervention_status {

static const char *state_label(intervention::InterventionState state) {
    switch (state) {
    case intervention::InterventionState::Running:
        return "🟢 Running";
    case intervention::InterventionState::WaitingForHuman:
        return "🟡 Waiting for human";
    case intervention::InterventionState::Resuming:
        return "🔵 Resuming";
    case intervention::InterventionState::TimedOut:
        return "🔴 Timed out";
    case intervention::InterventionState::Cancelled:
        return "⚫ Cancelled";
    }
    return "unknown";
}

static std::string format_time(std::chrono::system_clock::time_point time_point) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    std::tm utc_time{};
    gmtime_r(&seconds, &utc_time);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc_time);
    return buffer;
}

class InterventionStatusTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["required"] = json::array();

        return {
            "webpuppet_intervention_status",
            "Check if human intervention is needed (captcha, 2FA, etc.). "
            "Returns current automation state and any pending intervention reason.",
            input_schema
        };
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        (void)arguments;

        intervention::InterventionHandler &handler = context.intervention();
        intervention::InterventionState state = handler.state();
        std::optional<std::string> reason = handler.current_reason();

        std::string text = std::string("# Intervention Status\n\n**State**: ") + state_label(state);
        if (reason) {
            text += "\n**Reason**: " + *reason +
                    "\n\n⚠️ **Action Required**: Please complete the intervention in the browser, "
                    "then call `webpuppet_intervention_complete` with success=true.";
        } else {
            text += "\n\nNo intervention currently required. Automation is running normally.";
        }

        std::optional<intervention::InterventionOutcome> outcome = handler.last_outcome();
        if (outcome) {
            text += std::string("\n\n**Last Outcome**: ") + (outcome->success ? "success" : "failure") +
                    "\n**Message**: " + (outcome->message.empty() ? "None" : outcome->message) +
                    "\n**Completed At**: " + format_time(outcome->completed_at);
        }

        return mcp_tools::ok(mcp_types::text_result(text));
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<InterventionStatusTool>());
}

} // namespace tool_intervention_status
