#ifndef WEBPUPPET_MCP_MCP_TOOLS_HPP
#define WEBPUPPET_MCP_MCP_TOOLS_HPP

// MCP tool registry: the tool contract, the shared execution context, and
// registration, listing and dispatch of tool calls.

#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "automation/automation_handle.hpp"
#include "intervention/intervention_handler.hpp"
#include "mcp/mcp_error.hpp"
#include "policy/permission_gate.hpp"
#include "protocol/mcp_types.hpp"
#include "screening/response_screener.hpp"

namespace mcp_tools {

using json = nlohmann::json;

// Result of a tool execution. On success, result carries the content (which
// may itself be a tool-level failure with is_error set); on failure, error
// carries the protocol-level error.
struct ToolOutcome {
    bool success = false;
    mcp_types::ToolCallResult result;
    mcp_error::Error error;
};

ToolOutcome ok(mcp_types::ToolCallResult result);
ToolOutcome fail(mcp_error::ErrorKind kind, const std::string &message);

// Builds an automation handle. Returns nullptr and fills error_detail on failure.
using AutomationFactory = std::function<std::unique_ptr<automation::AutomationHandle>(
    const automation::AutomationOptions &options, std::string &error_detail)>;

// Everything a tool may need, shared by all invocations for the lifetime of
// the server. Only the automation handle is ever rebuilt.
class ToolContext {
public:
    ToolContext(std::shared_ptr<const permission_gate::PermissionGate> gate,
                response_screener::ScreeningConfig screening_config,
                std::shared_ptr<intervention::InterventionHandler> intervention_handler, bool headless,
                std::chrono::milliseconds intervention_timeout, AutomationFactory factory);

    const permission_gate::PermissionGate &gate() const { return *gate_; }
    const response_screener::ScreeningConfig &screening_config() const { return screening_config_; }
    intervention::InterventionHandler &intervention() const { return *intervention_handler_; }
    bool headless() const { return headless_; }

    // Return the live handle, building it on first use or after the browser
    // went away. Returns false and fills error_message on failure.
    bool acquire_automation(std::shared_ptr<automation::AutomationHandle> &handle,
                            std::string &error_message);

    // The live handle without building one; nullptr if none.
    std::shared_ptr<automation::AutomationHandle> current_automation() const;

    // Close and drop the handle, if any.
    void close_automation();

private:
    std::shared_ptr<const permission_gate::PermissionGate> gate_;
    response_screener::ScreeningConfig screening_config_;
    std::shared_ptr<intervention::InterventionHandler> intervention_handler_;
    bool headless_;
    std::chrono::milliseconds intervention_timeout_;
    AutomationFactory factory_;

    mutable std::shared_mutex automation_mutex_;
    std::shared_ptr<automation::AutomationHandle> automation_;
};

// The uniform contract every tool implements.
class Tool {
public:
    virtual ~Tool() = default;

    // Static description; no side effects.
    virtual mcp_types::ToolDefinition definition() const = 0;

    virtual ToolOutcome execute(const json &arguments, ToolContext &context) = 0;
};

class ToolRegistry {
public:
    explicit ToolRegistry(std::shared_ptr<ToolContext> context);

    // Insert a tool; an existing tool with the same name is replaced.
    void register_tool(std::shared_ptr<Tool> tool);

    // Definitions of every registered tool, sorted by name.
    std::vector<mcp_types::ToolDefinition> list_tools() const;

    bool has_tool(const std::string &name) const;

    // Look up the tool and run it with the shared context.
    // Fails with ToolNotFound if no tool has this name.
    ToolOutcome execute(const std::string &name, const json &arguments);

    ToolContext &context() { return *context_; }

private:
    std::shared_ptr<ToolContext> context_;
    mutable std::shared_mutex tools_mutex_;
    std::map<std::string, std::shared_ptr<Tool>> tools_;
};

// Argument helpers shared by the tools. Each returns false and fills
// error_message when the argument is missing or has the wrong type.
bool require_string_argument(const json &arguments, const std::string &key, std::string &output,
                             std::string &error_message);
std::string optional_string_argument(const json &arguments, const std::string &key,
                                     const std::string &fallback = "");

// Tool-level refusal when a human holds the browser; also acknowledges a
// finished intervention. Returns true if automation may proceed, otherwise
// fills refusal with the tool result to return.
bool automation_may_proceed(ToolContext &context, mcp_types::ToolCallResult &refusal);

} // namespace mcp_tools

#endif // WEBPUPPET_MCP_MCP_TOOLS_HPP
