#include "mcp/mcp_tools.hpp"
#include "utils/server_log.hpp"

#include <mutex>

namespace mcp_tools {

ToolOutcome ok(mcp_types::ToolCallResult result) {
    ToolOutcome outcome;
    outcome.success = true;
    outcome.result = std::move(result);
    return outcome;
}

ToolOutcome fail(mcp_error::ErrorKind kind, const std::string &message) {
    ToolOutcome outcome;
    outcome.success = false;
    outcome.error = mcp_error::make_error(kind, message);
    return outcome;
}

// --- ToolContext ---

ToolContext::ToolContext(std::shared_ptr<const permission_gate::PermissionGate> gate,
                         response_screener::ScreeningConfig screening_config,
                         std::shared_ptr<intervention::InterventionHandler> intervention_handler, bool headless,
                         std::chrono::milliseconds intervention_timeout, AutomationFactory factory)
    : gate_(std::move(gate)),
      screening_config_(screening_config),
      intervention_handler_(std::move(intervention_handler)),
      headless_(headless),
      intervention_timeout_(intervention_timeout),
      factory_(std::move(factory)) {}

bool ToolContext::acquire_automation(std::shared_ptr<automation::AutomationHandle> &handle,
                                     std::string &error_message) {
    {
        std::shared_lock<std::shared_mutex> read_lock(automation_mutex_);
        if (automation_ && automation_->is_alive()) {
            handle = automation_;
            return true;
        }
    }

    std::unique_lock<std::shared_mutex> write_lock(automation_mutex_);
    // Another caller may have built it between the two locks.
    if (automation_ && automation_->is_alive()) {
        handle = automation_;
        return true;
    }
    if (automation_) {
        server_log::warn("Browser connection lost; starting a new one.");
        automation_->close();
        automation_.reset();
    }
    if (!factory_) {
        error_message = "no automation engine configured";
        return false;
    }

    automation::AutomationOptions options;
    options.headless = headless_;
    options.screening_config = screening_config_;
    options.intervention_timeout = headless_ ? std::chrono::milliseconds(0) : intervention_timeout_;
    options.intervention_handler = intervention_handler_;

    std::string factory_error;
    std::unique_ptr<automation::AutomationHandle> built = factory_(options, factory_error);
    if (!built) {
        error_message = "failed to start browser automation: " + factory_error;
        return false;
    }

    server_log::info(std::string("Automation started in ") + (headless_ ? "headless" : "visible") + " mode.");
    automation_ = std::move(built);
    handle = automation_;
    return true;
}

std::shared_ptr<automation::AutomationHandle> ToolContext::current_automation() const {
    std::shared_lock<std::shared_mutex> read_lock(automation_mutex_);
    return automation_;
}

void ToolContext::close_automation() {
    std::unique_lock<std::shared_mutex> write_lock(automation_mutex_);
    if (automation_) {
        automation_->close();
        automation_.reset();
        server_log::debug("Automation closed.");
    }
}

// --- ToolRegistry ---

ToolRegistry::ToolRegistry(std::shared_ptr<ToolContext> context) : context_(std::move(context)) {}

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    std::string name = tool->definition().name;
    std::unique_lock<std::shared_mutex> write_lock(tools_mutex_);
    if (tools_.count(name) != 0) {
        server_log::debug("Tool '" + name + "' registered again; replacing the previous one.");
    }
    tools_[name] = std::move(tool);
}

std::vector<mcp_types::ToolDefinition> ToolRegistry::list_tools() const {
    std::shared_lock<std::shared_mutex> read_lock(tools_mutex_);
    std::vector<mcp_types::ToolDefinition> definitions;
    definitions.reserve(tools_.size());
    // std::map iterates in name order.
    for (const auto &entry : tools_) {
        definitions.push_back(entry.second->definition());
    }
    return definitions;
}

bool ToolRegistry::has_tool(const std::string &name) const {
    std::shared_lock<std::shared_mutex> read_lock(tools_mutex_);
    return tools_.count(name) != 0;
}

ToolOutcome ToolRegistry::execute(const std::string &name, const json &arguments) {
    std::shared_ptr<Tool> tool;
    {
        std::shared_lock<std::shared_mutex> read_lock(tools_mutex_);
        auto found = tools_.find(name);
        if (found == tools_.end()) {
            return fail(mcp_error::ErrorKind::ToolNotFound, name);
        }
        tool = found->second;
    }

    server_log::debug("Executing tool " + name);
    return tool->execute(arguments, *context_);
}

// --- Argument helpers ---

bool require_string_argument(const json &arguments, const std::string &key, std::string &output,
                             std::string &error_message) {
    if (!arguments.is_object() || !arguments.contains(key)) {
        error_message = "missing required argument '" + key + "'";
        return false;
    }
    if (!arguments[key].is_string()) {
        error_message = "argument '" + key + "' must be a string";
        return false;
    }
    output = arguments[key].get<std::string>();
    return true;
}

std::string optional_string_argument(const json &arguments, const std::string &key, const std::string &fallback) {
    if (arguments.is_object() && arguments.contains(key) && arguments[key].is_string()) {
        return arguments[key].get<std::string>();
    }
    return fallback;
}

bool automation_may_proceed(ToolContext &context, mcp_types::ToolCallResult &refusal) {
    intervention::InterventionHandler &handler = context.intervention();
    if (handler.is_blocking()) {
        std::string reason = handler.current_reason().value_or("waiting for human");
        refusal = mcp_types::text_result(
            "Automation is paused: " + reason +
                "\n\nUse webpuppet_intervention_complete or webpuppet_resume to continue.",
            true);
        return false;
    }
    if (handler.acknowledge_resume()) {
        server_log::debug("Intervention finished; automation running again.");
    }
    return true;
}

} // namespace mcp_tools
