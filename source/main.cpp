// webpuppet-mcp: MCP server for browser-driven AI provider automation
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr; stdout carries protocol messages only.

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "automation/cdp_automation.hpp"
#include "cli/cli_options.hpp"
#include "intervention/intervention_handler.hpp"
#include "mcp/mcp_server.hpp"
#include "mcp/mcp_tools.hpp"
#include "policy/permission_gate.hpp"
#include "protocol/mcp_types.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/server_log.hpp"

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

int main(int argc, char **argv) {
    cli_options::StartupOptions options;
    if (auto exit_code = cli_options::parse_cli(argc, argv, options)) {
        return *exit_code;
    }

    if (options.verbose || server_log::is_debug_env_enabled()) {
        server_log::set_level(server_log::Level::Debug);
    }
    if (!options.log_file.empty() && !server_log::redirect_to_file(options.log_file)) {
        server_log::warn("Cannot open log file " + options.log_file + "; logging to stderr.");
    }

    server_log::info(std::string(mcp_types::SERVER_NAME) + " " + mcp_types::SERVER_VERSION + " starting.");

    permission_gate::Policy policy;
    if (!permission_gate::policy_by_name(options.policy, policy)) {
        server_log::error("Unknown policy '" + options.policy + "'; using 'secure'.");
        policy = permission_gate::secure_policy();
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto context = std::make_shared<mcp_tools::ToolContext>(
        std::make_shared<const permission_gate::PermissionGate>(policy), response_screener::ScreeningConfig{},
        std::make_shared<intervention::InterventionHandler>(), !options.visible,
        std::chrono::seconds(options.intervention_timeout_seconds), automation::make_cdp_automation);

    auto registry = std::make_shared<mcp_tools::ToolRegistry>(context);
    tool_handlers::register_all_tools(*registry);

    server_log::info("Policy: " + policy.name + ", browser: " + (options.visible ? "visible" : "headless") + ".");
    server_log::info("Waiting for MCP messages on stdin.");

    mcp_server::Server server(registry);
    bool clean = server.run(std::cin, std::cout, &shutdown_requested);

    server_log::info(clean ? "Server shut down." : "Server stopped after a transport error.");
    return clean ? 0 : 1;
}
