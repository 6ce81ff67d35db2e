#include "cli/cli_options.hpp"
#include "protocol/mcp_types.hpp"

#include <CLI/CLI.hpp>

#include <iostream>

namespace cli_options {

std::optional<int> parse_cli(int argc, char **argv, StartupOptions &options) {
    CLI::App app{"webpuppet-mcp: MCP server for browser-driven AI provider automation"};

    bool show_version = false;

    app.add_flag("--version", show_version, "Print version and exit");
    app.add_flag("--stdio", options.stdio, "Serve MCP over stdin/stdout (the only transport)");
    app.add_option("--policy", options.policy, "Permission policy: secure|permissive|readonly");
    app.add_flag("--visible", options.visible, "Show the browser window instead of running headless");
    app.add_flag("-v,--verbose", options.verbose, "Enable debug logging");
    app.add_option("--log-file", options.log_file, "Append diagnostics to this file instead of stderr");
    app.add_option("--intervention-timeout", options.intervention_timeout_seconds,
                   "Seconds to wait for a human on a sign-in wall (visible mode)")
        ->check(CLI::NonNegativeNumber);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return std::optional<int>{app.exit(e)};
    }

    if (show_version) {
        std::cout << mcp_types::SERVER_NAME << " " << mcp_types::SERVER_VERSION << '\n';
        return std::optional<int>{0};
    }

    if (!options.stdio) {
        std::cerr << "only the stdio transport is supported\n";
        return std::optional<int>{1};
    }

    return std::nullopt;
}

} // namespace cli_options
