#ifndef WEBPUPPET_MCP_CDP_CHROME_LAUNCH_HPP
#define WEBPUPPET_MCP_CDP_CHROME_LAUNCH_HPP

// Chromium-family browser launch and port discovery via DevToolsActivePort file.

#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"

namespace cdp_chrome_launch {

// Result of launching the browser and discovering the debug port.
struct ChromeLaunchResult {
    bool success = false;
    int process_id = -1;
    int debug_port = -1;
    std::string websocket_debugger_url;
    std::string user_data_directory;
    std::string error_message;
};

// Persistent profile, so provider sign-ins survive restarts.
// ~/.cache/webpuppet-mcp/profile, or /tmp/webpuppet_mcp_profile without a home.
std::string default_profile_directory();

// If a browser is already running on this profile (DevToolsActivePort exists),
// returns its WebSocket URL. Otherwise returns empty string.
std::string try_get_existing_websocket_url(const std::string &user_data_directory);

// Launch the browser with remote debugging. Port 0 lets the browser pick one;
// it is read back from DevToolsActivePort.
ChromeLaunchResult launch_chrome(const browser_driver::OpenBrowserOptions &options = {});

// Build the command-line arguments for launching the browser.
struct ChromeCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};
ChromeCommandLine build_chrome_command_line(const std::string &user_data_directory, int port,
                                            const browser_driver::OpenBrowserOptions &options = {});

// Parse the DevToolsActivePort file contents: port on the first line,
// browser WebSocket path on the second.
// Returns the port number, or -1 on failure; browser_path gets the second line
// normalized to exactly one leading slash (empty if missing).
int parse_devtools_active_port(const std::string &contents, std::string &browser_path);

// Build the WebSocket debugger URL from the port and browser path.
std::string build_websocket_url(int port, const std::string &browser_path);

} // namespace cdp_chrome_launch

#endif // WEBPUPPET_MCP_CDP_CHROME_LAUNCH_HPP
