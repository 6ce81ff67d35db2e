#include "browser/cdp/cdp_chrome_launch.hpp"
#include "browser/browser_detector.hpp"
#include "platform/platform_abi.hpp"
#include "utils/server_log.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace cdp_chrome_launch {

std::string default_profile_directory() {
    std::string home = platform::home_directory();
    if (home.empty()) {
        return "/tmp/webpuppet_mcp_profile";
    }
    return home + "/.cache/webpuppet-mcp/profile";
}

ChromeCommandLine build_chrome_command_line(const std::string &user_data_directory, int port,
                                            const browser_driver::OpenBrowserOptions &options) {
    ChromeCommandLine command_line;
    command_line.executable_path = options.executable_path.empty()
                                       ? browser_detector::find_browser_executable()
                                       : options.executable_path;
    command_line.arguments = {
        "--remote-debugging-port=" + std::to_string(port),
        "--remote-allow-origins=*",
        "--user-data-dir=" + user_data_directory,
    };
    if (options.headless) {
        command_line.arguments.push_back("--headless=new");
        command_line.arguments.push_back("--window-size=1280,900");
    }
    if (getuid() == 0) {
        command_line.arguments.push_back("--no-sandbox");
    }
    std::vector<std::string> rest = {
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-background-networking",
        "--disable-client-side-phishing-detection",
        "--disable-default-apps",
        "--disable-extensions",
        "--disable-hang-monitor",
        "--disable-popup-blocking",
        "--disable-prompt-on-repost",
        "--disable-sync",
        "--disable-translate",
        "--metrics-recording-only",
        "about:blank",
    };
    command_line.arguments.insert(command_line.arguments.end(), rest.begin(), rest.end());
    return command_line;
}

int parse_devtools_active_port(const std::string &contents, std::string &browser_path) {
    std::istringstream line_stream(contents);
    std::string first_line;
    std::string second_line;
    if (!std::getline(line_stream, first_line) || first_line.empty()) {
        return -1;
    }
    std::getline(line_stream, second_line);

    int port = -1;
    try {
        port = std::stoi(first_line);
    } catch (const std::exception &) {
        return -1;
    }
    if (port <= 0 || port > 65535) {
        return -1;
    }

    // Normalize to exactly one leading slash (the browser may write it with or without).
    browser_path = second_line;
    while (!browser_path.empty() && (browser_path.back() == '\r' || browser_path.back() == ' ')) {
        browser_path.pop_back();
    }
    while (!browser_path.empty() && browser_path[0] == '/') {
        browser_path.erase(0, 1);
    }
    if (!browser_path.empty()) {
        browser_path = "/" + browser_path;
    }
    return port;
}

std::string build_websocket_url(int port, const std::string &browser_path) {
    std::string path = browser_path.empty() ? "/devtools/browser" : browser_path;
    return "ws://127.0.0.1:" + std::to_string(port) + path;
}

std::string try_get_existing_websocket_url(const std::string &user_data_directory) {
    std::string contents;
    if (!platform::read_file_contents(user_data_directory + "/DevToolsActivePort", contents)) {
        return "";
    }
    std::string browser_path;
    int port = parse_devtools_active_port(contents, browser_path);
    if (port <= 0) {
        return "";
    }
    return build_websocket_url(port, browser_path);
}

ChromeLaunchResult launch_chrome(const browser_driver::OpenBrowserOptions &options) {
    ChromeLaunchResult result;

    std::string profile_directory = options.user_data_directory.empty()
                                        ? "/tmp/webpuppet_mcp_profile_" + std::to_string(getpid())
                                        : options.user_data_directory;
    std::error_code directory_error;
    std::filesystem::create_directories(profile_directory, directory_error);
    if (directory_error) {
        result.error_message = "Could not create profile directory " + profile_directory + ": " +
                               directory_error.message();
        return result;
    }
    result.user_data_directory = profile_directory;

    // A stale port file from an earlier run would be read before the new one is written.
    std::string active_port_file = profile_directory + "/DevToolsActivePort";
    std::filesystem::remove(active_port_file, directory_error);

    ChromeCommandLine command_line = build_chrome_command_line(profile_directory, 0, options);
    if (command_line.executable_path.empty()) {
        result.error_message = "Could not find a supported browser on this system. "
                               "Install Brave, Chrome or Chromium and ensure it is on PATH.";
        return result;
    }

    server_log::debug("Launching browser: " + command_line.executable_path +
                      (options.headless ? " (headless)" : " (visible)"));

    platform::SpawnResult spawn_result = platform::spawn_process(command_line.executable_path,
                                                                 command_line.arguments);
    if (!spawn_result.success) {
        result.error_message = "Failed to spawn browser: " + spawn_result.error_message;
        return result;
    }
    result.process_id = spawn_result.process_id;

    if (!platform::wait_for_file(active_port_file, 15000)) {
        server_log::debug("launch_chrome: timed out waiting for DevToolsActivePort, killing pid=" +
                          std::to_string(result.process_id));
        result.error_message = "Timed out waiting for DevToolsActivePort file at: " + active_port_file;
        platform::kill_process(result.process_id);
        return result;
    }

    std::string contents;
    std::string browser_path;
    if (platform::read_file_contents(active_port_file, contents)) {
        result.debug_port = parse_devtools_active_port(contents, browser_path);
    }
    if (result.debug_port <= 0) {
        result.error_message = "Failed to parse debug port from DevToolsActivePort file.";
        platform::kill_process(result.process_id);
        return result;
    }

    result.websocket_debugger_url = build_websocket_url(result.debug_port, browser_path);
    server_log::debug("WebSocket URL: " + result.websocket_debugger_url);

    // The port file appears slightly before the socket accepts connections.
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    result.success = true;
    server_log::info("Browser launched (pid=" + std::to_string(result.process_id) +
                     ", port=" + std::to_string(result.debug_port) + ")");
    return result;
}

} // namespace cdp_chrome_launch
