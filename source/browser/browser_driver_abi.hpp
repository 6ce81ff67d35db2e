#ifndef WEBPUPPET_MCP_BROWSER_DRIVER_ABI_HPP
#define WEBPUPPET_MCP_BROWSER_DRIVER_ABI_HPP

// Result and option types shared by the browser driver layer.
// Keeps the automation layer decoupled from any particular browser protocol.

#include <nlohmann/json.hpp>
#include <string>

namespace browser_driver {

// Settings used when opening the browser (launch arguments).
struct OpenBrowserOptions {
    bool headless = true;
    // Empty: pick the first detected Chromium-family browser.
    std::string executable_path;
    // Empty: a throwaway profile under /tmp.
    std::string user_data_directory;
    // Reuse a browser already running on user_data_directory if possible.
    bool reuse_existing = true;
};

// Result of a browser driver operation.
struct DriverResult {
    bool success = false;
    std::string message;
    std::string error_detail;
};

// Result of navigation.
struct NavigateResult {
    bool success = false;
    std::string frame_id;
    std::string error_text; // CDP errorText if navigation failed
};

// Result of capturing a screenshot of the current tab.
struct CaptureScreenshotResult {
    bool success = false;
    std::string image_base64;
    std::string mime_type; // e.g. "image/png"
    std::string error_detail;
};

// Result of Runtime.evaluate with returnByValue.
struct EvaluateResult {
    bool success = false;
    nlohmann::json value; // null when the expression returned undefined
    std::string error_detail;
};

} // namespace browser_driver

#endif // WEBPUPPET_MCP_BROWSER_DRIVER_ABI_HPP
