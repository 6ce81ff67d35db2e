#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "browser/browser_detector.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool "webpuppet_detect_browsers".
// Lists installed Chromium-family browsers with version, paths and profiles.

namespace tool_detect_browsers {

std::string format_browsers(const std::vector<browser_detector::DetectedBrowser> &browsers) {
    std::string text;
    for (const auto &browser : browsers) {
        if (!text.empty()) {
            text += "\n\n";
        }
        std::vector<std::string> profiles = browser_detector::list_profiles(browser.user_data_dir);
        std::string profile_list;
        for (const auto &profile : profiles) {
            profile_list += (profile_list.empty() ? "" : ", ") + profile;
        }

        text += std::string("- **") + browser_detector::browser_type_name(browser.type) + "** (" +
                (browser.version.empty() ? "unknown" : browser.version) + ")\n" +
                "  - Path: `" + browser.executable_path + "`\n" +
                "  - Data: `" + browser.user_data_dir + "`\n" +
                "  - Profiles: " + (profile_list.empty() ? "none" : profile_list);
    }
    return "# Detected Browsers\n\n" + text;
}

class DetectBrowsersTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["required"] = json::array();

        return {"webpuppet_detect_browsers", "Detect installed browsers that can be used for automation.",
                input_schema};
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        (void)arguments;
        (void)context;

        std::vector<browser_detector::DetectedBrowser> browsers = browser_detector::detect_all();
        if (browsers.empty()) {
            return mcp_tools::ok(mcp_types::text_result(
                "No supported browsers detected. Please install Brave, Chrome, or Chromium.", true));
        }
        return mcp_tools::ok(mcp_types::text_result(format_browsers(browsers)));
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<DetectBrowsersTool>());
}

} // namespace tool_detect_browsers
