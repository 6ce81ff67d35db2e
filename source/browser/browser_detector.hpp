#ifndef WEBPUPPET_MCP_BROWSER_DETECTOR_HPP
#define WEBPUPPET_MCP_BROWSER_DETECTOR_HPP

// Detection of installed Chromium-family browsers usable for automation.

#include <string>
#include <vector>

namespace browser_detector {

enum class BrowserType {
    Brave,
    Chrome,
    Chromium,
    Edge
};

const char *browser_type_name(BrowserType type);

struct DetectedBrowser {
    BrowserType type = BrowserType::Chrome;
    std::string version;          // empty when `--version` gave nothing usable
    std::string executable_path;
    std::string user_data_dir;    // may not exist if the browser was never started
};

// Candidate executables for a browser type, in search order. Entries without
// a slash are looked up on PATH.
const std::vector<std::string> &executable_candidates(BrowserType type);

// Profile directory names in a user-data dir ("Default", "Profile 1", ...).
std::vector<std::string> list_profiles(const std::string &user_data_dir);

// Extract "120.0.6099.109" from "Google Chrome 120.0.6099.109 ".
std::string parse_version_output(const std::string &output);

// Detect every supported browser, in the order Brave, Chrome, Chromium, Edge.
std::vector<DetectedBrowser> detect_all();

// Executable of the first detected browser, or empty.
std::string find_browser_executable();

} // namespace browser_detector

#endif // WEBPUPPET_MCP_BROWSER_DETECTOR_HPP
