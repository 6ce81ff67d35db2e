#include "browser/browser_detector.hpp"
#include "platform/platform_abi.hpp"
#include "utils/server_log.hpp"

#include <cctype>

namespace browser_detector {

namespace {

const BrowserType ALL_TYPES[] = {
    BrowserType::Brave,
    BrowserType::Chrome,
    BrowserType::Chromium,
    BrowserType::Edge,
};

// User-data directory relative to $HOME.
std::string relative_user_data_dir(BrowserType type) {
    switch (type) {
    case BrowserType::Brave:
        return ".config/BraveSoftware/Brave-Browser";
    case BrowserType::Chrome:
        return ".config/google-chrome";
    case BrowserType::Chromium:
        return ".config/chromium";
    case BrowserType::Edge:
        return ".config/microsoft-edge";
    }
    return ".config/chromium";
}

std::string resolve_executable(BrowserType type) {
    for (const auto &candidate : executable_candidates(type)) {
        if (candidate.find('/') != std::string::npos) {
            if (platform::is_executable_file(candidate)) {
                return candidate;
            }
        } else {
            std::string full_path = platform::find_on_path(candidate);
            if (!full_path.empty()) {
                return full_path;
            }
        }
    }
    return "";
}

} // namespace

const char *browser_type_name(BrowserType type) {
    switch (type) {
    case BrowserType::Brave:
        return "Brave";
    case BrowserType::Chrome:
        return "Chrome";
    case BrowserType::Chromium:
        return "Chromium";
    case BrowserType::Edge:
        return "Edge";
    }
    return "Chromium";
}

const std::vector<std::string> &executable_candidates(BrowserType type) {
    static const std::vector<std::string> brave = {
        "brave-browser", "brave", "/usr/bin/brave-browser", "/opt/brave.com/brave/brave",
        "/snap/bin/brave",
    };
    static const std::vector<std::string> chrome = {
        "google-chrome", "google-chrome-stable", "/usr/bin/google-chrome",
        "/usr/bin/google-chrome-stable", "/opt/google/chrome/chrome",
    };
    static const std::vector<std::string> chromium = {
        "chromium", "chromium-browser", "/usr/bin/chromium", "/usr/bin/chromium-browser",
        "/snap/bin/chromium",
    };
    static const std::vector<std::string> edge = {
        "microsoft-edge", "microsoft-edge-stable", "/usr/bin/microsoft-edge",
        "/opt/microsoft/msedge/msedge",
    };
    switch (type) {
    case BrowserType::Brave:
        return brave;
    case BrowserType::Chrome:
        return chrome;
    case BrowserType::Chromium:
        return chromium;
    case BrowserType::Edge:
        return edge;
    }
    return chromium;
}

std::vector<std::string> list_profiles(const std::string &user_data_dir) {
    std::vector<std::string> profiles;
    for (const auto &name : platform::list_subdirectories(user_data_dir)) {
        if (name == "Default" || name.rfind("Profile ", 0) == 0) {
            profiles.push_back(name);
        }
    }
    return profiles;
}

std::string parse_version_output(const std::string &output) {
    // The version is the first token that starts with a digit and contains a dot.
    std::size_t position = 0;
    while (position < output.size()) {
        while (position < output.size() && std::isspace(static_cast<unsigned char>(output[position]))) {
            ++position;
        }
        std::size_t token_end = position;
        while (token_end < output.size() && !std::isspace(static_cast<unsigned char>(output[token_end]))) {
            ++token_end;
        }
        std::string token = output.substr(position, token_end - position);
        if (!token.empty() && std::isdigit(static_cast<unsigned char>(token[0])) &&
            token.find('.') != std::string::npos) {
            return token;
        }
        position = token_end;
    }
    return "";
}

std::vector<DetectedBrowser> detect_all() {
    std::vector<DetectedBrowser> browsers;
    std::string home = platform::home_directory();

    for (BrowserType type : ALL_TYPES) {
        std::string executable = resolve_executable(type);
        if (executable.empty()) {
            continue;
        }

        DetectedBrowser browser;
        browser.type = type;
        browser.executable_path = executable;
        if (!home.empty()) {
            browser.user_data_dir = home + "/" + relative_user_data_dir(type);
        }

        std::string version_output;
        if (platform::run_and_capture(executable, {"--version"}, version_output)) {
            browser.version = parse_version_output(version_output);
        }

        server_log::debug(std::string("Detected ") + browser_type_name(type) + " at " + executable);
        browsers.push_back(browser);
    }
    return browsers;
}

std::string find_browser_executable() {
    for (BrowserType type : ALL_TYPES) {
        std::string executable = resolve_executable(type);
        if (!executable.empty()) {
            return executable;
        }
    }
    return "";
}

} // namespace browser_detector
