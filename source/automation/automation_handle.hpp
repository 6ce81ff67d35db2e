#ifndef WEBPUPPET_MCP_AUTOMATION_HANDLE_HPP
#define WEBPUPPET_MCP_AUTOMATION_HANDLE_HPP

// Browser automation abstraction consumed by the tools.
// The CDP implementation lives in automation/cdp_automation.*; tests
// substitute their own implementation through the factory in ToolContext.

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "automation/providers.hpp"
#include "screening/response_screener.hpp"

namespace intervention {
class InterventionHandler;
}

namespace automation {

// Result of a browser operation, in the same shape the CDP layer reports.
struct OperationResult {
    bool success = false;
    std::string error_detail;
};

struct PromptRequest {
    std::string message;
    std::string context; // optional system/context text, prepended to the message
};

struct PromptResponse {
    std::string text;
    providers::Provider provider = providers::Provider::Claude;
};

struct PromptResult {
    bool success = false;
    PromptResponse response;
    response_screener::ScreeningResult screening;
    std::string error_detail;
};

struct ScreenshotResult {
    bool success = false;
    std::string image_base64;
    std::string mime_type;
    std::string error_detail;
};

// A browser tab bound to a provider.
class Session {
public:
    virtual ~Session() = default;

    virtual OperationResult navigate(const std::string &url) = 0;

    // Both fail when the page cannot be evaluated; callers fall back.
    virtual bool current_url(std::string &output) = 0;
    virtual bool get_title(std::string &output) = 0;
};

class AutomationHandle {
public:
    virtual ~AutomationHandle() = default;

    // Make sure the provider's page is open and signed in.
    virtual OperationResult authenticate(providers::Provider provider) = 0;

    // Send a prompt, wait for the answer and screen it.
    virtual PromptResult prompt_screened(providers::Provider provider, const PromptRequest &request) = 0;

    virtual std::shared_ptr<Session> get_session(providers::Provider provider) = 0;

    virtual std::optional<providers::Capabilities> provider_capabilities(providers::Provider provider) const = 0;

    virtual ScreenshotResult capture_screenshot() = 0;

    // False once the browser went away; the context then builds a new handle.
    virtual bool is_alive() const = 0;

    virtual void close() = 0;
};

// Settings a handle is built with.
struct AutomationOptions {
    bool headless = true;
    response_screener::ScreeningConfig screening_config;
    // How long a visible browser waits for a human on a sign-in wall.
    // Zero fails immediately instead.
    std::chrono::milliseconds intervention_timeout{0};
    std::shared_ptr<intervention::InterventionHandler> intervention_handler;
};

} // namespace automation

#endif // WEBPUPPET_MCP_AUTOMATION_HANDLE_HPP
