#ifndef WEBPUPPET_MCP_CDP_AUTOMATION_HPP
#define WEBPUPPET_MCP_CDP_AUTOMATION_HPP

// AutomationHandle backed by a Chromium-family browser over CDP.

#include <memory>
#include <mutex>
#include <string>

#include "automation/automation_handle.hpp"
#include "browser/cdp/cdp_driver.hpp"

namespace automation {

// Tab operations on the shared CDP connection. Each call takes the
// owning handle's operation lock, so it never interleaves with a prompt
// or with close().
class CdpSession : public Session {
public:
    CdpSession(std::shared_ptr<cdp_driver::Connection> connection, std::shared_ptr<std::mutex> operation_mutex);

    OperationResult navigate(const std::string &url) override;
    bool current_url(std::string &output) override;
    bool get_title(std::string &output) override;

private:
    std::shared_ptr<cdp_driver::Connection> connection_;
    std::shared_ptr<std::mutex> operation_mutex_;
};

class CdpAutomation : public AutomationHandle {
public:
    explicit CdpAutomation(const AutomationOptions &options);
    // Wrap an existing connection; start() is still needed to open a browser.
    CdpAutomation(const AutomationOptions &options, std::shared_ptr<cdp_driver::Connection> connection);
    ~CdpAutomation() override;

    // Launch or reuse the browser and attach to a tab.
    bool start(std::string &error_detail);

    OperationResult authenticate(providers::Provider provider) override;
    PromptResult prompt_screened(providers::Provider provider, const PromptRequest &request) override;
    std::shared_ptr<Session> get_session(providers::Provider provider) override;
    std::optional<providers::Capabilities> provider_capabilities(providers::Provider provider) const override;
    ScreenshotResult capture_screenshot() override;
    bool is_alive() const override;
    void close() override;

private:
    bool page_has(const std::string &selector);
    OperationResult open_provider_page(providers::Provider provider);
    PromptResult search_datasets(providers::Provider provider, const PromptRequest &request);
    PromptResult finish_prompt(providers::Provider provider, const std::string &raw_text);

    AutomationOptions options_;
    std::shared_ptr<cdp_driver::Connection> connection_;
    // Shared with the sessions handed out by get_session().
    std::shared_ptr<std::mutex> operation_mutex_;
};

// Build and start a CDP-backed handle. Returns nullptr and fills
// error_detail when the browser cannot be opened.
std::unique_ptr<AutomationHandle> make_cdp_automation(const AutomationOptions &options,
                                                      std::string &error_detail);

// Quote text as a JavaScript string literal.
std::string js_string_literal(const std::string &text);

// Percent-encode a query component (RFC 3986 unreserved characters kept).
std::string url_encode(const std::string &text);

} // namespace automation

#endif // WEBPUPPET_MCP_CDP_AUTOMATION_HPP
