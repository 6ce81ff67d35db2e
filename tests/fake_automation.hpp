#ifndef WEBPUPPET_MCP_TESTS_FAKE_AUTOMATION_HPP
#define WEBPUPPET_MCP_TESTS_FAKE_AUTOMATION_HPP

// In-memory AutomationHandle for tool and server tests. Records calls and
// returns canned answers; never touches a browser.

#include "automation/automation_handle.hpp"
#include "intervention/intervention_handler.hpp"
#include "mcp/mcp_tools.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fake_automation {

// Shared between a test and the handles its factory builds.
struct Script {
    bool start_fails = false;
    bool authenticate_fails = false;
    bool navigate_fails = false;
    bool title_unavailable = false;
    bool alive = true;
    std::string answer = "fake answer";
    std::string page_url;
    std::string page_title = "Fake Page";

    int handles_built = 0;
    int close_calls = 0;
    std::vector<std::string> calls;
    automation::AutomationOptions last_options;
};

class FakeSession : public automation::Session {
public:
    explicit FakeSession(std::shared_ptr<Script> script) : script_(std::move(script)) {}

    automation::OperationResult navigate(const std::string &url) override {
        script_->calls.push_back("navigate " + url);
        automation::OperationResult result;
        if (script_->navigate_fails) {
            result.error_detail = "net::ERR_NAME_NOT_RESOLVED";
            return result;
        }
        script_->page_url = url;
        result.success = true;
        return result;
    }

    bool current_url(std::string &output) override {
        if (script_->page_url.empty()) {
            return false;
        }
        output = script_->page_url;
        return true;
    }

    bool get_title(std::string &output) override {
        if (script_->title_unavailable) {
            return false;
        }
        output = script_->page_title;
        return true;
    }

private:
    std::shared_ptr<Script> script_;
};

class FakeAutomation : public automation::AutomationHandle {
public:
    FakeAutomation(std::shared_ptr<Script> script, const automation::AutomationOptions &options)
        : script_(std::move(script)), options_(options) {}

    automation::OperationResult authenticate(providers::Provider provider) override {
        script_->calls.push_back("authenticate " + providers::to_string(provider));
        automation::OperationResult result;
        if (script_->authenticate_fails) {
            intervention::InterventionReason reason;
            reason.kind = intervention::ReasonKind::Login;
            reason.detail = providers::to_string(provider);
            if (options_.intervention_handler) {
                options_.intervention_handler->request_intervention(reason);
            }
            result.error_detail = intervention::describe_reason(reason);
            return result;
        }
        result.success = true;
        return result;
    }

    automation::PromptResult prompt_screened(providers::Provider provider,
                                             const automation::PromptRequest &request) override {
        script_->calls.push_back("prompt " + providers::to_string(provider) + " " + request.message);
        automation::PromptResult result;
        result.success = true;
        result.response.provider = provider;
        result.response.text = script_->answer;
        result.screening = response_screener::screen(script_->answer, options_.screening_config);
        return result;
    }

    std::shared_ptr<automation::Session> get_session(providers::Provider provider) override {
        (void)provider;
        return std::make_shared<FakeSession>(script_);
    }

    std::optional<providers::Capabilities> provider_capabilities(providers::Provider provider) const override {
        return providers::capabilities(provider);
    }

    automation::ScreenshotResult capture_screenshot() override {
        script_->calls.push_back("screenshot");
        automation::ScreenshotResult result;
        result.success = true;
        result.image_base64 = "iVBORw0KGgo=";
        result.mime_type = "image/png";
        return result;
    }

    bool is_alive() const override { return script_->alive; }

    void close() override { script_->close_calls++; }

private:
    std::shared_ptr<Script> script_;
    automation::AutomationOptions options_;
};

inline mcp_tools::AutomationFactory make_factory(std::shared_ptr<Script> script) {
    return [script](const automation::AutomationOptions &options,
                    std::string &error_detail) -> std::unique_ptr<automation::AutomationHandle> {
        if (script->start_fails) {
            error_detail = "no browser installed";
            return nullptr;
        }
        script->handles_built++;
        script->last_options = options;
        return std::make_unique<FakeAutomation>(script, options);
    };
}

// Context with the given policy and a fake engine.
inline std::shared_ptr<mcp_tools::ToolContext> make_context(const permission_gate::Policy &policy,
                                                             std::shared_ptr<Script> script,
                                                             bool headless = true) {
    return std::make_shared<mcp_tools::ToolContext>(
        std::make_shared<const permission_gate::PermissionGate>(policy), response_screener::ScreeningConfig{},
        std::make_shared<intervention::InterventionHandler>(), headless, std::chrono::seconds(5),
        make_factory(std::move(script)));
}

} // namespace fake_automation

#endif // WEBPUPPET_MCP_TESTS_FAKE_AUTOMATION_HPP
