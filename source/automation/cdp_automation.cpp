#include "automation/cdp_automation.hpp"
#include "browser/cdp/cdp_chrome_launch.hpp"
#include "intervention/intervention_handler.hpp"
#include "policy/permission_gate.hpp"
#include "utils/server_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdio>
#include <set>
#include <thread>

namespace automation {

using json = nlohmann::json;

static const std::chrono::milliseconds PAGE_LOAD_TIMEOUT(20000);
static const std::chrono::milliseconds PROMPT_INPUT_TIMEOUT(10000);
static const std::chrono::milliseconds RESPONSE_TIMEOUT(180000);
static const std::chrono::milliseconds RESPONSE_POLL_INTERVAL(1000);
// Polls with unchanged text before an answer counts as finished.
static const int STABLE_POLLS_REQUIRED = 3;
static const size_t MAX_DATASET_LINKS = 10;

std::string js_string_literal(const std::string &text) {
    return json(text).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string url_encode(const std::string &text) {
    std::string encoded;
    for (unsigned char character : text) {
        bool unreserved = (character >= 'A' && character <= 'Z') || (character >= 'a' && character <= 'z') ||
                          (character >= '0' && character <= '9') || character == '-' || character == '_' ||
                          character == '.' || character == '~';
        if (unreserved) {
            encoded += static_cast<char>(character);
        } else {
            char escaped[4];
            std::snprintf(escaped, sizeof(escaped), "%%%02X", character);
            encoded += escaped;
        }
    }
    return encoded;
}

// Poll document.readyState until the page finished loading.
static bool wait_for_page_ready(cdp_driver::Connection &connection, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        browser_driver::EvaluateResult ready = connection.evaluate("document.readyState");
        if (ready.success && ready.value.is_string() && ready.value.get<std::string>() == "complete") {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    return false;
}

static bool evaluate_string(cdp_driver::Connection &connection, const std::string &expression, std::string &output) {
    browser_driver::EvaluateResult evaluated = connection.evaluate(expression);
    if (!evaluated.success || !evaluated.value.is_string()) {
        return false;
    }
    output = evaluated.value.get<std::string>();
    return true;
}

// Navigate and wait for the load. Callers hold the operation lock.
static OperationResult load_page(cdp_driver::Connection &connection, const std::string &url) {
    OperationResult result;
    browser_driver::NavigateResult navigated = connection.navigate(url);
    if (!navigated.success) {
        result.error_detail = "navigation to " + url + " failed: " + navigated.error_text;
        return result;
    }
    if (!wait_for_page_ready(connection, PAGE_LOAD_TIMEOUT)) {
        server_log::warn("Page did not finish loading in time: " + url);
    }
    result.success = true;
    return result;
}

// --- CdpSession ---

CdpSession::CdpSession(std::shared_ptr<cdp_driver::Connection> connection, std::shared_ptr<std::mutex> operation_mutex)
    : connection_(std::move(connection)), operation_mutex_(std::move(operation_mutex)) {}

OperationResult CdpSession::navigate(const std::string &url) {
    std::lock_guard<std::mutex> lock(*operation_mutex_);
    return load_page(*connection_, url);
}

bool CdpSession::current_url(std::string &output) {
    std::lock_guard<std::mutex> lock(*operation_mutex_);
    return evaluate_string(*connection_, "window.location.href", output);
}

bool CdpSession::get_title(std::string &output) {
    std::lock_guard<std::mutex> lock(*operation_mutex_);
    return evaluate_string(*connection_, "document.title", output);
}

// --- CdpAutomation ---

CdpAutomation::CdpAutomation(const AutomationOptions &options)
    : CdpAutomation(options, std::make_shared<cdp_driver::Connection>()) {}

CdpAutomation::CdpAutomation(const AutomationOptions &options, std::shared_ptr<cdp_driver::Connection> connection)
    : options_(options), connection_(std::move(connection)), operation_mutex_(std::make_shared<std::mutex>()) {}

CdpAutomation::~CdpAutomation() {
    close();
}

bool CdpAutomation::start(std::string &error_detail) {
    std::lock_guard<std::mutex> lock(*operation_mutex_);

    browser_driver::OpenBrowserOptions open_options;
    open_options.headless = options_.headless;
    open_options.user_data_directory = cdp_chrome_launch::default_profile_directory();

    browser_driver::DriverResult opened = connection_->open_browser(open_options);
    if (!opened.success) {
        error_detail = opened.message + " " + opened.error_detail;
        return false;
    }
    server_log::info(std::string("Browser ready (") + (options_.headless ? "headless" : "visible") + ").");
    return true;
}

bool CdpAutomation::page_has(const std::string &selector) {
    if (selector.empty()) {
        return false;
    }
    browser_driver::EvaluateResult found =
        connection_->evaluate("document.querySelector(" + js_string_literal(selector) + ") !== null");
    return found.success && found.value.is_boolean() && found.value.get<bool>();
}

OperationResult CdpAutomation::open_provider_page(providers::Provider provider) {
    OperationResult result;
    const providers::ProviderInfo &provider_info = providers::info(provider);

    std::string location;
    bool on_provider = evaluate_string(*connection_, "window.location.href", location) &&
                       permission_gate::extract_host(location) == permission_gate::extract_host(provider_info.url);
    if (on_provider) {
        result.success = true;
        return result;
    }

    server_log::debug("Opening provider page " + std::string(provider_info.url));
    return load_page(*connection_, provider_info.url);
}

OperationResult CdpAutomation::authenticate(providers::Provider provider) {
    std::lock_guard<std::mutex> lock(*operation_mutex_);

    OperationResult result = open_provider_page(provider);
    if (!result.success || providers::is_search_provider(provider)) {
        return result;
    }

    const providers::PageSelectors selectors = providers::page_selectors(provider);

    // Chat pages render their input after hydration.
    const auto deadline = std::chrono::steady_clock::now() + PROMPT_INPUT_TIMEOUT;
    while (std::chrono::steady_clock::now() < deadline) {
        if (page_has(selectors.prompt_input)) {
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    intervention::InterventionReason reason;
    reason.kind = intervention::ReasonKind::Login;
    reason.detail = providers::to_string(provider) + " (sign in to continue)";
    if (page_has(selectors.login_marker)) {
        reason.detail += ", sign-in form detected";
    }

    result.success = false;
    if (!options_.intervention_handler) {
        result.error_detail = intervention::describe_reason(reason);
        return result;
    }

    options_.intervention_handler->request_intervention(reason);
    server_log::warn("Intervention needed: " + intervention::describe_reason(reason));

    if (options_.headless || options_.intervention_timeout.count() <= 0) {
        result.error_detail = intervention::describe_reason(reason) +
                              ". Run with --visible to sign in, then call webpuppet_intervention_complete.";
        return result;
    }

    intervention::InterventionState exit_state = options_.intervention_handler->wait_for_human(
        options_.intervention_timeout, [this, &selectors]() { return page_has(selectors.prompt_input); });

    if (exit_state == intervention::InterventionState::Resuming) {
        options_.intervention_handler->acknowledge_resume();
        exit_state = intervention::InterventionState::Running;
    }
    if (exit_state == intervention::InterventionState::Running && page_has(selectors.prompt_input)) {
        server_log::info("Sign-in completed for " + providers::to_string(provider) + ".");
        result.success = true;
        return result;
    }

    result.error_detail = std::string("sign-in for ") + providers::to_string(provider) +
                          " did not complete (" + intervention::state_name(exit_state) + ")";
    return result;
}

PromptResult CdpAutomation::finish_prompt(providers::Provider provider, const std::string &raw_text) {
    PromptResult result;
    result.response.provider = provider;
    result.response.text = utf8_sanitize::sanitize(raw_text);
    result.screening = response_screener::screen(result.response.text, options_.screening_config);
    if (!result.screening.passed) {
        server_log::warn("Response from " + providers::to_string(provider) + " failed screening, risk score " +
                         std::to_string(result.screening.risk_score));
    }
    result.success = true;
    return result;
}

PromptResult CdpAutomation::search_datasets(providers::Provider provider, const PromptRequest &request) {
    PromptResult result;
    const std::string search_url = "https://www.kaggle.com/datasets?search=" + url_encode(request.message);

    OperationResult navigated = load_page(*connection_, search_url);
    if (!navigated.success) {
        result.error_detail = navigated.error_detail;
        return result;
    }

    const providers::PageSelectors selectors = providers::page_selectors(provider);
    const std::string collect_links = "Array.from(document.querySelectorAll(" +
                                      js_string_literal(selectors.response_block) + ")).map(a => a.href)";

    json links = json::array();
    const auto deadline = std::chrono::steady_clock::now() + PAGE_LOAD_TIMEOUT;
    while (std::chrono::steady_clock::now() < deadline) {
        browser_driver::EvaluateResult evaluated = connection_->evaluate(collect_links);
        if (evaluated.success && evaluated.value.is_array() && !evaluated.value.empty()) {
            links = evaluated.value;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    std::set<std::string> seen;
    std::string text = "Kaggle datasets matching \"" + request.message + "\":\n";
    for (const auto &link : links) {
        if (!link.is_string() || seen.size() >= MAX_DATASET_LINKS) {
            continue;
        }
        const std::string href = link.get<std::string>();
        if (seen.insert(href).second) {
            text += "- " + href + "\n";
        }
    }
    if (seen.empty()) {
        text = "No Kaggle datasets found for \"" + request.message + "\".";
    }
    return finish_prompt(provider, text);
}

PromptResult CdpAutomation::prompt_screened(providers::Provider provider, const PromptRequest &request) {
    std::lock_guard<std::mutex> lock(*operation_mutex_);

    if (providers::is_search_provider(provider)) {
        return search_datasets(provider, request);
    }

    PromptResult result;
    OperationResult opened = open_provider_page(provider);
    if (!opened.success) {
        result.error_detail = opened.error_detail;
        return result;
    }

    const providers::PageSelectors selectors = providers::page_selectors(provider);
    const std::string response_query = "document.querySelectorAll(" + js_string_literal(selectors.response_block) + ")";
    const std::string count_expression = response_query + ".length";
    const std::string last_text_expression =
        "(() => { const blocks = " + response_query +
        "; return blocks.length ? blocks[blocks.length - 1].innerText : ''; })()";

    browser_driver::EvaluateResult counted = connection_->evaluate(count_expression);
    int blocks_before = counted.success && counted.value.is_number_integer() ? counted.value.get<int>() : 0;

    browser_driver::EvaluateResult focused = connection_->evaluate(
        "(() => { const input = document.querySelector(" + js_string_literal(selectors.prompt_input) +
        "); if (!input) return false; input.focus(); return true; })()");
    if (!focused.success || !focused.value.is_boolean() || !focused.value.get<bool>()) {
        result.error_detail = "prompt input not found on " + providers::to_string(provider) + " page";
        return result;
    }

    std::string full_prompt = request.message;
    if (!request.context.empty()) {
        full_prompt = request.context + "\n\n" + request.message;
    }

    browser_driver::DriverResult typed = connection_->insert_text(full_prompt);
    if (!typed.success) {
        result.error_detail = "typing the prompt failed: " + typed.error_detail;
        return result;
    }
    browser_driver::DriverResult submitted = connection_->press_key("Enter");
    if (!submitted.success) {
        result.error_detail = "submitting the prompt failed: " + submitted.error_detail;
        return result;
    }

    std::string last_text;
    int stable_polls = 0;
    const auto deadline = std::chrono::steady_clock::now() + RESPONSE_TIMEOUT;
    while (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(RESPONSE_POLL_INTERVAL);

        browser_driver::EvaluateResult count_now = connection_->evaluate(count_expression);
        int blocks_now = count_now.success && count_now.value.is_number_integer() ? count_now.value.get<int>() : 0;
        if (blocks_now <= blocks_before) {
            continue;
        }

        std::string text;
        if (!evaluate_string(*connection_, last_text_expression, text) || text.empty()) {
            continue;
        }
        if (text == last_text) {
            if (++stable_polls >= STABLE_POLLS_REQUIRED) {
                return finish_prompt(provider, text);
            }
        } else {
            last_text = text;
            stable_polls = 0;
        }
    }

    if (!last_text.empty()) {
        server_log::warn("Response from " + providers::to_string(provider) + " still changing at timeout.");
        return finish_prompt(provider, last_text);
    }
    result.error_detail = "no response from " + providers::to_string(provider) + " before the timeout";
    return result;
}

std::shared_ptr<Session> CdpAutomation::get_session(providers::Provider provider) {
    (void)provider; // One tab serves every provider.
    return std::make_shared<CdpSession>(connection_, operation_mutex_);
}

std::optional<providers::Capabilities> CdpAutomation::provider_capabilities(providers::Provider provider) const {
    return providers::capabilities(provider);
}

ScreenshotResult CdpAutomation::capture_screenshot() {
    std::lock_guard<std::mutex> lock(*operation_mutex_);

    ScreenshotResult result;
    browser_driver::CaptureScreenshotResult captured = connection_->capture_screenshot();
    result.success = captured.success;
    result.image_base64 = std::move(captured.image_base64);
    result.mime_type = std::move(captured.mime_type);
    result.error_detail = std::move(captured.error_detail);
    return result;
}

// A browser whose tab was closed cannot serve prompts, so both must hold.
bool CdpAutomation::is_alive() const {
    return connection_->is_connected() && connection_->has_attached_page();
}

void CdpAutomation::close() {
    std::lock_guard<std::mutex> lock(*operation_mutex_);
    connection_->disconnect();
}

std::unique_ptr<AutomationHandle> make_cdp_automation(const AutomationOptions &options, std::string &error_detail) {
    auto handle = std::make_unique<CdpAutomation>(options);
    if (!handle->start(error_detail)) {
        return nullptr;
    }
    return handle;
}

} // namespace automation
