#include "automation/providers.hpp"

#include <algorithm>
#include <cctype>

namespace providers {

namespace {

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

} // namespace

const std::vector<ProviderInfo> &all_providers() {
    static const std::vector<ProviderInfo> table = {
        {Provider::Claude, "claude", "Claude (Anthropic)", "https://claude.ai",
         "Large context, artifacts, code"},
        {Provider::Grok, "grok", "Grok (X/xAI)", "https://x.com/i/grok",
         "Real-time info, integrated with X"},
        {Provider::Gemini, "gemini", "Gemini (Google)", "https://gemini.google.com",
         "Google integration, large context"},
        {Provider::ChatGpt, "chatgpt", "ChatGPT (OpenAI)", "https://chat.openai.com",
         "GPT-4o, vision, code, web search"},
        {Provider::Perplexity, "perplexity", "Perplexity AI", "https://www.perplexity.ai",
         "Search-focused, sources cited"},
        {Provider::NotebookLm, "notebooklm", "NotebookLM (Google)", "https://notebooklm.google.com",
         "Research assistant, 500k context"},
        {Provider::Kaggle, "kaggle", "Kaggle (Datasets)", "https://www.kaggle.com/datasets",
         "Dataset search/catalog; returns dataset page links"},
    };
    return table;
}

const ProviderInfo &info(Provider provider) {
    const auto &table = all_providers();
    for (const auto &entry : table) {
        if (entry.provider == provider) {
            return entry;
        }
    }
    return table.front();
}

std::string to_string(Provider provider) {
    return info(provider).id;
}

bool parse_provider(const std::string &text, Provider &output) {
    std::string normalized = to_lower(text);
    if (normalized == "openai") {
        output = Provider::ChatGpt;
        return true;
    }
    if (normalized == "notebook") {
        output = Provider::NotebookLm;
        return true;
    }
    for (const auto &entry : all_providers()) {
        if (normalized == entry.id) {
            output = entry.provider;
            return true;
        }
    }
    return false;
}

std::vector<std::string> provider_ids() {
    std::vector<std::string> ids;
    for (const auto &entry : all_providers()) {
        ids.push_back(entry.id);
    }
    return ids;
}

Capabilities capabilities(Provider provider) {
    Capabilities caps;
    switch (provider) {
    case Provider::Claude:
        caps.vision = true;
        caps.file_upload = true;
        caps.code_execution = true;
        caps.max_context = 200000;
        caps.models = {"claude-sonnet", "claude-opus", "claude-haiku"};
        break;
    case Provider::Grok:
        caps.vision = true;
        caps.web_search = true;
        caps.max_context = 128000;
        caps.models = {"grok-2", "grok-3"};
        break;
    case Provider::Gemini:
        caps.vision = true;
        caps.file_upload = true;
        caps.code_execution = true;
        caps.web_search = true;
        caps.max_context = 1000000;
        caps.models = {"gemini-1.5-pro", "gemini-2.0-flash"};
        break;
    case Provider::ChatGpt:
        caps.vision = true;
        caps.file_upload = true;
        caps.code_execution = true;
        caps.web_search = true;
        caps.max_context = 128000;
        caps.models = {"gpt-4o", "gpt-4o-mini", "o1"};
        break;
    case Provider::Perplexity:
        caps.file_upload = true;
        caps.web_search = true;
        caps.max_context = 32000;
        caps.models = {"sonar", "sonar-pro"};
        break;
    case Provider::NotebookLm:
        caps.file_upload = true;
        caps.max_context = 500000;
        caps.models = {"gemini"};
        break;
    case Provider::Kaggle:
        caps.conversation = false;
        caps.web_search = true;
        break;
    }
    return caps;
}

PageSelectors page_selectors(Provider provider) {
    PageSelectors selectors;
    switch (provider) {
    case Provider::Claude:
        selectors.prompt_input = "div[contenteditable='true'].ProseMirror";
        selectors.response_block = "div.font-claude-message";
        selectors.login_marker = "input[type='email']";
        break;
    case Provider::Grok:
        selectors.prompt_input = "textarea";
        selectors.response_block = "div[data-testid='markdown-content'], div.message-bubble";
        selectors.login_marker = "a[href='/login']";
        break;
    case Provider::Gemini:
        selectors.prompt_input = "rich-textarea div[contenteditable='true']";
        selectors.response_block = "message-content";
        selectors.login_marker = "a[href*='accounts.google.com/ServiceLogin']";
        break;
    case Provider::ChatGpt:
        selectors.prompt_input = "#prompt-textarea";
        selectors.response_block = "div[data-message-author-role='assistant']";
        selectors.login_marker = "button[data-testid='login-button']";
        break;
    case Provider::Perplexity:
        selectors.prompt_input = "textarea";
        selectors.response_block = "div.prose";
        selectors.login_marker = "";
        break;
    case Provider::NotebookLm:
        selectors.prompt_input = "textarea.query-box-input";
        selectors.response_block = "div.message-text-content";
        selectors.login_marker = "input[type='email']";
        break;
    case Provider::Kaggle:
        selectors.prompt_input = "";
        selectors.response_block = "a[href^='/datasets/']";
        selectors.login_marker = "";
        break;
    }
    return selectors;
}

bool is_search_provider(Provider provider) {
    return provider == Provider::Kaggle;
}

} // namespace providers
