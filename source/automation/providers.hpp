#ifndef WEBPUPPET_MCP_PROVIDERS_HPP
#define WEBPUPPET_MCP_PROVIDERS_HPP

// Static description of the AI providers (and web tools) reachable through
// browser automation.

#include <string>
#include <vector>

namespace providers {

enum class Provider {
    Claude,
    Grok,
    Gemini,
    ChatGpt,
    Perplexity,
    NotebookLm,
    Kaggle
};

// Declared capabilities (not runtime UI detection).
struct Capabilities {
    bool conversation = true;
    bool vision = false;
    bool file_upload = false;
    bool code_execution = false;
    bool web_search = false;
    int max_context = 0; // tokens; 0 when not applicable
    std::vector<std::string> models;
};

// CSS selectors used to drive a provider's chat page.
struct PageSelectors {
    std::string prompt_input;   // present only when signed in
    std::string response_block; // last match holds the latest answer
    std::string login_marker;   // present on a sign-in wall; may be empty
};

struct ProviderInfo {
    Provider provider;
    const char *id;            // e.g. "chatgpt"
    const char *display_name;  // e.g. "ChatGPT (OpenAI)"
    const char *url;
    const char *features;
};

// Every provider, in a fixed order.
const std::vector<ProviderInfo> &all_providers();

const ProviderInfo &info(Provider provider);

// Lowercase id ("claude", "notebooklm", ...).
std::string to_string(Provider provider);

// Case-insensitive parse with aliases ("openai" -> ChatGpt, "notebook" -> NotebookLm).
// Returns false for anything unmapped.
bool parse_provider(const std::string &text, Provider &output);

// Ids accepted in tool schemas.
std::vector<std::string> provider_ids();

Capabilities capabilities(Provider provider);

PageSelectors page_selectors(Provider provider);

// Kaggle is a dataset catalog rather than a chat; prompts become searches.
bool is_search_provider(Provider provider);

} // namespace providers

#endif // WEBPUPPET_MCP_PROVIDERS_HPP
