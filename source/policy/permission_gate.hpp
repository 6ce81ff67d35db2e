#ifndef WEBPUPPET_MCP_PERMISSION_GATE_HPP
#define WEBPUPPET_MCP_PERMISSION_GATE_HPP

// Permission policy evaluation for browser operations.
// A gate is immutable after construction and safe to share between threads.

#include <string>
#include <vector>

namespace permission_gate {

enum class Operation {
    Navigate,
    SendPrompt,
    ReadResponse,
    ReadContent,
    Screenshot,
    Click,
    TypeText,
    DeleteAccount,
    ChangePassword
};

// Display name, e.g. "SendPrompt".
const char *operation_name(Operation operation);

// Fixed risk level 1-10.
int risk_level(Operation operation);

// Map free text to an operation. Case-insensitive; accepts "SendPrompt",
// "sendprompt", "send_prompt" and "sendPrompt". Returns false if unknown.
bool parse_operation(const std::string &text, Operation &output);

// Comma-separated list of all operation display names.
std::string operation_list();

struct Decision {
    bool allowed = false;
    std::string reason;
    int risk_level = 0;
};

struct Policy {
    std::string name;
    std::vector<Operation> allowed_operations;
    // Empty means any domain is allowed for URL-scoped checks.
    std::vector<std::string> allowed_domains;
};

// Blocks account-destroying operations; URL checks limited to provider domains.
Policy secure_policy();
// Allows everything on any domain.
Policy permissive_policy();
// Navigation and reading only.
Policy read_only_policy();

// Look up a policy by name (secure, permissive, readonly). Returns false if unknown.
bool policy_by_name(const std::string &name, Policy &output);

// Host part of a URL, lowercased ("https://Chat.OpenAI.com:443/x" -> "chat.openai.com").
// Empty if no host can be found.
std::string extract_host(const std::string &url);

class PermissionGate {
public:
    explicit PermissionGate(Policy policy);

    const std::string &policy_name() const { return policy_.name; }

    Decision check(Operation operation) const;
    Decision check_with_url(Operation operation, const std::string &url) const;

    // Returns true if allowed; otherwise fills denial_reason.
    bool require(Operation operation, std::string &denial_reason) const;
    bool require_with_url(Operation operation, const std::string &url, std::string &denial_reason) const;

private:
    bool domain_allowed(const std::string &host) const;

    Policy policy_;
};

} // namespace permission_gate

#endif // WEBPUPPET_MCP_PERMISSION_GATE_HPP
