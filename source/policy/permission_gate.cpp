#include "policy/permission_gate.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace permission_gate {

namespace {

struct OperationInfo {
    Operation operation;
    const char *name;
    int risk;
};

const OperationInfo OPERATION_TABLE[] = {
    {Operation::Navigate, "Navigate", 2},
    {Operation::SendPrompt, "SendPrompt", 3},
    {Operation::ReadResponse, "ReadResponse", 1},
    {Operation::ReadContent, "ReadContent", 1},
    {Operation::Screenshot, "Screenshot", 2},
    {Operation::Click, "Click", 4},
    {Operation::TypeText, "TypeText", 4},
    {Operation::DeleteAccount, "DeleteAccount", 10},
    {Operation::ChangePassword, "ChangePassword", 9},
};

// Domains the AI providers live on (plus their sign-in hosts).
const std::vector<std::string> PROVIDER_DOMAINS = {
    "claude.ai",
    "anthropic.com",
    "x.com",
    "grok.com",
    "gemini.google.com",
    "accounts.google.com",
    "chat.openai.com",
    "chatgpt.com",
    "auth.openai.com",
    "perplexity.ai",
    "notebooklm.google.com",
    "kaggle.com",
};

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

} // namespace

const char *operation_name(Operation operation) {
    for (const auto &info : OPERATION_TABLE) {
        if (info.operation == operation) {
            return info.name;
        }
    }
    return "Unknown";
}

int risk_level(Operation operation) {
    for (const auto &info : OPERATION_TABLE) {
        if (info.operation == operation) {
            return info.risk;
        }
    }
    return 10;
}

bool parse_operation(const std::string &text, Operation &output) {
    // Lowercasing folds camelCase and PascalCase together; dropping
    // underscores and hyphens folds snake_case.
    std::string normalized;
    for (char character : to_lower(text)) {
        if (character != '_' && character != '-') {
            normalized += character;
        }
    }
    for (const auto &info : OPERATION_TABLE) {
        if (normalized == to_lower(info.name)) {
            output = info.operation;
            return true;
        }
    }
    return false;
}

std::string operation_list() {
    std::string list;
    for (const auto &info : OPERATION_TABLE) {
        if (!list.empty()) {
            list += ", ";
        }
        list += info.name;
    }
    return list;
}

Policy secure_policy() {
    Policy policy;
    policy.name = "secure";
    policy.allowed_operations = {
        Operation::Navigate, Operation::SendPrompt, Operation::ReadResponse, Operation::ReadContent,
        Operation::Screenshot, Operation::Click, Operation::TypeText,
    };
    policy.allowed_domains = PROVIDER_DOMAINS;
    return policy;
}

Policy permissive_policy() {
    Policy policy;
    policy.name = "permissive";
    for (const auto &info : OPERATION_TABLE) {
        policy.allowed_operations.push_back(info.operation);
    }
    return policy;
}

Policy read_only_policy() {
    Policy policy;
    policy.name = "readonly";
    policy.allowed_operations = {
        Operation::Navigate, Operation::ReadResponse, Operation::ReadContent, Operation::Screenshot,
    };
    policy.allowed_domains = PROVIDER_DOMAINS;
    return policy;
}

bool policy_by_name(const std::string &name, Policy &output) {
    std::string normalized = to_lower(name);
    if (normalized == "secure") {
        output = secure_policy();
        return true;
    }
    if (normalized == "permissive") {
        output = permissive_policy();
        return true;
    }
    if (normalized == "readonly" || normalized == "read_only" || normalized == "read-only") {
        output = read_only_policy();
        return true;
    }
    return false;
}

std::string extract_host(const std::string &url) {
    std::string remainder = url;
    auto scheme_position = remainder.find("://");
    if (scheme_position != std::string::npos) {
        remainder = remainder.substr(scheme_position + 3);
    }
    auto end_position = remainder.find_first_of("/?#");
    if (end_position != std::string::npos) {
        remainder = remainder.substr(0, end_position);
    }
    auto at_position = remainder.rfind('@');
    if (at_position != std::string::npos) {
        remainder = remainder.substr(at_position + 1);
    }
    auto colon_position = remainder.find(':');
    if (colon_position != std::string::npos) {
        remainder = remainder.substr(0, colon_position);
    }
    return to_lower(remainder);
}

PermissionGate::PermissionGate(Policy policy) : policy_(std::move(policy)) {}

bool PermissionGate::domain_allowed(const std::string &host) const {
    if (policy_.allowed_domains.empty()) {
        return true;
    }
    for (const auto &domain : policy_.allowed_domains) {
        if (host == domain) {
            return true;
        }
        if (host.size() > domain.size() &&
            host.compare(host.size() - domain.size(), domain.size(), domain) == 0 &&
            host[host.size() - domain.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

Decision PermissionGate::check(Operation operation) const {
    Decision decision;
    decision.risk_level = risk_level(operation);
    bool listed = std::find(policy_.allowed_operations.begin(), policy_.allowed_operations.end(), operation) !=
                  policy_.allowed_operations.end();
    decision.allowed = listed;
    if (listed) {
        decision.reason = std::string(operation_name(operation)) + " is permitted by the '" + policy_.name +
                          "' policy";
    } else {
        decision.reason = std::string(operation_name(operation)) + " is blocked by the '" + policy_.name +
                          "' policy";
    }
    return decision;
}

Decision PermissionGate::check_with_url(Operation operation, const std::string &url) const {
    Decision decision = check(operation);
    if (!decision.allowed) {
        return decision;
    }
    std::string host = extract_host(url);
    if (host.empty()) {
        decision.allowed = false;
        decision.reason = "could not determine the domain of URL '" + url + "'";
        return decision;
    }
    if (!domain_allowed(host)) {
        decision.allowed = false;
        decision.reason = "domain '" + host + "' is not on the allowlist of the '" + policy_.name + "' policy";
    }
    return decision;
}

bool PermissionGate::require(Operation operation, std::string &denial_reason) const {
    Decision decision = check(operation);
    if (!decision.allowed) {
        denial_reason = decision.reason;
    }
    return decision.allowed;
}

bool PermissionGate::require_with_url(Operation operation, const std::string &url,
                                      std::string &denial_reason) const {
    Decision decision = check_with_url(operation, url);
    if (!decision.allowed) {
        denial_reason = decision.reason;
    }
    return decision.allowed;
}

} // namespace permission_gate
