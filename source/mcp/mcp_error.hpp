#ifndef WEBPUPPET_MCP_MCP_ERROR_HPP
#define WEBPUPPET_MCP_MCP_ERROR_HPP

// Protocol-level error taxonomy. Every error kind maps to exactly one
// JSON-RPC error code; the same mapping is used for dispatch failures and
// for failures returned by tools.

#include <nlohmann/json.hpp>
#include <string>

namespace mcp_error {

using json = nlohmann::json;

enum class ErrorKind {
    JsonRpc,           // carries an explicit code
    ToolNotFound,
    InvalidParams,
    PermissionDenied,
    Automation,        // browser engine / collaborator failure
    Serialization,
    Io,
    Internal
};

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    int explicit_code = 0; // only for ErrorKind::JsonRpc
    json data;             // optional structured data, null when absent
};

Error make_error(ErrorKind kind, const std::string &message);
Error make_json_rpc_error(int code, const std::string &message, const json &data = nullptr);

// JSON-RPC code for an error.
int code_of(const Error &error);

// Short label for the kind, e.g. "tool not found".
const char *kind_label(ErrorKind kind);

// Human-readable text sent to the peer, e.g. "permission denied: SendPrompt is blocked".
std::string describe(const Error &error);

// Error object for a JSON-RPC error response ({code, message[, data]}).
json to_json_rpc_error(const Error &error);

} // namespace mcp_error

#endif // WEBPUPPET_MCP_MCP_ERROR_HPP
