#ifndef WEBPUPPET_MCP_JSON_RPC_HPP
#define WEBPUPPET_MCP_JSON_RPC_HPP

// JSON-RPC 2.0 message codec for MCP protocol communication.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Application range used by this server.
constexpr int PERMISSION_DENIED = -32000;
constexpr int AUTOMATION_ERROR = -32001;
constexpr int IO_ERROR = -32002;
constexpr int TOOL_NOT_FOUND = -32003;

// Deepest container nesting accepted in an incoming message.
constexpr int MAX_NESTING_DEPTH = 128;

// Protocol version tag written into every outgoing message.
constexpr const char *JSONRPC_VERSION = "2.0";

enum class MessageKind {
    Request,
    Notification,
    Response
};

// A classified incoming message. The kind is decided once, in parse_message;
// nothing downstream looks at field presence again.
struct Message {
    MessageKind kind = MessageKind::Notification;
    json id;      // string or integer for requests/responses; null otherwise
    std::string method;
    json params;  // null when absent
    json result;  // responses only
    json error;   // responses only
};

// Result of parsing one line.
struct ParseResult {
    bool success = false;
    Message message;
    int error_code = 0;        // PARSE_ERROR, or INVALID_REQUEST when nested too deep
    std::string error_message;
    json error_id;             // id to echo in the error response, if recoverable
};

// Parse raw text into a classified message.
// Malformed JSON, or JSON that is not a request, notification or response
// -> PARSE_ERROR with a null id. Nesting past MAX_NESTING_DEPTH ->
// INVALID_REQUEST, echoing the id when one can be read.
ParseResult parse_message(const std::string &raw_text);

// Classify an already-parsed JSON value (same rules as parse_message).
// Takes the value by value so its members are moved, not copied.
ParseResult classify(json value);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data);

// True if the response carries an error object.
bool is_error_response(const json &response);

// Serialize a message as a single line (no trailing newline). Invalid UTF-8
// in strings is replaced rather than failing the whole response.
std::string serialize(const json &message);

// Valid request ids are strings or integers.
bool is_valid_id(const json &id);

} // namespace json_rpc

#endif // WEBPUPPET_MCP_JSON_RPC_HPP
