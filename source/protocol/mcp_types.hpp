#ifndef WEBPUPPET_MCP_MCP_TYPES_HPP
#define WEBPUPPET_MCP_MCP_TYPES_HPP

// MCP-specific protocol types: tool definitions, tool call results,
// and the initialize handshake.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#ifndef WEBPUPPET_MCP_VERSION
#define WEBPUPPET_MCP_VERSION "0.0.0-dev"
#endif

namespace mcp_types {

using json = nlohmann::json;

// Protocol version we support.
constexpr const char *PROTOCOL_VERSION = "2024-11-05";

// Server info.
constexpr const char *SERVER_NAME = "webpuppet-mcp";
constexpr const char *SERVER_VERSION = WEBPUPPET_MCP_VERSION;

// Description of a tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
};

enum class ContentType {
    Text,
    Image,
    Resource
};

// One item of a tool call result.
struct ContentItem {
    ContentType type = ContentType::Text;
    std::string text;       // Text; optional for Resource
    std::string data;       // Image: base64 payload
    std::string mime_type;  // Image (required), Resource (optional)
    std::string uri;        // Resource
};

ContentItem text_content(const std::string &text);
ContentItem image_content(const std::string &base64_data, const std::string &mime_type);
ContentItem resource_content(const std::string &uri, const std::string &mime_type, const std::string &text);

// Result of a tools/call. is_error marks a tool-level failure inside a
// successful JSON-RPC response.
struct ToolCallResult {
    std::vector<ContentItem> content;
    bool is_error = false;
};

ToolCallResult text_result(const std::string &text, bool is_error = false);

json to_json(const ToolDefinition &definition);
json to_json(const ContentItem &item);
json to_json(const ToolCallResult &result);

// First text item of a result, or empty.
std::string first_text(const ToolCallResult &result);

// Parameters of the initialize request.
struct ClientInfo {
    std::string name;
    std::string version;
};

struct InitializeParams {
    std::string protocol_version;
    json capabilities; // always an object
    ClientInfo client_info;
};

// Validate and extract initialize params. On failure returns false and
// describes the problem in error_message.
bool parse_initialize_params(const json &params, InitializeParams &output, std::string &error_message);

// Result payload of initialize: protocolVersion, capabilities (tools only), serverInfo.
json build_initialize_result();

// Parameters of tools/call.
struct ToolCallParams {
    std::string name;
    json arguments; // always an object
};

bool parse_tool_call_params(const json &params, ToolCallParams &output, std::string &error_message);

} // namespace mcp_types

#endif // WEBPUPPET_MCP_MCP_TYPES_HPP
