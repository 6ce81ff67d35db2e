#include "protocol/mcp_types.hpp"

namespace mcp_types {

ContentItem text_content(const std::string &text) {
    ContentItem item;
    item.type = ContentType::Text;
    item.text = text;
    return item;
}

ContentItem image_content(const std::string &base64_data, const std::string &mime_type) {
    ContentItem item;
    item.type = ContentType::Image;
    item.data = base64_data;
    item.mime_type = mime_type;
    return item;
}

ContentItem resource_content(const std::string &uri, const std::string &mime_type, const std::string &text) {
    ContentItem item;
    item.type = ContentType::Resource;
    item.uri = uri;
    item.mime_type = mime_type;
    item.text = text;
    return item;
}

ToolCallResult text_result(const std::string &text, bool is_error) {
    ToolCallResult result;
    result.content.push_back(text_content(text));
    result.is_error = is_error;
    return result;
}

json to_json(const ToolDefinition &definition) {
    json tool_entry;
    tool_entry["name"] = definition.name;
    tool_entry["description"] = definition.description;
    tool_entry["inputSchema"] = definition.input_schema;
    return tool_entry;
}

json to_json(const ContentItem &item) {
    json entry;
    switch (item.type) {
    case ContentType::Text:
        entry["type"] = "text";
        entry["text"] = item.text;
        break;
    case ContentType::Image:
        entry["type"] = "image";
        entry["data"] = item.data;
        entry["mimeType"] = item.mime_type;
        break;
    case ContentType::Resource:
        entry["type"] = "resource";
        entry["resource"]["uri"] = item.uri;
        if (!item.mime_type.empty()) {
            entry["resource"]["mimeType"] = item.mime_type;
        }
        if (!item.text.empty()) {
            entry["resource"]["text"] = item.text;
        }
        break;
    }
    return entry;
}

json to_json(const ToolCallResult &result) {
    json content = json::array();
    for (const auto &item : result.content) {
        content.push_back(to_json(item));
    }
    json payload;
    payload["content"] = content;
    payload["isError"] = result.is_error;
    return payload;
}

std::string first_text(const ToolCallResult &result) {
    for (const auto &item : result.content) {
        if (item.type == ContentType::Text) {
            return item.text;
        }
    }
    return "";
}

bool parse_initialize_params(const json &params, InitializeParams &output, std::string &error_message) {
    if (params.is_null()) {
        error_message = "initialize params required";
        return false;
    }
    if (!params.is_object()) {
        error_message = "invalid initialize params: expected an object";
        return false;
    }
    if (!params.contains("protocolVersion") || !params["protocolVersion"].is_string()) {
        error_message = "invalid initialize params: missing field `protocolVersion`";
        return false;
    }
    if (!params.contains("capabilities") || !params["capabilities"].is_object()) {
        error_message = "invalid initialize params: missing field `capabilities`";
        return false;
    }
    if (!params.contains("clientInfo") || !params["clientInfo"].is_object()) {
        error_message = "invalid initialize params: missing field `clientInfo`";
        return false;
    }
    const json &client_info = params["clientInfo"];
    if (!client_info.contains("name") || !client_info["name"].is_string() ||
        !client_info.contains("version") || !client_info["version"].is_string()) {
        error_message = "invalid initialize params: clientInfo requires string `name` and `version`";
        return false;
    }

    output.protocol_version = params["protocolVersion"].get<std::string>();
    output.capabilities = params["capabilities"];
    output.client_info.name = client_info["name"].get<std::string>();
    output.client_info.version = client_info["version"].get<std::string>();
    return true;
}

json build_initialize_result() {
    json capabilities;
    capabilities["tools"]["listChanged"] = false;

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;
    return result;
}

bool parse_tool_call_params(const json &params, ToolCallParams &output, std::string &error_message) {
    if (params.is_null()) {
        error_message = "tool call params required";
        return false;
    }
    if (!params.is_object()) {
        error_message = "invalid tool call params: expected an object";
        return false;
    }
    if (!params.contains("name") || !params["name"].is_string()) {
        error_message = "invalid tool call params: missing or invalid 'name'";
        return false;
    }
    output.name = params["name"].get<std::string>();
    output.arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            error_message = "invalid tool call params: 'arguments' must be an object";
            return false;
        }
        output.arguments = params["arguments"];
    }
    return true;
}

} // namespace mcp_types
