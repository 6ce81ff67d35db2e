#include "protocol/json_rpc.hpp"

namespace json_rpc {

bool is_valid_id(const json &id) {
    return id.is_string() || id.is_number_integer();
}

static ParseResult parse_failure(const std::string &message) {
    ParseResult result;
    result.success = false;
    result.error_code = PARSE_ERROR;
    result.error_message = message;
    result.error_id = nullptr;
    return result;
}

ParseResult classify(json value) {
    if (!value.is_object()) {
        return parse_failure("invalid MCP message: expected a JSON object");
    }

    json id = nullptr;
    if (value.contains("id")) {
        id = std::move(value["id"]);
    }
    // A null id counts as absent.
    if (!id.is_null() && !is_valid_id(id)) {
        return parse_failure("invalid MCP message: id must be a string or integer");
    }

    ParseResult result;

    if (value.contains("method")) {
        if (!value["method"].is_string()) {
            return parse_failure("invalid MCP message: method must be a string");
        }
        result.message.method = value["method"].get<std::string>();
        if (value.contains("params")) {
            result.message.params = std::move(value["params"]);
        }
        result.message.id = std::move(id);
        result.message.kind = result.message.id.is_null() ? MessageKind::Notification : MessageKind::Request;
        result.success = true;
        return result;
    }

    if (value.contains("result") || value.contains("error")) {
        result.message.kind = MessageKind::Response;
        result.message.id = std::move(id);
        if (value.contains("result")) {
            result.message.result = std::move(value["result"]);
        }
        if (value.contains("error")) {
            result.message.error = std::move(value["error"]);
        }
        result.success = true;
        return result;
    }

    return parse_failure("invalid MCP message: no method, result or error");
}

ParseResult parse_message(const std::string &raw_text) {
    // Containers nested past the limit are dropped while parsing, so the
    // document never holds them; the message is then refused as a whole.
    bool too_deep = false;
    json::parser_callback_t limit_depth = [&too_deep](int depth, json::parse_event_t event, json &) {
        if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start) &&
            depth > MAX_NESTING_DEPTH) {
            too_deep = true;
            return false;
        }
        return true;
    };

    json value;
    try {
        value = json::parse(raw_text, limit_depth);
    } catch (const json::parse_error &error) {
        return parse_failure(std::string("parse error: ") + error.what());
    }

    if (too_deep) {
        ParseResult result;
        result.success = false;
        result.error_code = INVALID_REQUEST;
        result.error_message = "invalid MCP message: nesting deeper than " + std::to_string(MAX_NESTING_DEPTH) +
                               " levels";
        result.error_id = nullptr;
        if (value.is_object() && value.contains("id") && is_valid_id(value["id"])) {
            result.error_id = value["id"];
        }
        return result;
    }
    return classify(std::move(value));
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    if (!error_data.is_null()) {
        response["error"]["data"] = error_data;
    }
    return response;
}

bool is_error_response(const json &response) {
    return response.is_object() && response.contains("error");
}

std::string serialize(const json &message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace json_rpc
