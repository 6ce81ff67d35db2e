// Tests for the JSON-RPC codec, the error taxonomy and the MCP payload types.

#include "mcp/mcp_error.hpp"
#include "protocol/json_rpc.hpp"
#include "protocol/mcp_types.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace test_json_rpc {

static bool check(bool condition, const std::string &test_description) {
    if (condition) {
        std::cout << "  OK: " << test_description << std::endl;
    } else {
        std::cout << "  FAIL: " << test_description << std::endl;
    }
    return condition;
}

// Test: method + id is a request; method without id is a notification.
static bool test_classify_request_and_notification() {
    auto request = json_rpc::parse_message(R"({"jsonrpc":"2.0","id":7,"method":"ping"})");
    auto notification = json_rpc::parse_message(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    bool success = request.success && request.message.kind == json_rpc::MessageKind::Request &&
                   request.message.id == 7 && request.message.method == "ping" && notification.success &&
                   notification.message.kind == json_rpc::MessageKind::Notification;
    return check(success, "Request and notification classified by presence of id");
}

// Test: a null id is treated as absent.
static bool test_null_id_is_notification() {
    auto parsed = json_rpc::parse_message(R"({"jsonrpc":"2.0","id":null,"method":"exit"})");
    return check(parsed.success && parsed.message.kind == json_rpc::MessageKind::Notification,
                 "Null id classified as notification");
}

// Test: result/error without method is a response.
static bool test_classify_response() {
    auto result = json_rpc::parse_message(R"({"jsonrpc":"2.0","id":"a","result":{}})");
    auto error = json_rpc::parse_message(R"({"jsonrpc":"2.0","id":3,"error":{"code":-1,"message":"x"}})");
    bool success = result.success && result.message.kind == json_rpc::MessageKind::Response && error.success &&
                   error.message.kind == json_rpc::MessageKind::Response && error.message.error["code"] == -1;
    return check(success, "Result and error objects classified as responses");
}

// Test: the jsonrpc field is tolerated when missing.
static bool test_version_field_optional() {
    auto parsed = json_rpc::parse_message(R"({"id":1,"method":"ping"})");
    return check(parsed.success && parsed.message.kind == json_rpc::MessageKind::Request,
                 "Message without jsonrpc field accepted");
}

// Test: malformed JSON is a parse error with no id.
static bool test_malformed_json() {
    auto parsed = json_rpc::parse_message("{\"id\":1,\"method\":");
    return check(!parsed.success && parsed.error_code == json_rpc::PARSE_ERROR && parsed.error_id.is_null(),
                 "Malformed JSON yields PARSE_ERROR with null id");
}

// Test: well-formed JSON that is not a message is a parse error with no id.
static bool test_invalid_shapes() {
    auto array = json_rpc::parse_message("[1,2,3]");
    auto no_method = json_rpc::parse_message(R"({"id":4,"params":{}})");
    auto bad_id = json_rpc::parse_message(R"({"id":{"x":1},"method":"ping"})");
    auto bad_method = json_rpc::parse_message(R"({"id":"q","method":5})");
    bool success = !array.success && array.error_code == json_rpc::PARSE_ERROR && array.error_id.is_null() &&
                   !no_method.success && no_method.error_code == json_rpc::PARSE_ERROR &&
                   no_method.error_id.is_null() && !bad_id.success && bad_id.error_id.is_null() &&
                   !bad_method.success && bad_method.error_code == json_rpc::PARSE_ERROR &&
                   bad_method.error_id.is_null();
    return check(success, "Non-message shapes yield PARSE_ERROR with null id");
}

// Test: nesting past the limit is refused without building the nested value.
static bool test_nesting_limit() {
    const int depth = 100000;
    auto deep = json_rpc::parse_message(R"({"jsonrpc":"2.0","id":7,"method":"ping","params":)" +
                                        std::string(depth, '[') + std::string(depth, ']') + "}");
    bool refused = !deep.success && deep.error_code == json_rpc::INVALID_REQUEST && deep.error_id == 7;

    const int allowed = json_rpc::MAX_NESTING_DEPTH - 1;
    auto within = json_rpc::parse_message(R"({"id":8,"method":"tools/call","params":{"name":"x","arguments":{"a":)" +
                                          std::string(allowed - 3, '[') + std::string(allowed - 3, ']') + "}}}");
    bool accepted = within.success && within.message.kind == json_rpc::MessageKind::Request &&
                    within.message.params["arguments"]["a"].is_array();

    mcp_types::ToolCallParams call_params;
    std::string error_message;
    bool arguments_kept = accepted && mcp_types::parse_tool_call_params(within.message.params, call_params,
                                                                        error_message);
    return check(refused && accepted && arguments_kept, "Deeply nested params refused; nesting within the limit kept");
}

// Test: responses always carry jsonrpc 2.0 and exactly one of result/error.
static bool test_build_responses() {
    json ok = json_rpc::build_response("abc", json::object());
    json error = json_rpc::build_error_response(5, json_rpc::METHOD_NOT_FOUND, "Method not found: x");
    json with_data = json_rpc::build_error_response(5, -32000, "denied", json{{"op", "DeleteAccount"}});
    json null_data = json_rpc::build_error_response(5, -32000, "denied", json(nullptr));
    bool success = ok["jsonrpc"] == "2.0" && ok["id"] == "abc" && ok.contains("result") && !ok.contains("error") &&
                   error["jsonrpc"] == "2.0" && error["error"]["code"] == -32601 && !error.contains("result") &&
                   json_rpc::is_error_response(error) && !json_rpc::is_error_response(ok) &&
                   with_data["error"]["data"]["op"] == "DeleteAccount" && !null_data["error"].contains("data");
    return check(success, "Built responses have version tag and exclusive result/error");
}

// Test: serialize emits one line and re-parses to the same id and outcome.
static bool test_serialize_single_line() {
    json response = json_rpc::build_response(9, json{{"text", "line one\nline two"}});
    std::string line = json_rpc::serialize(response);
    auto reparsed = json_rpc::parse_message(line);
    bool success = line.find('\n') == std::string::npos && reparsed.success &&
                   reparsed.message.kind == json_rpc::MessageKind::Response && reparsed.message.id == 9 &&
                   reparsed.message.result["text"] == "line one\nline two";
    return check(success, "Serialized response is a single line and parses back");
}

// Test: invalid UTF-8 in a payload does not abort serialization.
static bool test_serialize_invalid_utf8() {
    json response = json_rpc::build_response(1, json{{"text", std::string("bad \xC3\x28 byte")}});
    std::string line = json_rpc::serialize(response);
    return check(!line.empty() && line.find("\"id\":1") != std::string::npos,
                 "Invalid UTF-8 replaced during serialization");
}

// Test: error responses survive serialize then parse, with and without data.
static bool test_error_round_trip() {
    json plain = json_rpc::build_error_response("r1", json_rpc::METHOD_NOT_FOUND, "Method not found: x");
    json detailed =
        json_rpc::build_error_response(11, json_rpc::PERMISSION_DENIED, "denied", json{{"operation", "Click"}});
    auto plain_parsed = json_rpc::parse_message(json_rpc::serialize(plain));
    auto detailed_parsed = json_rpc::parse_message(json_rpc::serialize(detailed));
    bool success = plain_parsed.success && plain_parsed.message.kind == json_rpc::MessageKind::Response &&
                   plain_parsed.message.id == "r1" && plain_parsed.message.result.is_null() &&
                   plain_parsed.message.error == plain["error"] && !plain_parsed.message.error.contains("data") &&
                   detailed_parsed.success && detailed_parsed.message.id == 11 &&
                   detailed_parsed.message.result.is_null() && detailed_parsed.message.error == detailed["error"] &&
                   detailed_parsed.message.error["data"]["operation"] == "Click";
    return check(success, "Error responses parse back with the same id, code, message and data");
}

// Test: every error kind maps to its fixed code.
static bool test_error_code_mapping() {
    using mcp_error::ErrorKind;
    bool success =
        mcp_error::code_of(mcp_error::make_error(ErrorKind::ToolNotFound, "x")) == json_rpc::TOOL_NOT_FOUND &&
        mcp_error::code_of(mcp_error::make_error(ErrorKind::InvalidParams, "x")) == -32602 &&
        mcp_error::code_of(mcp_error::make_error(ErrorKind::PermissionDenied, "x")) == -32000 &&
        mcp_error::code_of(mcp_error::make_error(ErrorKind::Automation, "x")) == -32001 &&
        mcp_error::code_of(mcp_error::make_error(ErrorKind::Io, "x")) == -32002 &&
        mcp_error::code_of(mcp_error::make_error(ErrorKind::Serialization, "x")) == -32603 &&
        mcp_error::code_of(mcp_error::make_error(ErrorKind::Internal, "x")) == -32603 &&
        mcp_error::code_of(mcp_error::make_json_rpc_error(-32099, "custom")) == -32099 &&
        json_rpc::TOOL_NOT_FOUND != json_rpc::METHOD_NOT_FOUND;
    return check(success, "Error kinds map to their codes; tool-not-found differs from method-not-found");
}

// Test: error text and JSON-RPC error object.
static bool test_error_describe() {
    auto denied = mcp_error::make_error(mcp_error::ErrorKind::PermissionDenied, "DeleteAccount is blocked");
    auto custom = mcp_error::make_json_rpc_error(-32050, "custom failure", json{{"retry", false}});
    json denied_object = mcp_error::to_json_rpc_error(denied);
    json custom_object = mcp_error::to_json_rpc_error(custom);
    bool success = mcp_error::describe(denied) == "permission denied: DeleteAccount is blocked" &&
                   mcp_error::describe(mcp_error::make_error(mcp_error::ErrorKind::ToolNotFound, "foo")) ==
                       "tool not found: foo" &&
                   denied_object["code"] == -32000 && !denied_object.contains("data") &&
                   custom_object["code"] == -32050 && custom_object["message"] == "custom failure" &&
                   custom_object["data"]["retry"] == false;
    return check(success, "Error descriptions and error objects");
}

// Test: initialize params validation.
static bool test_initialize_params() {
    mcp_types::InitializeParams output;
    std::string error_message;
    json valid = {{"protocolVersion", "2024-11-05"},
                  {"capabilities", json::object()},
                  {"clientInfo", {{"name", "t"}, {"version", "1"}}}};
    bool accepted = mcp_types::parse_initialize_params(valid, output, error_message) &&
                    output.client_info.name == "t" && output.protocol_version == "2024-11-05";

    json missing_client = {{"protocolVersion", "2024-11-05"}, {"capabilities", json::object()}};
    json bad_capabilities = {{"protocolVersion", "2024-11-05"},
                             {"capabilities", "all"},
                             {"clientInfo", {{"name", "t"}, {"version", "1"}}}};
    bool rejected = !mcp_types::parse_initialize_params(nullptr, output, error_message) &&
                    !mcp_types::parse_initialize_params(missing_client, output, error_message) &&
                    error_message.find("clientInfo") != std::string::npos &&
                    !mcp_types::parse_initialize_params(bad_capabilities, output, error_message);
    return check(accepted && rejected, "Initialize params accepted and rejected as expected");
}

// Test: initialize result advertises tools only.
static bool test_initialize_result() {
    json result = mcp_types::build_initialize_result();
    bool success = result["protocolVersion"] == "2024-11-05" && result["capabilities"].contains("tools") &&
                   !result["capabilities"].contains("resources") && !result["capabilities"].contains("prompts") &&
                   result["serverInfo"]["name"] == "webpuppet-mcp" && result["serverInfo"]["version"].is_string();
    return check(success, "Initialize result advertises only the tools capability");
}

// Test: tools/call params, arguments defaulting to an empty object.
static bool test_tool_call_params() {
    mcp_types::ToolCallParams output;
    std::string error_message;
    bool defaulted = mcp_types::parse_tool_call_params(json{{"name", "webpuppet_pause"}}, output, error_message) &&
                     output.arguments.is_object() && output.arguments.empty();
    bool no_name = !mcp_types::parse_tool_call_params(json{{"arguments", json::object()}}, output, error_message);
    bool bad_arguments =
        !mcp_types::parse_tool_call_params(json{{"name", "x"}, {"arguments", "[]"}}, output, error_message);
    return check(defaulted && no_name && bad_arguments, "tools/call params validated");
}

// Test: content items serialize with MCP field names.
static bool test_content_serialization() {
    mcp_types::ToolCallResult result;
    result.content.push_back(mcp_types::text_content("hello"));
    result.content.push_back(mcp_types::image_content("AAAA", "image/png"));
    result.content.push_back(mcp_types::resource_content("https://claude.ai", "text/html", ""));
    result.is_error = true;
    json payload = mcp_types::to_json(result);
    bool success = payload["isError"] == true && payload["content"].size() == 3 &&
                   payload["content"][0]["type"] == "text" && payload["content"][0]["text"] == "hello" &&
                   payload["content"][1]["mimeType"] == "image/png" && payload["content"][1]["data"] == "AAAA" &&
                   payload["content"][2]["type"] == "resource" &&
                   payload["content"][2]["resource"]["uri"] == "https://claude.ai" &&
                   !payload["content"][2]["resource"].contains("text") && mcp_types::first_text(result) == "hello";
    return check(success, "Content items serialize with MCP field names");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_classify_request_and_notification();
    all_passed &= test_null_id_is_notification();
    all_passed &= test_classify_response();
    all_passed &= test_version_field_optional();
    all_passed &= test_malformed_json();
    all_passed &= test_invalid_shapes();
    all_passed &= test_nesting_limit();
    all_passed &= test_build_responses();
    all_passed &= test_serialize_single_line();
    all_passed &= test_serialize_invalid_utf8();
    all_passed &= test_error_round_trip();
    all_passed &= test_error_code_mapping();
    all_passed &= test_error_describe();
    all_passed &= test_initialize_params();
    all_passed &= test_initialize_result();
    all_passed &= test_tool_call_params();
    all_passed &= test_content_serialization();
    return all_passed;
}

} // namespace test_json_rpc
