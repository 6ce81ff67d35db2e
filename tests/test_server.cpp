// Tests for the MCP server: lifecycle gating, method dispatch and the stdio loop.
// Tools run against the in-memory automation engine.

#include "fake_automation.hpp"
#include "mcp/mcp_server.hpp"
#include "protocol/json_rpc.hpp"
#include "tool_handlers/tool_handlers.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace test_server {

static const char *INITIALIZE_LINE =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"t","version":"1"}}})";

static bool check(bool condition, const std::string &test_description) {
    if (condition) {
        std::cout << "  OK: " << test_description << std::endl;
    } else {
        std::cout << "  FAIL: " << test_description << std::endl;
    }
    return condition;
}

struct Fixture {
    std::shared_ptr<fake_automation::Script> script = std::make_shared<fake_automation::Script>();
    std::shared_ptr<mcp_tools::ToolRegistry> registry;
    std::unique_ptr<mcp_server::Server> server;

    explicit Fixture(const permission_gate::Policy &policy = permission_gate::secure_policy()) {
        registry = std::make_shared<mcp_tools::ToolRegistry>(fake_automation::make_context(policy, script));
        tool_handlers::register_all_tools(*registry);
        server = std::make_unique<mcp_server::Server>(registry);
    }

    json request(const std::string &line) {
        std::optional<json> response = server->handle_message(line);
        return response ? *response : json(nullptr);
    }

    void initialize() { request(INITIALIZE_LINE); }

    json call_tool(int id, const std::string &name, const json &arguments) {
        json message = {{"jsonrpc", "2.0"},
                        {"id", id},
                        {"method", "tools/call"},
                        {"params", {{"name", name}, {"arguments", arguments}}}};
        return request(message.dump());
    }
};

static int error_code(const json &response) {
    if (!response.is_object() || !response.contains("error")) {
        return 0;
    }
    return response["error"]["code"].get<int>();
}

static std::string result_text(const json &response) {
    if (!response.contains("result") || !response["result"].contains("content") ||
        response["result"]["content"].empty()) {
        return "";
    }
    return response["result"]["content"][0].value("text", "");
}

// Test: initialize moves to Ready and answers with server info.
static bool test_initialize() {
    Fixture fixture;
    json response = fixture.request(INITIALIZE_LINE);
    bool success = response["id"] == 1 && response["result"]["protocolVersion"] == "2024-11-05" &&
                   response["result"]["serverInfo"]["name"] == "webpuppet-mcp" &&
                   fixture.server->state() == mcp_server::ServerState::Ready;
    return check(success, "initialize returns server info and moves to Ready");
}

// Test: initialize with a missing body is invalid params and leaves the state alone.
static bool test_initialize_invalid_params() {
    Fixture fixture;
    json no_params = fixture.request(R"({"jsonrpc":"2.0","id":2,"method":"initialize"})");
    json partial = fixture.request(R"({"jsonrpc":"2.0","id":3,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})");
    bool success = error_code(no_params) == json_rpc::INVALID_PARAMS && error_code(partial) == -32602 &&
                   fixture.server->state() == mcp_server::ServerState::Uninitialized;
    return check(success, "initialize without a valid body is INVALID_PARAMS");
}

// Test: a second initialize is accepted.
static bool test_duplicate_initialize() {
    Fixture fixture;
    fixture.initialize();
    json again = fixture.request(INITIALIZE_LINE);
    bool success = again.contains("result") && fixture.server->state() == mcp_server::ServerState::Ready;
    return check(success, "Repeated initialize is accepted");
}

// Test: tools/list and tools/call before initialize are internal errors.
static bool test_state_gating() {
    Fixture fixture;
    json list = fixture.request(R"({"jsonrpc":"2.0","id":"l","method":"tools/list"})");
    json call = fixture.call_tool(4, "webpuppet_list_providers", json::object());
    bool success = error_code(list) == json_rpc::INTERNAL_ERROR && list["id"] == "l" &&
                   error_code(call) == json_rpc::INTERNAL_ERROR && call["id"] == 4 && !list.contains("result");
    return check(success, "tools/list and tools/call before initialize fail with INTERNAL_ERROR");
}

// Test: ping answers {} in every state.
static bool test_ping_any_state() {
    Fixture fixture;
    const std::string ping = R"({"jsonrpc":"2.0","id":11,"method":"ping"})";
    json before = fixture.request(ping);
    fixture.initialize();
    json ready = fixture.request(ping);
    json ready_again = fixture.request(ping);
    fixture.request(R"({"jsonrpc":"2.0","id":12,"method":"shutdown"})");
    json after = fixture.request(ping);
    bool success = true;
    for (const auto &response : {before, ready, ready_again, after}) {
        success = success && response["id"] == 11 && response["result"] == json::object();
    }
    return check(success, "ping returns an empty result before, during and after Ready");
}

// Test: unknown method and unknown tool have different codes.
static bool test_not_found_codes() {
    Fixture fixture;
    fixture.initialize();
    json method = fixture.request(R"({"jsonrpc":"2.0","id":5,"method":"resources/list"})");
    json tool = fixture.call_tool(6, "no_such_tool", json::object());
    bool success = error_code(method) == json_rpc::METHOD_NOT_FOUND && error_code(tool) == json_rpc::TOOL_NOT_FOUND &&
                   tool["error"]["message"].get<std::string>().find("no_such_tool") != std::string::npos;
    return check(success, "Unknown method is METHOD_NOT_FOUND; unknown tool is TOOL_NOT_FOUND");
}

// Test: requests get exactly one response with the same id; notifications get none.
static bool test_ids_and_notifications() {
    Fixture fixture;
    fixture.initialize();
    json string_id = fixture.request(R"({"jsonrpc":"2.0","id":"req-42","method":"tools/list"})");
    json large_id = fixture.request(R"({"jsonrpc":"2.0","id":9007199254740993,"method":"ping"})");
    bool notifications_silent =
        !fixture.server->handle_message(R"({"jsonrpc":"2.0","method":"notifications/initialized"})") &&
        !fixture.server->handle_message(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":3}})") &&
        !fixture.server->handle_message(R"({"jsonrpc":"2.0","method":"notifications/unknown"})") &&
        !fixture.server->handle_message(R"({"jsonrpc":"2.0","id":99,"result":{}})");
    bool success = string_id["id"] == "req-42" && large_id["id"] == 9007199254740993LL && notifications_silent &&
                   fixture.server->state() == mcp_server::ServerState::Ready;
    return check(success, "Response ids mirror requests; notifications and peer responses get none");
}

// Test: parse failures answer with a null id.
static bool test_parse_error_response() {
    Fixture fixture;
    json response = fixture.request("{not json");
    bool success = error_code(response) == json_rpc::PARSE_ERROR && response["id"].is_null() &&
                   response["jsonrpc"] == "2.0";
    return check(success, "Malformed line yields PARSE_ERROR with null id");
}

// Test: a deeply nested message is refused and the server keeps answering.
static bool test_deep_nesting_refused() {
    Fixture fixture;
    const int depth = 100000;
    json refused = fixture.request(R"({"jsonrpc":"2.0","id":7,"method":"ping","params":)" + std::string(depth, '[') +
                                   std::string(depth, ']') + "}");
    json ping = fixture.request(R"({"jsonrpc":"2.0","id":8,"method":"ping"})");
    json not_a_message = fixture.request(R"({"id":9,"params":{}})");
    bool success = error_code(refused) == json_rpc::INVALID_REQUEST && refused["id"] == 7 && ping["id"] == 8 &&
                   ping["result"] == json::object() && error_code(not_a_message) == json_rpc::PARSE_ERROR &&
                   not_a_message["id"].is_null();
    return check(success, "Deep nesting refused with INVALID_REQUEST; non-messages get PARSE_ERROR");
}

// Test: tools/list includes the core tools, sorted by name.
static bool test_tools_list() {
    Fixture fixture;
    fixture.initialize();
    json response = fixture.request(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    std::vector<std::string> names;
    for (const auto &tool : response["result"]["tools"]) {
        names.push_back(tool["name"].get<std::string>());
        if (!tool["inputSchema"].is_object() || !tool["description"].is_string()) {
            return check(false, "Every listed tool has a description and input schema");
        }
    }
    auto has = [&names](const std::string &name) {
        return std::find(names.begin(), names.end(), name) != names.end();
    };
    bool success = names.size() == 12 && has("webpuppet_prompt") && has("webpuppet_detect_browsers") &&
                   has("webpuppet_check_permission") && has("webpuppet_intervention_status") &&
                   std::is_sorted(names.begin(), names.end());
    json again = fixture.request(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})");
    success = success && again["result"] == response["result"];
    return check(success, "tools/list returns all tools, sorted and stable");
}

// Test: tools/call params validation.
static bool test_tools_call_invalid_params() {
    Fixture fixture;
    fixture.initialize();
    json no_name = fixture.request(R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"arguments":{}}})");
    json bad_arguments = fixture.request(
        R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"webpuppet_pause","arguments":[1]}})");
    json missing_argument = fixture.call_tool(10, "webpuppet_check_permission", json::object());
    bool success = error_code(no_name) == json_rpc::INVALID_PARAMS &&
                   error_code(bad_arguments) == json_rpc::INVALID_PARAMS &&
                   error_code(missing_argument) == json_rpc::INVALID_PARAMS;
    return check(success, "Malformed tools/call params and tool arguments are INVALID_PARAMS");
}

// Test: check_permission marks allowed, denied and unknown operations.
static bool test_check_permission_scenarios() {
    Fixture fixture;
    fixture.initialize();
    json denied = fixture.call_tool(20, "webpuppet_check_permission", {{"operation", "DeleteAccount"}});
    json allowed = fixture.call_tool(21, "webpuppet_check_permission", {{"operation", "Navigate"}});
    json unknown = fixture.call_tool(22, "webpuppet_check_permission", {{"operation", "LaunchRockets"}});
    bool success = !denied.contains("error") && denied["result"]["isError"] == false &&
                   result_text(denied).find("DENIED") != std::string::npos &&
                   result_text(allowed).find("ALLOWED") != std::string::npos && !unknown.contains("error") &&
                   unknown["result"]["isError"] == true;
    return check(success, "check_permission: ALLOWED, DENIED and tool-level error for unknown operations");
}

// Test: policy rejection inside a tool is a PERMISSION_DENIED protocol error.
static bool test_permission_denied_error() {
    Fixture fixture(permission_gate::read_only_policy());
    fixture.initialize();
    json response = fixture.call_tool(30, "webpuppet_prompt", {{"provider", "claude"}, {"message", "hi"}});
    bool success = error_code(response) == json_rpc::PERMISSION_DENIED &&
                   response["error"]["message"].get<std::string>().find("permission denied") == 0 &&
                   fixture.script->handles_built == 0;
    return check(success, "Denied operation maps to PERMISSION_DENIED without starting a browser");
}

// Test: pause, resume and complete through the tools.
static bool test_intervention_workflow() {
    Fixture fixture;
    fixture.initialize();
    json initial = fixture.call_tool(40, "webpuppet_intervention_status", json::object());
    json paused = fixture.call_tool(41, "webpuppet_pause", json::object());
    json waiting = fixture.call_tool(42, "webpuppet_intervention_status", json::object());
    json resumed = fixture.call_tool(43, "webpuppet_resume", json::object());
    json completed = fixture.call_tool(44, "webpuppet_intervention_complete", {{"success", true}, {"message", "done"}});
    json status = fixture.call_tool(45, "webpuppet_intervention_status", json::object());

    bool success = result_text(initial).find("Running") != std::string::npos &&
                   result_text(paused).find("Paused") != std::string::npos &&
                   result_text(waiting).find("Waiting for human") != std::string::npos &&
                   result_text(resumed).find("Resumed") != std::string::npos &&
                   result_text(completed).find("SUCCESS") != std::string::npos &&
                   result_text(status).find("done") != std::string::npos;
    return check(success, "Intervention pause/resume/complete reflected in status text");
}

// Test: shutdown moves to ShuttingDown; nothing leaves it.
static bool test_shutdown_terminal() {
    Fixture fixture;
    fixture.initialize();
    json response = fixture.request(R"({"jsonrpc":"2.0","id":50,"method":"shutdown"})");
    json initialize_again = fixture.request(INITIALIZE_LINE);
    json list = fixture.request(R"({"jsonrpc":"2.0","id":51,"method":"tools/list"})");
    bool success = response["result"] == json::object() &&
                   fixture.server->state() == mcp_server::ServerState::ShuttingDown &&
                   initialize_again.contains("error") && error_code(list) == json_rpc::INTERNAL_ERROR;
    return check(success, "shutdown is terminal");
}

// Test: exit notification also shuts down, without a response.
static bool test_exit_notification() {
    Fixture fixture;
    fixture.initialize();
    bool silent = !fixture.server->handle_message(R"({"jsonrpc":"2.0","method":"exit"})");
    return check(silent && fixture.server->state() == mcp_server::ServerState::ShuttingDown,
                 "exit notification shuts down silently");
}

// Test: run skips blank lines, answers one line per request and stops at shutdown.
static bool test_run_loop() {
    Fixture fixture;
    std::istringstream input(std::string(INITIALIZE_LINE) + "\n" +
                             "\n   \n" +
                             R"({"jsonrpc":"2.0","method":"notifications/initialized"})" + "\n" +
                             R"({"jsonrpc":"2.0","id":2,"method":"ping"})" + "\r\n" +
                             R"({"jsonrpc":"2.0","id":3,"method":"shutdown"})" + "\n" +
                             R"({"jsonrpc":"2.0","id":4,"method":"ping"})" + "\n");
    std::ostringstream output;
    bool clean = fixture.server->run(input, output);

    std::vector<json> responses;
    std::istringstream lines(output.str());
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }
    bool success = clean && responses.size() == 3 && responses[0]["id"] == 1 && responses[1]["id"] == 2 &&
                   responses[2]["id"] == 3;
    return check(success, "run answers each request on its own line and stops after shutdown");
}

// Test: run ends cleanly at end of input and releases the browser.
static bool test_run_eof_releases_automation() {
    Fixture fixture;
    std::istringstream input(std::string(INITIALIZE_LINE) + "\n" +
                             R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"webpuppet_navigate","arguments":{"url":"https://claude.ai"}}})" +
                             "\n");
    std::ostringstream output;
    bool clean = fixture.server->run(input, output);
    bool success = clean && fixture.script->handles_built == 1 && fixture.script->close_calls == 1 &&
                   fixture.registry->context().current_automation() == nullptr &&
                   fixture.registry->context().intervention().state() == intervention::InterventionState::Cancelled;
    return check(success, "End of input is a clean stop that closes the browser");
}

// Test: a failing output stream ends run with failure.
static bool test_run_write_failure() {
    Fixture fixture;
    std::istringstream input(R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n");
    std::ostringstream output;
    output.setstate(std::ios::badbit);
    bool clean = fixture.server->run(input, output);
    return check(!clean, "Write failure makes run report failure");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_initialize();
    all_passed &= test_initialize_invalid_params();
    all_passed &= test_duplicate_initialize();
    all_passed &= test_state_gating();
    all_passed &= test_ping_any_state();
    all_passed &= test_not_found_codes();
    all_passed &= test_ids_and_notifications();
    all_passed &= test_parse_error_response();
    all_passed &= test_deep_nesting_refused();
    all_passed &= test_tools_list();
    all_passed &= test_tools_call_invalid_params();
    all_passed &= test_check_permission_scenarios();
    all_passed &= test_permission_denied_error();
    all_passed &= test_intervention_workflow();
    all_passed &= test_shutdown_terminal();
    all_passed &= test_exit_notification();
    all_passed &= test_run_loop();
    all_passed &= test_run_eof_releases_automation();
    all_passed &= test_run_write_failure();
    return all_passed;
}

} // namespace test_server
