#include "mcp/mcp_server.hpp"
#include "protocol/json_rpc.hpp"
#include "protocol/mcp_types.hpp"
#include "utils/server_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <istream>
#include <mutex>
#include <ostream>

namespace mcp_server {

// Screenshots and long answers are cut in the debug log.
static const size_t MAX_LOGGED_LINE_BYTES = 4096;

const char *state_name(ServerState state) {
    switch (state) {
    case ServerState::Uninitialized:
        return "uninitialized";
    case ServerState::Ready:
        return "ready";
    case ServerState::ShuttingDown:
        return "shutting down";
    }
    return "unknown";
}

Server::Server(std::shared_ptr<mcp_tools::ToolRegistry> registry) : registry_(std::move(registry)) {}

ServerState Server::state() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return state_;
}

void Server::transition_to(ServerState next_state) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (state_ == ServerState::ShuttingDown || state_ == next_state) {
        return;
    }
    server_log::debug(std::string("Server state: ") + state_name(state_) + " -> " + state_name(next_state));
    state_ = next_state;
}

// Handle the "initialize" request.
json Server::handle_initialize(const json &request_id, const json &params) {
    mcp_types::InitializeParams initialize_params;
    std::string error_message;
    if (!mcp_types::parse_initialize_params(params, initialize_params, error_message)) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, error_message);
    }

    ServerState current = state();
    if (current == ServerState::ShuttingDown) {
        return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR, "server is shutting down");
    }
    if (current == ServerState::Ready) {
        server_log::info("initialize received again; accepting the new client parameters.");
    }

    server_log::info("Client " + initialize_params.client_info.name + " " + initialize_params.client_info.version +
                     " connected (protocol " + initialize_params.protocol_version + ").");
    if (initialize_params.protocol_version != mcp_types::PROTOCOL_VERSION) {
        server_log::warn("Client requested protocol " + initialize_params.protocol_version + "; answering with " +
                         mcp_types::PROTOCOL_VERSION + ".");
    }

    transition_to(ServerState::Ready);
    return json_rpc::build_response(request_id, mcp_types::build_initialize_result());
}

// Handle the "tools/list" request.
json Server::handle_tools_list(const json &request_id) {
    json tools_array = json::array();
    for (const auto &definition : registry_->list_tools()) {
        tools_array.push_back(mcp_types::to_json(definition));
    }

    json result;
    result["tools"] = tools_array;
    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/call" request.
json Server::handle_tools_call(const json &request_id, const json &params) {
    mcp_types::ToolCallParams call_params;
    std::string error_message;
    if (!mcp_types::parse_tool_call_params(params, call_params, error_message)) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, error_message);
    }

    mcp_tools::ToolOutcome outcome;
    try {
        outcome = registry_->execute(call_params.name, call_params.arguments);
    } catch (const json::exception &json_error) {
        outcome = mcp_tools::fail(mcp_error::ErrorKind::Serialization, json_error.what());
    } catch (const std::exception &unexpected) {
        outcome = mcp_tools::fail(mcp_error::ErrorKind::Internal, unexpected.what());
    }

    if (!outcome.success) {
        server_log::warn("Tool " + call_params.name + " failed: " + mcp_error::describe(outcome.error));
        return json_rpc::build_error_response(request_id, mcp_error::code_of(outcome.error),
                                              mcp_error::describe(outcome.error), outcome.error.data);
    }
    if (outcome.result.is_error) {
        server_log::debug("Tool " + call_params.name + " reported: " + mcp_types::first_text(outcome.result));
    }
    return json_rpc::build_response(request_id, mcp_types::to_json(outcome.result));
}

json Server::dispatch(const json &request_id, const std::string &method, const json &params) {
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "shutdown") {
        transition_to(ServerState::ShuttingDown);
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list" || method == "tools/call") {
        ServerState current = state();
        if (current != ServerState::Ready) {
            return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                                  std::string("server not initialized (state: ") +
                                                      state_name(current) + ")");
        }
        return method == "tools/list" ? handle_tools_list(request_id) : handle_tools_call(request_id, params);
    }

    // Unknown method.
    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND, "Method not found: " + method);
}

void Server::handle_notification(const std::string &method, const json &params) {
    if (method == "notifications/initialized") {
        server_log::debug("Client finished initialization.");
    } else if (method == "notifications/cancelled") {
        // In-flight calls run to completion; the notice is only recorded.
        std::string request_id = "?";
        if (params.is_object() && params.contains("requestId")) {
            request_id = params["requestId"].dump();
        }
        server_log::info("Client cancelled request " + request_id + "; cancellation is not supported.");
    } else if (method == "exit") {
        server_log::debug("exit notification received.");
        transition_to(ServerState::ShuttingDown);
    } else {
        server_log::debug("Ignoring notification " + method);
    }
}

std::optional<json> Server::handle_message(const std::string &raw_line) {
    json_rpc::ParseResult parsed = json_rpc::parse_message(raw_line);
    if (!parsed.success) {
        server_log::warn("Rejected message: " + parsed.error_message);
        return json_rpc::build_error_response(parsed.error_id, parsed.error_code, parsed.error_message);
    }

    const json_rpc::Message &message = parsed.message;
    switch (message.kind) {
    case json_rpc::MessageKind::Request:
        return dispatch(message.id, message.method, message.params);
    case json_rpc::MessageKind::Notification:
        handle_notification(message.method, message.params);
        return std::nullopt;
    case json_rpc::MessageKind::Response:
        server_log::debug("Ignoring response from client for id " + message.id.dump());
        return std::nullopt;
    }
    return std::nullopt;
}

bool Server::run(std::istream &input, std::ostream &output, const volatile std::sig_atomic_t *stop_flag) {
    bool clean = true;
    std::string line;

    while (true) {
        if (stop_flag != nullptr && *stop_flag != 0) {
            server_log::info("Stop requested. Shutting down.");
            break;
        }
        if (!std::getline(input, line)) {
            if (stop_flag != nullptr && *stop_flag != 0) {
                server_log::info("Stop requested. Shutting down.");
            } else if (input.bad()) {
                server_log::error("Failed to read from stdin.");
                clean = false;
            } else {
                server_log::info("EOF on stdin. Shutting down.");
            }
            break;
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        server_log::debug("<- " + utf8_sanitize::truncate(line, MAX_LOGGED_LINE_BYTES));
        std::optional<json> response = handle_message(line);
        if (response) {
            std::string serialized = json_rpc::serialize(*response);
            server_log::debug("-> " + utf8_sanitize::truncate(serialized, MAX_LOGGED_LINE_BYTES));
            output << serialized << "\n";
            output.flush();
            if (!output) {
                server_log::error("Failed to write to stdout.");
                clean = false;
                break;
            }
        }

        if (state() == ServerState::ShuttingDown) {
            server_log::info("Shutdown requested by client.");
            break;
        }
    }

    release_collaborators();
    return clean;
}

void Server::release_collaborators() {
    mcp_tools::ToolContext &context = registry_->context();
    if (context.intervention().is_blocking()) {
        server_log::info("Cancelling pending intervention.");
    }
    context.intervention().cancel();
    context.close_automation();
}

} // namespace mcp_server
