#include "browser/cdp/cdp_driver.hpp"
#include "browser/cdp/cdp_chrome_launch.hpp"
#include "platform/platform_abi.hpp"
#include "utils/server_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <vector>

namespace cdp_driver {

// --- WebSocket callback ---

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;

    if (websocket_instance == nullptr) {
        return 0;
    }
    struct lws_context *context = lws_get_context(websocket_instance);
    Connection *connection = context ? static_cast<Connection *>(lws_context_user(context)) : nullptr;
    if (connection == nullptr) {
        return 0;
    }

    switch (reason) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
        connection->on_established();
        break;

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        bool message_complete = lws_is_final_fragment(websocket_instance) &&
                                lws_remaining_packet_payload(websocket_instance) == 0;
        connection->on_receive(static_cast<const char *>(incoming_data), incoming_length, message_complete);
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
        connection->on_connection_error(incoming_data ? static_cast<const char *>(incoming_data) : "unknown");
        break;

    case LWS_CALLBACK_CLIENT_CLOSED:
        connection->on_closed();
        break;

    default:
        break;
    }

    return 0;
}

// WebSocket protocol definition for libwebsockets.
static const struct lws_protocols websocket_protocols[] = {
    {
        "cdp-protocol",
        websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

std::string response_error(const json &response) {
    if (!response.is_object() || !response.contains("error")) {
        return "";
    }
    const json &error = response["error"];
    if (error.is_string()) {
        return error.get<std::string>();
    }
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        return error["message"].get<std::string>();
    }
    return error.dump();
}

json build_command(int message_id, const std::string &method, const json &params,
                   const std::string &session_id) {
    json command;
    command["id"] = message_id;
    command["method"] = method;
    if (!params.is_null() && !params.empty()) {
        command["params"] = params;
    }
    if (!session_id.empty()) {
        command["sessionId"] = session_id;
    }
    return command;
}

// --- Callback entry points ---

void Connection::on_established() {
    state_.connected = true;
    server_log::debug("CDP WebSocket connected.");
}

void Connection::on_receive(const char *data, size_t length, bool message_complete) {
    state_.receive_buffer.append(data, length);
    if (!message_complete) {
        return;
    }

    json message;
    try {
        message = json::parse(state_.receive_buffer);
    } catch (const json::parse_error &parse_error) {
        server_log::warn(std::string("Failed to parse CDP message: ") + parse_error.what());
        state_.receive_buffer.clear();
        return;
    }
    state_.receive_buffer.clear();

    // Responses carry the id of the command; events have none.
    if (message.contains("id") && message["id"].is_number_integer()) {
        int message_id = message["id"].get<int>();
        std::lock_guard<std::mutex> lock(state_.pending_mutex);
        if (message_id != state_.awaited_message_id) {
            // Late answer to a command that already timed out.
            server_log::debug("CDP: dropping response to message id=" + std::to_string(message_id));
            return;
        }
        state_.pending_responses[message_id] = std::move(message);
        state_.pending_condition.notify_all();
    } else if (message.contains("method") && message["method"].is_string()) {
        const std::string method = message["method"].get<std::string>();
        if (method == "Target.detachedFromTarget" && message.contains("params") &&
            message["params"].value("sessionId", "") == state_.current_session_id) {
            server_log::warn("CDP: attached tab was detached.");
            state_.page_attached = false;
            state_.current_session_id.clear();
        }
    }
}

void Connection::on_connection_error(const std::string &error_message) {
    server_log::warn("CDP WebSocket connection error: " + error_message);
    state_.connected = false;
    state_.connection_failed = true;
}

void Connection::on_closed() {
    server_log::debug("CDP WebSocket closed.");
    state_.connected = false;
}

// --- Connection ---

Connection::Connection() = default;

Connection::~Connection() {
    disconnect();
}

bool Connection::is_connected() const {
    return state_.connected;
}

bool Connection::has_attached_page() const {
    return state_.page_attached;
}

bool Connection::connect(const std::string &websocket_url) {
    server_log::debug("Connecting to CDP WebSocket: " + websocket_url);

    std::string url_without_scheme = websocket_url;
    if (url_without_scheme.compare(0, 5, "ws://") == 0) {
        url_without_scheme = url_without_scheme.substr(5);
    }

    // Split host:port from path.
    std::string host_and_port = url_without_scheme;
    std::string path = "/";
    auto slash_position = url_without_scheme.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = url_without_scheme.substr(0, slash_position);
        path = url_without_scheme.substr(slash_position);
    }

    std::string host = host_and_port;
    int port = 9222;
    auto colon_position = host_and_port.find(':');
    if (colon_position != std::string::npos) {
        host = host_and_port.substr(0, colon_position);
        try {
            port = std::stoi(host_and_port.substr(colon_position + 1));
        } catch (const std::exception &) {
            server_log::warn("Failed to parse port from WebSocket URL: " + websocket_url);
            return false;
        }
    }

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    state_.websocket_context = lws_create_context(&context_info);
    if (state_.websocket_context == nullptr) {
        server_log::warn("Failed to create libwebsockets context.");
        return false;
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = state_.websocket_context;
    connect_info.address = host.c_str();
    connect_info.port = port;
    connect_info.path = path.c_str();
    connect_info.host = host.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;

    state_.connection_failed = false;
    state_.websocket_connection = lws_client_connect_via_info(&connect_info);
    if (state_.websocket_connection == nullptr) {
        server_log::warn("lws_client_connect_via_info returned null for " + websocket_url);
        lws_context_destroy(state_.websocket_context);
        state_.websocket_context = nullptr;
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    while (!state_.connected) {
        lws_service(state_.websocket_context, 50);

        if (state_.connection_failed || std::chrono::steady_clock::now() > deadline) {
            server_log::warn(state_.connection_failed ? "CDP WebSocket connection failed."
                                                      : "Timed out connecting to CDP WebSocket.");
            lws_context_destroy(state_.websocket_context);
            state_.websocket_context = nullptr;
            state_.websocket_connection = nullptr;
            return false;
        }
    }

    return true;
}

void Connection::disconnect() {
    std::lock_guard<std::mutex> command_lock(command_mutex_);

    if (state_.websocket_context != nullptr) {
        lws_context_destroy(state_.websocket_context);
        state_.websocket_context = nullptr;
        server_log::debug("disconnect(): WebSocket context destroyed.");
    }
    state_.websocket_connection = nullptr;
    state_.connected = false;
    state_.page_attached = false;

    if (state_.chrome_process_id > 0) {
        server_log::debug("disconnect(): killing browser pid=" + std::to_string(state_.chrome_process_id));
        platform::kill_process(state_.chrome_process_id);
    }
    state_.chrome_process_id = -1;
    state_.current_target_id.clear();
    state_.current_session_id.clear();

    std::lock_guard<std::mutex> lock(state_.pending_mutex);
    state_.pending_responses.clear();
    state_.awaited_message_id = 0;
}

json Connection::send_command(const std::string &method, const json &params,
                              const std::string &session_id, int timeout_milliseconds) {
    std::lock_guard<std::mutex> command_lock(command_mutex_);

    if (!is_connected() || state_.websocket_connection == nullptr) {
        json error_response;
        error_response["error"] = "Not connected to CDP";
        return error_response;
    }

    int message_id = state_.next_message_id++;
    {
        std::lock_guard<std::mutex> lock(state_.pending_mutex);
        state_.awaited_message_id = message_id;
    }
    auto stop_awaiting = [this]() {
        std::lock_guard<std::mutex> lock(state_.pending_mutex);
        state_.awaited_message_id = 0;
        state_.pending_responses.clear();
    };

    std::string serialized_command = build_command(message_id, method, params, session_id).dump();

    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + serialized_command.size());
    memcpy(send_buffer.data() + LWS_PRE, serialized_command.data(), serialized_command.size());

    int bytes_written = lws_write(state_.websocket_connection, send_buffer.data() + LWS_PRE,
                                  serialized_command.size(), LWS_WRITE_TEXT);
    if (bytes_written < 0) {
        stop_awaiting();
        json error_response;
        error_response["error"] = "Failed to send CDP command via WebSocket";
        return error_response;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (true) {
        // Service the event loop to receive messages.
        lws_service(state_.websocket_context, 10);

        {
            std::lock_guard<std::mutex> lock(state_.pending_mutex);
            auto response_iterator = state_.pending_responses.find(message_id);
            if (response_iterator != state_.pending_responses.end()) {
                json response = std::move(response_iterator->second);
                state_.pending_responses.erase(response_iterator);
                state_.awaited_message_id = 0;
                return response;
            }
        }

        if (!state_.connected) {
            stop_awaiting();
            json error_response;
            error_response["error"] = "CDP connection closed while waiting for " + method;
            return error_response;
        }
        if (std::chrono::steady_clock::now() > deadline) {
            stop_awaiting();
            json error_response;
            error_response["error"] = "Timed out waiting for CDP response to method: " + method;
            error_response["message_id"] = message_id;
            return error_response;
        }
    }
}

bool Connection::attach_to_page() {
    json get_targets_response = send_command("Target.getTargets", json::object());

    std::string chosen_target_id;
    if (get_targets_response.contains("result") && get_targets_response["result"].contains("targetInfos")) {
        for (const auto &target_info : get_targets_response["result"]["targetInfos"]) {
            if (target_info.value("type", "") == "page") {
                chosen_target_id = target_info.value("targetId", "");
                break;
            }
        }
    }

    // If no page target exists, create a new one.
    if (chosen_target_id.empty()) {
        json create_params;
        create_params["url"] = "about:blank";
        json create_response = send_command("Target.createTarget", create_params);
        if (!create_response.contains("result") || !create_response["result"].contains("targetId")) {
            server_log::warn("Target.createTarget failed: " + create_response.dump());
            return false;
        }
        chosen_target_id = create_response["result"]["targetId"].get<std::string>();
    }

    json attach_params;
    attach_params["targetId"] = chosen_target_id;
    attach_params["flatten"] = true;
    json attach_response = send_command("Target.attachToTarget", attach_params);
    if (!attach_response.contains("result") || !attach_response["result"].contains("sessionId")) {
        server_log::warn("Target.attachToTarget failed: " + attach_response.dump());
        return false;
    }

    state_.current_target_id = chosen_target_id;
    state_.current_session_id = attach_response["result"]["sessionId"].get<std::string>();
    state_.page_attached = true;

    for (const char *domain : {"Page.enable", "Runtime.enable"}) {
        json enable_response = send_command(domain, json::object(), state_.current_session_id);
        std::string error_text = response_error(enable_response);
        if (!error_text.empty()) {
            server_log::debug(std::string(domain) + " failed: " + error_text);
        }
    }

    server_log::debug("Attached to target id=" + state_.current_target_id + " session=" +
                      state_.current_session_id);
    return true;
}

browser_driver::DriverResult Connection::open_browser(const browser_driver::OpenBrowserOptions &options) {
    browser_driver::DriverResult result;
    bool connected = false;

    if (options.reuse_existing && !options.user_data_directory.empty()) {
        std::string existing_url = cdp_chrome_launch::try_get_existing_websocket_url(options.user_data_directory);
        if (!existing_url.empty()) {
            server_log::debug("open_browser: found a running browser, trying " + existing_url);
            connected = connect(existing_url);
            if (connected) {
                state_.chrome_process_id = -1;
                state_.user_data_directory = options.user_data_directory;
            }
        }
    }

    if (!connected) {
        cdp_chrome_launch::ChromeLaunchResult launch_result = cdp_chrome_launch::launch_chrome(options);
        if (!launch_result.success) {
            result.error_detail = launch_result.error_message;
            result.message = "Failed to launch browser.";
            return result;
        }
        state_.chrome_process_id = launch_result.process_id;
        state_.user_data_directory = launch_result.user_data_directory;

        connected = connect(launch_result.websocket_debugger_url);
        if (!connected) {
            result.error_detail = "Could not establish WebSocket connection to: " +
                                  launch_result.websocket_debugger_url;
            result.message = "Failed to connect to browser CDP.";
            platform::kill_process(state_.chrome_process_id);
            state_.chrome_process_id = -1;
            return result;
        }
    }

    if (!attach_to_page()) {
        result.error_detail = "Could not attach to a browser tab.";
        result.message = "Failed to attach to the browser tab.";
        disconnect();
        return result;
    }

    result.success = true;
    result.message = "Browser opened and connected to default tab.";
    return result;
}

browser_driver::NavigateResult Connection::navigate(const std::string &url) {
    browser_driver::NavigateResult result;

    if (!is_connected() || state_.current_session_id.empty()) {
        result.error_text = "No active browser session.";
        return result;
    }

    json navigate_params;
    navigate_params["url"] = url;
    json navigate_response = send_command("Page.navigate", navigate_params, state_.current_session_id, 30000);

    std::string error_text = response_error(navigate_response);
    if (!error_text.empty()) {
        result.error_text = error_text;
        return result;
    }

    if (navigate_response.contains("result")) {
        const auto &navigation = navigate_response["result"];
        result.frame_id = navigation.value("frameId", "");
        if (navigation.contains("errorText") && navigation["errorText"].is_string()) {
            result.error_text = navigation["errorText"].get<std::string>();
            return result;
        }
    }

    result.success = true;
    return result;
}

browser_driver::EvaluateResult Connection::evaluate(const std::string &expression, int timeout_milliseconds) {
    browser_driver::EvaluateResult result;

    if (!is_connected() || state_.current_session_id.empty()) {
        result.error_detail = "No active browser session.";
        return result;
    }

    json eval_params;
    eval_params["expression"] = expression;
    eval_params["returnByValue"] = true;
    eval_params["awaitPromise"] = true;
    json eval_response = send_command("Runtime.evaluate", eval_params, state_.current_session_id,
                                      timeout_milliseconds);

    std::string error_text = response_error(eval_response);
    if (!error_text.empty()) {
        result.error_detail = error_text;
        return result;
    }
    if (!eval_response.contains("result")) {
        result.error_detail = "Runtime.evaluate returned no result.";
        return result;
    }

    const json &payload = eval_response["result"];
    if (payload.contains("exceptionDetails")) {
        const json &details = payload["exceptionDetails"];
        std::string description = details.value("text", "exception");
        if (details.contains("exception") && details["exception"].contains("description")) {
            description = details["exception"]["description"].get<std::string>();
        }
        result.error_detail = "JavaScript exception: " + description;
        return result;
    }

    if (payload.contains("result") && payload["result"].contains("value")) {
        result.value = payload["result"]["value"];
    }
    result.success = true;
    return result;
}

browser_driver::DriverResult Connection::insert_text(const std::string &text) {
    browser_driver::DriverResult result;
    if (!is_connected() || state_.current_session_id.empty()) {
        result.error_detail = "No active browser session.";
        return result;
    }

    json insert_params;
    insert_params["text"] = text;
    json insert_response = send_command("Input.insertText", insert_params, state_.current_session_id, 5000);
    std::string error_text = response_error(insert_response);
    if (!error_text.empty()) {
        result.error_detail = error_text;
        result.message = "insert_text failed.";
        return result;
    }

    result.success = true;
    result.message = "Text inserted.";
    return result;
}

browser_driver::DriverResult Connection::press_key(const std::string &key) {
    browser_driver::DriverResult result;
    if (!is_connected() || state_.current_session_id.empty()) {
        result.error_detail = "No active browser session.";
        return result;
    }

    int key_code = 0;
    std::string key_text;
    if (key == "Enter") {
        key_code = 13;
        key_text = "\r";
    } else if (key == "Tab") {
        key_code = 9;
    } else if (key == "Escape") {
        key_code = 27;
    }

    for (const char *event_type : {"keyDown", "keyUp"}) {
        json key_params;
        key_params["type"] = event_type;
        key_params["key"] = key;
        key_params["code"] = key;
        if (key_code != 0) {
            key_params["windowsVirtualKeyCode"] = key_code;
            key_params["nativeVirtualKeyCode"] = key_code;
        }
        if (!key_text.empty() && std::string(event_type) == "keyDown") {
            key_params["text"] = key_text;
        }
        json key_response = send_command("Input.dispatchKeyEvent", key_params, state_.current_session_id, 5000);
        std::string error_text = response_error(key_response);
        if (!error_text.empty()) {
            result.error_detail = error_text;
            result.message = "press_key failed.";
            return result;
        }
    }

    result.success = true;
    result.message = "Key pressed.";
    return result;
}

browser_driver::CaptureScreenshotResult Connection::capture_screenshot() {
    browser_driver::CaptureScreenshotResult result;

    if (!is_connected() || state_.current_session_id.empty()) {
        result.error_detail = "No active browser session.";
        return result;
    }

    json capture_params;
    capture_params["format"] = "png";
    json capture_response = send_command("Page.captureScreenshot", capture_params,
                                         state_.current_session_id, 30000);

    std::string error_text = response_error(capture_response);
    if (!error_text.empty()) {
        result.error_detail = error_text;
        return result;
    }

    if (capture_response.contains("result") && capture_response["result"].contains("data") &&
        capture_response["result"]["data"].is_string()) {
        result.success = true;
        result.image_base64 = capture_response["result"]["data"].get<std::string>();
        result.mime_type = "image/png";
        server_log::debug("capture_screenshot: captured " + std::to_string(result.image_base64.size()) +
                          " bytes base64");
    } else {
        result.error_detail = "Page.captureScreenshot did not return image data.";
    }

    return result;
}

} // namespace cdp_driver
