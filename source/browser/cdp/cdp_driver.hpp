#ifndef WEBPUPPET_MCP_CDP_DRIVER_HPP
#define WEBPUPPET_MCP_CDP_DRIVER_HPP

// CDP (Chrome DevTools Protocol) driver.
// Manages the WebSocket connection to the browser, Target/session routing,
// and provides the page operations the automation layer needs.

#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>

#include "browser/browser_driver_abi.hpp"

struct lws_context;
struct lws;

namespace cdp_driver {

using json = nlohmann::json;

// State of one CDP connection.
struct ConnectionState {
    std::atomic<bool> connected{false};
    std::atomic<bool> connection_failed{false};
    // Set once a tab is attached, cleared when the browser detaches it.
    std::atomic<bool> page_attached{false};
    struct lws_context *websocket_context = nullptr;
    struct lws *websocket_connection = nullptr;

    // Browser process we launched (-1 if we attached to an existing one).
    int chrome_process_id = -1;
    std::string user_data_directory;

    // CDP message ID counter (incremented for each request).
    int next_message_id = 1;

    // Current attached target and session.
    std::string current_target_id;
    std::string current_session_id;

    // Pending request map: message id -> response JSON (filled when response arrives).
    // Only the response to awaited_message_id is kept; 0 means none in flight.
    std::map<int, json> pending_responses;
    int awaited_message_id = 0;
    std::mutex pending_mutex;
    std::condition_variable pending_condition;

    // Buffer for incoming WebSocket fragments.
    std::string receive_buffer;
};

// Pull a readable error out of a send_command response: our own
// {"error": "..."} or a CDP {"error": {"code", "message"}}. Empty if none.
std::string response_error(const json &response);

// Build the command object send_command writes to the socket.
json build_command(int message_id, const std::string &method, const json &params,
                   const std::string &session_id);

class Connection {
public:
    Connection();
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Connect to the browser via WebSocket at the given URL.
    bool connect(const std::string &websocket_url);

    // Close the socket and kill the browser if we launched it. Waits for
    // an in-flight command to finish.
    void disconnect();

    bool is_connected() const;

    // True while the browser still has our tab attached.
    bool has_attached_page() const;

    // Send a CDP command and wait for the response (blocking, with timeout).
    // If session_id is non-empty, the command is routed to that session.
    // Returns the response JSON, or {"error": "..."} if timed out / failed.
    json send_command(const std::string &method, const json &params,
                      const std::string &session_id = "", int timeout_milliseconds = 10000);

    // Launch (or reuse) a browser, connect, and attach to a page target.
    browser_driver::DriverResult open_browser(const browser_driver::OpenBrowserOptions &options);

    // Navigate the attached tab.
    browser_driver::NavigateResult navigate(const std::string &url);

    // Evaluate JavaScript in the attached tab; promises are awaited.
    browser_driver::EvaluateResult evaluate(const std::string &expression, int timeout_milliseconds = 10000);

    // Type text into the focused element.
    browser_driver::DriverResult insert_text(const std::string &text);

    // Press and release a key on the focused element ("Enter", "Tab").
    browser_driver::DriverResult press_key(const std::string &key);

    // PNG screenshot of the attached tab.
    browser_driver::CaptureScreenshotResult capture_screenshot();

    ConnectionState &state() { return state_; }

    // Event entry points for the libwebsockets callback.
    void on_established();
    void on_receive(const char *data, size_t length, bool message_complete);
    void on_connection_error(const std::string &error_message);
    void on_closed();

private:
    bool attach_to_page();

    ConnectionState state_;
    // libwebsockets is not thread-safe; one command in flight at a time.
    std::mutex command_mutex_;
};

} // namespace cdp_driver

#endif // WEBPUPPET_MCP_CDP_DRIVER_HPP
