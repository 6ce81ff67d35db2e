#ifndef WEBPUPPET_MCP_MCP_SERVER_HPP
#define WEBPUPPET_MCP_MCP_SERVER_HPP

// MCP server: lifecycle state, JSON-RPC method dispatch, and the
// line-delimited stdio loop.

#include <nlohmann/json.hpp>
#include <csignal>
#include <iosfwd>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

#include "mcp/mcp_tools.hpp"

namespace mcp_server {

using json = nlohmann::json;

// Uninitialized -> Ready on initialize; Ready -> ShuttingDown on shutdown or
// exit. Nothing leaves ShuttingDown.
enum class ServerState {
    Uninitialized,
    Ready,
    ShuttingDown
};

const char *state_name(ServerState state);

class Server {
public:
    explicit Server(std::shared_ptr<mcp_tools::ToolRegistry> registry);

    ServerState state() const;

    // Handle one raw line. Returns the response to send, or nothing for
    // notifications and for responses sent by the peer.
    std::optional<json> handle_message(const std::string &raw_line);

    // Run one request through the method table.
    json dispatch(const json &request_id, const std::string &method, const json &params);

    // Read lines until end of input or shutdown, writing one response line per
    // request. stop_flag, if set, is checked between lines (signal handlers).
    // Returns false if reading or writing failed before a clean stop.
    bool run(std::istream &input, std::ostream &output, const volatile std::sig_atomic_t *stop_flag = nullptr);

    // Cancel any pending intervention and close the browser.
    void release_collaborators();

private:
    void handle_notification(const std::string &method, const json &params);
    void transition_to(ServerState next_state);

    json handle_initialize(const json &request_id, const json &params);
    json handle_tools_list(const json &request_id);
    json handle_tools_call(const json &request_id, const json &params);

    std::shared_ptr<mcp_tools::ToolRegistry> registry_;
    mutable std::shared_mutex state_mutex_;
    ServerState state_ = ServerState::Uninitialized;
};

} // namespace mcp_server

#endif // WEBPUPPET_MCP_MCP_SERVER_HPP
