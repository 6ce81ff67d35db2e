#ifndef WEBPUPPET_MCP_SERVER_LOG_HPP
#define WEBPUPPET_MCP_SERVER_LOG_HPP

// Diagnostic logging. Everything goes to stderr (or a log file); stdout is
// reserved for protocol messages.

#include <string>

namespace server_log {

enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

// Returns true if WEBPUPPET_MCP_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_env_enabled();

// Set the maximum level that is written. Default: Info (Debug if the env flag is set).
void set_level(Level level);
Level get_level();

// Redirect output to the given file (append mode). Returns false and keeps
// writing to stderr if the file cannot be opened.
bool redirect_to_file(const std::string &file_path);

bool is_enabled(Level level);

void error(const std::string &message);
void warn(const std::string &message);
void info(const std::string &message);
void debug(const std::string &message);

} // namespace server_log

#endif // WEBPUPPET_MCP_SERVER_LOG_HPP
