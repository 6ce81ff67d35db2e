#ifndef WEBPUPPET_MCP_PLATFORM_ABI_HPP
#define WEBPUPPET_MCP_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstddef>
#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

// Spawn a detached child process. Its stdout/stderr are sent to /dev/null so
// browser chatter never reaches the protocol stream.
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments);

// Run a command to completion and capture its stdout (first max_bytes).
// Returns false if it could not be started or exited non-zero.
bool run_and_capture(const std::string &executable_path,
                     const std::vector<std::string> &arguments,
                     std::string &output, std::size_t max_bytes = 4096);

// Read the entire contents of a text file into a string.
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Poll until a file exists and is non-empty, up to timeout_milliseconds.
bool wait_for_file(const std::string &file_path, int timeout_milliseconds);

// Send SIGTERM, then reap the child so it does not linger as a zombie.
bool kill_process(int process_id);

// Full path of an executable found on PATH, or empty.
std::string find_on_path(const std::string &executable_name);

bool is_executable_file(const std::string &file_path);

// $HOME, falling back to the password database.
std::string home_directory();

// Names of the immediate subdirectories (sorted).
std::vector<std::string> list_subdirectories(const std::string &directory_path);

} // namespace platform

#endif // WEBPUPPET_MCP_PLATFORM_ABI_HPP
