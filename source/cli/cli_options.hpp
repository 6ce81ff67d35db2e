#ifndef WEBPUPPET_MCP_CLI_OPTIONS_HPP
#define WEBPUPPET_MCP_CLI_OPTIONS_HPP

// Command-line configuration of the server.

#include <optional>
#include <string>

namespace cli_options {

struct StartupOptions {
    bool stdio = true;
    std::string policy = "secure";
    bool visible = false;
    bool verbose = false;
    std::string log_file;
    int intervention_timeout_seconds = 120;
};

// Parse argv into options. Returns an exit code when the process should stop
// right away (--help, --version, argument errors), otherwise nothing.
std::optional<int> parse_cli(int argc, char **argv, StartupOptions &options);

} // namespace cli_options

#endif // WEBPUPPET_MCP_CLI_OPTIONS_HPP
