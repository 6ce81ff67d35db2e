#include "utils/server_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace server_log {

static std::mutex output_mutex;
static std::ofstream log_file_stream;
static Level current_level = is_debug_env_enabled() ? Level::Debug : Level::Info;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static const char *level_tag(Level level) {
    switch (level) {
    case Level::Error:
        return "ERROR";
    case Level::Warn:
        return "WARN ";
    case Level::Info:
        return "INFO ";
    case Level::Debug:
        return "DEBUG";
    }
    return "INFO ";
}

bool is_debug_env_enabled() {
    const char *value = std::getenv("WEBPUPPET_MCP_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

void set_level(Level level) {
    std::lock_guard<std::mutex> lock(output_mutex);
    current_level = level;
}

Level get_level() {
    std::lock_guard<std::mutex> lock(output_mutex);
    return current_level;
}

bool redirect_to_file(const std::string &file_path) {
    std::lock_guard<std::mutex> lock(output_mutex);
    if (log_file_stream.is_open()) {
        log_file_stream.close();
    }
    log_file_stream.open(file_path, std::ios::out | std::ios::app);
    return log_file_stream.is_open();
}

bool is_enabled(Level level) {
    std::lock_guard<std::mutex> lock(output_mutex);
    return static_cast<int>(level) <= static_cast<int>(current_level);
}

static void write_line(Level level, const std::string &message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    if (static_cast<int>(level) > static_cast<int>(current_level)) {
        return;
    }
    std::ostream &output = log_file_stream.is_open() ? static_cast<std::ostream &>(log_file_stream)
                                                     : static_cast<std::ostream &>(std::cerr);
    output << "[webpuppet-mcp] " << level_tag(level) << " " << message << std::endl;
}

void error(const std::string &message) {
    write_line(Level::Error, message);
}

void warn(const std::string &message) {
    write_line(Level::Warn, message);
}

void info(const std::string &message) {
    write_line(Level::Info, message);
}

void debug(const std::string &message) {
    write_line(Level::Debug, message);
}

} // namespace server_log
