#include "platform/platform_abi.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <pwd.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace platform {

namespace {

// posix_spawn wants mutable char* argv terminated by nullptr.
struct ArgumentVector {
    std::vector<std::string> storage;
    std::vector<char *> pointers;

    ArgumentVector(const std::string &executable_path, const std::vector<std::string> &arguments) {
        storage.push_back(executable_path);
        storage.insert(storage.end(), arguments.begin(), arguments.end());
        for (auto &argument : storage) {
            pointers.push_back(argument.data());
        }
        pointers.push_back(nullptr);
    }
};

} // namespace

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments) {
    SpawnResult result;
    ArgumentVector argv(executable_path, arguments);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&file_actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&file_actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(), &file_actions, nullptr,
                                   argv.pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    if (spawn_status != 0) {
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    return result;
}

bool run_and_capture(const std::string &executable_path,
                     const std::vector<std::string> &arguments,
                     std::string &output, std::size_t max_bytes) {
    int pipe_descriptors[2];
    if (pipe(pipe_descriptors) != 0) {
        return false;
    }

    ArgumentVector argv(executable_path, arguments);
    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, pipe_descriptors[1], STDOUT_FILENO);
    posix_spawn_file_actions_addopen(&file_actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addclose(&file_actions, pipe_descriptors[0]);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(), &file_actions, nullptr,
                                   argv.pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);
    close(pipe_descriptors[1]);

    if (spawn_status != 0) {
        close(pipe_descriptors[0]);
        return false;
    }

    output.clear();
    char buffer[512];
    ssize_t bytes_read = 0;
    while ((bytes_read = read(pipe_descriptors[0], buffer, sizeof(buffer))) > 0) {
        if (output.size() < max_bytes) {
            output.append(buffer, std::min(static_cast<std::size_t>(bytes_read), max_bytes - output.size()));
        }
    }
    close(pipe_descriptors[0]);

    int exit_status = 0;
    if (waitpid(child_pid, &exit_status, 0) < 0) {
        return false;
    }
    return WIFEXITED(exit_status) && WEXITSTATUS(exit_status) == 0;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool wait_for_file(const std::string &file_path, int timeout_milliseconds) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (true) {
        std::error_code error;
        if (std::filesystem::exists(file_path, error)) {
            // Chrome creates DevToolsActivePort before writing it.
            std::string contents;
            if (read_file_contents(file_path, contents) && !contents.empty()) {
                return true;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

bool kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    if (kill(static_cast<pid_t>(process_id), SIGTERM) != 0) {
        return false;
    }
    // Give the browser a moment to exit, then reap it.
    for (int attempt = 0; attempt < 30; ++attempt) {
        int status = 0;
        pid_t reaped = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
        if (reaped == static_cast<pid_t>(process_id) || reaped < 0) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    kill(static_cast<pid_t>(process_id), SIGKILL);
    waitpid(static_cast<pid_t>(process_id), nullptr, 0);
    return true;
}

bool is_executable_file(const std::string &file_path) {
    std::error_code error;
    return std::filesystem::is_regular_file(file_path, error) && access(file_path.c_str(), X_OK) == 0;
}

std::string find_on_path(const std::string &executable_name) {
    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        std::string full_path = directory + "/" + executable_name;
        if (is_executable_file(full_path)) {
            return full_path;
        }
    }
    return "";
}

std::string home_directory() {
    const char *home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return home;
    }
    struct passwd *entry = getpwuid(getuid());
    if (entry != nullptr && entry->pw_dir != nullptr) {
        return entry->pw_dir;
    }
    return "";
}

std::vector<std::string> list_subdirectories(const std::string &directory_path) {
    std::vector<std::string> names;
    std::error_code error;
    std::filesystem::directory_iterator iterator(directory_path, error);
    if (error) {
        return names;
    }
    for (const auto &entry : iterator) {
        std::error_code entry_error;
        if (entry.is_directory(entry_error)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace platform
