#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

extern char **environ;

namespace platform {

std::vector<std::string> build_environment(const std::map<std::string, std::string> &environment_overrides) {
    std::vector<std::string> entries;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string text(*entry);
        std::string key = text.substr(0, text.find('='));
        if (environment_overrides.count(key) != 0) {
            continue;
        }
        entries.push_back(text);
    }
    for (const auto &override_entry : environment_overrides) {
        entries.push_back(override_entry.first + "=" + override_entry.second);
    }
    return entries;
}

PipedProcess spawn_piped_process(const std::string &command,
                                 const std::vector<std::string> &arguments,
                                 const std::map<std::string, std::string> &environment_overrides) {
    PipedProcess result;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    if (!create_pipe(stdin_pipe, result.error_message)) {
        return result;
    }
    if (!create_pipe(stdout_pipe, result.error_message)) {
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        return result;
    }

    // argv: [command, arg1, ..., nullptr]; posix_spawn wants mutable pointers.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(command);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    std::vector<std::string> environment_strings = build_environment(environment_overrides);
    std::vector<char *> environment_pointers;
    for (auto &environment_string : environment_strings) {
        environment_pointers.push_back(environment_string.data());
    }
    environment_pointers.push_back(nullptr);

    // The child's stderr is left alone: it is our stderr, the diagnostic sink.
    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);

    // Spawning threads block SIGINT/SIGTERM and the process ignores SIGPIPE;
    // the child starts with an empty mask and default dispositions instead.
    posix_spawnattr_t spawn_attributes;
    posix_spawnattr_init(&spawn_attributes);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    posix_spawnattr_setsigmask(&spawn_attributes, &empty_mask);
    posix_spawnattr_setsigdefault(&spawn_attributes, &default_signals);
    posix_spawnattr_setflags(&spawn_attributes, static_cast<short>(POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF));

    pid_t child_pid = 0;
    int spawn_status = posix_spawnp(&child_pid, command.c_str(), &file_actions, &spawn_attributes,
                                    argv_pointers.data(), environment_pointers.data());
    posix_spawnattr_destroy(&spawn_attributes);
    posix_spawn_file_actions_destroy(&file_actions);

    // The child holds its own copies now.
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);

    if (spawn_status != 0) {
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        result.error_message = "posix_spawnp(" + command + ") failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_fd = stdin_pipe[1];
    result.stdout_fd = stdout_pipe[0];
    return result;
}

bool kill_process(int process_id, int signal_number) {
    if (process_id <= 0) {
        return false;
    }
    return kill(static_cast<pid_t>(process_id), signal_number) == 0;
}

bool wait_for_exit(int process_id, int timeout_milliseconds) {
    if (process_id <= 0) {
        return true;
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (true) {
        int status = 0;
        pid_t reaped = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
        if (reaped == static_cast<pid_t>(process_id)) {
            return true;
        }
        if (reaped < 0) {
            if (errno == EINTR) {
                continue;
            }
            // ECHILD: already reaped elsewhere.
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool write_all(int fd, const std::string &data, std::string &error_message) {
    if (fd < 0) {
        error_message = "channel is closed";
        return false;
    }
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t count = ::write(fd, data.data() + written, data.size() - written);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_message = "write failed: " + std::string(strerror(errno));
            return false;
        }
        written += static_cast<std::size_t>(count);
    }
    return true;
}

ReadStatus read_with_timeout(int fd, char *buffer, std::size_t capacity,
                             int timeout_milliseconds, std::size_t &bytes_read) {
    bytes_read = 0;
    struct pollfd poll_entry;
    poll_entry.fd = fd;
    poll_entry.events = POLLIN;
    poll_entry.revents = 0;

    int ready = poll(&poll_entry, 1, timeout_milliseconds);
    if (ready == 0) {
        return ReadStatus::Timeout;
    }
    if (ready < 0) {
        return (errno == EINTR) ? ReadStatus::Timeout : ReadStatus::Error;
    }

    ssize_t count = ::read(fd, buffer, capacity);
    if (count > 0) {
        bytes_read = static_cast<std::size_t>(count);
        return ReadStatus::Data;
    }
    if (count == 0) {
        return ReadStatus::EndOfFile;
    }
    if (errno == EINTR || errno == EAGAIN) {
        return ReadStatus::Timeout;
    }
    return ReadStatus::Error;
}

bool create_pipe(int (&pipe_fds)[2], std::string &error_message) {
    if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
        error_message = "pipe2 failed: " + std::string(strerror(errno));
        pipe_fds[0] = -1;
        pipe_fds[1] = -1;
        return false;
    }
    return true;
}

int duplicate_fd(int fd) {
    return fcntl(fd, F_DUPFD_CLOEXEC, 0);
}

bool replace_fd(int source_fd, int target_fd) {
    while (dup2(source_fd, target_fd) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

void close_fd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void block_termination_signals() {
    sigset_t blocked;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &blocked, nullptr);
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

} // namespace platform
