#ifndef AMCPS_PLATFORM_ABI_HPP
#define AMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace platform {

// A child process whose stdin and stdout are private pipes owned by us.
// stderr is inherited from this process.
struct PipedProcess {
    bool success = false;
    int process_id = -1;
    int stdin_fd = -1;  // write end, child's stdin
    int stdout_fd = -1; // read end, child's stdout
    std::string error_message;
};

// Spawn command (looked up on PATH when it has no '/') with the given
// arguments. The environment is this process's environment with
// environment_overrides applied on top. Every descriptor we keep is
// close-on-exec, so siblings spawned later never inherit it.
PipedProcess spawn_piped_process(const std::string &command,
                                 const std::vector<std::string> &arguments,
                                 const std::map<std::string, std::string> &environment_overrides);

// Current environment merged with overrides, as KEY=VALUE strings.
std::vector<std::string> build_environment(const std::map<std::string, std::string> &environment_overrides);

// Send a signal to a process. Returns false if process_id is invalid or kill() failed.
bool kill_process(int process_id, int signal_number);

// Reap the process if it has exited, waiting at most timeout_milliseconds.
// Returns true once the process is reaped (or was not our child any more).
bool wait_for_exit(int process_id, int timeout_milliseconds);

// Write the whole buffer, retrying on EINTR and short writes.
bool write_all(int fd, const std::string &data, std::string &error_message);

enum class ReadStatus {
    Data,
    EndOfFile,
    Timeout,
    Error,
};

// Wait up to timeout_milliseconds for fd to become readable, then read once.
// bytes_read is set when the status is Data.
ReadStatus read_with_timeout(int fd, char *buffer, std::size_t capacity,
                             int timeout_milliseconds, std::size_t &bytes_read);

// Create a pipe with both ends close-on-exec.
bool create_pipe(int (&pipe_fds)[2], std::string &error_message);

// dup() with close-on-exec set on the copy. Returns -1 on failure.
int duplicate_fd(int fd);

// dup2() retrying on EINTR.
bool replace_fd(int source_fd, int target_fd);

// Close fd if it is valid and set it to -1.
void close_fd(int &fd);

// Block SIGINT and SIGTERM in the calling thread, so that they are delivered
// to the main thread (whose blocking stdin read they interrupt).
void block_termination_signals();

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

} // namespace platform

#endif // AMCPS_PLATFORM_ABI_HPP
