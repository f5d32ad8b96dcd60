#ifndef AMCPS_STDOUT_ISOLATION_HPP
#define AMCPS_STDOUT_ISOLATION_HPP

// Keeps stray writes off the protocol channel during startup.
// begin() points fd 1 at a private pipe whose contents are re-emitted to the
// diagnostic log; restore() puts the real stdout back. Between the two, only
// the session loop writes to fd 1.

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

namespace stdout_isolation {

class StdoutIsolation {
public:
    StdoutIsolation() = default;
    ~StdoutIsolation();

    StdoutIsolation(const StdoutIsolation &) = delete;
    StdoutIsolation &operator=(const StdoutIsolation &) = delete;

    // Returns false (and leaves fd 1 alone) if a descriptor could not be set up.
    bool begin(std::string &error_message);

    // Flush buffered output, put the saved descriptor back on fd 1 and wait
    // for the drain thread to finish. Idempotent.
    void restore();

    bool active() const { return active_; }

    // Lines captured so far.
    std::size_t captured_lines() const { return captured_lines_; }

private:
    void drain_loop();

    int saved_stdout_fd_ = -1;
    int pipe_read_fd_ = -1;
    bool active_ = false;
    std::atomic<bool> stopping_{false};
    std::atomic<std::size_t> captured_lines_{0};
    std::thread drain_thread_;
};

} // namespace stdout_isolation

#endif // AMCPS_STDOUT_ISOLATION_HPP
