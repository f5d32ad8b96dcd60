#ifndef AMCPS_SHUTDOWN_TOKEN_HPP
#define AMCPS_SHUTDOWN_TOKEN_HPP

// Process-wide "stop now" flag. request() only touches a lock-free atomic, so
// it may be called from a signal handler. Waiters poll it between short sleeps.

#include <atomic>
#include <chrono>

namespace shutdown_token {

class ShutdownToken {
public:
    ShutdownToken() = default;
    ShutdownToken(const ShutdownToken &) = delete;
    ShutdownToken &operator=(const ShutdownToken &) = delete;

    void request() { requested_.store(true); }
    bool is_requested() const { return requested_.load(); }

    // Sleep for up to duration, waking early if shutdown is requested.
    // Returns true if shutdown was requested.
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> requested_{false};
};

// Poll interval used by every bounded wait in the process.
constexpr std::chrono::milliseconds kPollInterval{50};

} // namespace shutdown_token

#endif // AMCPS_SHUTDOWN_TOKEN_HPP
