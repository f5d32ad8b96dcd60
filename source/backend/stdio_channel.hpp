#ifndef AMCPS_STDIO_CHANNEL_HPP
#define AMCPS_STDIO_CHANNEL_HPP

// BackendChannel over a spawned subprocess's stdin/stdout, one JSON-RPC
// message per line. A reader thread collects replies into a pending map keyed
// by request id; callers wait on a condition variable for their id.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "backend/backend_abi.hpp"

namespace backend {

class StdioChannel : public BackendChannel {
public:
    explicit StdioChannel(BackendSpec spec);
    ~StdioChannel() override;

    StdioChannel(const StdioChannel &) = delete;
    StdioChannel &operator=(const StdioChannel &) = delete;

    bool open(std::string &error_message) override;
    ExchangeResult request(const std::string &method, const json &params,
                           std::chrono::milliseconds timeout,
                           const shutdown_token::ShutdownToken *shutdown) override;
    bool notify(const std::string &method, const json &params, std::string &error_message) override;
    bool is_alive() const override;
    void close() override;

    // Grace period for the backend to exit after its stdin is closed,
    // before it is sent SIGTERM.
    static constexpr int kExitGraceMilliseconds = 2000;

private:
    void reader_loop();
    void handle_line(const std::string &line);
    void answer_backend_request(const json &message);
    bool write_line(const std::string &line, std::string &error_message);

    BackendSpec spec_;
    int process_id_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::thread reader_thread_;

    std::atomic<bool> alive_{false};
    std::atomic<bool> stopping_{false};
    bool closed_ = false;
    std::mutex lifecycle_mutex_;

    std::mutex write_mutex_;

    std::atomic<std::int64_t> next_request_id_{1};
    std::set<std::int64_t> awaited_ids_;
    std::map<std::int64_t, json> pending_responses_;
    std::mutex pending_mutex_;
    std::condition_variable pending_condition_;
};

// Default factory used by the supervisor.
std::unique_ptr<BackendChannel> make_stdio_channel(const BackendSpec &spec);

} // namespace backend

#endif // AMCPS_STDIO_CHANNEL_HPP
