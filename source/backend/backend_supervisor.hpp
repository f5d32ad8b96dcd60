#ifndef AMCPS_BACKEND_SUPERVISOR_HPP
#define AMCPS_BACKEND_SUPERVISOR_HPP

// Backend lifecycle: spawn, handshake, tool discovery and teardown for every
// configured backend. The supervisor exclusively owns the connections; other
// components refer to backends by name only.

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "backend/backend_abi.hpp"

namespace shutdown_token {
class ShutdownToken;
}

namespace backend {

// Identity sent in every handshake and reported to the front-end.
struct Identity {
    std::string name = "amcps";
    std::string version = "1.0.0";
};

struct SupervisorOptions {
    Identity identity;
    std::string protocol_version = "2024-11-05";
    // Bound for one backend's initialize + discover pair.
    std::chrono::milliseconds initialize_timeout{60000};
    // Number of backends started concurrently.
    int startup_parallelism = 4;
};

// One backend: its spec, its channel and what we learned from it.
class BackendConnection {
public:
    BackendConnection(BackendSpec spec, std::unique_ptr<BackendChannel> channel);
    ~BackendConnection();

    BackendConnection(const BackendConnection &) = delete;
    BackendConnection &operator=(const BackendConnection &) = delete;

    const std::string &name() const { return spec_.name; }
    const BackendSpec &spec() const { return spec_; }
    BackendState state() const;
    const std::vector<ToolDescriptor> &catalog() const { return catalog_; }
    const std::string &failure_reason() const { return failure_reason_; }
    FaultKind failure_fault() const { return failure_fault_; }

    BackendChannel &channel() { return *channel_; }

    void mark_ready();
    void mark_failed(FaultKind fault, const std::string &reason);
    void set_catalog(std::vector<ToolDescriptor> catalog);
    // Close the channel; Ready and Pending connections become Closed.
    void close();

private:
    BackendSpec spec_;
    std::unique_ptr<BackendChannel> channel_;
    mutable std::mutex state_mutex_;
    BackendState state_ = BackendState::Pending;
    FaultKind failure_fault_ = FaultKind::None;
    std::string failure_reason_;
    std::vector<ToolDescriptor> catalog_;
};

// Per-backend startup outcome.
struct BackendOutcome {
    std::string name;
    BackendState state = BackendState::Pending;
    FaultKind fault = FaultKind::None;
    std::string error_message;
    std::size_t tool_count = 0;
};

struct StartupReport {
    bool success = false; // at least one backend is Ready
    bool cancelled = false; // a shutdown request arrived during startup
    FaultKind fault = FaultKind::None;
    std::string error_message;
    std::vector<BackendOutcome> outcomes; // in configuration order
    std::size_t ready_count = 0;
};

class BackendSupervisor {
public:
    explicit BackendSupervisor(SupervisorOptions options, ChannelFactory channel_factory = ChannelFactory());
    ~BackendSupervisor();

    BackendSupervisor(const BackendSupervisor &) = delete;
    BackendSupervisor &operator=(const BackendSupervisor &) = delete;

    // Spawn the backend and open its channel. The connection is Failed if the
    // spawn failed, Pending otherwise.
    std::unique_ptr<BackendConnection> start(const BackendSpec &spec);

    // Handshake. Ready on success; Failed (channel closed) otherwise.
    BackendState initialize(BackendConnection &connection, std::chrono::milliseconds timeout,
                            const shutdown_token::ShutdownToken *shutdown);

    // List the backend's tools, following pagination cursors. On failure the
    // connection is marked Failed and closed, and false is returned.
    bool discover(BackendConnection &connection, std::chrono::milliseconds timeout,
                  const shutdown_token::ShutdownToken *shutdown);

    // Start every backend (bounded parallelism). Ready connections are kept;
    // failed ones are closed and dropped. Fails only if none is Ready. A
    // shutdown request during startup sets cancelled instead of a fault.
    StartupReport start_all(const std::vector<BackendSpec> &specs, const shutdown_token::ShutdownToken *shutdown);

    // Forward one request to a named backend.
    ExchangeResult call(const std::string &backend_name, const std::string &method, const json &params,
                        std::chrono::milliseconds timeout, const shutdown_token::ShutdownToken *shutdown);

    // Catalog of a Ready backend (empty if unknown).
    std::vector<ToolDescriptor> catalog(const std::string &backend_name) const;

    bool has_backend(const std::string &backend_name) const;
    std::vector<std::string> backend_names() const;

    // Close every connection. Idempotent.
    void shutdown();

private:
    SupervisorOptions options_;
    ChannelFactory channel_factory_;
    mutable std::mutex connections_mutex_;
    std::map<std::string, std::unique_ptr<BackendConnection>> connections_;
};

} // namespace backend

#endif // AMCPS_BACKEND_SUPERVISOR_HPP
