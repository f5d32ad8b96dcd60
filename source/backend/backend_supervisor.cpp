#include "backend/backend_supervisor.hpp"

#include "backend/stdio_channel.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/shutdown_token.hpp"

#include <algorithm>
#include <atomic>
#include <set>
#include <thread>

namespace backend {

namespace {

std::string describe_failed_reply(const std::string &method, const ExchangeResult &reply) {
    if (!reply.error_object.is_null()) {
        return method + " rejected by backend: " + reply.error_object.dump();
    }
    return reply.error_message;
}

std::string string_field(const json &object, const char *key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "?";
}

std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline) {
    auto remaining = deadline - std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(remaining);
}

} // namespace

// --- BackendConnection ---

BackendConnection::BackendConnection(BackendSpec spec, std::unique_ptr<BackendChannel> channel)
    : spec_(std::move(spec)), channel_(std::move(channel)) {}

BackendConnection::~BackendConnection() {
    close();
}

BackendState BackendConnection::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void BackendConnection::mark_ready() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = BackendState::Ready;
}

void BackendConnection::mark_failed(FaultKind fault, const std::string &reason) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = BackendState::Failed;
    failure_fault_ = fault;
    failure_reason_ = reason;
}

void BackendConnection::set_catalog(std::vector<ToolDescriptor> catalog) {
    catalog_ = std::move(catalog);
}

void BackendConnection::close() {
    if (channel_) {
        channel_->close();
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != BackendState::Failed) {
        state_ = BackendState::Closed;
    }
}

// --- BackendSupervisor ---

BackendSupervisor::BackendSupervisor(SupervisorOptions options, ChannelFactory channel_factory)
    : options_(std::move(options)), channel_factory_(std::move(channel_factory)) {
    if (!channel_factory_) {
        channel_factory_ = make_stdio_channel;
    }
}

BackendSupervisor::~BackendSupervisor() {
    shutdown();
}

std::unique_ptr<BackendConnection> BackendSupervisor::start(const BackendSpec &spec) {
    debug_log::log("Initializing backend " + spec.name + " with command: " + spec.command);
    auto connection = std::make_unique<BackendConnection>(spec, channel_factory_(spec));

    std::string error_message;
    if (!connection->channel().open(error_message)) {
        debug_log::error("Failed to start backend " + spec.name + ": " + error_message);
        connection->mark_failed(FaultKind::BackendInitFault, "failed to start: " + error_message);
    }
    return connection;
}

BackendState BackendSupervisor::initialize(BackendConnection &connection, std::chrono::milliseconds timeout,
                                           const shutdown_token::ShutdownToken *shutdown) {
    json client_info;
    client_info["name"] = options_.identity.name;
    client_info["version"] = options_.identity.version;

    json params;
    params["protocolVersion"] = options_.protocol_version;
    params["capabilities"] = json::object();
    params["clientInfo"] = client_info;

    debug_log::log("Sending initialize request to " + connection.name() + "...");
    ExchangeResult reply = connection.channel().request("initialize", params, timeout, shutdown);

    std::string failure;
    if (!reply.success) {
        failure = describe_failed_reply("initialize", reply);
    } else if (!reply.result.is_object()) {
        failure = "initialize returned a non-object result: " + reply.result.dump();
    }

    if (failure.empty()) {
        std::string notify_error;
        if (!connection.channel().notify("notifications/initialized", json(), notify_error)) {
            failure = "failed to send notifications/initialized: " + notify_error;
        }
    }

    if (!failure.empty()) {
        debug_log::error("Failed to initialize backend " + connection.name() + ": " + failure);
        debug_log::error("Skipping backend " + connection.name() + ", continuing with the others");
        connection.mark_failed(FaultKind::BackendInitFault, failure);
        connection.close();
        return BackendState::Failed;
    }

    json server_info = json::object();
    if (reply.result.contains("serverInfo") && reply.result["serverInfo"].is_object()) {
        server_info = reply.result["serverInfo"];
    }
    if (reply.result.contains("protocolVersion") && reply.result["protocolVersion"] != options_.protocol_version) {
        debug_log::log("Backend " + connection.name() + " negotiated protocol version " +
                       reply.result["protocolVersion"].dump());
    }

    debug_log::info("Backend " + connection.name() + " initialized: " + string_field(server_info, "name") + " " +
                    string_field(server_info, "version"));
    connection.mark_ready();
    return BackendState::Ready;
}

bool BackendSupervisor::discover(BackendConnection &connection, std::chrono::milliseconds timeout,
                                 const shutdown_token::ShutdownToken *shutdown) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<ToolDescriptor> tools;
    std::set<std::string> seen_cursors;
    std::string cursor;
    std::string failure;

    debug_log::log("Discovering tools for backend " + connection.name() + "...");
    while (failure.empty()) {
        std::chrono::milliseconds remaining = remaining_until(deadline);
        if (remaining.count() <= 0) {
            failure = "timed out listing tools";
            break;
        }

        json params = json::object();
        if (!cursor.empty()) {
            params["cursor"] = cursor;
        }
        ExchangeResult reply = connection.channel().request("tools/list", params, remaining, shutdown);
        if (!reply.success) {
            failure = describe_failed_reply("tools/list", reply);
            break;
        }
        if (!reply.result.is_object() || !reply.result.contains("tools") || !reply.result["tools"].is_array()) {
            failure = "tools/list returned no tools array";
            break;
        }

        for (const auto &entry : reply.result["tools"]) {
            ToolDescriptor descriptor;
            if (!parse_tool_descriptor(entry, descriptor)) {
                debug_log::error("Backend " + connection.name() + " listed a tool without a name, skipped: " + entry.dump());
                continue;
            }
            tools.push_back(std::move(descriptor));
        }

        if (!reply.result.contains("nextCursor") || !reply.result["nextCursor"].is_string()) {
            break;
        }
        cursor = reply.result["nextCursor"].get<std::string>();
        if (cursor.empty()) {
            break;
        }
        if (!seen_cursors.insert(cursor).second) {
            failure = "tools/list pagination repeated cursor " + cursor;
        }
    }

    if (!failure.empty()) {
        debug_log::error("Failed to discover tools for backend " + connection.name() + ": " + failure);
        connection.mark_failed(FaultKind::BackendDiscoveryFault, failure);
        connection.close();
        return false;
    }

    debug_log::log("Found " + std::to_string(tools.size()) + " tools for backend " + connection.name());
    connection.set_catalog(std::move(tools));
    return true;
}

StartupReport BackendSupervisor::start_all(const std::vector<BackendSpec> &specs,
                                           const shutdown_token::ShutdownToken *shutdown) {
    StartupReport report;
    std::vector<std::unique_ptr<BackendConnection>> started(specs.size());
    report.outcomes.resize(specs.size());

    std::atomic<std::size_t> next_index{0};
    auto worker = [&]() {
        platform::block_termination_signals();
        while (true) {
            std::size_t index = next_index++;
            if (index >= specs.size()) {
                return;
            }
            const BackendSpec &spec = specs[index];
            BackendOutcome &outcome = report.outcomes[index];
            outcome.name = spec.name;

            if (shutdown != nullptr && shutdown->is_requested()) {
                outcome.state = BackendState::Failed;
                outcome.fault = FaultKind::BackendInitFault;
                outcome.error_message = "startup cancelled by shutdown request";
                continue;
            }

            auto deadline = std::chrono::steady_clock::now() + options_.initialize_timeout;
            std::unique_ptr<BackendConnection> connection = start(spec);
            if (connection->state() == BackendState::Pending) {
                initialize(*connection, options_.initialize_timeout, shutdown);
            }
            if (connection->state() == BackendState::Ready) {
                discover(*connection, remaining_until(deadline), shutdown);
            }

            outcome.state = connection->state();
            outcome.fault = connection->failure_fault();
            outcome.error_message = connection->failure_reason();
            outcome.tool_count = connection->catalog().size();
            if (connection->state() == BackendState::Ready) {
                started[index] = std::move(connection);
            }
        }
    };

    std::size_t worker_count = std::min<std::size_t>(
        static_cast<std::size_t>(std::max(1, options_.startup_parallelism)), specs.size());
    std::vector<std::thread> workers;
    for (std::size_t worker_index = 0; worker_index < worker_count; ++worker_index) {
        workers.emplace_back(worker);
    }
    for (auto &worker_thread : workers) {
        worker_thread.join();
    }

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (std::size_t index = 0; index < specs.size(); ++index) {
            if (!started[index]) {
                continue;
            }
            const std::string &name = specs[index].name;
            if (connections_.count(name) != 0) {
                debug_log::error("Duplicate backend name " + name + ", keeping the first one");
                report.outcomes[index].state = BackendState::Failed;
                report.outcomes[index].fault = FaultKind::BackendInitFault;
                report.outcomes[index].error_message = "duplicate backend name";
                started[index]->close();
                continue;
            }
            connections_[name] = std::move(started[index]);
            report.ready_count++;
        }
    }

    if (shutdown != nullptr && shutdown->is_requested()) {
        report.cancelled = true;
        report.success = false;
        report.error_message = "startup cancelled by shutdown request";
        debug_log::info("Startup cancelled with " + std::to_string(report.ready_count) + " backend(s) ready");
        return report;
    }

    if (report.ready_count == 0) {
        report.success = false;
        report.fault = FaultKind::AllBackendsFailedFault;
        report.error_message = "no backends were successfully initialized";
        debug_log::error("All " + std::to_string(specs.size()) + " configured backends failed to start");
        return report;
    }

    report.success = true;
    debug_log::info(std::to_string(report.ready_count) + " of " + std::to_string(specs.size()) + " backends ready");
    return report;
}

ExchangeResult BackendSupervisor::call(const std::string &backend_name, const std::string &method, const json &params,
                                       std::chrono::milliseconds timeout,
                                       const shutdown_token::ShutdownToken *shutdown) {
    BackendConnection *connection = nullptr;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto iterator = connections_.find(backend_name);
        if (iterator != connections_.end()) {
            connection = iterator->second.get();
        }
    }

    if (connection == nullptr) {
        ExchangeResult result;
        result.fault = FaultKind::BackendTransportFault;
        result.error_message = "backend " + backend_name + " is not connected";
        return result;
    }
    BackendState state = connection->state();
    if (state != BackendState::Ready) {
        ExchangeResult result;
        result.fault = FaultKind::BackendTransportFault;
        result.error_message = "backend " + backend_name + " is " + state_name(state);
        return result;
    }

    // Entries are never erased before destruction, so the pointer stays valid.
    return connection->channel().request(method, params, timeout, shutdown);
}

std::vector<ToolDescriptor> BackendSupervisor::catalog(const std::string &backend_name) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto iterator = connections_.find(backend_name);
    if (iterator == connections_.end()) {
        return {};
    }
    return iterator->second->catalog();
}

bool BackendSupervisor::has_backend(const std::string &backend_name) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.count(backend_name) != 0;
}

std::vector<std::string> BackendSupervisor::backend_names() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    std::vector<std::string> names;
    for (const auto &entry : connections_) {
        names.push_back(entry.first);
    }
    return names;
}

void BackendSupervisor::shutdown() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto &entry : connections_) {
        if (entry.second->state() == BackendState::Closed) {
            continue;
        }
        debug_log::log("Closing backend " + entry.first);
        entry.second->close();
    }
}

} // namespace backend
