#include "backend/stdio_channel.hpp"

#include "platform/platform_abi.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/shutdown_token.hpp"
#include "utils/utf8_sanitize.hpp"

#include <signal.h>

namespace backend {

namespace {

constexpr int kReadPollMilliseconds = 100;
constexpr std::size_t kReadChunkSize = 8192;
constexpr std::size_t kLogSnippetBytes = 200;

ExchangeResult transport_fault(const std::string &message) {
    ExchangeResult result;
    result.success = false;
    result.fault = FaultKind::BackendTransportFault;
    result.error_message = message;
    return result;
}

} // namespace

StdioChannel::StdioChannel(BackendSpec spec) : spec_(std::move(spec)) {}

StdioChannel::~StdioChannel() {
    close();
}

bool StdioChannel::open(std::string &error_message) {
    debug_log::log("Spawning backend " + spec_.name + ": " + spec_.command);
    platform::PipedProcess process = platform::spawn_piped_process(spec_.command, spec_.arguments, spec_.environment);
    if (!process.success) {
        error_message = process.error_message;
        return false;
    }

    process_id_ = process.process_id;
    stdin_fd_ = process.stdin_fd;
    stdout_fd_ = process.stdout_fd;
    alive_ = true;
    reader_thread_ = std::thread(&StdioChannel::reader_loop, this);

    debug_log::log("Backend " + spec_.name + " running, pid=" + std::to_string(process_id_));
    return true;
}

ExchangeResult StdioChannel::request(const std::string &method, const json &params,
                                     std::chrono::milliseconds timeout,
                                     const shutdown_token::ShutdownToken *shutdown) {
    if (!alive_) {
        return transport_fault("backend " + spec_.name + " is not running");
    }

    std::int64_t request_id = next_request_id_++;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        awaited_ids_.insert(request_id);
    }

    std::string write_error;
    if (!write_line(json_rpc::build_request(request_id, method, params).dump(), write_error)) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        awaited_ids_.erase(request_id);
        return transport_fault("failed to send " + method + " to backend " + spec_.name + ": " + write_error);
    }

    auto start_time = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(pending_mutex_);
    while (true) {
        auto response_iterator = pending_responses_.find(request_id);
        if (response_iterator != pending_responses_.end()) {
            json reply = std::move(response_iterator->second);
            pending_responses_.erase(response_iterator);
            awaited_ids_.erase(request_id);
            lock.unlock();

            ExchangeResult result;
            if (reply.contains("error")) {
                result.error_object = reply["error"];
                if (result.error_object.is_object() && result.error_object.contains("message") &&
                    result.error_object["message"].is_string()) {
                    result.error_message = result.error_object["message"].get<std::string>();
                } else {
                    result.error_message = "backend returned an error";
                }
                return result;
            }
            result.success = true;
            result.result = reply.contains("result") ? reply["result"] : json();
            return result;
        }

        if (!alive_) {
            awaited_ids_.erase(request_id);
            return transport_fault("backend " + spec_.name + " exited before answering " + method);
        }
        if (shutdown != nullptr && shutdown->is_requested()) {
            awaited_ids_.erase(request_id);
            return transport_fault("shutdown requested while waiting for " + method + " from backend " + spec_.name);
        }
        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (timeout.count() > 0 && elapsed >= timeout) {
            awaited_ids_.erase(request_id);
            return transport_fault("timed out after " + std::to_string(timeout.count()) + " ms waiting for " +
                                   method + " from backend " + spec_.name);
        }

        pending_condition_.wait_for(lock, shutdown_token::kPollInterval);
    }
}

bool StdioChannel::notify(const std::string &method, const json &params, std::string &error_message) {
    if (!alive_) {
        error_message = "backend " + spec_.name + " is not running";
        return false;
    }
    return write_line(json_rpc::build_notification(method, params).dump(), error_message);
}

bool StdioChannel::is_alive() const {
    return alive_;
}

void StdioChannel::close() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    stopping_ = true;

    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        platform::close_fd(stdin_fd_);
    }

    if (process_id_ > 0) {
        // Closing stdin is the polite shutdown for a stdio MCP server.
        if (!platform::wait_for_exit(process_id_, kExitGraceMilliseconds)) {
            debug_log::log("Backend " + spec_.name + " still running, sending SIGTERM to pid " + std::to_string(process_id_));
            platform::kill_process(process_id_, SIGTERM);
            if (!platform::wait_for_exit(process_id_, 1000)) {
                debug_log::error("Backend " + spec_.name + " ignored SIGTERM, sending SIGKILL to pid " + std::to_string(process_id_));
                platform::kill_process(process_id_, SIGKILL);
                platform::wait_for_exit(process_id_, 1000);
            }
        }
        debug_log::log("Backend " + spec_.name + " (pid " + std::to_string(process_id_) + ") terminated");
        process_id_ = -1;
    }

    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    platform::close_fd(stdout_fd_);

    alive_ = false;
    std::lock_guard<std::mutex> pending_lock(pending_mutex_);
    pending_condition_.notify_all();
}

void StdioChannel::reader_loop() {
    platform::block_termination_signals();

    std::string buffer;
    char chunk[kReadChunkSize];
    while (true) {
        std::size_t bytes_read = 0;
        platform::ReadStatus status =
            platform::read_with_timeout(stdout_fd_, chunk, sizeof(chunk), kReadPollMilliseconds, bytes_read);

        if (status == platform::ReadStatus::Data) {
            buffer.append(chunk, bytes_read);
            std::size_t newline_position;
            while ((newline_position = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, newline_position);
                buffer.erase(0, newline_position + 1);
                handle_line(line);
            }
            continue;
        }
        if (status == platform::ReadStatus::Timeout) {
            if (stopping_) {
                break;
            }
            continue;
        }

        if (!stopping_) {
            debug_log::error("Backend " + spec_.name + " closed its output channel (process exited?)");
        }
        break;
    }

    alive_ = false;
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_condition_.notify_all();
}

void StdioChannel::handle_line(const std::string &raw_line) {
    std::string line = raw_line;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) {
        return;
    }
    debug_log::rpc("backend " + spec_.name + " <-", line);

    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error &error) {
        debug_log::error("Backend " + spec_.name + " wrote a non-JSON line (" + utf8_sanitize::sanitize(error.what()) +
                         "): " + utf8_sanitize::snippet(line, kLogSnippetBytes));
        return;
    }

    if (json_rpc::is_response(message)) {
        if (!message["id"].is_number_integer()) {
            debug_log::error("Backend " + spec_.name + " replied with a non-integer id: " + message["id"].dump());
            return;
        }
        std::int64_t response_id = message["id"].get<std::int64_t>();
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (awaited_ids_.count(response_id) == 0) {
            debug_log::log("Backend " + spec_.name + " replied to request " + std::to_string(response_id) +
                           " which nobody is waiting for; dropped");
            return;
        }
        pending_responses_[response_id] = std::move(message);
        pending_condition_.notify_all();
        return;
    }

    if (json_rpc::is_request(message)) {
        answer_backend_request(message);
        return;
    }

    std::string method = json_rpc::get_method(message);
    if (!method.empty()) {
        debug_log::log("Backend " + spec_.name + " notification: " + method);
        return;
    }
    debug_log::error("Backend " + spec_.name + " sent an unrecognized message: " +
                     utf8_sanitize::snippet(line, kLogSnippetBytes));
}

void StdioChannel::answer_backend_request(const json &message) {
    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);

    json response;
    if (method == "ping") {
        response = json_rpc::build_response(request_id, json::object());
    } else {
        debug_log::log("Backend " + spec_.name + " asked for unsupported method " + method);
        response = json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                                  "Method not supported by aggregator: " + method);
    }

    std::string write_error;
    if (!write_line(response.dump(), write_error)) {
        debug_log::error("Failed to answer " + method + " from backend " + spec_.name + ": " + write_error);
    }
}

bool StdioChannel::write_line(const std::string &line, std::string &error_message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    debug_log::rpc("backend " + spec_.name + " ->", line);
    return platform::write_all(stdin_fd_, line + "\n", error_message);
}

std::unique_ptr<BackendChannel> make_stdio_channel(const BackendSpec &spec) {
    return std::make_unique<StdioChannel>(spec);
}

} // namespace backend
