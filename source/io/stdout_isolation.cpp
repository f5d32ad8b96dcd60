#include "io/stdout_isolation.hpp"

#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <unistd.h>
#include <cstdio>
#include <iostream>

namespace stdout_isolation {

namespace {

constexpr int kDrainPollMilliseconds = 100;

void flush_standard_output() {
    std::cout.flush();
    std::fflush(stdout);
}

} // namespace

StdoutIsolation::~StdoutIsolation() {
    restore();
}

bool StdoutIsolation::begin(std::string &error_message) {
    if (active_) {
        return true;
    }
    flush_standard_output();

    saved_stdout_fd_ = platform::duplicate_fd(STDOUT_FILENO);
    if (saved_stdout_fd_ < 0) {
        error_message = "could not duplicate stdout";
        return false;
    }

    int pipe_fds[2] = {-1, -1};
    if (!platform::create_pipe(pipe_fds, error_message)) {
        platform::close_fd(saved_stdout_fd_);
        return false;
    }
    if (!platform::replace_fd(pipe_fds[1], STDOUT_FILENO)) {
        error_message = "could not redirect stdout";
        platform::close_fd(pipe_fds[0]);
        platform::close_fd(pipe_fds[1]);
        platform::close_fd(saved_stdout_fd_);
        return false;
    }
    // fd 1 now holds the only write end.
    platform::close_fd(pipe_fds[1]);

    pipe_read_fd_ = pipe_fds[0];
    stopping_ = false;
    active_ = true;
    drain_thread_ = std::thread(&StdoutIsolation::drain_loop, this);
    debug_log::log("stdout isolated until startup completes");
    return true;
}

void StdoutIsolation::restore() {
    if (!active_) {
        return;
    }
    flush_standard_output();

    if (!platform::replace_fd(saved_stdout_fd_, STDOUT_FILENO)) {
        debug_log::error("could not restore stdout");
    }
    platform::close_fd(saved_stdout_fd_);

    stopping_ = true;
    if (drain_thread_.joinable()) {
        drain_thread_.join();
    }
    platform::close_fd(pipe_read_fd_);
    active_ = false;

    if (captured_lines_ > 0) {
        debug_log::info("Diverted " + std::to_string(captured_lines_.load()) + " line(s) of startup output from stdout");
    }
    debug_log::log("stdout restored");
}

void StdoutIsolation::drain_loop() {
    platform::block_termination_signals();

    std::string buffer;
    char chunk[4096];
    auto emit = [this](const std::string &line) {
        captured_lines_++;
        debug_log::info("stdout: " + utf8_sanitize::sanitize(line));
    };

    while (true) {
        std::size_t bytes_read = 0;
        platform::ReadStatus status =
            platform::read_with_timeout(pipe_read_fd_, chunk, sizeof(chunk), kDrainPollMilliseconds, bytes_read);
        if (status == platform::ReadStatus::Data) {
            buffer.append(chunk, bytes_read);
            std::size_t newline_position;
            while ((newline_position = buffer.find('\n')) != std::string::npos) {
                emit(buffer.substr(0, newline_position));
                buffer.erase(0, newline_position + 1);
            }
            continue;
        }
        if (status == platform::ReadStatus::Timeout && !stopping_) {
            continue;
        }
        // EOF once the write end is gone, or nothing left after restore().
        break;
    }

    if (!buffer.empty()) {
        emit(buffer);
    }
}

} // namespace stdout_isolation
