#include "utils/debug_log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace debug_log {

namespace {

std::mutex log_mutex;
std::atomic<Level> active_level{Level::Info};
std::ofstream log_file;

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool debug_env_enabled() {
    const char *value = std::getenv("AMCPS_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

const char *level_tag(Level level) {
    switch (level) {
    case Level::Error:
        return "ERROR";
    case Level::Info:
        return "INFO";
    case Level::Debug:
        return "DEBUG";
    case Level::Trace:
        return "TRACE";
    }
    return "INFO";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    long milliseconds = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm broken_down{};
    localtime_r(&seconds, &broken_down);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &broken_down);
    char with_millis[40];
    std::snprintf(with_millis, sizeof(with_millis), "%s.%03ld", buffer, milliseconds);
    return with_millis;
}

bool enabled(Level level) {
    if (level == Level::Debug && debug_env_enabled()) {
        return true;
    }
    return static_cast<int>(level) <= static_cast<int>(active_level.load());
}

void write(Level level, const std::string &message) {
    if (!enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << "[amcps] " << level_tag(level) << ": " << message << std::endl;
    if (log_file.is_open()) {
        log_file << timestamp() << " " << level_tag(level) << ": " << message << std::endl;
    }
}

} // namespace

Level parse_level(const std::string &text) {
    std::string normalized = to_lower(text);
    if (normalized == "error" || normalized == "0") {
        return Level::Error;
    }
    if (normalized == "info" || normalized == "1") {
        return Level::Info;
    }
    if (normalized == "debug" || normalized == "2") {
        return Level::Debug;
    }
    if (normalized == "trace" || normalized == "3") {
        return Level::Trace;
    }
    return Level::Info;
}

bool initialize(Level level, const std::string &log_file_path, std::string &error_message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (debug_env_enabled() && static_cast<int>(level) < static_cast<int>(Level::Debug)) {
        level = Level::Debug;
    }
    active_level = level;
    if (log_file.is_open()) {
        log_file.close();
    }
    if (log_file_path.empty()) {
        return true;
    }

    std::error_code directory_error;
    std::filesystem::path parent = std::filesystem::path(log_file_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, directory_error);
        if (directory_error) {
            error_message = "failed to create log directory " + parent.string() + ": " + directory_error.message();
            return false;
        }
    }

    log_file.open(log_file_path, std::ios::out | std::ios::app);
    if (!log_file.is_open()) {
        error_message = "failed to open log file " + log_file_path;
        return false;
    }
    log_file << timestamp() << " INFO: Logger initialized with level " << level_tag(level) << std::endl;
    return true;
}

void close() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
}

void error(const std::string &message) {
    write(Level::Error, message);
}

void info(const std::string &message) {
    write(Level::Info, message);
}

void log(const std::string &message) {
    write(Level::Debug, message);
}

void trace(const std::string &message) {
    write(Level::Trace, message);
}

void rpc(const std::string &direction, const std::string &line) {
    if (!enabled(Level::Trace)) {
        return;
    }
    write(Level::Trace, direction + " RPC: " + line);
}

} // namespace debug_log
