#ifndef AMCPS_DEBUG_LOG_HPP
#define AMCPS_DEBUG_LOG_HPP

// Diagnostic log. Everything goes to stderr (never stdout, which carries the
// protocol) and, when configured, to an append-mode log file.

#include <string>

namespace debug_log {

enum class Level {
    Error = 0,
    Info = 1,
    Debug = 2,
    Trace = 3,
};

// Parse MCP_LOG_LEVEL style values: "error", "info", "debug", "trace" or 0..3.
// Anything else yields Level::Info.
Level parse_level(const std::string &text);

// Set the level and optional log file. Returns false (and keeps logging to
// stderr only) if the file cannot be opened; error_message is filled in.
bool initialize(Level level, const std::string &log_file_path, std::string &error_message);

// Close the log file, if any.
void close();

void error(const std::string &message);
void info(const std::string &message);

// Debug-level message.
void log(const std::string &message);

void trace(const std::string &message);

// Trace a raw protocol line. direction is e.g. "IN", "OUT", "backend:foo <-".
void rpc(const std::string &direction, const std::string &line);

} // namespace debug_log

#endif // AMCPS_DEBUG_LOG_HPP
