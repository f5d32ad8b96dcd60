#ifndef AMCPS_CONFIG_HPP
#define AMCPS_CONFIG_HPP

// Aggregator configuration: the backend list from a JSON file plus runtime
// settings from environment variables.
//
// Two file shapes are accepted:
//   {"servers": [{"name": "x", "command": "...", "args": [...], "env": {...},
//                 "tools": {"allowed": [...]}}]}
//   {"mcpServers": {"x": {"command": "...", "args": [...], "env": {...}}}}

#include <map>
#include <string>
#include <vector>

#include "backend/backend_abi.hpp"
#include "utils/debug_log.hpp"

namespace config {

// Environment variable names.
constexpr const char *CONFIG_PATH_VARIABLE = "MCP_CONFIG";
constexpr const char *LOG_LEVEL_VARIABLE = "MCP_LOG_LEVEL";
constexpr const char *LOG_FILE_VARIABLE = "MCP_LOG_FILE";
constexpr const char *PROTOCOL_VERSION_VARIABLE = "MCP_PROTOCOL_VERSION";
constexpr const char *CURSOR_MODE_VARIABLE = "MCP_CURSOR_MODE";
constexpr const char *INIT_TIMEOUT_VARIABLE = "AMCPS_INIT_TIMEOUT_MS";
constexpr const char *CALL_TIMEOUT_VARIABLE = "AMCPS_CALL_TIMEOUT_MS";
constexpr const char *STARTUP_PARALLELISM_VARIABLE = "AMCPS_STARTUP_PARALLELISM";

struct AggregatorConfig {
    std::vector<backend::BackendSpec> servers;
    debug_log::Level log_level = debug_log::Level::Info;
    std::string log_file;
    std::string protocol_version = "2024-11-05";
    bool cursor_mode = false;
    long init_timeout_ms = 60000;
    long call_timeout_ms = 300000;
    int startup_parallelism = 4;
};

struct ConfigLoadResult {
    bool success = false;
    AggregatorConfig config;
    std::string error_message;
};

// Snapshot of the variables above from the process environment (unset ones
// are left out).
std::map<std::string, std::string> read_environment();

// Parse and validate the server list. Settings other than servers keep their
// defaults.
ConfigLoadResult parse_config(const std::string &text);

// Apply environment settings on top of a parsed config. Returns false with
// error_message set when a numeric value is malformed or out of range.
bool apply_environment(AggregatorConfig &config, const std::map<std::string, std::string> &environment,
                       std::string &error_message);

// The command-line path if given, else MCP_CONFIG, else empty.
std::string resolve_config_path(const std::string &command_line_path,
                                const std::map<std::string, std::string> &environment);

// resolve_config_path + read + parse_config + apply_environment.
ConfigLoadResult load_config(const std::string &command_line_path,
                             const std::map<std::string, std::string> &environment);

} // namespace config

#endif // AMCPS_CONFIG_HPP
