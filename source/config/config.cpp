#include "config/config.hpp"

#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstdlib>
#include <set>

namespace config {

using json = nlohmann::json;

namespace {

bool parse_string_list(const json &value, const std::string &context, std::vector<std::string> &output,
                       std::string &error_message) {
    if (!value.is_array()) {
        error_message = context + " must be an array of strings";
        return false;
    }
    for (const auto &item : value) {
        if (!item.is_string()) {
            error_message = context + " must contain only strings";
            return false;
        }
        output.push_back(item.get<std::string>());
    }
    return true;
}

// Fields shared by both shapes; name is set by the caller.
bool parse_server_fields(const json &entry, backend::BackendSpec &spec, std::string &error_message) {
    const std::string context = "server " + spec.name;
    if (!entry.is_object()) {
        error_message = context + " must be an object";
        return false;
    }

    if (!entry.contains("command") || !entry["command"].is_string() ||
        entry["command"].get<std::string>().empty()) {
        error_message = context + " missing command";
        return false;
    }
    spec.command = entry["command"].get<std::string>();

    if (entry.contains("args") && !entry["args"].is_null()) {
        if (!parse_string_list(entry["args"], context + " args", spec.arguments, error_message)) {
            return false;
        }
    }

    if (entry.contains("env") && !entry["env"].is_null()) {
        if (!entry["env"].is_object()) {
            error_message = context + " env must be an object";
            return false;
        }
        for (const auto &item : entry["env"].items()) {
            if (!item.value().is_string()) {
                error_message = context + " env value for " + item.key() + " must be a string";
                return false;
            }
            spec.environment[item.key()] = item.value().get<std::string>();
        }
    }

    if (entry.contains("tools") && !entry["tools"].is_null()) {
        const json &tools = entry["tools"];
        if (!tools.is_object()) {
            error_message = context + " tools must be an object";
            return false;
        }
        if (tools.contains("allowed") && !tools["allowed"].is_null()) {
            std::vector<std::string> allowed;
            if (!parse_string_list(tools["allowed"], context + " tools.allowed", allowed, error_message)) {
                return false;
            }
            spec.allowed_tools = std::move(allowed);
        }
    }
    return true;
}

bool parse_positive_number(const std::map<std::string, std::string> &environment, const char *variable,
                           long &output, std::string &error_message) {
    auto iterator = environment.find(variable);
    if (iterator == environment.end() || iterator->second.empty()) {
        return true;
    }
    const std::string &text = iterator->second;
    errno = 0;
    char *end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || value <= 0) {
        error_message = std::string(variable) + " must be a positive integer, got '" + text + "'";
        return false;
    }
    output = value;
    return true;
}

} // namespace

std::map<std::string, std::string> read_environment() {
    static const char *const variables[] = {
        CONFIG_PATH_VARIABLE,    LOG_LEVEL_VARIABLE,    LOG_FILE_VARIABLE,
        PROTOCOL_VERSION_VARIABLE, CURSOR_MODE_VARIABLE, INIT_TIMEOUT_VARIABLE,
        CALL_TIMEOUT_VARIABLE,   STARTUP_PARALLELISM_VARIABLE,
    };
    std::map<std::string, std::string> environment;
    for (const char *variable : variables) {
        const char *value = std::getenv(variable);
        if (value != nullptr) {
            environment[variable] = value;
        }
    }
    return environment;
}

ConfigLoadResult parse_config(const std::string &text) {
    ConfigLoadResult result;

    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error &error) {
        result.error_message = "error parsing config file: " + std::string(error.what());
        return result;
    }
    if (!document.is_object()) {
        result.error_message = "config file must contain a JSON object";
        return result;
    }

    std::vector<backend::BackendSpec> servers;
    bool has_servers = document.contains("servers") && !document["servers"].is_null();
    bool has_mcp_servers = document.contains("mcpServers") && !document["mcpServers"].is_null();

    if (has_servers && !document["servers"].is_array()) {
        result.error_message = "\"servers\" must be an array";
        return result;
    }
    if (has_mcp_servers && !document["mcpServers"].is_object()) {
        result.error_message = "\"mcpServers\" must be an object";
        return result;
    }

    if (has_servers && !document["servers"].empty()) {
        std::size_t index = 0;
        for (const auto &entry : document["servers"]) {
            backend::BackendSpec spec;
            if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string() ||
                entry["name"].get<std::string>().empty()) {
                result.error_message = "server at index " + std::to_string(index) + " missing name";
                return result;
            }
            spec.name = entry["name"].get<std::string>();
            if (!parse_server_fields(entry, spec, result.error_message)) {
                return result;
            }
            servers.push_back(std::move(spec));
            index++;
        }
    } else if (has_mcp_servers) {
        // nlohmann::json objects iterate in key order.
        for (const auto &item : document["mcpServers"].items()) {
            backend::BackendSpec spec;
            spec.name = item.key();
            if (spec.name.empty()) {
                result.error_message = "mcpServers entry with an empty name";
                return result;
            }
            if (!parse_server_fields(item.value(), spec, result.error_message)) {
                return result;
            }
            servers.push_back(std::move(spec));
        }
    }

    if (servers.empty()) {
        result.error_message = "no servers defined in config";
        return result;
    }

    std::set<std::string> seen_names;
    for (const auto &spec : servers) {
        if (!seen_names.insert(spec.name).second) {
            result.error_message = "duplicate server name " + spec.name;
            return result;
        }
    }

    result.config.servers = std::move(servers);
    result.success = true;
    return result;
}

bool apply_environment(AggregatorConfig &config, const std::map<std::string, std::string> &environment,
                       std::string &error_message) {
    auto lookup = [&environment](const char *variable) -> std::string {
        auto iterator = environment.find(variable);
        return iterator == environment.end() ? std::string() : iterator->second;
    };

    config.log_level = debug_log::parse_level(lookup(LOG_LEVEL_VARIABLE));
    config.log_file = lookup(LOG_FILE_VARIABLE);

    std::string protocol_version = lookup(PROTOCOL_VERSION_VARIABLE);
    if (!protocol_version.empty()) {
        config.protocol_version = protocol_version;
    }
    config.cursor_mode = !lookup(CURSOR_MODE_VARIABLE).empty();

    if (!parse_positive_number(environment, INIT_TIMEOUT_VARIABLE, config.init_timeout_ms, error_message)) {
        return false;
    }
    if (!parse_positive_number(environment, CALL_TIMEOUT_VARIABLE, config.call_timeout_ms, error_message)) {
        return false;
    }
    long parallelism = config.startup_parallelism;
    if (!parse_positive_number(environment, STARTUP_PARALLELISM_VARIABLE, parallelism, error_message)) {
        return false;
    }
    if (parallelism > 64) {
        parallelism = 64;
    }
    config.startup_parallelism = static_cast<int>(parallelism);
    return true;
}

std::string resolve_config_path(const std::string &command_line_path,
                                const std::map<std::string, std::string> &environment) {
    if (!command_line_path.empty()) {
        return command_line_path;
    }
    auto iterator = environment.find(CONFIG_PATH_VARIABLE);
    if (iterator != environment.end()) {
        return iterator->second;
    }
    return "";
}

ConfigLoadResult load_config(const std::string &command_line_path,
                             const std::map<std::string, std::string> &environment) {
    std::string path = resolve_config_path(command_line_path, environment);
    if (path.empty()) {
        ConfigLoadResult result;
        result.error_message = "no config file: pass a path or set " + std::string(CONFIG_PATH_VARIABLE);
        return result;
    }

    std::string contents;
    if (!platform::read_file_contents(path, contents)) {
        ConfigLoadResult result;
        result.error_message = "error reading config file " + path;
        return result;
    }

    ConfigLoadResult result = parse_config(contents);
    if (!result.success) {
        result.error_message = path + ": " + result.error_message;
        return result;
    }
    if (!apply_environment(result.config, environment, result.error_message)) {
        result.success = false;
        return result;
    }
    return result;
}

} // namespace config
