#include "mcp/mcp_session.hpp"

#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/shutdown_token.hpp"
#include "utils/utf8_sanitize.hpp"

#include <istream>
#include <ostream>

namespace mcp_session {

const char *end_name(SessionEnd reason) {
    switch (reason) {
    case SessionEnd::EndOfInput:
        return "end of input";
    case SessionEnd::ReadError:
        return "read error";
    case SessionEnd::WriteError:
        return "write error";
    case SessionEnd::Shutdown:
        return "shutdown requested";
    }
    return "unknown";
}

json handle_line(const std::string &line, mcp_dispatch::Dispatcher &dispatcher) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return nullptr;
    }

    json parsed_message;
    try {
        parsed_message = json::parse(line);
    } catch (const json::parse_error &error) {
        std::string reason = utf8_sanitize::sanitize(std::string(error.what()));
        debug_log::error("Failed to parse incoming JSON: " + reason);
        return json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error", reason);
    }

    return dispatcher.dispatch_message(parsed_message);
}

std::string serialize(const json &response) {
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

SessionEnd run(std::istream &input, std::ostream &output, mcp_dispatch::Dispatcher &dispatcher,
               const shutdown_token::ShutdownToken *shutdown) {
    debug_log::info("Waiting for MCP messages on stdin");

    std::string line;
    while (true) {
        if (shutdown != nullptr && shutdown->is_requested()) {
            return SessionEnd::Shutdown;
        }
        if (!mcp_stdio::read_message(input, line)) {
            if (shutdown != nullptr && shutdown->is_requested()) {
                return SessionEnd::Shutdown;
            }
            return input.eof() ? SessionEnd::EndOfInput : SessionEnd::ReadError;
        }
        debug_log::rpc("IN", line);

        json response = handle_line(line, dispatcher);
        if (response.is_null()) {
            continue;
        }

        std::string serialized = serialize(response);
        debug_log::rpc("OUT", serialized);
        if (!mcp_stdio::write_message(output, serialized)) {
            debug_log::error("Failed to write response to stdout");
            return SessionEnd::WriteError;
        }
    }
}

} // namespace mcp_session
