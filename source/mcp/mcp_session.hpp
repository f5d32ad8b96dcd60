#ifndef AMCPS_MCP_SESSION_HPP
#define AMCPS_MCP_SESSION_HPP

// Front-end session loop: read a line, dispatch it, write the response line.
// One request at a time, responses in read order.

#include <nlohmann/json.hpp>
#include <iosfwd>
#include <string>

#include "mcp/mcp_dispatch.hpp"

namespace mcp_session {

using json = nlohmann::json;

enum class SessionEnd {
    EndOfInput,
    ReadError,
    WriteError,
    Shutdown,
};

const char *end_name(SessionEnd reason);

// Response for one raw input line: null when nothing is to be written (blank
// line, notification), a -32700 error with id null for malformed JSON.
json handle_line(const std::string &line, mcp_dispatch::Dispatcher &dispatcher);

// Serialize a response as one line; invalid UTF-8 is replaced, never thrown.
std::string serialize(const json &response);

SessionEnd run(std::istream &input, std::ostream &output, mcp_dispatch::Dispatcher &dispatcher,
               const shutdown_token::ShutdownToken *shutdown);

} // namespace mcp_session

#endif // AMCPS_MCP_SESSION_HPP
