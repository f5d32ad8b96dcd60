#ifndef AMCPS_MCP_STDIO_HPP
#define AMCPS_MCP_STDIO_HPP

// MCP stdio transport framing: one JSON-RPC message per line.

#include <iosfwd>
#include <string>

namespace mcp_stdio {

// Read the next line into line, without the trailing '\n' or '\r'.
// Returns false on end of input or a read error.
bool read_message(std::istream &input, std::string &line);

// Write one message followed by '\n' and flush. Returns false if the stream
// went bad.
bool write_message(std::ostream &output, const std::string &json_string);

} // namespace mcp_stdio

#endif // AMCPS_MCP_STDIO_HPP
