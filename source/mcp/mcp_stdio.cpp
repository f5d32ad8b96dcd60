#include "mcp/mcp_stdio.hpp"

#include <istream>
#include <ostream>

namespace mcp_stdio {

bool read_message(std::istream &input, std::string &line) {
    if (!std::getline(input, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool write_message(std::ostream &output, const std::string &json_string) {
    // json::dump() without indent escapes control characters: one message, one line.
    output << json_string << '\n';
    output.flush();
    return static_cast<bool>(output);
}

} // namespace mcp_stdio
