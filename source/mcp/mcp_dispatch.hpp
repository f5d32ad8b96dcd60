#ifndef AMCPS_MCP_DISPATCH_HPP
#define AMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch for the front-end.
// initialize and ping are answered locally; tools/list is served from the
// registry; tools/call is routed to the backend that owns the tool.

#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <vector>

#include "aggregator/aggregator_state.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

struct DispatchOptions {
    std::string protocol_version = "2024-11-05";
    std::string server_name = "amcps";
    std::string server_version = "1.0.0";
    std::chrono::milliseconds call_timeout{300000};
    const shutdown_token::ShutdownToken *shutdown = nullptr;
};

// Outcome of one tools/call.
//   fault None                  -> result is the backend's result, verbatim
//   fault None, error_object    -> the backend answered with a JSON-RPC error
//   UnknownTool/BackendTransport -> message explains; no result
struct ToolCallOutcome {
    backend::FaultKind fault = backend::FaultKind::None;
    json result;
    json error_object;
    std::string message;
};

class Dispatcher {
public:
    Dispatcher(aggregator::AggregatorState &state, DispatchOptions options);

    // Handle one front-end message. Returns the response, or null for
    // notifications and for responses sent by the client.
    json dispatch_message(const json &message);

    std::vector<backend::ToolDescriptor> list_tools() const;

    // params is the whole tools/call params object; everything except the
    // name is forwarded untouched.
    ToolCallOutcome call_tool(const std::string &public_tool_name, const json &params);

private:
    json handle_initialize(const json &request_id, const json &params);
    json handle_tools_list(const json &request_id);
    json handle_tools_call(const json &request_id, const json &params);

    aggregator::AggregatorState &state_;
    DispatchOptions options_;
};

} // namespace mcp_dispatch

#endif // AMCPS_MCP_DISPATCH_HPP
