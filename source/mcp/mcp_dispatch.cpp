#include "mcp/mcp_dispatch.hpp"

#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

namespace mcp_dispatch {

namespace {

std::string string_field(const json &object, const char *key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "?";
}

} // namespace

Dispatcher::Dispatcher(aggregator::AggregatorState &state, DispatchOptions options)
    : state_(state), options_(std::move(options)) {}

// Handle the "initialize" request.
json Dispatcher::handle_initialize(const json &request_id, const json &params) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        debug_log::info("Front-end client: " + string_field(params["clientInfo"], "name") + " " +
                        string_field(params["clientInfo"], "version"));
    }

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = options_.server_name;
    server_info["version"] = options_.server_version;

    json result;
    result["protocolVersion"] = options_.protocol_version;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_tools_list(const json &request_id) {
    json tools_array = json::array();
    for (const auto &tool : list_tools()) {
        tools_array.push_back(backend::tool_descriptor_to_json(tool));
    }

    json result;
    result["tools"] = tools_array;
    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_tools_call(const json &request_id, const json &params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in tools/call");
    }
    std::string tool_name = params["name"].get<std::string>();

    ToolCallOutcome outcome = call_tool(tool_name, params);
    if (outcome.fault != backend::FaultKind::None) {
        return json_rpc::build_response(request_id, json_rpc::build_tool_error_result(outcome.message));
    }
    if (!outcome.error_object.is_null()) {
        return json_rpc::build_error_response_from(request_id, outcome.error_object);
    }
    return json_rpc::build_response(request_id, outcome.result);
}

std::vector<backend::ToolDescriptor> Dispatcher::list_tools() const {
    return state_.registry.get_all();
}

ToolCallOutcome Dispatcher::call_tool(const std::string &public_tool_name, const json &params) {
    ToolCallOutcome outcome;

    tool_registry::ResolveResult target = state_.registry.resolve(public_tool_name);
    if (!target.found) {
        debug_log::error("Unknown tool requested: " + public_tool_name);
        outcome.fault = backend::FaultKind::UnknownToolFault;
        outcome.message = "Unknown tool: " + public_tool_name;
        return outcome;
    }

    json forwarded_params = params.is_object() ? params : json::object();
    forwarded_params["name"] = target.original_name;

    debug_log::log("Calling tool " + target.original_name + " on backend " + target.backend_name);
    auto start_time = std::chrono::steady_clock::now();
    backend::ExchangeResult reply = state_.supervisor.call(target.backend_name, "tools/call", forwarded_params,
                                                           options_.call_timeout, options_.shutdown);
    long elapsed_milliseconds = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count());

    if (reply.success) {
        debug_log::log("Tool " + public_tool_name + " returned after " + std::to_string(elapsed_milliseconds) + " ms");
        outcome.result = reply.result;
        return outcome;
    }
    if (!reply.error_object.is_null()) {
        debug_log::error("Tool " + public_tool_name + " failed on backend " + target.backend_name + ": " +
                         reply.error_message);
        outcome.error_object = reply.error_object;
        return outcome;
    }

    debug_log::error("Tool " + public_tool_name + " could not reach backend " + target.backend_name + ": " +
                     reply.error_message);
    outcome.fault = backend::FaultKind::BackendTransportFault;
    outcome.message = "Error calling tool " + public_tool_name + ": " + reply.error_message;
    return outcome;
}

json Dispatcher::dispatch_message(const json &message) {
    if (!message.is_object()) {
        return json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST,
                                              message.is_array() ? "Batch requests are not supported"
                                                                 : "Request must be a JSON object");
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);

    // Responses are never answered; we send no requests of our own.
    if (json_rpc::is_response(message)) {
        debug_log::log("Dropping unexpected response from front-end, id " + request_id.dump());
        return nullptr;
    }
    if (json_rpc::is_notification(message)) {
        if (!method.empty()) {
            debug_log::log("Front-end notification: " + method);
        }
        return nullptr;
    }
    if (method.empty()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Missing or invalid 'method'");
    }

    if (message.contains("params") && !message["params"].is_null() && !message["params"].is_object()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, "'params' must be an object");
    }
    json params = json_rpc::get_params(message);

    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND, "Unknown method: " + method);
}

} // namespace mcp_dispatch
