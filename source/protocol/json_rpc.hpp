#ifndef AMCPS_JSON_RPC_HPP
#define AMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication, both directions:
// answering the front-end and talking to backends.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data);

// Build a JSON-RPC 2.0 error response carrying an error object as-is.
json build_error_response_from(const json &request_id, const json &error_object);

// Build a request. params are omitted when null.
json build_request(const json &request_id, const std::string &method, const json &params);

// Build a notification (no id). params are omitted when null.
json build_notification(const std::string &method, const json &params);

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing.
json get_params(const json &message);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

// A response carries an id and a result or error, and no method.
bool is_response(const json &message);

// A request carries a method and an id.
bool is_request(const json &message);

// MCP tool result reporting a failure: one text content item and isError.
json build_tool_error_result(const std::string &text);

} // namespace json_rpc

#endif // AMCPS_JSON_RPC_HPP
