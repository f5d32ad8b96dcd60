#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json error_object;
    error_object["code"] = error_code;
    error_object["message"] = error_message;
    return build_error_response_from(request_id, error_object);
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json error_object;
    error_object["code"] = error_code;
    error_object["message"] = error_message;
    error_object["data"] = error_data;
    return build_error_response_from(request_id, error_object);
}

json build_error_response_from(const json &request_id, const json &error_object) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"] = error_object;
    return response;
}

json build_request(const json &request_id, const std::string &method, const json &params) {
    json request;
    request["jsonrpc"] = "2.0";
    request["id"] = request_id;
    request["method"] = method;
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

json build_notification(const std::string &method, const json &params) {
    json notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.is_object() && message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return message.is_object() && !message.contains("id");
}

bool is_response(const json &message) {
    return message.is_object() && message.contains("id") && !message.contains("method") &&
           (message.contains("result") || message.contains("error"));
}

bool is_request(const json &message) {
    return message.is_object() && message.contains("id") && message.contains("method");
}

json build_tool_error_result(const std::string &text) {
    json error_content;
    error_content["type"] = "text";
    error_content["text"] = text;

    json result;
    result["content"] = json::array({error_content});
    result["isError"] = true;
    return result;
}

} // namespace json_rpc
