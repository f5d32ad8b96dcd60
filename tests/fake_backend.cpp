// Minimal MCP server used by the tests as a real backend subprocess.
//
// Options:
//   --tools a,b,c       tool names to list (default: echo)
//   --page-size N       split tools/list into pages of N with nextCursor
//   --hang              never answer initialize
//   --fail-init         answer initialize with a JSON-RPC error
//   --exit-on-start     exit before reading anything
//   --crash-on-call     exit(3) when a tools/call arrives
//   --noisy             write a non-JSON line before each response
//   --ping-client       ping the client before answering initialize
//
// tools/call answers with a text item and echoes the params it received
// under "received". Calling the tool named "fail" yields a JSON-RPC error;
// the tool named "signals" reports the signal mask and SIGPIPE disposition
// this process started with.

#include <nlohmann/json.hpp>
#include <signal.h>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

struct Options {
    std::vector<std::string> tools = {"echo"};
    std::size_t page_size = 0;
    bool hang = false;
    bool fail_init = false;
    bool exit_on_start = false;
    bool crash_on_call = false;
    bool noisy = false;
    bool ping_client = false;
};

static std::vector<std::string> split_names(const std::string &text) {
    std::vector<std::string> names;
    std::stringstream stream(text);
    std::string name;
    while (std::getline(stream, name, ',')) {
        if (!name.empty()) {
            names.push_back(name);
        }
    }
    return names;
}

static Options parse_options(int argc, char **argv) {
    Options options;
    for (int index = 1; index < argc; ++index) {
        std::string argument = argv[index];
        if (argument == "--tools" && index + 1 < argc) {
            options.tools = split_names(argv[++index]);
        } else if (argument == "--page-size" && index + 1 < argc) {
            options.page_size = static_cast<std::size_t>(std::atoi(argv[++index]));
        } else if (argument == "--hang") {
            options.hang = true;
        } else if (argument == "--fail-init") {
            options.fail_init = true;
        } else if (argument == "--exit-on-start") {
            options.exit_on_start = true;
        } else if (argument == "--crash-on-call") {
            options.crash_on_call = true;
        } else if (argument == "--noisy") {
            options.noisy = true;
        } else if (argument == "--ping-client") {
            options.ping_client = true;
        }
    }
    return options;
}

static void send(const Options &options, const json &message) {
    if (options.noisy) {
        std::cout << "fake backend chatter, not JSON" << "\n";
    }
    std::cout << message.dump() << "\n";
    std::cout.flush();
}

static json describe_signal_state() {
    sigset_t blocked;
    sigemptyset(&blocked);
    sigprocmask(SIG_BLOCK, nullptr, &blocked);
    json blocked_names = json::array();
    if (sigismember(&blocked, SIGINT) == 1) {
        blocked_names.push_back("SIGINT");
    }
    if (sigismember(&blocked, SIGTERM) == 1) {
        blocked_names.push_back("SIGTERM");
    }
    if (sigismember(&blocked, SIGPIPE) == 1) {
        blocked_names.push_back("SIGPIPE");
    }

    struct sigaction pipe_action {};
    sigaction(SIGPIPE, nullptr, &pipe_action);

    json state;
    state["blocked"] = blocked_names;
    state["sigpipe_default"] = (pipe_action.sa_handler == SIG_DFL);
    return state;
}

static json build_tools_page(const Options &options, const json &params) {
    std::size_t start = 0;
    if (params.is_object() && params.contains("cursor") && params["cursor"].is_string()) {
        start = static_cast<std::size_t>(std::atoi(params["cursor"].get<std::string>().c_str()));
    }
    std::size_t end = options.tools.size();
    if (options.page_size > 0 && start + options.page_size < end) {
        end = start + options.page_size;
    }

    json tools = json::array();
    for (std::size_t index = start; index < end; ++index) {
        json tool;
        tool["name"] = options.tools[index];
        tool["description"] = "Fake tool " + options.tools[index];
        tool["inputSchema"] = {{"type", "object"}, {"properties", json::object()}};
        tools.push_back(tool);
    }

    json result;
    result["tools"] = tools;
    if (end < options.tools.size()) {
        result["nextCursor"] = std::to_string(end);
    }
    return result;
}

int main(int argc, char **argv) {
    Options options = parse_options(argc, argv);
    if (options.exit_on_start) {
        return 2;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        json message;
        try {
            message = json::parse(line);
        } catch (const json::parse_error &error) {
            std::cerr << "[fake_backend] bad input: " << error.what() << std::endl;
            continue;
        }
        if (!message.is_object() || !message.contains("method")) {
            // Replies to our own requests (ping) need no answer.
            continue;
        }
        std::string method = message["method"].get<std::string>();
        if (!message.contains("id")) {
            continue;
        }
        json id = message["id"];
        json params = message.contains("params") ? message["params"] : json::object();

        json response;
        response["jsonrpc"] = "2.0";
        response["id"] = id;

        if (method == "initialize") {
            if (options.hang) {
                continue;
            }
            if (options.ping_client) {
                send(options, {{"jsonrpc", "2.0"}, {"id", "fake-ping-1"}, {"method", "ping"}});
            }
            if (options.fail_init) {
                response["error"] = {{"code", -32603}, {"message", "fake initialization failure"}};
            } else {
                response["result"] = {{"protocolVersion", params.value("protocolVersion", std::string("2024-11-05"))},
                                      {"capabilities", {{"tools", json::object()}}},
                                      {"serverInfo", {{"name", "fake-backend"}, {"version", "0.0.1"}}},
                                      {"received", params}};
            }
        } else if (method == "tools/list") {
            response["result"] = build_tools_page(options, params);
        } else if (method == "tools/call") {
            if (options.crash_on_call) {
                std::exit(3);
            }
            std::string tool_name = params.value("name", std::string());
            if (tool_name == "signals") {
                response["result"] = {{"content", json::array()}, {"signals", describe_signal_state()}};
            } else if (tool_name == "fail") {
                response["error"] = {{"code", -32000}, {"message", "tool failed"}, {"data", {{"tool", tool_name}}}};
            } else {
                json content = {{"type", "text"}, {"text", "called " + tool_name}};
                response["result"] = {{"content", json::array({content})}, {"received", params}};
            }
        } else if (method == "ping") {
            response["result"] = json::object();
        } else {
            response["error"] = {{"code", -32601}, {"message", "Method not found: " + method}};
        }
        send(options, response);
    }
    return 0;
}
