#ifndef AMCPS_BACKEND_ABI_HPP
#define AMCPS_BACKEND_ABI_HPP

// Backend abstraction interface.
// A backend is an MCP server we launch and talk to over a private channel.
// The supervisor only sees BackendChannel, so the stdio implementation can be
// swapped for an in-process fake in tests.

#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shutdown_token {
class ShutdownToken;
}

namespace backend {

using json = nlohmann::json;

// Error taxonomy shared by every layer.
enum class FaultKind {
    None,
    ConfigFault,            // fatal, before the core runs
    BackendInitFault,       // one backend failed to spawn or handshake
    BackendDiscoveryFault,  // one backend failed to list its tools
    UnknownToolFault,       // per call: public name not registered
    BackendTransportFault,  // per call: no reply from the backend
    AllBackendsFailedFault, // fatal: zero backends reached Ready
};

const char *fault_name(FaultKind fault);

// One configured backend. Immutable after load.
struct BackendSpec {
    std::string name;
    std::string command;
    std::vector<std::string> arguments;
    std::map<std::string, std::string> environment;
    // Absent: register every tool. Present (even empty): only these names.
    std::optional<std::vector<std::string>> allowed_tools;
};

enum class BackendState {
    Pending,
    Ready,
    Failed,
    Closed,
};

const char *state_name(BackendState state);

// A tool as the backend describes it.
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema; // passed through, normalized only when published
};

// Parse one entry of a tools/list "tools" array. Returns false if it has no
// string name.
bool parse_tool_descriptor(const json &entry, ToolDescriptor &descriptor);

// Serialize a descriptor in MCP tools/list form.
json tool_descriptor_to_json(const ToolDescriptor &descriptor);

// Outcome of one request/response exchange.
//   success            -> result holds the reply's "result"
//   !success, error    -> the backend replied with a JSON-RPC error object
//   !success, no error -> no reply; fault is BackendTransportFault
struct ExchangeResult {
    bool success = false;
    json result;
    json error_object;
    FaultKind fault = FaultKind::None;
    std::string error_message;
};

// A private duplex JSON-RPC channel to one backend.
class BackendChannel {
public:
    virtual ~BackendChannel() = default;

    // Launch the backend and connect. Returns false with error_message filled in.
    virtual bool open(std::string &error_message) = 0;

    // Send a request and wait for its reply, at most timeout (zero or negative
    // means no limit) and never past a shutdown request.
    // Safe to call from several threads at once.
    virtual ExchangeResult request(const std::string &method, const json &params,
                                   std::chrono::milliseconds timeout,
                                   const shutdown_token::ShutdownToken *shutdown) = 0;

    virtual bool notify(const std::string &method, const json &params, std::string &error_message) = 0;

    // False once the backend has exited or the channel broke.
    virtual bool is_alive() const = 0;

    // Close the channel and terminate the backend. Idempotent.
    virtual void close() = 0;
};

using ChannelFactory = std::function<std::unique_ptr<BackendChannel>(const BackendSpec &spec)>;

} // namespace backend

#endif // AMCPS_BACKEND_ABI_HPP
