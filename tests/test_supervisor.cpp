// Tests for backend startup, partial failure, timeouts, shutdown and crash
// handling. The stdio tests spawn the fake_backend executable as a real
// subprocess.

#include "aggregator/aggregator_state.hpp"
#include "backend/backend_supervisor.hpp"
#include "backend/stdio_channel.hpp"
#include "fake_channel.hpp"
#include "utils/shutdown_token.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#ifndef AMCPS_FAKE_BACKEND_PATH
#error "AMCPS_FAKE_BACKEND_PATH must point at the fake_backend executable"
#endif

using json = nlohmann::json;

namespace test_supervisor {

static bool check(bool condition, const std::string &description) {
    std::cout << (condition ? "  OK: " : "  FAIL: ") << description << std::endl;
    return condition;
}

static backend::BackendSpec fake_backend(const std::string &name, const std::vector<std::string> &arguments) {
    backend::BackendSpec spec;
    spec.name = name;
    spec.command = AMCPS_FAKE_BACKEND_PATH;
    spec.arguments = arguments;
    return spec;
}

static long elapsed_since(std::chrono::steady_clock::time_point start) {
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

static backend::SupervisorOptions short_timeouts(long initialize_milliseconds) {
    backend::SupervisorOptions options;
    options.initialize_timeout = std::chrono::milliseconds(initialize_milliseconds);
    return options;
}

// --- In-process fakes ---

static bool test_all_backends_fail() {
    auto log = std::make_shared<fake_channel::Log>();
    std::map<std::string, fake_channel::Script> scripts;
    scripts["a"].fail_open = true;
    scripts["b"].fail_initialize = true;
    scripts["c"].fail_discovery = true;

    backend::BackendSupervisor supervisor(backend::SupervisorOptions(), fake_channel::make_factory(scripts, log));
    backend::StartupReport report = supervisor.start_all(
        {fake_channel::make_spec("a"), fake_channel::make_spec("b"), fake_channel::make_spec("c")}, nullptr);

    bool success = check(!report.success && report.fault == backend::FaultKind::AllBackendsFailedFault,
                         "zero Ready backends yields AllBackendsFailedFault");
    success &= check(report.outcomes.size() == 3 && report.outcomes[0].name == "a" && report.outcomes[2].name == "c",
                     "outcomes are reported in configuration order");
    success &= check(report.outcomes[0].fault == backend::FaultKind::BackendInitFault &&
                         report.outcomes[1].fault == backend::FaultKind::BackendInitFault &&
                         report.outcomes[2].fault == backend::FaultKind::BackendDiscoveryFault,
                     "each failure carries its fault kind");
    success &= check(supervisor.backend_names().empty(), "no failed backend is kept");
    return success;
}

static bool test_handshake_contents() {
    auto log = std::make_shared<fake_channel::Log>();
    std::map<std::string, fake_channel::Script> scripts;
    scripts["only"].tool_names = {"x"};

    backend::SupervisorOptions options;
    options.protocol_version = "2025-03-26";
    backend::BackendSupervisor supervisor(options, fake_channel::make_factory(scripts, log));
    backend::StartupReport report = supervisor.start_all({fake_channel::make_spec("only")}, nullptr);
    if (!check(report.success, "single backend starts")) {
        return false;
    }

    std::vector<fake_channel::RecordedRequest> requests = log->requests;
    bool success = check(requests.size() >= 3 && requests[0].method == "initialize" &&
                             requests[1].method == "notifications/initialized" && requests[2].method == "tools/list",
                         "initialize, notifications/initialized, then tools/list");
    if (requests.empty()) {
        return false;
    }
    const json &params = requests[0].params;
    success &= check(params["protocolVersion"] == "2025-03-26" && params["capabilities"] == json::object() &&
                         params["clientInfo"]["name"] == "amcps" && params["clientInfo"]["version"] == "1.0.0",
                     "handshake sends the protocol version and the fixed identity");
    return success;
}

static bool test_hung_backend_is_abandoned() {
    auto log = std::make_shared<fake_channel::Log>();
    std::map<std::string, fake_channel::Script> scripts;
    scripts["slow"].hang_initialize = true;
    scripts["fast"].tool_names = {"t"};

    backend::BackendSupervisor supervisor(short_timeouts(300), fake_channel::make_factory(scripts, log));
    auto start = std::chrono::steady_clock::now();
    backend::StartupReport report =
        supervisor.start_all({fake_channel::make_spec("slow"), fake_channel::make_spec("fast")}, nullptr);
    long elapsed = elapsed_since(start);

    bool success = check(report.success && report.ready_count == 1 && supervisor.has_backend("fast") &&
                             !supervisor.has_backend("slow"),
                         "hung backend fails, the other one serves");
    success &= check(elapsed < 3000, "startup finishes near the timeout (" + std::to_string(elapsed) + " ms)");
    success &= check(log->closed_count >= 1, "the hung backend's channel is closed");
    return success;
}

static bool test_shutdown_cancels_startup() {
    auto log = std::make_shared<fake_channel::Log>();
    std::map<std::string, fake_channel::Script> scripts;
    scripts["slow"].hang_initialize = true;

    shutdown_token::ShutdownToken shutdown;
    backend::BackendSupervisor supervisor(short_timeouts(60000), fake_channel::make_factory(scripts, log));
    std::thread requester([&shutdown]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        shutdown.request();
    });

    auto start = std::chrono::steady_clock::now();
    backend::StartupReport report = supervisor.start_all({fake_channel::make_spec("slow")}, &shutdown);
    long elapsed = elapsed_since(start);
    requester.join();

    bool success = check(!report.success && elapsed < 3000,
                         "shutdown request cuts the startup wait short (" + std::to_string(elapsed) + " ms)");
    success &= check(report.cancelled && report.fault != backend::FaultKind::AllBackendsFailedFault,
                     "interrupted startup is reported as cancelled, not as a fatal fault");
    return success;
}

static bool test_registration_follows_config_order() {
    auto log = std::make_shared<fake_channel::Log>();
    std::map<std::string, fake_channel::Script> scripts;
    // "a-b"/"c" and "a"/"b-c" derive the same public name "a_b_c".
    scripts["a-b"].tool_names = {"c"};
    scripts["a"].tool_names = {"b-c"};

    backend::SupervisorOptions options;
    options.startup_parallelism = 2;
    aggregator::AggregatorState state(options, fake_channel::make_factory(scripts, log));
    aggregator::bootstrap(state, {fake_channel::make_spec("a-b"), fake_channel::make_spec("a")}, nullptr);

    tool_registry::ResolveResult hit = state.registry.resolve("a_b_c");
    return check(hit.found && hit.backend_name == "a", "the later configured backend wins a collision");
}

static bool test_allow_list_applied_at_bootstrap() {
    auto log = std::make_shared<fake_channel::Log>();
    std::map<std::string, fake_channel::Script> scripts;
    scripts["test-server"].tool_names = {"tool1", "tool2"};

    backend::BackendSpec spec = fake_channel::make_spec("test-server");
    spec.allowed_tools = std::vector<std::string>{"tool1", "non-existent"};
    aggregator::AggregatorState state(backend::SupervisorOptions(), fake_channel::make_factory(scripts, log));
    backend::StartupReport report = aggregator::bootstrap(state, {spec}, nullptr);

    std::vector<backend::ToolDescriptor> tools = state.registry.get_all();
    return check(report.success && tools.size() == 1 && tools[0].name == "test_server_tool1",
                 "bootstrap registers only allow-listed tools");
}

// --- Real subprocesses ---

static bool test_stdio_backend_round_trip() {
    backend::BackendSupervisor supervisor{backend::SupervisorOptions()};
    backend::StartupReport report =
        supervisor.start_all({fake_backend("fake", {"--tools", "alpha,beta-gamma", "--noisy", "--ping-client"})}, nullptr);
    if (!check(report.success, "fake backend process starts: " + report.error_message)) {
        return false;
    }

    std::vector<backend::ToolDescriptor> catalog = supervisor.catalog("fake");
    bool success = check(catalog.size() == 2 && catalog[1].name == "beta-gamma",
                         "catalog comes from the backend's tools/list");

    json params = {{"name", "alpha"}, {"arguments", {{"text", "héllo"}}}};
    backend::ExchangeResult reply =
        supervisor.call("fake", "tools/call", params, std::chrono::milliseconds(5000), nullptr);
    success &= check(reply.success && reply.result["received"] == params,
                     "tools/call round-trips over the stdio channel");

    backend::ExchangeResult failure = supervisor.call("fake", "tools/call", {{"name", "fail"}},
                                                      std::chrono::milliseconds(5000), nullptr);
    success &= check(!failure.success && failure.error_object["code"] == -32000 &&
                         failure.error_object["data"]["tool"] == "fail",
                     "backend error object is returned intact");

    supervisor.shutdown();
    backend::ExchangeResult after = supervisor.call("fake", "tools/call", params, std::chrono::milliseconds(1000), nullptr);
    success &= check(!after.success && after.fault == backend::FaultKind::BackendTransportFault,
                     "calls after shutdown are transport faults");
    return success;
}

// Startup workers block SIGINT/SIGTERM and the runner ignores SIGPIPE; none of
// that may reach the backend, or SIGTERM teardown would never work.
static bool test_stdio_backend_signal_state() {
    backend::BackendSupervisor supervisor{backend::SupervisorOptions()};
    backend::StartupReport report = supervisor.start_all({fake_backend("sig", {"--tools", "signals"})}, nullptr);
    if (!check(report.success, "fake backend process starts: " + report.error_message)) {
        return false;
    }

    backend::ExchangeResult reply = supervisor.call("sig", "tools/call", {{"name", "signals"}},
                                                    std::chrono::milliseconds(5000), nullptr);
    if (!check(reply.success && reply.result.contains("signals"), "backend reports its signal state")) {
        return false;
    }
    const json &state = reply.result["signals"];
    bool success = check(state["blocked"] == json::array(),
                         "backend starts with no blocked signals (got " + state["blocked"].dump() + ")");
    success &= check(state["sigpipe_default"] == true, "backend starts with the default SIGPIPE disposition");
    return success;
}

static bool test_stdio_pagination() {
    backend::BackendSupervisor supervisor{backend::SupervisorOptions()};
    backend::StartupReport report =
        supervisor.start_all({fake_backend("paged", {"--tools", "a,b,c,d,e", "--page-size", "2"})}, nullptr);
    return check(report.success && supervisor.catalog("paged").size() == 5, "tools/list pages are followed to the end");
}

static bool test_stdio_startup_failures() {
    backend::BackendSupervisor supervisor(short_timeouts(500));
    backend::BackendSpec missing;
    missing.name = "missing";
    missing.command = "/nonexistent/amcps-no-such-backend";

    auto start = std::chrono::steady_clock::now();
    backend::StartupReport report = supervisor.start_all(
        {missing, fake_backend("refuses", {"--fail-init"}), fake_backend("quits", {"--exit-on-start"}),
         fake_backend("hangs", {"--hang"}), fake_backend("good", {"--tools", "ok"})},
        nullptr);
    long elapsed = elapsed_since(start);

    bool success = check(report.success && report.ready_count == 1 && supervisor.has_backend("good"),
                         "only the healthy backend is Ready");
    for (std::size_t index = 0; index < 4; ++index) {
        success &= check(report.outcomes[index].state == backend::BackendState::Failed &&
                             report.outcomes[index].fault == backend::FaultKind::BackendInitFault,
                         report.outcomes[index].name + " fails with BackendInitFault: " +
                             report.outcomes[index].error_message);
    }
    success &= check(elapsed < 10000, "hung backend is abandoned after its timeout (" + std::to_string(elapsed) + " ms)");
    return success;
}

static bool test_stdio_crash_after_ready() {
    aggregator::AggregatorState state{backend::SupervisorOptions()};
    backend::StartupReport report = aggregator::bootstrap(
        state, {fake_backend("crashy", {"--tools", "boom", "--crash-on-call"}), fake_backend("steady", {"--tools", "ok"})},
        nullptr);
    if (!check(report.success && report.ready_count == 2, "both backends start")) {
        return false;
    }

    backend::ExchangeResult crashed = state.supervisor.call("crashy", "tools/call", {{"name", "boom"}},
                                                            std::chrono::milliseconds(5000), nullptr);
    bool success = check(!crashed.success && crashed.fault == backend::FaultKind::BackendTransportFault,
                         "a crash mid-call is a transport fault: " + crashed.error_message);
    success &= check(state.registry.resolve("crashy_boom").found, "the crashed backend's mapping stays resolvable");

    backend::ExchangeResult again = state.supervisor.call("crashy", "tools/call", {{"name", "boom"}},
                                                          std::chrono::milliseconds(1000), nullptr);
    success &= check(!again.success && again.fault == backend::FaultKind::BackendTransportFault,
                     "later calls to the dead backend fail fast");

    backend::ExchangeResult steady = state.supervisor.call("steady", "tools/call", {{"name", "ok"}},
                                                           std::chrono::milliseconds(5000), nullptr);
    success &= check(steady.success, "the other backend keeps working");
    return success;
}

static bool test_stdio_timeout_and_shutdown() {
    backend::BackendSupervisor supervisor{backend::SupervisorOptions()};
    std::unique_ptr<backend::BackendConnection> connection = supervisor.start(fake_backend("mute", {"--hang"}));
    if (!check(connection->state() == backend::BackendState::Pending, "silent fake backend spawns")) {
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    backend::ExchangeResult timed_out =
        connection->channel().request("initialize", json::object(), std::chrono::milliseconds(300), nullptr);
    long elapsed = elapsed_since(start);
    bool success = check(!timed_out.success && timed_out.fault == backend::FaultKind::BackendTransportFault &&
                             elapsed >= 250 && elapsed < 3000,
                         "unanswered request times out (" + std::to_string(elapsed) + " ms)");

    shutdown_token::ShutdownToken shutdown;
    std::thread requester([&shutdown]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        shutdown.request();
    });
    start = std::chrono::steady_clock::now();
    backend::ExchangeResult cancelled =
        connection->channel().request("initialize", json::object(), std::chrono::milliseconds(0), &shutdown);
    elapsed = elapsed_since(start);
    requester.join();
    success &= check(!cancelled.success && elapsed < 3000,
                     "shutdown ends an unbounded wait (" + std::to_string(elapsed) + " ms)");

    connection->close();
    success &= check(!connection->channel().is_alive() && connection->state() == backend::BackendState::Closed,
                     "closed connection is Closed and its channel is not alive");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_all_backends_fail();
    all_passed &= test_handshake_contents();
    all_passed &= test_hung_backend_is_abandoned();
    all_passed &= test_shutdown_cancels_startup();
    all_passed &= test_registration_follows_config_order();
    all_passed &= test_allow_list_applied_at_bootstrap();
    all_passed &= test_stdio_backend_round_trip();
    all_passed &= test_stdio_backend_signal_state();
    all_passed &= test_stdio_pagination();
    all_passed &= test_stdio_startup_failures();
    all_passed &= test_stdio_crash_after_ready();
    all_passed &= test_stdio_timeout_and_shutdown();
    return all_passed;
}

} // namespace test_supervisor
