// AMCPS - Aggregating Model Context Protocol Server
// Entry point: starts the configured backend MCP servers and serves their
// tools to the front-end over one stdio MCP session.
//
// stdout carries JSON-RPC responses only. Logs go to stderr.

#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <map>
#include <string>
#include <signal.h>

#include "aggregator/aggregator_state.hpp"
#include "config/config.hpp"
#include "io/stdout_isolation.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_session.hpp"
#include "utils/debug_log.hpp"
#include "utils/shutdown_token.hpp"

// Set from the signal handler; every bounded wait polls it.
static shutdown_token::ShutdownToken shutdown_requested;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested.request();
}

// No SA_RESTART: a blocking read on stdin must fail with EINTR so the session
// loop sees the request.
static void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);
}

static void print_fatal(backend::FaultKind fault, const std::string &message) {
    std::cerr << "FATAL: " << backend::fault_name(fault) << ": " << message << std::endl;
}

int main(int argc, char **argv) {
    std::cerr << "[amcps] amcps - Aggregating MCP Server, build " << __DATE__ << " " << __TIME__ << std::endl;

    // Before anything else can write to stdout.
    stdout_isolation::StdoutIsolation isolation;
    std::string isolation_error;
    if (!isolation.begin(isolation_error)) {
        debug_log::error("stdout isolation unavailable, continuing without it: " + isolation_error);
    }

    install_signal_handlers();

    std::map<std::string, std::string> environment = config::read_environment();
    config::ConfigLoadResult loaded = config::load_config(argc > 1 ? argv[1] : "", environment);
    if (!loaded.success) {
        isolation.restore();
        print_fatal(backend::FaultKind::ConfigFault, loaded.error_message);
        return 1;
    }
    const config::AggregatorConfig &settings = loaded.config;

    std::string log_error;
    if (!debug_log::initialize(settings.log_level, settings.log_file, log_error)) {
        debug_log::error(log_error);
    }
    debug_log::info("Loaded " + std::to_string(settings.servers.size()) + " backend(s) from config");

    backend::SupervisorOptions supervisor_options;
    supervisor_options.protocol_version = settings.protocol_version;
    supervisor_options.initialize_timeout = std::chrono::milliseconds(settings.init_timeout_ms);
    supervisor_options.startup_parallelism = settings.startup_parallelism;

    aggregator::AggregatorState state(supervisor_options);
    backend::StartupReport report = aggregator::bootstrap(state, settings.servers, &shutdown_requested);
    if (report.cancelled || shutdown_requested.is_requested()) {
        debug_log::info("Shutdown requested during startup");
        state.supervisor.shutdown();
        isolation.restore();
        debug_log::close();
        return 0;
    }
    if (!report.success) {
        state.supervisor.shutdown();
        isolation.restore();
        print_fatal(report.fault, report.error_message);
        debug_log::close();
        return 1;
    }

    isolation.restore();

    mcp_dispatch::DispatchOptions dispatch_options;
    dispatch_options.protocol_version = settings.protocol_version;
    dispatch_options.server_name = settings.cursor_mode ? "cursor-mcp-server" : supervisor_options.identity.name;
    dispatch_options.server_version = supervisor_options.identity.version;
    dispatch_options.call_timeout = std::chrono::milliseconds(settings.call_timeout_ms);
    dispatch_options.shutdown = &shutdown_requested;

    mcp_dispatch::Dispatcher dispatcher(state, dispatch_options);
    mcp_session::SessionEnd session_end = mcp_session::run(std::cin, std::cout, dispatcher, &shutdown_requested);
    debug_log::info(std::string("Session ended (") + mcp_session::end_name(session_end) + "), shutting down");

    state.supervisor.shutdown();
    debug_log::info("amcps shut down");
    debug_log::close();

    bool clean_exit = session_end == mcp_session::SessionEnd::EndOfInput ||
                      session_end == mcp_session::SessionEnd::Shutdown;
    return clean_exit ? 0 : 1;
}
