#include "aggregator/aggregator_state.hpp"

#include "utils/debug_log.hpp"

namespace aggregator {

backend::StartupReport bootstrap(AggregatorState &state, const std::vector<backend::BackendSpec> &specs,
                                 const shutdown_token::ShutdownToken *shutdown) {
    debug_log::info("Starting " + std::to_string(specs.size()) + " backend(s)");
    backend::StartupReport report = state.supervisor.start_all(specs, shutdown);

    for (std::size_t index = 0; index < specs.size(); ++index) {
        const backend::BackendOutcome &outcome = report.outcomes[index];
        if (outcome.state != backend::BackendState::Ready) {
            debug_log::error("Backend " + outcome.name + " excluded (" + backend::fault_name(outcome.fault) +
                             "): " + outcome.error_message);
            continue;
        }

        const backend::BackendSpec &spec = specs[index];
        std::size_t registered = state.registry.register_tools(spec.name, state.supervisor.catalog(spec.name),
                                                               spec.allowed_tools);
        debug_log::info("Backend " + spec.name + ": " + std::to_string(registered) + " of " +
                        std::to_string(outcome.tool_count) + " tool(s) registered");
    }

    if (report.success) {
        debug_log::info("Serving " + std::to_string(state.registry.size()) + " tool(s) from " +
                        std::to_string(report.ready_count) + " backend(s)");
    }
    return report;
}

} // namespace aggregator
