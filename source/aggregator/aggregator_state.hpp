#ifndef AMCPS_AGGREGATOR_STATE_HPP
#define AMCPS_AGGREGATOR_STATE_HPP

// Everything the aggregator knows at run time: the backends (owned by the
// supervisor) and the public tool names (owned by the registry). main()
// constructs exactly one and passes it down by reference.

#include <vector>

#include "aggregator/tool_registry.hpp"
#include "backend/backend_supervisor.hpp"

namespace aggregator {

struct AggregatorState {
    explicit AggregatorState(backend::SupervisorOptions options,
                             backend::ChannelFactory channel_factory = backend::ChannelFactory())
        : supervisor(std::move(options), std::move(channel_factory)) {}

    backend::BackendSupervisor supervisor;
    tool_registry::ToolRegistry registry;
};

// Start every backend, then register the Ready ones in configuration order.
// The report fails with AllBackendsFailedFault if no backend is Ready.
backend::StartupReport bootstrap(AggregatorState &state, const std::vector<backend::BackendSpec> &specs,
                                 const shutdown_token::ShutdownToken *shutdown);

} // namespace aggregator

#endif // AMCPS_AGGREGATOR_STATE_HPP
