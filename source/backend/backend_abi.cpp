#include "backend/backend_abi.hpp"

namespace backend {

const char *fault_name(FaultKind fault) {
    switch (fault) {
    case FaultKind::None:
        return "None";
    case FaultKind::ConfigFault:
        return "ConfigFault";
    case FaultKind::BackendInitFault:
        return "BackendInitFault";
    case FaultKind::BackendDiscoveryFault:
        return "BackendDiscoveryFault";
    case FaultKind::UnknownToolFault:
        return "UnknownToolFault";
    case FaultKind::BackendTransportFault:
        return "BackendTransportFault";
    case FaultKind::AllBackendsFailedFault:
        return "AllBackendsFailedFault";
    }
    return "Unknown";
}

const char *state_name(BackendState state) {
    switch (state) {
    case BackendState::Pending:
        return "Pending";
    case BackendState::Ready:
        return "Ready";
    case BackendState::Failed:
        return "Failed";
    case BackendState::Closed:
        return "Closed";
    }
    return "Unknown";
}

bool parse_tool_descriptor(const json &entry, ToolDescriptor &descriptor) {
    if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
        return false;
    }
    descriptor.name = entry["name"].get<std::string>();
    descriptor.description.clear();
    if (entry.contains("description") && entry["description"].is_string()) {
        descriptor.description = entry["description"].get<std::string>();
    }
    descriptor.input_schema = entry.contains("inputSchema") ? entry["inputSchema"] : json();
    return true;
}

json tool_descriptor_to_json(const ToolDescriptor &descriptor) {
    json tool_entry;
    tool_entry["name"] = descriptor.name;
    tool_entry["description"] = descriptor.description;
    tool_entry["inputSchema"] = descriptor.input_schema;
    return tool_entry;
}

} // namespace backend
