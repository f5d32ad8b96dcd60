#include "aggregator/tool_registry.hpp"

#include "utils/debug_log.hpp"

#include <algorithm>
#include <mutex>

namespace tool_registry {

std::string sanitize(const std::string &name) {
    std::string result = name;
    std::replace(result.begin(), result.end(), '-', '_');
    return result;
}

std::string public_name(const std::string &backend_name, const std::string &original_name) {
    return sanitize(backend_name) + "_" + sanitize(original_name);
}

json normalize_schema(const json &schema) {
    json normalized = schema.is_object() ? schema : json::object();
    normalized["type"] = "object";
    if (!normalized.contains("properties") || !normalized["properties"].is_object()) {
        normalized["properties"] = json::object();
    }
    return normalized;
}

std::size_t ToolRegistry::register_tools(const std::string &backend_name,
                                         const std::vector<backend::ToolDescriptor> &descriptors,
                                         const std::optional<std::vector<std::string>> &allowed_tools) {
    std::unique_lock<std::shared_mutex> lock(mappings_mutex_);
    std::size_t registered_count = 0;

    for (const auto &descriptor : descriptors) {
        if (allowed_tools.has_value()) {
            const auto &allowed = *allowed_tools;
            if (std::find(allowed.begin(), allowed.end(), descriptor.name) == allowed.end()) {
                debug_log::log("Tool " + descriptor.name + " of backend " + backend_name + " not in allow-list, skipped");
                continue;
            }
        }

        ToolMapping mapping;
        mapping.public_name = public_name(backend_name, descriptor.name);
        mapping.backend_name = backend_name;
        mapping.original_name = descriptor.name;
        mapping.descriptor = descriptor;

        auto existing = mappings_.find(mapping.public_name);
        if (existing != mappings_.end()) {
            debug_log::info("Tool name collision on " + mapping.public_name + ": " + existing->second.backend_name +
                            "/" + existing->second.original_name + " replaced by " + backend_name + "/" +
                            descriptor.name);
        }
        debug_log::trace("Registered " + mapping.public_name + " -> " + backend_name + "/" + descriptor.name);
        mappings_[mapping.public_name] = std::move(mapping);
        registered_count++;
    }
    return registered_count;
}

std::vector<backend::ToolDescriptor> ToolRegistry::get_all() const {
    std::shared_lock<std::shared_mutex> lock(mappings_mutex_);
    std::vector<backend::ToolDescriptor> tools;
    tools.reserve(mappings_.size());

    for (const auto &entry : mappings_) {
        const ToolMapping &mapping = entry.second;
        backend::ToolDescriptor published;
        published.name = mapping.public_name;
        if (!mapping.descriptor.description.empty()) {
            published.description = "[" + mapping.backend_name + "] " + mapping.descriptor.description;
        }
        published.input_schema = normalize_schema(mapping.descriptor.input_schema);
        tools.push_back(std::move(published));
    }
    return tools;
}

ResolveResult ToolRegistry::resolve(const std::string &public_tool_name) const {
    std::shared_lock<std::shared_mutex> lock(mappings_mutex_);
    ResolveResult result;
    auto iterator = mappings_.find(public_tool_name);
    if (iterator == mappings_.end()) {
        return result;
    }
    result.found = true;
    result.backend_name = iterator->second.backend_name;
    result.original_name = iterator->second.original_name;
    return result;
}

std::size_t ToolRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mappings_mutex_);
    return mappings_.size();
}

} // namespace tool_registry
