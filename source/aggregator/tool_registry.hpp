#ifndef AMCPS_TOOL_REGISTRY_HPP
#define AMCPS_TOOL_REGISTRY_HPP

// Tool registry: maps public tool names to (backend, original name) pairs.
// Public names are derived from the backend name and the tool name, so tools
// from different backends never shadow each other unless the derived names
// are identical; in that case the later registration wins.

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "backend/backend_abi.hpp"

namespace tool_registry {

using json = nlohmann::json;

// Replace every '-' with '_'.
std::string sanitize(const std::string &name);

// sanitize(backend) + "_" + sanitize(original).
std::string public_name(const std::string &backend_name, const std::string &original_name);

// Force an MCP-compatible object schema: "type" is "object" and "properties"
// is an object. Anything that is not an object becomes an empty object schema.
json normalize_schema(const json &schema);

struct ToolMapping {
    std::string public_name;
    std::string backend_name;
    std::string original_name;
    backend::ToolDescriptor descriptor; // as the backend reported it
};

struct ResolveResult {
    bool found = false;
    std::string backend_name;
    std::string original_name;
};

class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry &) = delete;
    ToolRegistry &operator=(const ToolRegistry &) = delete;

    // Register a backend's tools. With an allow-list only the listed original
    // names are registered (an empty list registers nothing). Returns the
    // number of mappings written.
    std::size_t register_tools(const std::string &backend_name,
                               const std::vector<backend::ToolDescriptor> &descriptors,
                               const std::optional<std::vector<std::string>> &allowed_tools);

    // Published descriptors, ordered by public name.
    std::vector<backend::ToolDescriptor> get_all() const;

    ResolveResult resolve(const std::string &public_tool_name) const;

    std::size_t size() const;

private:
    mutable std::shared_mutex mappings_mutex_;
    std::map<std::string, ToolMapping> mappings_;
};

} // namespace tool_registry

#endif // AMCPS_TOOL_REGISTRY_HPP
