#pragma once

#include "codemode/bindings.h"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace codemode {

using ToolHandler = BoundMethod;

// One host API operation, exposed to scripts as pg.<group>.<method>.
struct ToolDefinition {
    std::string name;          // e.g. "pg_jsonb_extract"
    std::string group;         // e.g. "jsonb"
    std::string description;
    ToolHandler handler;
};

// pg_read_query -> readQuery; pg_jsonb_extract (group jsonb) -> extract.
// Hyphens in the group name match underscores in the tool name.
std::string tool_name_to_method_name(const std::string& tool_name, const std::string& group);

// Holds the tools available to scripts and hands them out grouped by
// method name. Not thread-safe for registration; sandbox_bindings() returns
// an independent copy.
class ToolRegistry : public BindingProvider {
public:
    // If allow_override is false, duplicate names (or names mapping to the
    // same group method) throw std::runtime_error.
    void register_tool(const ToolDefinition& def, bool allow_override = false);

    const ToolDefinition* get_tool(const std::string& name) const;
    size_t size() const { return tools_.size(); }

    // group -> number of tools
    std::map<std::string, size_t> available_groups() const;
    std::vector<std::string> group_methods(const std::string& group) const;

    ApiBindings sandbox_bindings() override;

private:
    std::unordered_map<std::string, ToolDefinition> tools_;
    // group -> method -> tool name
    std::map<std::string, std::map<std::string, std::string>> methods_;
};

} // namespace codemode
