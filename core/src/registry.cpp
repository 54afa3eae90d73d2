#include "codemode/registry.h"

#include <cctype>
#include <stdexcept>

namespace codemode {

std::string tool_name_to_method_name(const std::string& tool_name, const std::string& group) {
    std::string name = tool_name;
    if (name.compare(0, 3, "pg_") == 0) name.erase(0, 3);

    std::string prefix = group;
    for (auto& c : prefix) {
        if (c == '-') c = '_';
    }
    prefix += "_";
    if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
        name.erase(0, prefix.size());
    }

    std::string out;
    out.reserve(name.size());
    for (size_t i = 0; i < name.size(); i++) {
        if (name[i] == '_' && i + 1 < name.size() && std::islower(static_cast<unsigned char>(name[i + 1]))) {
            out.push_back((char)std::toupper(static_cast<unsigned char>(name[i + 1])));
            i++;
        } else {
            out.push_back(name[i]);
        }
    }
    return out;
}

void ToolRegistry::register_tool(const ToolDefinition& def, bool allow_override) {
    if (def.name.empty()) throw std::runtime_error("tool definition without a name");
    if (def.group.empty()) throw std::runtime_error("tool has no group: " + def.name);
    if (!def.handler) throw std::runtime_error("tool has no handler: " + def.name);

    const std::string method = tool_name_to_method_name(def.name, def.group);
    auto& group = methods_[def.group];
    auto existing = group.find(method);

    if (!allow_override) {
        if (tools_.count(def.name)) throw std::runtime_error("duplicate tool in registry: " + def.name);
        if (existing != group.end()) {
            throw std::runtime_error("tool " + def.name + " collides with " + existing->second +
                                     " as " + def.group + "." + method);
        }
    } else if (existing != group.end() && existing->second != def.name) {
        tools_.erase(existing->second);
    }

    auto prev = tools_.find(def.name);
    if (prev != tools_.end() && (prev->second.group != def.group)) {
        methods_[prev->second.group].erase(tool_name_to_method_name(def.name, prev->second.group));
    }
    tools_[def.name] = def;
    group[method] = def.name;
}

const ToolDefinition* ToolRegistry::get_tool(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) return nullptr;
    return &it->second;
}

std::map<std::string, size_t> ToolRegistry::available_groups() const {
    std::map<std::string, size_t> out;
    for (const auto& g : methods_) {
        if (!g.second.empty()) out[g.first] = g.second.size();
    }
    return out;
}

std::vector<std::string> ToolRegistry::group_methods(const std::string& group) const {
    std::vector<std::string> out;
    auto it = methods_.find(group);
    if (it == methods_.end()) return out;
    for (const auto& m : it->second) out.push_back(m.first);
    return out;
}

ApiBindings ToolRegistry::sandbox_bindings() {
    ApiBindings b;
    for (const auto& g : methods_) {
        for (const auto& m : g.second) {
            auto it = tools_.find(m.second);
            if (it == tools_.end()) continue;
            b[g.first][m.first] = it->second.handler;
        }
    }
    return b;
}

} // namespace codemode
