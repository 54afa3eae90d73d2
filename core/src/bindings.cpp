#include "codemode/bindings.h"

#include <exception>

namespace codemode {

size_t count_bound_methods(const ApiBindings& b) {
    size_t n = 0;
    for (const auto& g : b) n += g.second.size();
    return n;
}

BindingManifest binding_manifest(const ApiBindings& b) {
    BindingManifest m;
    for (const auto& g : b) {
        auto& methods = m[g.first];
        for (const auto& kv : g.second) {
            if (kv.second) methods.push_back(kv.first);
        }
    }
    return m;
}

BindingResult invoke_binding(const ApiBindings& b, const std::string& group,
                             const std::string& method, const std::string& params_json) {
    auto g = b.find(group);
    if (g == b.end()) return BindingResult::fail("pg." + group + " is not defined");
    auto m = g->second.find(method);
    if (m == g->second.end() || !m->second) {
        return BindingResult::fail("pg." + group + "." + method + " is not a function");
    }
    try {
        return m->second(params_json);
    } catch (const std::exception& e) {
        return BindingResult::fail(e.what());
    }
}

} // namespace codemode
