#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace codemode {

// Outcome of one bound API call. result_json empty means undefined.
struct BindingResult {
    bool ok{true};
    std::string result_json;
    std::string error;

    static BindingResult value(std::string json) { return BindingResult{true, std::move(json), {}}; }
    static BindingResult fail(std::string msg) { return BindingResult{false, {}, std::move(msg)}; }
};

// params_json is the JSON text of the single argument ("null" when absent).
using BoundMethod = std::function<BindingResult(const std::string& params_json)>;

// group -> method -> callable; exposed to scripts as pg.<group>.<method>(params).
using ApiBindings = std::map<std::string, std::map<std::string, BoundMethod>>;

// group -> method names; what crosses the process boundary instead of callables.
using BindingManifest = std::map<std::string, std::vector<std::string>>;

size_t count_bound_methods(const ApiBindings& b);
BindingManifest binding_manifest(const ApiBindings& b);

// Dispatches one call. Unknown group/method and exceptions thrown by the
// method become failed results.
BindingResult invoke_binding(const ApiBindings& b, const std::string& group,
                             const std::string& method, const std::string& params_json);

// Source of the binding table handed to each execution.
class BindingProvider {
public:
    virtual ~BindingProvider() = default;
    virtual ApiBindings sandbox_bindings() = 0;
};

} // namespace codemode
