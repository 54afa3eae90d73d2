#include "codemode/inprocess_sandbox.h"
#include "codemode/log.h"

namespace codemode {

namespace {

RealmLimits realm_limits_for(const SandboxOptions& options) {
    RealmLimits lim;
    lim.memory_limit_mb = options.memory_limit_mb;
    return lim;
}

} // namespace

InProcessSandbox::InProcessSandbox(const SandboxOptions& options)
    : Sandbox(options),
      realm_(std::make_shared<ScriptRealm>(realm_limits_for(options))) {
    log_debug("sandbox", "inprocess sandbox ready (memory " +
                             std::to_string(options.memory_limit_mb) + "MB, timeout " +
                             std::to_string(options.timeout_ms) + "ms)");
}

InProcessSandbox::~InProcessSandbox() {
    dispose();
}

SandboxResult InProcessSandbox::run_script(const std::string& code, const ApiBindings& bindings,
                                           const RunBudget& budget) {
    std::shared_ptr<ScriptRealm> r = realm();
    if (!r) return disposed_result();

    HostCall host = [&bindings](const std::string& group, const std::string& method,
                                const std::string& params_json) {
        return invoke_binding(bindings, group, method, params_json);
    };

    RealmOutcome o = r->run(code, binding_manifest(bindings), host, budget);
    if (!o.ok && poisons_sandbox(o.kind)) healthy_.store(false);
    if (!r->usable()) healthy_.store(false);
    return to_sandbox_result(o);
}

bool InProcessSandbox::backend_healthy() const {
    std::shared_ptr<ScriptRealm> r = realm();
    return healthy_.load() && r && r->usable();
}

void InProcessSandbox::interrupt_running() {
    if (std::shared_ptr<ScriptRealm> r = realm()) r->interrupt();
}

void InProcessSandbox::release_backend() {
    std::atomic_store(&realm_, std::shared_ptr<ScriptRealm>());
}

std::vector<std::string> InProcessSandbox::console_output() const {
    std::shared_ptr<ScriptRealm> r = realm();
    if (!r) return {};
    return r->console_output();
}

void InProcessSandbox::clear_console_output() {
    if (std::shared_ptr<ScriptRealm> r = realm()) r->clear_console_output();
}

} // namespace codemode
