#include "codemode/sandbox.h"
#include "codemode/log.h"

#include <algorithm>
#include <chrono>

namespace codemode {

int effective_timeout_ms(const SandboxOptions& options, const ExecuteOptions& opts) {
    int t = options.timeout_ms;
    if (opts.timeout_ms && *opts.timeout_ms > 0) t = std::min(t, *opts.timeout_ms);
    return std::max(1, t);
}

SandboxResult disposed_result() {
    return SandboxResult::failed(FailureKind::DISPOSED, "Sandbox has been disposed");
}

SandboxResult to_sandbox_result(const RealmOutcome& o) {
    ExecutionMetrics m;
    m.cpu_time_ms = o.cpu_time_ms;
    m.memory_used_mb = o.memory_used_mb;
    if (o.ok) return SandboxResult::succeeded(o.value, m);
    return SandboxResult::failed(o.kind, o.error, o.stack, m);
}

bool poisons_sandbox(FailureKind k) {
    switch (k) {
        case FailureKind::TIMEOUT:
        case FailureKind::CPU_LIMIT:
        case FailureKind::MEMORY_LIMIT:
        case FailureKind::WORKER_CRASH:
        case FailureKind::INTERNAL:
            return true;
        default:
            return false;
    }
}

SandboxResult Sandbox::execute(const std::string& code, const ApiBindings& bindings,
                               const ExecuteOptions& opts) {
    if (disposed_.load()) return disposed_result();
    std::lock_guard<std::mutex> lk(exec_mu_);
    if (disposed_.load()) return disposed_result();

    RunBudget budget;
    budget.timeout_ms = effective_timeout_ms(options_, opts);
    budget.cpu_limit_ms = options_.cpu_limit_ms;

    auto t0 = std::chrono::steady_clock::now();
    SandboxResult r = run_script(code, bindings, budget);
    r.metrics.wall_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

    if (const ExecutionFailure* f = r.failure()) {
        if (poisons_sandbox(f->kind)) {
            log_warn("sandbox", std::string(isolation_mode_name(mode())) + " sandbox retired after " +
                                    failure_kind_name(f->kind) + ": " + f->error);
        }
    }
    return r;
}

bool Sandbox::is_healthy() const {
    return !disposed_.load() && backend_healthy();
}

void Sandbox::dispose() {
    if (disposed_.exchange(true)) return;
    interrupt_running();
    std::lock_guard<std::mutex> lk(exec_mu_);
    release_backend();
}

} // namespace codemode
