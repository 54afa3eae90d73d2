#include "codemode/types.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace codemode {

const char* isolation_mode_name(IsolationMode m) {
    switch (m) {
        case IsolationMode::IN_PROCESS: return "inprocess";
        case IsolationMode::PROCESS:    return "process";
    }
    return "inprocess";
}

std::optional<IsolationMode> parse_isolation_mode(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "inprocess" || v == "in-process" || v == "vm") return IsolationMode::IN_PROCESS;
    if (v == "process" || v == "worker") return IsolationMode::PROCESS;
    return std::nullopt;
}

SandboxOptions merge_sandbox_options(const SandboxOptions& base, const SandboxOverrides& o) {
    SandboxOptions out = base;
    if (o.memory_limit_mb) out.memory_limit_mb = *o.memory_limit_mb;
    if (o.timeout_ms) out.timeout_ms = *o.timeout_ms;
    if (o.cpu_limit_ms) out.cpu_limit_ms = *o.cpu_limit_ms;
    return out;
}

std::string validate_pool_options(const PoolOptions& o) {
    if (o.min_instances < 0) return "min_instances must be >= 0";
    if (o.max_instances < 0) return "max_instances must be >= 0";
    if (o.min_instances > o.max_instances) {
        return "min_instances (" + std::to_string(o.min_instances) +
               ") exceeds max_instances (" + std::to_string(o.max_instances) + ")";
    }
    if (o.idle_timeout_ms <= 0) return "idle_timeout_ms must be > 0";
    return {};
}

const char* failure_kind_name(FailureKind k) {
    switch (k) {
        case FailureKind::SCRIPT_ERROR: return "script_error";
        case FailureKind::TIMEOUT:      return "timeout";
        case FailureKind::CPU_LIMIT:    return "cpu_limit";
        case FailureKind::MEMORY_LIMIT: return "memory_limit";
        case FailureKind::STALLED:      return "stalled";
        case FailureKind::DISPOSED:     return "disposed";
        case FailureKind::WORKER_CRASH: return "worker_crash";
        case FailureKind::INTERNAL:     return "internal";
    }
    return "internal";
}

std::optional<FailureKind> parse_failure_kind(const std::string& s) {
    static const FailureKind all[] = {
        FailureKind::SCRIPT_ERROR, FailureKind::TIMEOUT, FailureKind::CPU_LIMIT,
        FailureKind::MEMORY_LIMIT, FailureKind::STALLED, FailureKind::DISPOSED,
        FailureKind::WORKER_CRASH, FailureKind::INTERNAL,
    };
    for (FailureKind k : all) {
        if (s == failure_kind_name(k)) return k;
    }
    return std::nullopt;
}

SandboxResult SandboxResult::succeeded(ScriptValue v, const ExecutionMetrics& m) {
    SandboxResult r{ExecutionSuccess{std::move(v)}, m};
    return r;
}

SandboxResult SandboxResult::failed(FailureKind kind, std::string error,
                                    std::optional<std::string> stack,
                                    const ExecutionMetrics& m) {
    SandboxResult r{ExecutionFailure{std::move(error), std::move(stack), kind}, m};
    return r;
}

std::string timeout_error_text(int timeout_ms) {
    return "Execution timeout: exceeded " + std::to_string(timeout_ms) + "ms limit";
}

} // namespace codemode
