#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace codemode {

// Where a sandbox runs scripts: a QuickJS realm inside this process, or a
// QuickJS realm inside a separate worker process.
enum class IsolationMode { IN_PROCESS, PROCESS };

// "inprocess" / "process"
const char* isolation_mode_name(IsolationMode m);

// Accepts the canonical names plus the aliases "vm" and "worker".
std::optional<IsolationMode> parse_isolation_mode(const std::string& s);

// Per-sandbox limits. Fixed once the sandbox exists.
struct SandboxOptions {
    size_t memory_limit_mb{128};
    int timeout_ms{30000};
    int cpu_limit_ms{10000};
};

// Caller overrides merged onto factory defaults at creation time.
struct SandboxOverrides {
    std::optional<size_t> memory_limit_mb;
    std::optional<int> timeout_ms;
    std::optional<int> cpu_limit_ms;
};

SandboxOptions merge_sandbox_options(const SandboxOptions& base, const SandboxOverrides& o);

struct PoolOptions {
    int min_instances{2};
    int max_instances{10};
    int idle_timeout_ms{60000};
};

// Empty string when the options satisfy 0 <= min <= max and a positive idle timeout.
std::string validate_pool_options(const PoolOptions& o);

// cpu_time_ms comes from the thread or worker CPU clock, never from wall time.
struct ExecutionMetrics {
    double wall_time_ms{0.0};
    double cpu_time_ms{0.0};
    double memory_used_mb{0.0};
};

// A script's completion value as seen from the host.
// type is the JavaScript typeof; json is absent when JSON.stringify could not
// represent the value (functions, symbols, cycles, BigInt).
struct ScriptValue {
    std::string type{"undefined"};
    std::optional<std::string> json;

    bool is_undefined() const { return type == "undefined"; }
};

enum class FailureKind {
    SCRIPT_ERROR,
    TIMEOUT,
    CPU_LIMIT,
    MEMORY_LIMIT,
    STALLED,
    DISPOSED,
    WORKER_CRASH,
    INTERNAL,
};

const char* failure_kind_name(FailureKind k);
std::optional<FailureKind> parse_failure_kind(const std::string& s);

struct ExecutionSuccess {
    ScriptValue value;
};

struct ExecutionFailure {
    std::string error;
    std::optional<std::string> stack;
    FailureKind kind{FailureKind::SCRIPT_ERROR};
};

struct SandboxResult {
    std::variant<ExecutionSuccess, ExecutionFailure> outcome;
    ExecutionMetrics metrics;

    bool ok() const { return std::holds_alternative<ExecutionSuccess>(outcome); }
    const ExecutionSuccess* success() const { return std::get_if<ExecutionSuccess>(&outcome); }
    const ExecutionFailure* failure() const { return std::get_if<ExecutionFailure>(&outcome); }

    static SandboxResult succeeded(ScriptValue v, const ExecutionMetrics& m);
    static SandboxResult failed(FailureKind kind, std::string error,
                                std::optional<std::string> stack = std::nullopt,
                                const ExecutionMetrics& m = {});
};

std::string timeout_error_text(int timeout_ms);

} // namespace codemode
