#pragma once

#include "codemode/bindings.h"
#include "codemode/types.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct JSRuntime;
struct JSContext;

namespace codemode {

// Namespace under which bindings appear inside scripts.
constexpr const char* kBindingNamespace = "pg";

struct RealmLimits {
    size_t memory_limit_mb{128};
    size_t max_stack_bytes{1024 * 1024};
    size_t console_max_lines{1000};
    size_t console_max_bytes{1024 * 1024};
};

struct RunBudget {
    int timeout_ms{30000};
    int cpu_limit_ms{10000};    // 0 disables the CPU check
};

using HostCall = std::function<BindingResult(const std::string& group,
                                             const std::string& method,
                                             const std::string& params_json)>;

struct RealmOutcome {
    bool ok{false};
    ScriptValue value;
    std::string error;
    std::optional<std::string> stack;
    FailureKind kind{FailureKind::SCRIPT_ERROR};
    double cpu_time_ms{0.0};
    double memory_used_mb{0.0};
};

// A QuickJS runtime that runs one script at a time, each in a fresh context
// built from an intrinsic allowlist (no std/os modules, no module loader).
// Scripts are wrapped as `(async () => { <code> })()`; the completion value
// is JSON-encoded inside the realm and handed out as a ScriptValue.
//
// Not thread-safe except for interrupt(), which may be called from any
// thread to abort the script currently in run().
class ScriptRealm {
public:
    // Throws std::runtime_error when the runtime cannot be allocated.
    explicit ScriptRealm(const RealmLimits& limits);
    ~ScriptRealm();

    ScriptRealm(const ScriptRealm&) = delete;
    ScriptRealm& operator=(const ScriptRealm&) = delete;

    RealmOutcome run(const std::string& code, const BindingManifest& manifest,
                     const HostCall& host, const RunBudget& budget);

    void interrupt() { interrupt_requested_.store(true); }

    // False once a script left behind a job queue that could not be drained;
    // the runtime should then be discarded.
    bool usable() const { return !poisoned_; }

    std::vector<std::string> console_output() const;
    void clear_console_output();

    // Used by the native callbacks.
    struct RunState;
    void append_console(const std::string& line);

private:
    static int on_interrupt(JSRuntime* rt, void* opaque);

    RealmLimits limits_;
    JSRuntime* rt_{nullptr};
    RunState* state_{nullptr};
    std::atomic<bool> interrupt_requested_{false};
    bool poisoned_{false};

    mutable std::mutex console_mu_;
    std::vector<std::string> console_;
    size_t console_bytes_{0};
    bool console_truncated_{false};
};

// CPU time consumed by the calling thread, in milliseconds.
double thread_cpu_ms();

} // namespace codemode
