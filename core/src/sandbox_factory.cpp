#include "codemode/sandbox_factory.h"
#include "codemode/config.h"
#include "codemode/inprocess_sandbox.h"
#include "codemode/log.h"

#include <mutex>

namespace codemode {

namespace {

struct FactoryState {
    std::mutex mu;
    std::optional<FactoryDefaults> defaults;
    std::optional<IsolationMode> default_mode;
};

FactoryState& state() {
    static FactoryState s;
    return s;
}

FactoryDefaults defaults_from_settings(const Settings& s) {
    FactoryDefaults d;
    d.sandbox = s.sandbox;
    d.pool = s.pool;
    d.worker = s.worker;
    d.fallback_mode = s.isolation;
    return d;
}

// Caller holds state().mu.
const FactoryDefaults& defaults_locked(FactoryState& st) {
    if (!st.defaults) st.defaults = defaults_from_settings(load_settings());
    return *st.defaults;
}

} // namespace

FactoryDefaults factory_defaults() {
    FactoryState& st = state();
    std::lock_guard<std::mutex> lk(st.mu);
    return defaults_locked(st);
}

void set_factory_defaults(const FactoryDefaults& d) {
    FactoryState& st = state();
    std::lock_guard<std::mutex> lk(st.mu);
    st.defaults = d;
}

void set_default_sandbox_mode(IsolationMode mode) {
    {
        FactoryState& st = state();
        std::lock_guard<std::mutex> lk(st.mu);
        st.default_mode = mode;
    }
    log_info("factory", std::string("sandbox default mode set to: ") + isolation_mode_name(mode));
}

IsolationMode default_sandbox_mode() {
    FactoryState& st = state();
    std::lock_guard<std::mutex> lk(st.mu);
    if (st.default_mode) return *st.default_mode;
    return defaults_locked(st).fallback_mode;
}

void reset_default_sandbox_mode() {
    FactoryState& st = state();
    std::lock_guard<std::mutex> lk(st.mu);
    st.default_mode.reset();
}

std::vector<IsolationMode> available_sandbox_modes() {
    return {IsolationMode::IN_PROCESS, IsolationMode::PROCESS};
}

SandboxModeInfo sandbox_mode_info(IsolationMode mode) {
    switch (mode) {
        case IsolationMode::PROCESS:
            return {
                "Worker Process",
                "Separate QuickJS runtime in a child process per sandbox",
                "Higher overhead (process start per sandbox, IPC per bound call)",
                "Enhanced - separate address space, rlimits, optional seccomp, hard kill on timeout",
                "codemode_worker binary; seccomp needs Linux",
            };
        case IsolationMode::IN_PROCESS:
            break;
    }
    return {
        "In-Process Realm",
        "Fresh QuickJS context per execution inside the host process",
        "Low overhead (reusable runtimes)",
        "Standard - restricted globals, heap and time limits",
        "QuickJS (linked in)",
    };
}

std::unique_ptr<Sandbox> make_sandbox(IsolationMode mode, const SandboxOptions& options,
                                      const WorkerConfig& worker) {
    switch (mode) {
        case IsolationMode::PROCESS:
            return std::make_unique<ProcessSandbox>(options, worker);
        case IsolationMode::IN_PROCESS:
            break;
    }
    return std::make_unique<InProcessSandbox>(options);
}

SandboxCreator sandbox_creator(IsolationMode mode, const SandboxOptions& options,
                               const WorkerConfig& worker) {
    return [mode, options, worker]() { return make_sandbox(mode, options, worker); };
}

std::unique_ptr<Sandbox> create_sandbox(std::optional<IsolationMode> mode, const SandboxOverrides& overrides) {
    const IsolationMode m = mode ? *mode : default_sandbox_mode();
    const FactoryDefaults d = factory_defaults();
    return make_sandbox(m, merge_sandbox_options(d.sandbox, overrides), d.worker);
}

std::unique_ptr<SandboxPool> create_sandbox_pool(std::optional<IsolationMode> mode,
                                                 std::optional<PoolOptions> pool,
                                                 const SandboxOverrides& overrides) {
    const IsolationMode m = mode ? *mode : default_sandbox_mode();
    const FactoryDefaults d = factory_defaults();
    return std::make_unique<SandboxPool>(
        sandbox_creator(m, merge_sandbox_options(d.sandbox, overrides), d.worker),
        pool ? *pool : d.pool);
}

} // namespace codemode
