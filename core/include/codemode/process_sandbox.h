#pragma once

#include "codemode/proc.h"
#include "codemode/sandbox.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace codemode {

struct WorkerConfig {
    // Empty: CODEMODE_WORKER_BIN, then codemode_worker beside the running executable.
    std::string worker_path;
    bool enable_seccomp{false};
    // Lifetime CPU budget of one worker (RLIMIT_CPU), 0 = unlimited.
    int cpu_budget_sec{600};
    // Added to the script timeout before the host gives up on the worker.
    int grace_ms{1000};
    int startup_timeout_ms{5000};
    size_t max_message_bytes{64ull * 1024 * 1024};
    // Address-space allowance on top of the script heap limit.
    size_t address_space_headroom_mb{256};
};

std::string resolve_worker_path(const std::string& configured);

// Runs scripts in a persistent codemode_worker child process. The child owns
// a QuickJS realm, runs under rlimits (and optionally a seccomp filter), and
// calls back into the host over its pipes for every bound API call, so the
// callables never leave this process.
//
// A worker that misses its deadline, crashes or breaks protocol is killed
// and the sandbox reports itself unhealthy. An idle worker that dies is
// noticed by is_healthy(). dispose() kills a running worker and asks an
// idle one to shut down.
class ProcessSandbox : public Sandbox {
public:
    // Spawns the worker and waits for its handshake.
    // Throws std::runtime_error when the worker cannot be started.
    ProcessSandbox(const SandboxOptions& options, const WorkerConfig& config);
    ~ProcessSandbox() override;

    IsolationMode mode() const override { return IsolationMode::PROCESS; }
    std::vector<std::string> console_output() const override;
    void clear_console_output() override;

    int worker_pid() const { return pid_.load(); }
    // Exit code of the last worker this sandbox stopped (see describe_exit_code), -1 if none.
    int last_exit_code() const { return last_exit_code_.load(); }

protected:
    SandboxResult run_script(const std::string& code, const ApiBindings& bindings,
                             const RunBudget& budget) override;
    bool backend_healthy() const override;
    void interrupt_running() override;
    void release_backend() override;

private:
    bool start_worker(std::string* err);
    SandboxResult abandon_worker(FailureKind kind, const std::string& error);
    // Clears pid_ before the child is reaped.
    void forget_pid();

    WorkerConfig config_;
    ChildProcess child_;
    LineReader reader_;
    uint64_t next_id_{1};

    std::mutex pid_mu_;  // orders interrupt kill() against reaping
    std::atomic<int> pid_{-1};
    std::atomic<bool> healthy_{true};
    std::atomic<bool> running_{false};
    std::atomic<int> last_exit_code_{-1};

    mutable std::mutex console_mu_;
    std::vector<std::string> console_;
};

} // namespace codemode
