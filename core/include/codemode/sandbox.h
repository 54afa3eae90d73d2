#pragma once

#include "codemode/bindings.h"
#include "codemode/realm.h"
#include "codemode/types.h"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace codemode {

struct ExecuteOptions {
    // Soft hint; clamped to the sandbox's configured timeout.
    std::optional<int> timeout_ms;
};

int effective_timeout_ms(const SandboxOptions& options, const ExecuteOptions& opts);

// One isolation context that runs at most one script at a time.
//
// execute() never throws for script-level problems: timeouts, uncaught
// exceptions, worker crashes and use after dispose() all come back as a
// failed SandboxResult. dispose() is idempotent and may be called from any
// thread; a script running at that moment is aborted first.
class Sandbox {
public:
    explicit Sandbox(const SandboxOptions& options) : options_(options) {}
    virtual ~Sandbox() = default;

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    SandboxResult execute(const std::string& code, const ApiBindings& bindings,
                          const ExecuteOptions& opts = {});

    bool is_healthy() const;
    bool is_disposed() const { return disposed_.load(); }
    void dispose();

    const SandboxOptions& options() const { return options_; }

    virtual IsolationMode mode() const = 0;
    virtual std::vector<std::string> console_output() const = 0;
    virtual void clear_console_output() = 0;

protected:
    // Called with the execution lock held.
    virtual SandboxResult run_script(const std::string& code, const ApiBindings& bindings,
                                     const RunBudget& budget) = 0;
    virtual bool backend_healthy() const = 0;
    // Any thread; must not block on the execution lock.
    virtual void interrupt_running() = 0;
    // Execution lock held, nothing running.
    virtual void release_backend() = 0;

private:
    SandboxOptions options_;
    std::atomic<bool> disposed_{false};
    std::mutex exec_mu_;
};

SandboxResult disposed_result();

// Maps a realm outcome (local or received from a worker) onto the result
// contract. Wall time is filled in by Sandbox::execute.
SandboxResult to_sandbox_result(const RealmOutcome& o);

// Failures after which a sandbox should not be reused.
bool poisons_sandbox(FailureKind k);

} // namespace codemode
