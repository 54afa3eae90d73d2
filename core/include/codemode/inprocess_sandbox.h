#pragma once

#include "codemode/realm.h"
#include "codemode/sandbox.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace codemode {

// Runs scripts in a QuickJS realm owned by this process. The fastest mode:
// no process boundary, but a runaway script shares the host's address space
// (the realm's heap is capped by the runtime memory limit).
class InProcessSandbox : public Sandbox {
public:
    // Throws std::runtime_error if the QuickJS runtime cannot be created.
    explicit InProcessSandbox(const SandboxOptions& options);
    ~InProcessSandbox() override;

    IsolationMode mode() const override { return IsolationMode::IN_PROCESS; }
    std::vector<std::string> console_output() const override;
    void clear_console_output() override;

protected:
    SandboxResult run_script(const std::string& code, const ApiBindings& bindings,
                             const RunBudget& budget) override;
    bool backend_healthy() const override;
    void interrupt_running() override;
    void release_backend() override;

private:
    std::shared_ptr<ScriptRealm> realm() const { return std::atomic_load(&realm_); }

    std::shared_ptr<ScriptRealm> realm_;
    std::atomic<bool> healthy_{true};
};

} // namespace codemode
