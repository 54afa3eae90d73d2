#pragma once

#include "codemode/bindings.h"
#include "codemode/config.h"
#include "codemode/sandbox_pool.h"
#include "codemode/security.h"
#include "codemode/types.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace codemode {

constexpr int kMaxRequestTimeoutMs = 30000;

struct ExecuteCodeRequest {
    std::string code;
    std::optional<int> timeout_ms;   // clamped to [1, 30000], never above the sandbox limit
    bool readonly{false};            // recorded in the audit trail only
    std::optional<std::string> caller_id;
};

struct ExecuteCodeResponse {
    bool success{false};
    std::optional<std::string> result_json;   // absent when the script returned undefined
    std::optional<std::string> error;
    std::optional<std::string> stack;
    ExecutionMetrics metrics;
    std::optional<std::string> hint;

    std::string to_json() const;
};

// The single entry point for running caller-supplied scripts:
// validate -> rate limit -> fetch bindings -> pooled sandbox -> sanitize -> audit.
// Every path ends in a response; nothing thrown by the pool escapes execute().
class CodeExecutionTool {
public:
    // Throws std::invalid_argument for bad settings (pool sizes, blocked
    // patterns) and std::runtime_error if the audit file cannot be opened.
    CodeExecutionTool(BindingProvider& provider, Settings settings,
                      SecurityManager::ClockFn clock = nullptr);
    ~CodeExecutionTool();

    CodeExecutionTool(const CodeExecutionTool&) = delete;
    CodeExecutionTool& operator=(const CodeExecutionTool&) = delete;

    // Creates the sandbox pool. Idempotent; may run again after shutdown().
    void initialize();
    // Disposes the pool. No-op when not initialized.
    void shutdown();
    bool initialized() const;

    ExecuteCodeResponse execute(const ExecuteCodeRequest& req);

    std::optional<PoolStats> pool_stats() const;
    SecurityManager& security() { return security_; }
    const Settings& settings() const { return settings_; }

private:
    std::shared_ptr<SandboxPool> pool() const;

    BindingProvider& provider_;
    Settings settings_;
    SecurityManager security_;

    mutable std::mutex mu_;
    std::shared_ptr<SandboxPool> pool_;
};

} // namespace codemode
