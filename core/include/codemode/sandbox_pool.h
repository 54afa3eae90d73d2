#pragma once

#include "codemode/sandbox.h"
#include "codemode/types.h"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace codemode {

// Builds one sandbox; may throw std::runtime_error.
using SandboxCreator = std::function<std::unique_ptr<Sandbox>()>;

class PoolExhaustedError : public std::runtime_error {
public:
    explicit PoolExhaustedError(int max)
        : std::runtime_error("Sandbox pool exhausted (max: " + std::to_string(max) + ")") {}
};

class PoolDisposedError : public std::runtime_error {
public:
    PoolDisposedError() : std::runtime_error("Pool has been disposed") {}
};

struct PoolStats {
    size_t available{0};
    size_t in_use{0};
    int max{0};
};

// Bounded set of sandboxes of one isolation mode.
// - acquire() fails fast with PoolExhaustedError instead of queueing
// - available + in_use (+ sandboxes being created) never exceeds max_instances
// - a background thread runs cleanup() every idle_timeout_ms
//
// Thread-safe. Sandboxes are created and disposed outside the pool lock.
class SandboxPool {
public:
    // Throws std::invalid_argument for inconsistent options.
    SandboxPool(SandboxCreator creator, const PoolOptions& options);
    ~SandboxPool();

    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    // Pre-creates min_instances sandboxes and starts the cleanup thread.
    // Idempotent. Throws PoolDisposedError after dispose().
    void initialize();

    std::shared_ptr<Sandbox> acquire();
    // Unknown or already released sandboxes are ignored.
    void release(const std::shared_ptr<Sandbox>& sandbox);

    // acquire -> execute -> release; acquire errors propagate.
    SandboxResult execute(const std::string& code, const ApiBindings& bindings,
                          const ExecuteOptions& opts = {});

    PoolStats stats() const;

    // Drops unhealthy idle sandboxes, then trims idle ones down to min_instances.
    void cleanup();

    void dispose();
    bool is_disposed() const;

    const PoolOptions& options() const { return options_; }

private:
    void cleanup_loop();

    SandboxCreator creator_;
    PoolOptions options_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::vector<std::shared_ptr<Sandbox>> available_;
    std::set<std::shared_ptr<Sandbox>> in_use_;
    int reserved_{0};   // creations in flight, counted against max
    bool initialized_{false};
    bool disposed_{false};

    std::unique_ptr<std::thread> cleanup_thread_;
};

} // namespace codemode
