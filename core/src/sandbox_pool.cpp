#include "codemode/sandbox_pool.h"
#include "codemode/log.h"

#include <chrono>
#include <utility>

namespace codemode {

namespace {

void dispose_all(std::vector<std::shared_ptr<Sandbox>>& sandboxes) {
    for (auto& sb : sandboxes) {
        if (sb) sb->dispose();
    }
    sandboxes.clear();
}

} // namespace

SandboxPool::SandboxPool(SandboxCreator creator, const PoolOptions& options)
    : creator_(std::move(creator)), options_(options) {
    std::string bad = validate_pool_options(options_);
    if (!bad.empty()) throw std::invalid_argument("invalid pool options: " + bad);
    if (!creator_) throw std::invalid_argument("invalid pool options: no sandbox creator");
}

SandboxPool::~SandboxPool() {
    dispose();
}

void SandboxPool::initialize() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (disposed_) throw PoolDisposedError();
        if (initialized_) return;
        initialized_ = true;
    }

    log_info("pool", "initializing sandbox pool with " + std::to_string(options_.min_instances) +
                         " instances (max " + std::to_string(options_.max_instances) + ")");

    std::vector<std::shared_ptr<Sandbox>> fresh;
    fresh.reserve((size_t)options_.min_instances);
    try {
        for (int i = 0; i < options_.min_instances; i++) {
            fresh.push_back(std::shared_ptr<Sandbox>(creator_()));
        }
    } catch (const std::exception& e) {
        log_error("pool", std::string("pool initialization failed: ") + e.what());
        dispose_all(fresh);
        std::lock_guard<std::mutex> lk(mu_);
        initialized_ = false;
        throw;
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (disposed_) {
        // dispose() raced us; nothing may be parked in a dead pool.
        for (auto& sb : fresh) sb->dispose();
        throw PoolDisposedError();
    }
    for (auto& sb : fresh) {
        if ((int)(available_.size() + in_use_.size()) + reserved_ >= options_.max_instances) {
            sb->dispose();
            continue;
        }
        available_.push_back(std::move(sb));
    }
    cleanup_thread_.reset(new std::thread([this]() { cleanup_loop(); }));
}

std::shared_ptr<Sandbox> SandboxPool::acquire() {
    std::vector<std::shared_ptr<Sandbox>> discard;
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (disposed_) throw PoolDisposedError();

        while (!available_.empty()) {
            std::shared_ptr<Sandbox> sb = std::move(available_.back());
            available_.pop_back();
            if (sb->is_healthy()) {
                in_use_.insert(sb);
                lk.unlock();
                dispose_all(discard);
                return sb;
            }
            discard.push_back(std::move(sb));
        }

        if ((int)in_use_.size() + reserved_ >= options_.max_instances) {
            lk.unlock();
            dispose_all(discard);
            throw PoolExhaustedError(options_.max_instances);
        }
        reserved_++;
    }
    dispose_all(discard);

    std::shared_ptr<Sandbox> sb;
    try {
        sb = std::shared_ptr<Sandbox>(creator_());
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lk(mu_);
        reserved_--;
        log_error("pool", std::string("sandbox creation failed: ") + e.what());
        throw;
    }

    std::unique_lock<std::mutex> lk(mu_);
    reserved_--;
    if (disposed_) {
        lk.unlock();
        sb->dispose();
        throw PoolDisposedError();
    }
    in_use_.insert(sb);
    return sb;
}

void SandboxPool::release(const std::shared_ptr<Sandbox>& sandbox) {
    if (!sandbox) return;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = in_use_.find(sandbox);
        if (it == in_use_.end()) return;
        in_use_.erase(it);

        if (!disposed_ && sandbox->is_healthy() &&
            available_.size() < (size_t)options_.max_instances) {
            sandbox->clear_console_output();
            available_.push_back(sandbox);
            return;
        }
    }
    sandbox->dispose();
}

SandboxResult SandboxPool::execute(const std::string& code, const ApiBindings& bindings,
                                   const ExecuteOptions& opts) {
    std::shared_ptr<Sandbox> sb = acquire();

    struct ReleaseOnExit {
        SandboxPool* pool;
        const std::shared_ptr<Sandbox>& sb;
        ~ReleaseOnExit() { pool->release(sb); }
    } guard{this, sb};

    return sb->execute(code, bindings, opts);
}

PoolStats SandboxPool::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    PoolStats s;
    s.available = available_.size();
    s.in_use = in_use_.size();
    s.max = options_.max_instances;
    return s;
}

void SandboxPool::cleanup() {
    std::vector<std::shared_ptr<Sandbox>> discard;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (disposed_) return;

        std::vector<std::shared_ptr<Sandbox>> healthy;
        healthy.reserve(available_.size());
        for (auto& sb : available_) {
            if (sb->is_healthy()) {
                healthy.push_back(std::move(sb));
            } else {
                discard.push_back(std::move(sb));
            }
        }
        available_ = std::move(healthy);

        while (available_.size() > (size_t)options_.min_instances) {
            discard.push_back(std::move(available_.back()));
            available_.pop_back();
        }
    }
    if (!discard.empty()) {
        log_debug("pool", "cleanup disposed " + std::to_string(discard.size()) + " idle sandbox(es)");
    }
    dispose_all(discard);
}

void SandboxPool::cleanup_loop() {
    const auto period = std::chrono::milliseconds(options_.idle_timeout_ms);
    std::unique_lock<std::mutex> lk(mu_);
    while (!disposed_) {
        if (cv_.wait_for(lk, period, [this]() { return disposed_; })) break;
        lk.unlock();
        cleanup();
        lk.lock();
    }
}

void SandboxPool::dispose() {
    std::vector<std::shared_ptr<Sandbox>> discard;
    std::unique_ptr<std::thread> thread;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (disposed_) return;
        disposed_ = true;
        discard = std::move(available_);
        available_.clear();
        discard.insert(discard.end(), in_use_.begin(), in_use_.end());
        in_use_.clear();
        thread = std::move(cleanup_thread_);
    }
    cv_.notify_all();
    if (thread && thread->joinable()) thread->join();

    log_debug("pool", "disposing " + std::to_string(discard.size()) + " sandbox(es)");
    dispose_all(discard);
}

bool SandboxPool::is_disposed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return disposed_;
}

} // namespace codemode
