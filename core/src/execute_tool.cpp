#include "codemode/execute_tool.h"
#include "codemode/audit_log.h"
#include "codemode/log.h"
#include "codemode/sandbox_factory.h"

#include <algorithm>
#include <utility>

namespace codemode {

namespace {

const char* const kNotInitialized = "Code execution is not initialized";
const char* const kNoBindings = "No API bindings are available";
const char* const kRateLimited = "Rate limit exceeded. Please wait before executing more code.";

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

ExecuteCodeResponse rejected(std::string error, std::optional<std::string> hint = std::nullopt) {
    ExecuteCodeResponse r;
    r.success = false;
    r.error = std::move(error);
    r.hint = std::move(hint);
    return r;
}

std::optional<std::string> hint_for(FailureKind kind) {
    switch (kind) {
        case FailureKind::TIMEOUT:
        case FailureKind::CPU_LIMIT:
            return std::string("Do less work per execution or batch fewer API calls; long loops are cut off.");
        case FailureKind::MEMORY_LIMIT:
            return std::string("Keep intermediate results small; fetch only the rows and columns you need.");
        case FailureKind::STALLED:
            return std::string("Await only promises returned by the pg API.");
        default:
            return std::nullopt;
    }
}

std::shared_ptr<AuditLog> open_audit_log(const std::string& path) {
    return std::make_shared<AuditLog>(path);
}

} // namespace

std::string ExecuteCodeResponse::to_json() const {
    json::Doc d = json::new_object();
    json_object_object_add(d.root, "success", json_object_new_boolean(success));
    // Already valid JSON (stringified or sanitized); spliced verbatim.
    if (result_json) json_object_object_add(d.root, "result", json::new_raw(*result_json));
    if (error) json::put_string(d.root, "error", *error);
    if (stack) json::put_string(d.root, "stack", *stack);

    json_object* m = json_object_new_object();
    json_object_object_add(m, "wall_time_ms", json_object_new_double(metrics.wall_time_ms));
    json_object_object_add(m, "cpu_time_ms", json_object_new_double(metrics.cpu_time_ms));
    json_object_object_add(m, "memory_used_mb", json_object_new_double(metrics.memory_used_mb));
    json_object_object_add(d.root, "metrics", m);

    if (hint) json::put_string(d.root, "hint", *hint);
    return json::to_string(d.root);
}

CodeExecutionTool::CodeExecutionTool(BindingProvider& provider, Settings settings,
                                     SecurityManager::ClockFn clock)
    : provider_(provider),
      settings_(std::move(settings)),
      security_(settings_.security, open_audit_log(settings_.audit_log_path), std::move(clock)) {
    std::string bad = validate_pool_options(settings_.pool);
    if (!bad.empty()) throw std::invalid_argument("invalid pool options: " + bad);
}

CodeExecutionTool::~CodeExecutionTool() {
    shutdown();
}

void CodeExecutionTool::initialize() {
    std::lock_guard<std::mutex> lk(mu_);
    if (pool_) return;
    auto pool = std::make_shared<SandboxPool>(
        sandbox_creator(settings_.isolation, settings_.sandbox, settings_.worker), settings_.pool);
    pool->initialize();
    pool_ = std::move(pool);
    log_info("tool", std::string("code execution ready (") + isolation_mode_name(settings_.isolation) +
                         " sandboxes, timeout " + std::to_string(settings_.sandbox.timeout_ms) + "ms)");
}

void CodeExecutionTool::shutdown() {
    std::shared_ptr<SandboxPool> pool;
    {
        std::lock_guard<std::mutex> lk(mu_);
        pool = std::move(pool_);
        pool_.reset();
    }
    if (pool) {
        pool->dispose();
        log_info("tool", "code execution shut down");
    }
}

bool CodeExecutionTool::initialized() const {
    return pool() != nullptr;
}

std::shared_ptr<SandboxPool> CodeExecutionTool::pool() const {
    std::lock_guard<std::mutex> lk(mu_);
    return pool_;
}

std::optional<PoolStats> CodeExecutionTool::pool_stats() const {
    std::shared_ptr<SandboxPool> p = pool();
    if (!p) return std::nullopt;
    return p->stats();
}

ExecuteCodeResponse CodeExecutionTool::execute(const ExecuteCodeRequest& req) {
    std::shared_ptr<SandboxPool> p = pool();
    if (!p) return rejected(kNotInitialized, std::string("Call initialize() before executing code."));

    ValidationResult v = security_.validate_code(req.code);
    if (!v.valid) {
        return rejected("Code validation failed: " + join(v.errors, "; "),
                        std::string("Use the pg.<group>.<method>() API; host modules and dynamic code are unavailable."));
    }

    const std::string rate_key = req.caller_id.value_or("default");
    if (!security_.check_rate_limit(rate_key)) {
        return rejected(kRateLimited, std::string("Up to " +
                                                  std::to_string(security_.config().max_executions_per_minute) +
                                                  " executions per minute are allowed per caller."));
    }

    ApiBindings bindings = provider_.sandbox_bindings();
    if (count_bound_methods(bindings) == 0) {
        log_error("tool", kNoBindings);
        return rejected(kNoBindings);
    }

    ExecuteOptions opts;
    if (req.timeout_ms) opts.timeout_ms = std::clamp(*req.timeout_ms, 1, kMaxRequestTimeoutMs);

    SandboxResult result;
    try {
        result = p->execute(req.code, bindings, opts);
    } catch (const PoolExhaustedError& e) {
        log_warn("tool", e.what());
        return rejected(e.what(), std::string("All sandboxes are busy; retry shortly."));
    } catch (const std::exception& e) {
        log_error("tool", std::string("sandbox unavailable: ") + e.what());
        return rejected(e.what());
    }

    ExecuteCodeResponse resp;
    resp.metrics = result.metrics;
    if (const ExecutionSuccess* s = result.success()) {
        resp.success = true;
        if (!s->value.is_undefined()) resp.result_json = security_.sanitize_result(s->value);
    } else if (const ExecutionFailure* f = result.failure()) {
        resp.success = false;
        resp.error = f->error;
        resp.stack = f->stack;
        resp.hint = hint_for(f->kind);
    }

    try {
        ExecutionRecord record = security_.create_execution_record(req.code, result, req.readonly, req.caller_id);
        security_.audit_log(record);
    } catch (const std::exception& e) {
        log_error("tool", std::string("could not record execution: ") + e.what());
    }
    return resp;
}

} // namespace codemode
