#include "codemode/security.h"
#include "codemode/crypto.h"
#include "codemode/log.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace codemode {

namespace {

constexpr size_t kCodePreviewBytes = 200;
constexpr size_t kResultPreviewBytes = 1000;
constexpr size_t kLogPreviewBytes = 50;
constexpr unsigned kReapEveryChecks = 256;

int64_t system_now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// Longest prefix of at most n bytes that does not split a UTF-8 sequence.
std::string utf8_prefix(const std::string& s, size_t n) {
    if (s.size() <= n) return s;
    size_t cut = n;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) cut--;
    return s.substr(0, cut);
}

std::string preview(const std::string& s, size_t n) {
    if (s.size() <= n) return s;
    return utf8_prefix(s, n) + "...";
}

} // namespace

std::vector<BlockedPattern> default_blocked_patterns() {
    return {
        {R"(\brequire\s*\()", "module-loading"},
        {R"(\bimport\s*\()", "module-loading"},
        {R"(\bprocess\.)", "host-object"},
        {R"(\bglobal\.)", "host-object"},
        {R"(\bglobalThis\.)", "host-object"},
        {R"(\beval\s*\()", "dynamic-code"},
        {R"(\bFunction\s*\()", "dynamic-code"},
        {R"(\b__proto__\b)", "prototype-tampering"},
        {R"(\bconstructor\.constructor)", "prototype-tampering"},
        {R"(\bchild_process)", "host-object"},
        {R"(\bfs\.)", "filesystem"},
        {R"(\bnet\.)", "network"},
        {R"(\bhttp\.)", "network"},
        {R"(\bhttps\.)", "network"},
    };
}

json::Doc execution_record_to_json(const ExecutionRecord& r) {
    json::Doc d = json::new_object();
    json::put_string(d.root, "id", r.id);
    json::put_string(d.root, "caller_id", r.caller_id.value_or("anonymous"));
    json_object_object_add(d.root, "timestamp_ms", json_object_new_int64(r.timestamp_ms));
    json::put_string(d.root, "code_preview", r.code_preview);
    json_object_object_add(d.root, "readonly", json_object_new_boolean(r.readonly));
    json_object_object_add(d.root, "success", json_object_new_boolean(r.result.ok()));
    json_object_object_add(d.root, "wall_time_ms", json_object_new_double(r.result.metrics.wall_time_ms));
    json_object_object_add(d.root, "cpu_time_ms", json_object_new_double(r.result.metrics.cpu_time_ms));
    json_object_object_add(d.root, "memory_used_mb", json_object_new_double(r.result.metrics.memory_used_mb));
    if (const ExecutionFailure* f = r.result.failure()) {
        json::put_string(d.root, "error", f->error);
        json::put_string(d.root, "failure_kind", failure_kind_name(f->kind));
        if (f->stack) json::put_string(d.root, "stack", *f->stack);
    }
    return d;
}

SecurityManager::SecurityManager(SecurityConfig config, std::shared_ptr<AuditLog> audit, ClockFn clock)
    : config_(std::move(config)), audit_(std::move(audit)), clock_(std::move(clock)) {
    if (!clock_) clock_ = system_now_ms;
    compiled_.reserve(config_.blocked_patterns.size());
    for (const auto& p : config_.blocked_patterns) {
        try {
            compiled_.emplace_back(p.source, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("invalid blocked pattern '" + p.source + "': " + e.what());
        }
    }
}

ValidationResult SecurityManager::validate_code(const std::string& code) const {
    ValidationResult r;
    if (code.empty()) {
        r.valid = false;
        r.errors.push_back("Code must be a non-empty string");
        return r;
    }
    if (code.size() > config_.max_code_length) {
        r.valid = false;
        r.errors.push_back("Code exceeds maximum length of " + std::to_string(config_.max_code_length) + " bytes");
        return r;
    }
    for (size_t i = 0; i < compiled_.size(); i++) {
        if (std::regex_search(code, compiled_[i])) {
            r.errors.push_back("Blocked pattern detected: " + config_.blocked_patterns[i].source);
        }
    }
    r.valid = r.errors.empty();
    if (!r.valid) log_debug("security", "rejected script: " + std::to_string(r.errors.size()) + " blocked pattern(s)");
    return r;
}

void SecurityManager::reap_expired_locked(int64_t now) {
    for (auto it = rate_limits_.begin(); it != rate_limits_.end();) {
        if (now >= it->second.reset_time_ms) {
            it = rate_limits_.erase(it);
        } else {
            ++it;
        }
    }
}

bool SecurityManager::check_rate_limit(const std::string& caller_id) {
    const int64_t now = clock_();
    std::lock_guard<std::mutex> lk(mu_);
    if (++checks_since_reap_ >= kReapEveryChecks) {
        checks_since_reap_ = 0;
        reap_expired_locked(now);
    }

    auto it = rate_limits_.find(caller_id);
    if (it == rate_limits_.end() || now >= it->second.reset_time_ms) {
        rate_limits_[caller_id] = RateLimitEntry{1, now + kRateWindowMs};
        return true;
    }
    if (it->second.count >= config_.max_executions_per_minute) {
        log_debug("security", "rate limit hit for caller " + caller_id);
        return false;
    }
    it->second.count++;
    return true;
}

int SecurityManager::rate_limit_remaining(const std::string& caller_id) const {
    const int64_t now = clock_();
    std::lock_guard<std::mutex> lk(mu_);
    auto it = rate_limits_.find(caller_id);
    if (it == rate_limits_.end() || now >= it->second.reset_time_ms) {
        return config_.max_executions_per_minute;
    }
    return std::max(0, config_.max_executions_per_minute - it->second.count);
}

void SecurityManager::cleanup_rate_limits() {
    const int64_t now = clock_();
    std::lock_guard<std::mutex> lk(mu_);
    reap_expired_locked(now);
}

size_t SecurityManager::tracked_callers() const {
    std::lock_guard<std::mutex> lk(mu_);
    return rate_limits_.size();
}

std::string SecurityManager::sanitize_result(const ScriptValue& value) const {
    if (!value.json) {
        json::Doc d = json::new_object();
        json::put_string(d.root, "_error", "Result could not be serialized");
        json::put_string(d.root, "_type", value.type);
        return json::to_string(d.root);
    }
    const std::string& text = *value.json;
    if (text.size() > config_.max_result_size) {
        json::Doc d = json::new_object();
        json_object_object_add(d.root, "_truncated", json_object_new_boolean(1));
        json_object_object_add(d.root, "_originalSize", json_object_new_int64((int64_t)text.size()));
        json_object_object_add(d.root, "_maxSize", json_object_new_int64((int64_t)config_.max_result_size));
        json::put_string(d.root, "preview", utf8_prefix(text, kResultPreviewBytes) + "...");
        return json::to_string(d.root);
    }
    return text;
}

ExecutionRecord SecurityManager::create_execution_record(const std::string& code, const SandboxResult& result,
                                                         bool readonly,
                                                         const std::optional<std::string>& caller_id) const {
    ExecutionRecord r;
    r.id = uuid_v4();
    r.caller_id = caller_id;
    r.timestamp_ms = clock_();
    r.code_preview = preview(code, kCodePreviewBytes);
    r.result = result;
    r.readonly = readonly;
    return r;
}

void SecurityManager::audit_log(const ExecutionRecord& record) const {
    const std::string who = record.caller_id.value_or("anonymous");
    if (const ExecutionFailure* f = record.result.failure()) {
        log_warn("audit", "Code execution failed: " + f->error + " (caller " + who + ", id " + record.id + ")");
    } else {
        log_info("audit", "Code execution completed: " + preview(record.code_preview, kLogPreviewBytes) +
                              " (caller " + who + ", " +
                              std::to_string((int64_t)record.result.metrics.wall_time_ms) + "ms)");
    }

    if (!audit_) return;
    try {
        json::Doc payload = execution_record_to_json(record);
        audit_->event("codemode.execute", payload.root);
    } catch (const std::exception& e) {
        log_error("audit", std::string("audit sink write failed: ") + e.what());
    }
}

} // namespace codemode
