#pragma once

#include "codemode/audit_log.h"
#include "codemode/json.h"
#include "codemode/types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace codemode {

struct BlockedPattern {
    std::string source;     // ECMAScript regex, reported verbatim on a match
    std::string category;   // module-loading, host-object, dynamic-code, ...
};

std::vector<BlockedPattern> default_blocked_patterns();

struct SecurityConfig {
    size_t max_code_length{50 * 1024};
    int max_executions_per_minute{60};
    size_t max_result_size{10 * 1024 * 1024};
    std::vector<BlockedPattern> blocked_patterns{default_blocked_patterns()};
};

struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
};

struct RateLimitEntry {
    int count{0};
    int64_t reset_time_ms{0};
};

struct ExecutionRecord {
    std::string id;                        // UUIDv4
    std::optional<std::string> caller_id;
    int64_t timestamp_ms{0};
    std::string code_preview;              // first 200 bytes + "..." when longer
    SandboxResult result;
    bool readonly{false};
};

// Audit payload for one record; caller_id falls back to "anonymous".
json::Doc execution_record_to_json(const ExecutionRecord& r);

// Pre-execution screening, per-caller rate limiting, result size capping
// and the audit trail. Blocked patterns are a heuristic: the sandbox is the
// actual boundary, this layer only rejects obvious probing early.
//
// Thread-safe.
class SecurityManager {
public:
    using ClockFn = std::function<int64_t()>;   // epoch milliseconds

    static constexpr int64_t kRateWindowMs = 60 * 1000;

    // Throws std::invalid_argument if a blocked pattern does not compile.
    explicit SecurityManager(SecurityConfig config = {},
                             std::shared_ptr<AuditLog> audit = nullptr,
                             ClockFn clock = nullptr);

    ValidationResult validate_code(const std::string& code) const;

    // Counts the attempt. False once the caller's window is used up.
    bool check_rate_limit(const std::string& caller_id);
    int rate_limit_remaining(const std::string& caller_id) const;
    void cleanup_rate_limits();
    size_t tracked_callers() const;

    // JSON text to hand back to the caller in place of the script value.
    std::string sanitize_result(const ScriptValue& value) const;

    ExecutionRecord create_execution_record(const std::string& code, const SandboxResult& result,
                                            bool readonly,
                                            const std::optional<std::string>& caller_id = std::nullopt) const;

    // Never throws.
    void audit_log(const ExecutionRecord& record) const;

    const SecurityConfig& config() const { return config_; }

private:
    void reap_expired_locked(int64_t now);

    SecurityConfig config_;
    std::vector<std::regex> compiled_;
    std::shared_ptr<AuditLog> audit_;
    ClockFn clock_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, RateLimitEntry> rate_limits_;
    unsigned checks_since_reap_{0};
};

} // namespace codemode
