#include "test_common.h"
#include "codemode/config.h"
#include <cstdlib>

static const char* const kVars[] = {
    "CODEMODE_PROFILE", "CODEMODE_SECCOMP_ENABLE", "CODEMODE_LOG_LEVEL",
    "CODEMODE_TIMEOUT_MS", "CODEMODE_MEMORY_LIMIT_MB", "CODEMODE_CPU_LIMIT_MS",
    "CODEMODE_POOL_MIN", "CODEMODE_POOL_MAX", "CODEMODE_POOL_IDLE_MS",
    "CODEMODE_MAX_CODE_LENGTH", "CODEMODE_MAX_EXEC_PER_MIN", "CODEMODE_MAX_RESULT_SIZE",
    "CODEMODE_ISOLATION", "CODEMODE_WORKER_BIN", "CODEMODE_WORKER_CPU_BUDGET_SEC",
    "CODEMODE_AUDIT_LOG",
};

static void clear_env() {
    for (const char* k : kVars) unsetenv(k);
}

int main() {
    clear_env();

    // Test 1: Default profile is DEV
    auto p = codemode::detect_profile();
    expect_true(p == codemode::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("CODEMODE_PROFILE", "Production", 1);
    p = codemode::detect_profile();
    expect_true(p == codemode::Profile::PROD, "should detect PROD");

    // Test 3: Apply defaults (won't override existing)
    setenv("CODEMODE_SECCOMP_ENABLE", "0", 1);
    codemode::apply_profile_defaults(codemode::Profile::PROD);
    std::string val = std::getenv("CODEMODE_SECCOMP_ENABLE") ? std::getenv("CODEMODE_SECCOMP_ENABLE") : "";
    expect_true(val == "0", "should NOT override pre-existing env var");

    // Test 4: Apply sets missing vars
    unsetenv("CODEMODE_SECCOMP_ENABLE");
    codemode::apply_profile_defaults(codemode::Profile::PROD);
    val = std::getenv("CODEMODE_SECCOMP_ENABLE") ? std::getenv("CODEMODE_SECCOMP_ENABLE") : "";
    expect_true(val == "1", "PROD should enable seccomp");
    expect_true(codemode::load_settings().worker.enable_seccomp, "settings pick up the PROD default");

    // Test 5: Profile name
    expect_true(std::string(codemode::profile_name(codemode::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(codemode::profile_name(codemode::Profile::PROD)) == "prod", "prod name");

    // Test 6: defaults with nothing set
    clear_env();
    codemode::Settings s = codemode::load_settings();
    expect_eq_ll((long long)s.sandbox.memory_limit_mb, 128, "default memory");
    expect_eq_ll(s.sandbox.timeout_ms, 30000, "default timeout");
    expect_eq_ll(s.sandbox.cpu_limit_ms, 10000, "default cpu");
    expect_eq_ll(s.pool.min_instances, 2, "default pool min");
    expect_eq_ll(s.pool.max_instances, 10, "default pool max");
    expect_eq_ll(s.pool.idle_timeout_ms, 60000, "default idle");
    expect_eq_ll((long long)s.security.max_code_length, 50 * 1024, "default max code");
    expect_eq_ll(s.security.max_executions_per_minute, 60, "default rate");
    expect_eq_ll((long long)s.security.max_result_size, 10 * 1024 * 1024, "default max result");
    expect_eq_ll((long long)s.security.blocked_patterns.size(), 14, "default pattern count");
    expect_true(s.isolation == codemode::IsolationMode::IN_PROCESS, "default isolation");
    expect_true(!s.worker.enable_seccomp, "seccomp off by default");
    expect_true(s.audit_log_path.empty(), "audit to stderr by default");

    // Test 7: env overrides
    setenv("CODEMODE_TIMEOUT_MS", "5000", 1);
    setenv("CODEMODE_MEMORY_LIMIT_MB", "64", 1);
    setenv("CODEMODE_POOL_MIN", "0", 1);
    setenv("CODEMODE_POOL_MAX", "3", 1);
    setenv("CODEMODE_MAX_EXEC_PER_MIN", "5", 1);
    setenv("CODEMODE_ISOLATION", "worker", 1);
    setenv("CODEMODE_WORKER_BIN", "/opt/codemode/bin/codemode_worker", 1);
    setenv("CODEMODE_AUDIT_LOG", "/var/log/codemode/audit.jsonl", 1);
    s = codemode::load_settings();
    expect_eq_ll(s.sandbox.timeout_ms, 5000, "timeout override");
    expect_eq_ll((long long)s.sandbox.memory_limit_mb, 64, "memory override");
    expect_eq_ll(s.pool.min_instances, 0, "pool min override");
    expect_eq_ll(s.pool.max_instances, 3, "pool max override");
    expect_eq_ll(s.security.max_executions_per_minute, 5, "rate override");
    expect_true(s.isolation == codemode::IsolationMode::PROCESS, "isolation override");
    expect_true(s.worker.worker_path == "/opt/codemode/bin/codemode_worker", "worker path");
    expect_true(s.audit_log_path == "/var/log/codemode/audit.jsonl", "audit path");

    // Test 8: malformed values keep defaults
    clear_env();
    setenv("CODEMODE_TIMEOUT_MS", "soon", 1);
    setenv("CODEMODE_MEMORY_LIMIT_MB", "-4", 1);
    setenv("CODEMODE_ISOLATION", "thread", 1);
    setenv("CODEMODE_SECCOMP_ENABLE", "maybe", 1);
    s = codemode::load_settings();
    expect_eq_ll(s.sandbox.timeout_ms, 30000, "bad timeout ignored");
    expect_eq_ll((long long)s.sandbox.memory_limit_mb, 128, "negative memory ignored");
    expect_true(s.isolation == codemode::IsolationMode::IN_PROCESS, "unknown isolation ignored");
    expect_true(!s.worker.enable_seccomp, "bad boolean ignored");

    // Test 9: inconsistent pool sizes are rejected as a whole
    clear_env();
    setenv("CODEMODE_POOL_MIN", "8", 1);
    setenv("CODEMODE_POOL_MAX", "4", 1);
    s = codemode::load_settings();
    expect_eq_ll(s.pool.min_instances, 2, "pool min kept");
    expect_eq_ll(s.pool.max_instances, 10, "pool max kept");

    clear_env();
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
