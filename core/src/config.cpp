#include "codemode/config.h"
#include "codemode/log.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace codemode {

namespace {

// Reads an integer env var in [lo, hi]. Unset leaves *out alone.
template <typename T>
void env_int(const char* key, long long lo, long long hi, T* out) {
    const char* v = std::getenv(key);
    if (!v || !*v) return;
    errno = 0;
    char* end = nullptr;
    long long n = std::strtoll(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || n < lo || n > hi) {
        log_warn("config", std::string("ignoring ") + key + "=" + v + " (expected integer in [" +
                               std::to_string(lo) + ", " + std::to_string(hi) + "])");
        return;
    }
    *out = static_cast<T>(n);
}

void env_bool(const char* key, bool* out) {
    const char* v = std::getenv(key);
    if (!v || !*v) return;
    std::string s(v);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        *out = true;
    } else if (s == "0" || s == "false" || s == "no" || s == "off") {
        *out = false;
    } else {
        log_warn("config", std::string("ignoring ") + key + "=" + v + " (expected boolean)");
    }
}

} // namespace

Profile detect_profile() {
    const char* env = std::getenv("CODEMODE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // Must run before any threads are started; setenv races getenv.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("CODEMODE_SECCOMP_ENABLE", "0",     NO_OVERWRITE);
            setenv("CODEMODE_LOG_LEVEL",      "debug", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("CODEMODE_SECCOMP_ENABLE", "1",    NO_OVERWRITE);
            setenv("CODEMODE_LOG_LEVEL",      "info", NO_OVERWRITE);
            break;
    }
}

Settings load_settings() {
    Settings s;

    env_int("CODEMODE_TIMEOUT_MS", 1, INT_MAX, &s.sandbox.timeout_ms);
    env_int("CODEMODE_MEMORY_LIMIT_MB", 1, 64 * 1024, &s.sandbox.memory_limit_mb);
    env_int("CODEMODE_CPU_LIMIT_MS", 0, INT_MAX, &s.sandbox.cpu_limit_ms);

    PoolOptions pool = s.pool;
    env_int("CODEMODE_POOL_MIN", 0, 1024, &pool.min_instances);
    env_int("CODEMODE_POOL_MAX", 0, 1024, &pool.max_instances);
    env_int("CODEMODE_POOL_IDLE_MS", 1, INT_MAX, &pool.idle_timeout_ms);
    std::string bad = validate_pool_options(pool);
    if (bad.empty()) {
        s.pool = pool;
    } else {
        log_warn("config", "ignoring pool settings: " + bad);
    }

    env_int("CODEMODE_MAX_CODE_LENGTH", 1, INT_MAX, &s.security.max_code_length);
    env_int("CODEMODE_MAX_EXEC_PER_MIN", 0, INT_MAX, &s.security.max_executions_per_minute);
    env_int("CODEMODE_MAX_RESULT_SIZE", 1, INT_MAX, &s.security.max_result_size);

    if (const char* v = std::getenv("CODEMODE_ISOLATION")) {
        if (auto m = parse_isolation_mode(v)) {
            s.isolation = *m;
        } else if (*v) {
            log_warn("config", std::string("unknown CODEMODE_ISOLATION=") + v + ", using inprocess");
        }
    }

    if (const char* v = std::getenv("CODEMODE_WORKER_BIN")) s.worker.worker_path = v;
    env_bool("CODEMODE_SECCOMP_ENABLE", &s.worker.enable_seccomp);
    env_int("CODEMODE_WORKER_CPU_BUDGET_SEC", 0, INT_MAX, &s.worker.cpu_budget_sec);

    if (const char* v = std::getenv("CODEMODE_AUDIT_LOG")) s.audit_log_path = v;
    return s;
}

} // namespace codemode
