#pragma once

#include "codemode/process_sandbox.h"
#include "codemode/security.h"
#include "codemode/types.h"

#include <string>

namespace codemode {

enum class Profile { DEV, PROD };

// Detect profile from CODEMODE_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: no seccomp, debug logging
// PROD: seccomp on for isolated workers, info logging
void apply_profile_defaults(Profile p);

// Everything the code-execution tool needs, resolved from CODEMODE_* env vars.
struct Settings {
    SandboxOptions sandbox;
    PoolOptions pool;
    SecurityConfig security;
    IsolationMode isolation{IsolationMode::IN_PROCESS};
    WorkerConfig worker;
    std::string audit_log_path;   // empty: audit events go to stderr
};

// Malformed or out-of-range values keep the default and log a warning.
Settings load_settings();

} // namespace codemode
