#pragma once

// seccomp-BPF allowlist for the script worker process.
//
// The worker installs the filter itself once its script engine is up, so the
// list only has to cover a running interpreter: memory management, reads and
// writes on already-open fds, clocks, futex and exit. Notably absent: execve,
// fork/clone, socket and friends, ptrace, mount, unlink/rename/mkdir, kill.
//
// Argument checks:
//   mprotect with PROT_EXEC       -> kill (the interpreter never JITs)
//   openat with any write/create  -> EACCES (read-only opens stay possible
//                                    for the tz database)
// Any other syscall kills the process (SIGSYS).
//
// Architecture-aware: x86_64 and aarch64.

#include <string>

namespace codemode {

// Must be called after prctl(PR_SET_NO_NEW_PRIVS, 1), which
// proc_spawn_piped already set for the worker.
// Returns empty string on success, error message on failure.
// On non-Linux platforms, returns success (no-op).
std::string install_seccomp_filter();

bool seccomp_available();

} // namespace codemode
