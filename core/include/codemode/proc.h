#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace codemode {

// Limits applied to a spawned worker between fork and exec.
struct ProcLimits {
    size_t rlimit_as_mb{512};       // virtual memory MB
    int rlimit_cpu_sec{0};          // lifetime CPU seconds, 0 = unlimited
    size_t rlimit_fsize_mb{1};      // max file size MB
    int rlimit_nofile{32};          // max open fds
    int rlimit_nproc{32};           // max processes (best-effort)

    bool no_new_privs{true};
};

// A running child wired to the parent through two pipes.
// stderr is inherited so worker diagnostics land in the host's log.
struct ChildProcess {
    int pid{-1};
    int stdin_fd{-1};   // parent writes, non-blocking
    int stdout_fd{-1};  // parent reads, non-blocking

    bool running() const { return pid > 0; }
};

// Fork/exec argv with rlimits, its own process group, PDEATHSIG and
// closed inherited fds. Honors CODEMODE_PROC_WRAPPER_ENABLE /
// CODEMODE_PROC_WRAPPER (e.g. "bwrap --ro-bind / / --unshare-all").
bool proc_spawn_piped(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ChildProcess* child,
                      std::string* err);

// Writes all of data to a non-blocking fd, polling until deadline.
bool proc_write_all(int fd, const std::string& data,
                    std::chrono::steady_clock::time_point deadline,
                    std::string* err);

enum class ReadStatus { LINE, TIMEOUT, CLOSED, TOO_LARGE, FAILED };

// Splits a non-blocking byte stream into '\n'-terminated lines.
class LineReader {
public:
    explicit LineReader(size_t max_line_bytes) : max_line_bytes_(max_line_bytes) {}

    ReadStatus read_line(int fd, std::chrono::steady_clock::time_point deadline,
                         std::string* line, std::string* err);
    void reset() { buf_.clear(); }

private:
    std::string buf_;
    size_t max_line_bytes_;
};

// Non-blocking reap. Returns true and fills exit_code once the child is gone.
bool proc_try_reap(ChildProcess* child, int* exit_code);

// True once the child has exited (or is not ours to wait for). Leaves a
// zombie in place, so a later proc_try_reap/proc_kill still gets the status.
bool proc_exited(int pid);

// SIGKILL the child's process group, reap it, close pipes. Returns the
// exit code (128 + signal for signalled children), -1 if nothing ran.
int proc_kill(ChildProcess* child);

// Close the child's stdin, give it grace_ms to exit on its own, then kill.
int proc_shutdown(ChildProcess* child, int grace_ms);

// Human-readable form of an exit code produced by the functions above.
std::string describe_exit_code(int exit_code);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace codemode
