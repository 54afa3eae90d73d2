#include "codemode/proc.h"

#include <algorithm>
#include <cerrno>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <mutex>

#ifndef _WIN32
  #include <unistd.h>
  #include <fcntl.h>
  #include <signal.h>
  #include <sys/stat.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <sys/resource.h>
  #include <poll.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif
extern char** environ;
#endif

namespace codemode {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

std::string describe_exit_code(int exit_code) {
    if (exit_code < 0) return "not started";
    if (exit_code > 128) {
        int sig = exit_code - 128;
        const char* name = ::strsignal(sig);
        return "signal " + std::to_string(sig) + (name ? std::string(" (") + name + ")" : std::string());
    }
    return "exit code " + std::to_string(exit_code);
}

#ifdef _WIN32

bool proc_spawn_piped(const std::vector<std::string>&, const std::string&, const ProcLimits&,
                      ChildProcess*, std::string* err) {
    if (err) *err = "proc_spawn_piped: not supported on Windows";
    return false;
}
bool proc_write_all(int, const std::string&, std::chrono::steady_clock::time_point, std::string* err) {
    if (err) *err = "proc_write_all: not supported on Windows";
    return false;
}
ReadStatus LineReader::read_line(int, std::chrono::steady_clock::time_point, std::string*, std::string* err) {
    if (err) *err = "LineReader: not supported on Windows";
    return ReadStatus::FAILED;
}
bool proc_try_reap(ChildProcess*, int*) { return false; }
bool proc_exited(int) { return false; }
int proc_kill(ChildProcess*) { return -1; }
int proc_shutdown(ChildProcess*, int) { return -1; }

#else

namespace {

bool env_true(const char* key) {
    const char* v = std::getenv(key);
    if (!v) return false;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return (s == "1" || s == "true" || s == "yes" || s == "on");
}

void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_fd(int* fd) {
    if (*fd >= 0) {
        ::close(*fd);
        *fd = -1;
    }
}

int exit_code_from_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 128;
}

// A worker that dies mid-write must surface as EPIPE, not kill the host.
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction sa;
        if (sigaction(SIGPIPE, nullptr, &sa) == 0 && sa.sa_handler == SIG_DFL) {
            (void)::signal(SIGPIPE, SIG_IGN);
        }
    });
}

int ms_until(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) return 0;
    return (int)std::min<long long>(left, 60 * 1000);
}

} // namespace

bool proc_spawn_piped(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ChildProcess* child,
                      std::string* err) {
    if (!child) return false;
    *child = ChildProcess{};
    if (argv.empty() || argv[0].empty()) {
        if (err) *err = "empty argv";
        return false;
    }

    ignore_sigpipe_once();

    std::vector<std::string> eff_argv = argv;
    if (env_true("CODEMODE_PROC_WRAPPER_ENABLE")) {
        if (const char* w = std::getenv("CODEMODE_PROC_WRAPPER")) {
            auto toks = split_argv_quoted(w);
            if (!toks.empty()) eff_argv.insert(eff_argv.begin(), toks.begin(), toks.end());
        }
    }

    // Everything the child needs is prepared before fork; the child only
    // makes async-signal-safe calls.
    std::vector<char*> cargv;
    cargv.reserve(eff_argv.size() + 1);
    for (const auto& s : eff_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<char*> cenv;
    for (char** e = environ; e && *e; e++) {
        if (std::strncmp(*e, "LD_PRELOAD=", 11) == 0) continue;
        if (std::strncmp(*e, "LD_LIBRARY_PATH=", 16) == 0) continue;
        cenv.push_back(*e);
    }
    cenv.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        if (err) *err = std::string("pipe failed: ") + std::strerror(errno);
        for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &exec_pipe[0], &exec_pipe[1]})
            close_fd(fd);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        if (err) *err = std::string("fork failed: ") + std::strerror(errno);
        for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &exec_pipe[0], &exec_pipe[1]})
            close_fd(fd);
        return false;
    }

    if (pid == 0) {
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)::signal(SIGPIPE, SIG_DFL);

        // isolate process group so a kill reaches the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256 || maxfd > 65536) maxfd = 4096;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != exec_pipe[1]) (void)close(fd);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int e = errno;
            (void)!write(exec_pipe[1], &e, sizeof(e));
            _exit(127);
        }

#ifdef __linux__
        if (lim.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
        if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
#ifdef RLIMIT_NPROC
        if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
#endif

        execvpe(cargv[0], cargv.data(), cenv.data());
        int e = errno;
        (void)!write(exec_pipe[1], &e, sizeof(e));
        _exit(127);
    }

    (void)setpgid(pid, pid);
    close_fd(&in_pipe[0]);
    close_fd(&out_pipe[1]);
    close_fd(&exec_pipe[1]);

    // exec_pipe is CLOEXEC: EOF without data means execvpe succeeded.
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(&exec_pipe[0]);

    if (n == (ssize_t)sizeof(child_errno)) {
        if (err) *err = "exec " + eff_argv[0] + " failed: " + std::strerror(child_errno);
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close_fd(&in_pipe[1]);
        close_fd(&out_pipe[0]);
        return false;
    }

    set_nonblocking(in_pipe[1]);
    set_nonblocking(out_pipe[0]);
    child->pid = (int)pid;
    child->stdin_fd = in_pipe[1];
    child->stdout_fd = out_pipe[0];
    return true;
}

bool proc_write_all(int fd, const std::string& data,
                    std::chrono::steady_clock::time_point deadline,
                    std::string* err) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n > 0) {
            off += (size_t)n;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            int wait = ms_until(deadline);
            if (wait == 0) {
                if (err) *err = "write timed out";
                return false;
            }
            struct pollfd pfd{fd, POLLOUT, 0};
            int pr = poll(&pfd, 1, wait);
            if (pr < 0 && errno != EINTR) {
                if (err) *err = std::string("poll failed: ") + std::strerror(errno);
                return false;
            }
            continue;
        }
        if (err) *err = std::string("write failed: ") + std::strerror(errno);
        return false;
    }
    return true;
}

ReadStatus LineReader::read_line(int fd, std::chrono::steady_clock::time_point deadline,
                                 std::string* line, std::string* err) {
    while (true) {
        size_t nl = buf_.find('\n');
        if (nl != std::string::npos) {
            line->assign(buf_, 0, nl);
            buf_.erase(0, nl + 1);
            return ReadStatus::LINE;
        }
        if (buf_.size() > max_line_bytes_) return ReadStatus::TOO_LARGE;

        char chunk[16 * 1024];
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buf_.append(chunk, (size_t)n);
            continue;
        }
        if (n == 0) return ReadStatus::CLOSED;
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            if (err) *err = std::string("read failed: ") + std::strerror(errno);
            return ReadStatus::FAILED;
        }

        int wait = ms_until(deadline);
        if (wait == 0) return ReadStatus::TIMEOUT;
        struct pollfd pfd{fd, POLLIN, 0};
        int pr = poll(&pfd, 1, wait);
        if (pr < 0 && errno != EINTR) {
            if (err) *err = std::string("poll failed: ") + std::strerror(errno);
            return ReadStatus::FAILED;
        }
    }
}

bool proc_try_reap(ChildProcess* child, int* exit_code) {
    if (!child || child->pid <= 0) return false;
    int status = 0;
    pid_t w = waitpid((pid_t)child->pid, &status, WNOHANG);
    if (w != (pid_t)child->pid) return false;
    if (exit_code) *exit_code = exit_code_from_status(status);
    child->pid = -1;
    close_fd(&child->stdin_fd);
    close_fd(&child->stdout_fd);
    return true;
}

bool proc_exited(int pid) {
    if (pid <= 0) return true;
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    int rc;
    do {
        rc = waitid(P_PID, (id_t)pid, &info, WEXITED | WNOHANG | WNOWAIT);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) return errno == ECHILD;
    return info.si_pid == (pid_t)pid;
}

int proc_kill(ChildProcess* child) {
    if (!child) return -1;
    int code = -1;
    if (child->pid > 0) {
        pid_t pid = (pid_t)child->pid;
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
        int status = 0;
        pid_t w;
        do {
            w = waitpid(pid, &status, 0);
        } while (w < 0 && errno == EINTR);
        code = (w == pid) ? exit_code_from_status(status) : 128 + SIGKILL;
        child->pid = -1;
    }
    close_fd(&child->stdin_fd);
    close_fd(&child->stdout_fd);
    return code;
}

int proc_shutdown(ChildProcess* child, int grace_ms) {
    if (!child) return -1;
    close_fd(&child->stdin_fd);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    int code = -1;
    while (child->pid > 0) {
        if (proc_try_reap(child, &code)) return code;
        if (std::chrono::steady_clock::now() >= deadline) break;
        ::usleep(5 * 1000);
    }
    return proc_kill(child);
}

#endif

} // namespace codemode
