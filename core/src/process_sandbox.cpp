#include "codemode/process_sandbox.h"
#include "codemode/log.h"
#include "codemode/worker_protocol.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#ifndef _WIN32
#include <csignal>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace codemode {

namespace {

using Clock = std::chrono::steady_clock;

struct RunningFlag {
    explicit RunningFlag(std::atomic<bool>* f) : flag(f) { flag->store(true); }
    ~RunningFlag() { flag->store(false); }
    std::atomic<bool>* flag;
};

} // namespace

std::string resolve_worker_path(const std::string& configured) {
    if (!configured.empty()) return configured;
    if (const char* e = std::getenv("CODEMODE_WORKER_BIN")) {
        if (*e) return e;
    }
#ifndef _WIN32
    char buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len > 0) {
        buf[len] = '\0';
        return (std::filesystem::path(buf).parent_path() / "codemode_worker").string();
    }
#endif
    return {};
}

ProcessSandbox::ProcessSandbox(const SandboxOptions& options, const WorkerConfig& config)
    : Sandbox(options), config_(config), reader_(config.max_message_bytes) {
    std::string err;
    if (!start_worker(&err)) {
        throw std::runtime_error("failed to start sandbox worker: " + err);
    }
}

ProcessSandbox::~ProcessSandbox() {
    dispose();
}

bool ProcessSandbox::start_worker(std::string* err) {
    const std::string path = resolve_worker_path(config_.worker_path);
    if (path.empty()) {
        if (err) *err = "worker binary not found (set CODEMODE_WORKER_BIN)";
        return false;
    }

    std::vector<std::string> argv = {
        path,
        "--memory-mb", std::to_string(options().memory_limit_mb),
        "--max-message-bytes", std::to_string(config_.max_message_bytes),
    };
    if (config_.enable_seccomp) argv.push_back("--seccomp");

    ProcLimits lim;
    lim.rlimit_as_mb = options().memory_limit_mb + config_.address_space_headroom_mb;
    lim.rlimit_cpu_sec = config_.cpu_budget_sec;

    if (!proc_spawn_piped(argv, "", lim, &child_, err)) return false;
    pid_.store(child_.pid);
    reader_.reset();

    auto deadline = Clock::now() + std::chrono::milliseconds(config_.startup_timeout_ms);
    std::string line, rerr;
    ReadStatus st = reader_.read_line(child_.stdout_fd, deadline, &line, &rerr);
    if (st != ReadStatus::LINE) {
        forget_pid();
        int code = proc_kill(&child_);
        if (err) {
            *err = st == ReadStatus::TIMEOUT ? "worker did not become ready"
                                             : "worker exited during startup (" + describe_exit_code(code) + ")";
        }
        return false;
    }

    json::Doc msg = json::parse(line);
    const std::string op = protocol::message_op(msg.root);
    if (op != "ready") {
        forget_pid();
        proc_kill(&child_);
        if (err) {
            *err = op == "fatal" ? json::get_string(msg.root, "error").value_or("worker failed")
                                 : "unexpected worker handshake";
        }
        return false;
    }

    log_debug("sandbox", "process sandbox worker pid " + std::to_string(child_.pid) +
                             (config_.enable_seccomp ? " (seccomp)" : ""));
    return true;
}

SandboxResult ProcessSandbox::abandon_worker(FailureKind kind, const std::string& error) {
    healthy_.store(false);
    forget_pid();
    int code = proc_kill(&child_);
    last_exit_code_.store(code);
    if (is_disposed()) return disposed_result();
    if (kind == FailureKind::WORKER_CRASH && code >= 0) {
        return SandboxResult::failed(kind, error + " (" + describe_exit_code(code) + ")");
    }
    return SandboxResult::failed(kind, error);
}

SandboxResult ProcessSandbox::run_script(const std::string& code, const ApiBindings& bindings,
                                         const RunBudget& budget) {
    RunningFlag flag(&running_);
    if (!child_.running()) {
        healthy_.store(false);
        return SandboxResult::failed(FailureKind::WORKER_CRASH, "Sandbox worker is not running");
    }

    const auto deadline = Clock::now() +
                          std::chrono::milliseconds((int64_t)budget.timeout_ms + config_.grace_ms);

    protocol::ExecuteRequest req;
    req.id = next_id_++;
    req.code = code;
    req.budget = budget;
    req.manifest = binding_manifest(bindings);

    std::string err;
    if (!proc_write_all(child_.stdin_fd, protocol::encode_execute(req), deadline, &err)) {
        return abandon_worker(FailureKind::WORKER_CRASH, "Failed to send script to worker: " + err);
    }

    std::string line;
    while (true) {
        ReadStatus st = reader_.read_line(child_.stdout_fd, deadline, &line, &err);
        switch (st) {
            case ReadStatus::LINE:
                break;
            case ReadStatus::TIMEOUT:
                return abandon_worker(FailureKind::TIMEOUT, timeout_error_text(budget.timeout_ms));
            case ReadStatus::CLOSED:
                return abandon_worker(FailureKind::WORKER_CRASH, "Sandbox worker exited unexpectedly");
            case ReadStatus::TOO_LARGE:
                return abandon_worker(FailureKind::WORKER_CRASH,
                                      "Worker message exceeds " + std::to_string(config_.max_message_bytes) +
                                          " bytes");
            case ReadStatus::FAILED:
                return abandon_worker(FailureKind::WORKER_CRASH, "Worker pipe failed: " + err);
        }

        json::Doc msg = json::parse(line);
        const std::string op = protocol::message_op(msg.root);

        if (op == "call") {
            protocol::CallRequest call;
            if (!protocol::decode_call(msg.root, &call, &err)) {
                return abandon_worker(FailureKind::WORKER_CRASH, "Malformed call from worker: " + err);
            }
            protocol::CallReply reply;
            reply.id = call.id;
            reply.result = invoke_binding(bindings, call.group, call.method, call.params_json);
            if (!proc_write_all(child_.stdin_fd, protocol::encode_call_result(reply), deadline, &err)) {
                return abandon_worker(FailureKind::WORKER_CRASH, "Failed to answer worker call: " + err);
            }
            continue;
        }

        if (op == "result") {
            protocol::ExecuteReply reply;
            if (!protocol::decode_result(msg.root, &reply, &err) || reply.id != req.id) {
                return abandon_worker(FailureKind::WORKER_CRASH,
                                      "Malformed result from worker" + (err.empty() ? "" : ": " + err));
            }
            {
                std::lock_guard<std::mutex> lk(console_mu_);
                console_.insert(console_.end(), reply.console.begin(), reply.console.end());
            }
            if (!reply.outcome.ok && poisons_sandbox(reply.outcome.kind)) healthy_.store(false);
            return to_sandbox_result(reply.outcome);
        }

        return abandon_worker(FailureKind::WORKER_CRASH,
                              "Unexpected message from worker: " + (op.empty() ? std::string("<invalid>") : op));
    }
}

void ProcessSandbox::forget_pid() {
    std::lock_guard<std::mutex> lk(pid_mu_);
    pid_.store(-1);
}

bool ProcessSandbox::backend_healthy() const {
    if (!healthy_.load()) return false;
    int pid = pid_.load();
    // A worker that died while idle (OOM killer, RLIMIT_CPU, outside kill)
    // stays a zombie until the next run reaps it.
    return pid > 0 && !proc_exited(pid);
}

void ProcessSandbox::interrupt_running() {
#ifndef _WIN32
    if (!running_.load()) return;
    // Held across kill() so the pid cannot be reaped and recycled underneath us.
    std::lock_guard<std::mutex> lk(pid_mu_);
    int pid = pid_.load();
    if (pid > 0) {
        (void)::kill(-pid, SIGKILL);
        (void)::kill(pid, SIGKILL);
    }
#endif
}

void ProcessSandbox::release_backend() {
    forget_pid();
    if (child_.running()) {
        std::string err;
        auto deadline = Clock::now() + std::chrono::milliseconds(100);
        if (!proc_write_all(child_.stdin_fd, protocol::encode_shutdown(), deadline, &err)) {
            log_debug("sandbox", "worker shutdown request not delivered: " + err);
        }
        int code = proc_shutdown(&child_, config_.grace_ms);
        last_exit_code_.store(code);
        log_debug("sandbox", "process sandbox worker stopped (" + describe_exit_code(code) + ")");
    }
}

std::vector<std::string> ProcessSandbox::console_output() const {
    std::lock_guard<std::mutex> lk(console_mu_);
    return console_;
}

void ProcessSandbox::clear_console_output() {
    std::lock_guard<std::mutex> lk(console_mu_);
    console_.clear();
}

} // namespace codemode
