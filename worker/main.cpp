#include "codemode/log.h"
#include "codemode/proc.h"
#include "codemode/realm.h"
#include "codemode/seccomp.h"
#include "codemode/worker_protocol.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace codemode;

// Script worker for ProcessSandbox. Speaks the NDJSON protocol from
// worker_protocol.h: stdin carries host messages, stdout carries ours,
// stderr goes to the host's log. I/O is raw fd reads/writes so the process
// stays inside the seccomp allowlist once the filter is on.

namespace {

constexpr int STDIN_FD = 0;
constexpr int STDOUT_FD = 1;

std::chrono::steady_clock::time_point no_deadline() {
    return std::chrono::steady_clock::now() + std::chrono::hours(24 * 365);
}

bool send(const std::string& line) {
    std::string err;
    if (!proc_write_all(STDOUT_FD, line, no_deadline(), &err)) {
        log_error("worker", "write to host failed: " + err);
        return false;
    }
    return true;
}

// Set once the host pipe breaks mid-call; the worker exits after the
// current script unwinds.
bool g_host_lost = false;

BindingResult call_host(LineReader& in, uint64_t* next_call_id, const std::string& group,
                        const std::string& method, const std::string& params_json) {
    if (g_host_lost) return BindingResult::fail("Host connection lost");

    protocol::CallRequest call;
    call.id = (*next_call_id)++;
    call.group = group;
    call.method = method;
    call.params_json = params_json;
    if (!send(protocol::encode_call(call))) {
        g_host_lost = true;
        return BindingResult::fail("Host connection lost");
    }

    std::string line, err;
    while (true) {
        ReadStatus st = in.read_line(STDIN_FD, no_deadline(), &line, &err);
        if (st != ReadStatus::LINE) {
            g_host_lost = true;
            return BindingResult::fail("Host connection lost");
        }
        json::Doc msg = json::parse(line);
        if (protocol::message_op(msg.root) != "call_result") {
            log_warn("worker", "ignoring message while waiting for call result");
            continue;
        }
        protocol::CallReply reply;
        if (!protocol::decode_call_result(msg.root, &reply, &err)) {
            return BindingResult::fail("Malformed call result: " + err);
        }
        if (reply.id != call.id) {
            log_warn("worker", "stale call result id " + std::to_string(reply.id));
            continue;
        }
        return reply.result;
    }
}

} // namespace

int main(int argc, char** argv) {
    size_t memory_mb = 128;
    size_t max_message_bytes = 64ull * 1024 * 1024;
    bool enable_seccomp = false;

    for (int i = 1; i < argc; i++) {
        const std::string a = argv[i];
        if (a == "--memory-mb" && i + 1 < argc) {
            memory_mb = (size_t)std::strtoull(argv[++i], nullptr, 10);
        } else if (a == "--max-message-bytes" && i + 1 < argc) {
            max_message_bytes = (size_t)std::strtoull(argv[++i], nullptr, 10);
        } else if (a == "--seccomp") {
            enable_seccomp = true;
        } else {
            std::cerr << "usage: codemode_worker [--memory-mb N] [--max-message-bytes N] [--seccomp]\n";
            return 2;
        }
    }
    if (memory_mb == 0 || max_message_bytes == 0) {
        (void)send(protocol::encode_fatal("invalid limits"));
        return 2;
    }

    // Load the tz database while files can still be opened freely.
    tzset();

    std::unique_ptr<ScriptRealm> realm;
    try {
        RealmLimits lim;
        lim.memory_limit_mb = memory_mb;
        realm = std::make_unique<ScriptRealm>(lim);
    } catch (const std::exception& e) {
        (void)send(protocol::encode_fatal(e.what()));
        return 3;
    }

    if (enable_seccomp) {
        std::string err = install_seccomp_filter();
        if (!err.empty()) {
            (void)send(protocol::encode_fatal("seccomp: " + err));
            return 4;
        }
    }

#ifndef _WIN32
    const int pid = (int)getpid();
#else
    const int pid = 0;
#endif
    if (!send(protocol::encode_ready(pid))) return 5;

    LineReader in(max_message_bytes);
    uint64_t next_call_id = 1;
    std::string line, err;

    while (!g_host_lost) {
        ReadStatus st = in.read_line(STDIN_FD, no_deadline(), &line, &err);
        if (st == ReadStatus::CLOSED) return 0;
        if (st == ReadStatus::TOO_LARGE) {
            log_error("worker", "host message exceeds " + std::to_string(max_message_bytes) + " bytes");
            return 5;
        }
        if (st != ReadStatus::LINE) {
            log_error("worker", "stdin read failed: " + err);
            return 5;
        }

        json::Doc msg = json::parse(line);
        const std::string op = protocol::message_op(msg.root);
        if (op == "shutdown") return 0;
        if (op != "execute") {
            log_warn("worker", "ignoring unexpected message: " + (op.empty() ? std::string("<invalid>") : op));
            continue;
        }

        protocol::ExecuteRequest req;
        if (!protocol::decode_execute(msg.root, &req, &err)) {
            log_error("worker", "malformed execute request: " + err);
            return 5;
        }

        HostCall host = [&in, &next_call_id](const std::string& group, const std::string& method,
                                              const std::string& params_json) {
            return call_host(in, &next_call_id, group, method, params_json);
        };

        protocol::ExecuteReply reply;
        reply.id = req.id;
        reply.outcome = realm->run(req.code, req.manifest, host, req.budget);
        reply.console = realm->console_output();
        realm->clear_console_output();

        if (!send(protocol::encode_result(reply))) return 5;
        if (!realm->usable()) {
            log_warn("worker", "script runtime unusable, exiting");
            return 6;
        }
    }
    return 0;
}
