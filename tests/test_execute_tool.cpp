#include "test_common.h"
#include "codemode/audit_log.h"
#include "codemode/execute_tool.h"
#include "codemode/json.h"
#include "codemode/registry.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace codemode;

static bool starts_with(const std::string& s, const std::string& p) {
    return s.compare(0, p.size(), p) == 0;
}

static std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> out;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

static Settings base_settings(const std::string& audit_path) {
    Settings s;
    s.isolation = IsolationMode::IN_PROCESS;
    s.pool.min_instances = 1;
    s.pool.max_instances = 2;
    s.security.max_result_size = 4096;
    s.audit_log_path = audit_path;
    return s;
}

static ExecuteCodeRequest request(const std::string& code) {
    ExecuteCodeRequest r;
    r.code = code;
    return r;
}

int main() {
    fs::path dir = fs::temp_directory_path() / "codemode_test_execute_tool";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const std::string audit_path = (dir / "audit.jsonl").string();

    std::atomic<bool> blocker_entered{false};
    std::atomic<bool> blocker_release{false};

    ToolRegistry registry;
    registry.register_tool({"pg_core_echo", "core", "Returns its argument",
                            [](const std::string& params) { return BindingResult::value(params); }});
    registry.register_tool({"pg_core_block", "core", "Waits for the test to release it",
                            [&](const std::string&) {
                                blocker_entered = true;
                                while (!blocker_release.load()) {
                                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                                }
                                return BindingResult::value("true");
                            }});

    CodeExecutionTool tool(registry, base_settings(audit_path));
    int audited = 0;

    // Test 1: execute before initialize
    {
        ExecuteCodeResponse r = tool.execute(request("return 1;"));
        expect_true(!r.success, "not initialized fails");
        expect_true(r.error && *r.error == "Code execution is not initialized", "not initialized message");
        expect_true(!tool.initialized() && !tool.pool_stats(), "no pool yet");
    }

    tool.initialize();
    tool.initialize();
    expect_true(tool.initialized(), "initialized");
    expect_eq_ll((long long)tool.pool_stats()->available, 1, "warm sandbox");

    // Test 2: success through a binding
    {
        ExecuteCodeResponse r = tool.execute(request("const r = await pg.core.echo({msg: 'hi'}); return r;"));
        audited++;
        expect_true(r.success, "success");
        expect_true(r.result_json && *r.result_json == "{\"msg\":\"hi\"}", "result json");
        expect_true(!r.error && !r.hint, "no error or hint");

        json::Doc d = json::parse(r.to_json());
        expect_true(d, "response is JSON");
        expect_true(json::get_bool(d.root, "success").value_or(false), "success field");
        json_object* result = nullptr;
        expect_true(json_object_object_get_ex(d.root, "result", &result), "result embedded");
        expect_true(json::get_string(result, "msg").value_or("") == "hi", "result parsed, not quoted");
        json_object* metrics = nullptr;
        expect_true(json_object_object_get_ex(d.root, "metrics", &metrics), "metrics present");
        expect_true(json::get_double(metrics, "wall_time_ms").has_value(), "wall_time_ms");
        expect_true(json::get_double(metrics, "cpu_time_ms").has_value(), "cpu_time_ms");
        expect_true(json::get_double(metrics, "memory_used_mb").has_value(), "memory_used_mb");
    }

    // Test 3: undefined completion value
    {
        ExecuteCodeResponse r = tool.execute(request("await pg.core.echo(1);"));
        audited++;
        expect_true(r.success && !r.result_json, "undefined result omitted");
        json::Doc d = json::parse(r.to_json());
        expect_true(!json_object_object_get_ex(d.root, "result", nullptr), "no result key");
    }

    // Test 4: validation failures are rejected before running
    {
        PoolStats before = *tool.pool_stats();
        ExecuteCodeResponse r = tool.execute(request("const fs = require('fs'); return eval('1');"));
        expect_true(!r.success, "blocked");
        expect_true(r.error && starts_with(*r.error, "Code validation failed: Blocked pattern detected: "),
                    "validation message: " + r.error.value_or(""));
        expect_true(r.error->find("; ") != std::string::npos, "errors joined");
        expect_true(r.hint.has_value(), "validation hint");

        r = tool.execute(request(""));
        expect_true(!r.success && *r.error == "Code validation failed: Code must be a non-empty string",
                    "empty code");

        PoolStats after = *tool.pool_stats();
        expect_eq_ll((long long)after.available, (long long)before.available, "pool untouched (available)");
        expect_eq_ll((long long)after.in_use, 0, "pool untouched (in use)");
        expect_eq_ll((long long)read_lines(audit_path).size(), audited, "rejections are not audited");
    }

    // Test 5: script errors carry message and stack
    {
        ExecuteCodeResponse r = tool.execute(request("throw new Error('bad input');"));
        audited++;
        expect_true(!r.success && *r.error == "bad input", "script error");
        expect_true(r.stack.has_value(), "stack kept");
        expect_true(!r.hint, "no hint for plain script errors");
    }

    // Test 6: timeouts come back with a hint
    {
        ExecuteCodeRequest req = request("while (true) {}");
        req.timeout_ms = 100;
        ExecuteCodeResponse r = tool.execute(req);
        audited++;
        expect_true(!r.success && *r.error == "Execution timeout: exceeded 100ms limit", "timeout error");
        expect_true(r.hint.has_value(), "timeout hint");
        expect_true(r.metrics.wall_time_ms >= 100.0, "wall time reported");
    }

    // Test 7: oversized results are replaced by a truncation marker
    {
        ExecuteCodeResponse r = tool.execute(request("return 'x'.repeat(10000);"));
        audited++;
        expect_true(r.success && r.result_json, "success");
        json::Doc d = json::parse(*r.result_json);
        expect_true(d && json::get_bool(d.root, "_truncated").value_or(false), "truncated marker");
        expect_eq_ll(json::get_int(d.root, "_maxSize").value_or(0), 4096, "max size reported");
    }

    // Test 8: readonly and caller are recorded in the audit trail
    {
        ExecuteCodeRequest req = request("return await pg.core.echo([1, 2]);");
        req.readonly = true;
        req.caller_id = "agent-42";
        ExecuteCodeResponse r = tool.execute(req);
        audited++;
        expect_true(r.success && *r.result_json == "[1,2]", "array result");

        auto lines = read_lines(audit_path);
        expect_eq_ll((long long)lines.size(), audited, "one audit line per executed request");
        json::Doc last = json::parse(lines.back());
        expect_true(json::get_string(last.root, "event").value_or("") == "codemode.execute", "event name");
        json_object* payload = nullptr;
        expect_true(json_object_object_get_ex(last.root, "payload", &payload), "payload present");
        expect_true(json::get_bool(payload, "readonly").value_or(false), "readonly recorded");
        expect_true(json::get_string(payload, "caller_id").value_or("") == "agent-42", "caller recorded");
        expect_true(json::get_bool(payload, "success").value_or(false), "success recorded");

        ChainCheck c = verify_audit_chain(audit_path);
        expect_true(c.ok, "audit chain intact: " + c.error);
    }

    // Test 9: a busy pool answers with an exhaustion error, not a queue
    {
        Settings s = base_settings("");
        s.pool.min_instances = 0;
        s.pool.max_instances = 1;
        s.security.max_executions_per_minute = 1;
        CodeExecutionTool single(registry, s);
        single.initialize();

        ExecuteCodeResponse first;
        std::thread t([&] {
            ExecuteCodeRequest req = request("return await pg.core.block();");
            req.caller_id = "holder";
            first = single.execute(req);
        });
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!blocker_entered.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        expect_true(blocker_entered.load(), "first script reached the binding");

        ExecuteCodeResponse second = single.execute(request("return 2;"));

        // With the only sandbox held, any acquire would report exhaustion.
        ExecuteCodeResponse invalid = single.execute(request("return process.env;"));
        ExecuteCodeRequest again = request("return 3;");
        again.caller_id = "holder";
        ExecuteCodeResponse limited = single.execute(again);
        PoolStats busy = *single.pool_stats();
        blocker_release = true;
        t.join();

        expect_true(!invalid.success && starts_with(invalid.error.value_or(""), "Code validation failed: "),
                    "validation answered without a sandbox: " + invalid.error.value_or(""));
        expect_eq_str(limited.error.value_or(""), "Rate limit exceeded. Please wait before executing more code.",
                      "rate limit answered without a sandbox");
        expect_eq_ll((long long)busy.in_use, 1, "only the blocked request holds a sandbox");
        expect_eq_ll((long long)busy.available, 0, "nothing parked while busy");

        expect_true(!second.success && *second.error == "Sandbox pool exhausted (max: 1)", "exhausted error");
        expect_true(second.hint.has_value(), "exhaustion hint");
        expect_true(first.success && *first.result_json == "true", "first request completed");
    }

    // Test 10: per-caller rate limiting
    {
        Settings s = base_settings("");
        s.security.max_executions_per_minute = 2;
        CodeExecutionTool limited(registry, s);
        limited.initialize();

        ExecuteCodeRequest req = request("return 1;");
        req.caller_id = "c";
        expect_true(limited.execute(req).success, "first allowed");
        expect_true(limited.execute(req).success, "second allowed");
        PoolStats before = *limited.pool_stats();
        ExecuteCodeResponse r = limited.execute(req);
        PoolStats after = *limited.pool_stats();
        expect_eq_ll((long long)after.available, (long long)before.available, "rate limit leaves pool alone");
        expect_eq_ll((long long)after.in_use, 0, "nothing acquired for a rate-limited call");
        expect_true(!r.success &&
                        *r.error == "Rate limit exceeded. Please wait before executing more code.",
                    "third rate limited");
        expect_true(r.hint.has_value(), "rate limit hint");

        req.caller_id = "d";
        expect_true(limited.execute(req).success, "other caller unaffected");
        expect_true(limited.execute(request("return 1;")).success, "anonymous caller uses its own bucket");
    }

    // Test 11: no bindings means nothing to run against
    {
        ToolRegistry empty;
        CodeExecutionTool bare(empty, base_settings(""));
        bare.initialize();
        ExecuteCodeResponse r = bare.execute(request("return 1;"));
        expect_true(!r.success && *r.error == "No API bindings are available", "no bindings");
    }

    // Test 12: shutdown and re-initialize
    {
        tool.shutdown();
        tool.shutdown();
        expect_true(!tool.initialized(), "shut down");
        ExecuteCodeResponse r = tool.execute(request("return 1;"));
        expect_true(!r.success && *r.error == "Code execution is not initialized", "rejected after shutdown");
        tool.initialize();
        r = tool.execute(request("return 'back';"));
        audited++;
        expect_true(r.success && *r.result_json == "\"back\"", "works after re-initialize");
        expect_eq_ll((long long)read_lines(audit_path).size(), audited, "audit lines match");
    }

    // Test 13: deeply nested results stay structured in the response
    {
        std::string nested;
        for (int i = 0; i < 40; i++) nested += "[";
        for (int i = 0; i < 40; i++) nested += "]";
        ExecuteCodeResponse r = tool.execute(request("return JSON.parse('['.repeat(40) + ']'.repeat(40));"));
        audited++;
        expect_true(r.success, "deep result succeeds");
        expect_eq_str(r.result_json.value_or(""), nested, "deep result json");
        const std::string out = r.to_json();
        expect_true(contains(out, "\"result\":" + nested), "deep result embedded as JSON: " + out);
        expect_true(!contains(out, "\"result\":\""), "deep result not quoted");
    }

    // Test 14: invalid settings are refused up front
    {
        Settings s = base_settings("");
        s.pool.min_instances = 5;
        s.pool.max_instances = 1;
        bool threw = false;
        try {
            CodeExecutionTool bad(registry, s);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect_true(threw, "bad pool options rejected");
    }

    tool.shutdown();
    fs::remove_all(dir);
    std::cerr << "test_execute_tool: ALL PASSED" << std::endl;
    return 0;
}
