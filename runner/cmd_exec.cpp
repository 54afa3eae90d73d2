#include "commands.h"
#include "runner_utils.h"

#include "codemode/config.h"
#include "codemode/execute_tool.h"
#include "codemode/json.h"
#include "codemode/log.h"
#include "codemode/registry.h"
#include "codemode/sandbox_factory.h"
#include "codemode/security.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

using namespace codemode;

namespace {

void exec_usage() {
    std::cerr << "usage: codemode_cli exec <script.js|-> [--fixture bindings.json] [--caller id]\n"
                 "                        [--readonly] [--timeout ms] [--mode inprocess|process]\n";
}

} // namespace

int cmd_exec(int argc, char** argv) {
    if (argc < 3) {
        exec_usage();
        return 2;
    }
    const std::string script_path = argv[2];
    ExecuteCodeRequest req;
    std::string fixture;
    std::optional<IsolationMode> mode;

    for (int i = 3; i < argc; i++) {
        const std::string a = argv[i];
        if (a == "--fixture" && i + 1 < argc) {
            fixture = argv[++i];
        } else if (a == "--caller" && i + 1 < argc) {
            req.caller_id = argv[++i];
        } else if (a == "--readonly") {
            req.readonly = true;
        } else if (a == "--timeout" && i + 1 < argc) {
            req.timeout_ms = std::atoi(argv[++i]);
        } else if (a == "--mode" && i + 1 < argc) {
            mode = parse_isolation_mode(argv[++i]);
            if (!mode) {
                std::cerr << "unknown mode: " << argv[i] << "\n";
                return 2;
            }
        } else {
            exec_usage();
            return 2;
        }
    }

    // The worker ships next to the CLI.
    set_env_if_missing("CODEMODE_WORKER_BIN",
                       (std::filesystem::path(argv[0]).parent_path() / "codemode_worker").string());

    Settings settings = load_settings();
    if (mode) settings.isolation = *mode;
    // One-shot run: no point warming a full pool.
    settings.pool.min_instances = std::min(settings.pool.min_instances, 1);

    try {
        req.code = slurp(script_path);

        ToolRegistry registry;
        register_host_tools(&registry);
        if (!fixture.empty()) load_fixture_tools(fixture, &registry);

        CodeExecutionTool tool(registry, settings);
        tool.initialize();
        ExecuteCodeResponse resp = tool.execute(req);
        tool.shutdown();

        std::cout << resp.to_json() << "\n";
        return resp.success ? 0 : 1;
    } catch (const std::exception& e) {
        log_error("cli", e.what());
        return 3;
    }
}

int cmd_validate(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: codemode_cli validate <script.js|->\n";
        return 2;
    }
    try {
        SecurityManager security(load_settings().security);
        ValidationResult v = security.validate_code(slurp(argv[2]));
        json::Doc d = json::new_object();
        json_object_object_add(d.root, "valid", json_object_new_boolean(v.valid));
        json_object* errs = json_object_new_array();
        for (const auto& e : v.errors) json_object_array_add(errs, json_object_new_string(e.c_str()));
        json_object_object_add(d.root, "errors", errs);
        std::cout << json::to_string(d.root) << "\n";
        return v.valid ? 0 : 1;
    } catch (const std::exception& e) {
        log_error("cli", e.what());
        return 3;
    }
}

int cmd_modes(int, char**) {
    const IsolationMode current = default_sandbox_mode();
    json::Doc d = json::new_object();
    json::put_string(d.root, "default", isolation_mode_name(current));
    json_object* arr = json_object_new_array();
    for (IsolationMode m : available_sandbox_modes()) {
        SandboxModeInfo info = sandbox_mode_info(m);
        json_object* o = json_object_new_object();
        json::put_string(o, "mode", isolation_mode_name(m));
        json::put_string(o, "name", info.name);
        json::put_string(o, "isolation", info.isolation);
        json::put_string(o, "performance", info.performance);
        json::put_string(o, "security", info.security);
        json::put_string(o, "requirements", info.requirements);
        json_object_array_add(arr, o);
    }
    json_object_object_add(d.root, "modes", arr);
    std::cout << json::to_string(d.root) << "\n";
    return 0;
}
