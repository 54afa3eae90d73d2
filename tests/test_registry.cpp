#include "test_common.h"
#include "codemode/registry.h"

#include <stdexcept>

using namespace codemode;

static ToolDefinition make_tool(const std::string& name, const std::string& group, const std::string& reply) {
    ToolDefinition d;
    d.name = name;
    d.group = group;
    d.description = "test tool " + name;
    d.handler = [reply](const std::string&) { return BindingResult::value(reply); };
    return d;
}

static bool throws_runtime(ToolRegistry& r, const ToolDefinition& d, bool allow_override = false) {
    try {
        r.register_tool(d, allow_override);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

int main() {
    // Test 1: tool names map onto group methods
    {
        expect_eq_str(tool_name_to_method_name("pg_read_query", "core"), "readQuery", "camelCase");
        expect_eq_str(tool_name_to_method_name("pg_jsonb_extract", "jsonb"), "extract", "group prefix stripped");
        expect_true(tool_name_to_method_name("pg_full_text_search", "full-text") == "search",
                    "hyphenated group matches underscores");
        expect_eq_str(tool_name_to_method_name("list_tables", "core"), "listTables", "no pg_ prefix");
        expect_eq_str(tool_name_to_method_name("pg_jsonb", "jsonb"), "jsonb", "bare group name kept");
        expect_eq_str(tool_name_to_method_name("pg_stat_v_2", "core"), "statV_2", "digits not capitalized");
    }

    // Test 2: registration and lookup
    ToolRegistry reg;
    reg.register_tool(make_tool("pg_read_query", "core", "[1]"));
    reg.register_tool(make_tool("pg_write_query", "core", "{\"rowCount\":1}"));
    reg.register_tool(make_tool("pg_jsonb_extract", "jsonb", "\"x\""));
    expect_eq_ll((long long)reg.size(), 3, "three tools");
    const ToolDefinition* t = reg.get_tool("pg_jsonb_extract");
    expect_true(t != nullptr && t->group == "jsonb", "get_tool finds by name");
    expect_true(reg.get_tool("pg_missing") == nullptr, "missing tool is null");

    // Test 3: duplicates and collisions are rejected
    expect_true(throws_runtime(reg, make_tool("pg_read_query", "core", "0")), "duplicate name throws");
    expect_true(throws_runtime(reg, make_tool("read_query", "core", "0")), "method collision throws");
    expect_true(throws_runtime(reg, make_tool("", "core", "0")), "empty name throws");
    expect_true(throws_runtime(reg, make_tool("pg_x", "", "0")), "empty group throws");
    {
        ToolDefinition no_handler = make_tool("pg_y", "core", "0");
        no_handler.handler = nullptr;
        expect_true(throws_runtime(reg, no_handler), "missing handler throws");
    }
    expect_eq_ll((long long)reg.size(), 3, "failed registrations leave the registry unchanged");

    // Test 4: groups and methods
    {
        auto groups = reg.available_groups();
        expect_eq_ll((long long)groups.size(), 2, "two groups");
        expect_eq_ll((long long)groups["core"], 2, "core has two");
        expect_eq_ll((long long)groups["jsonb"], 1, "jsonb has one");
        auto methods = reg.group_methods("core");
        expect_eq_ll((long long)methods.size(), 2, "core methods");
        expect_true(methods[0] == "readQuery" && methods[1] == "writeQuery", "sorted method names");
        expect_true(reg.group_methods("nope").empty(), "unknown group has no methods");
    }

    // Test 5: override replaces the handler behind a method
    {
        expect_true(!throws_runtime(reg, make_tool("pg_read_query", "core", "[2]"), true), "override allowed");
        ApiBindings b = reg.sandbox_bindings();
        expect_true(invoke_binding(b, "core", "readQuery", "null").result_json == "[2]", "override took effect");
        expect_eq_ll((long long)reg.size(), 3, "override does not grow the registry");
    }

    // Test 6: bindings dispatch and error conversion
    {
        ToolDefinition boom;
        boom.name = "pg_fail_hard";
        boom.group = "core";
        boom.handler = [](const std::string&) -> BindingResult { throw std::runtime_error("connection reset"); };
        reg.register_tool(boom);

        ApiBindings b = reg.sandbox_bindings();
        expect_eq_ll((long long)count_bound_methods(b), 4, "four bound methods");

        BindingResult r = invoke_binding(b, "jsonb", "extract", "{\"path\":\"a\"}");
        expect_true(r.ok, "dispatch succeeds");
        expect_eq_str(r.result_json, "\"x\"", "dispatch returns handler result");

        r = invoke_binding(b, "core", "failHard", "null");
        expect_true(!r.ok && r.error == "connection reset", "handler exception becomes a failure");

        r = invoke_binding(b, "admin", "drop", "null");
        expect_true(!r.ok && r.error == "pg.admin is not defined", "unknown group");

        r = invoke_binding(b, "core", "dropAll", "null");
        expect_true(!r.ok && r.error == "pg.core.dropAll is not a function", "unknown method");

        BindingManifest m = binding_manifest(b);
        expect_eq_ll((long long)m["core"].size(), 3, "manifest lists core methods");
        expect_true(m["jsonb"].size() == 1 && m["jsonb"][0] == "extract", "manifest lists jsonb");
    }

    // Test 7: bindings are an independent snapshot
    {
        ApiBindings before = reg.sandbox_bindings();
        reg.register_tool(make_tool("pg_vector_search", "vector", "[]"));
        expect_true(before.count("vector") == 0, "earlier snapshot unaffected");
        expect_true(reg.sandbox_bindings().count("vector") == 1, "new snapshot has the group");
    }

    std::cerr << "test_registry: ALL PASSED" << std::endl;
    return 0;
}
