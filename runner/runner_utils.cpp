#include "runner_utils.h"

#include "codemode/json.h"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace codemode {

void set_env_if_missing(const char* key, const std::string& value) {
    if (std::getenv(key) != nullptr) return;
#ifdef _WIN32
    _putenv_s(key, value.c_str());
#else
    setenv(key, value.c_str(), 0);
#endif
}

std::string slurp(const std::string& path) {
    std::stringstream ss;
    if (path == "-") {
        ss << std::cin.rdbuf();
        return ss.str();
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    ss << f.rdbuf();
    return ss.str();
}

void register_host_tools(ToolRegistry* reg) {
    reg->register_tool(ToolDefinition{
        "pg_host_echo", "host", "Returns its argument unchanged",
        [](const std::string& params_json) { return BindingResult::value(params_json); },
    });
    reg->register_tool(ToolDefinition{
        "pg_host_now", "host", "Current time in epoch milliseconds",
        [](const std::string&) {
            using namespace std::chrono;
            auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
            return BindingResult::value(std::to_string(ms));
        },
    });
}

void load_fixture_tools(const std::string& path, ToolRegistry* reg) {
    json::Doc doc = json::parse(slurp(path));
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        throw std::runtime_error("fixture is not a JSON object: " + path);
    }

    json_object_object_foreach(doc.root, group, methods) {
        if (!json_object_is_type(methods, json_type_object)) {
            throw std::runtime_error(std::string("fixture group is not an object: ") + group);
        }
        json_object_object_foreach(methods, method, canned) {
            BindingResult result;
            auto err = json::get_string(canned, "_error");
            if (canned && json_object_is_type(canned, json_type_object) && err) {
                result = BindingResult::fail(*err);
            } else {
                result = BindingResult::value(json::to_string(canned));
            }
            ToolDefinition def;
            def.name = std::string("pg_") + group + "_" + method;
            def.group = group;
            def.description = "fixture";
            def.handler = [result](const std::string&) { return result; };
            reg->register_tool(def);
        }
    }
}

} // namespace codemode
